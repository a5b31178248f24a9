// MediaRelay - WebRTC SFU Signaling Server
// Linux Process PAL Implementation

#include "mediarelay/pal/linux/linux_process_pal.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace mediarelay {
namespace pal {
namespace linux {

namespace {

constexpr std::chrono::milliseconds KILL_WAIT{5000};
constexpr std::chrono::milliseconds SHUTDOWN_GRACE{2000};

ProcessExit decodeStatus(int status) {
    ProcessExit exit;
    if (WIFEXITED(status)) {
        exit.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit.signal = WTERMSIG(status);
    }
    return exit;
}

} // namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxProcessPAL::LinuxProcessPAL() = default;

LinuxProcessPAL::~LinuxProcessPAL() {
    std::unordered_map<uint64_t, std::shared_ptr<ChildProcess>> remaining;
    {
        std::lock_guard<std::mutex> lock(childrenMutex_);
        remaining.swap(children_);
    }

    for (auto& entry : remaining) {
        ChildProcess& child = *entry.second;
        bool exited;
        {
            std::lock_guard<std::mutex> lock(child.stateMutex);
            exited = child.exited;
        }
        if (!exited) {
            kill(child.pid, SIGTERM);
            if (!waitForExit(child, SHUTDOWN_GRACE)) {
                kill(child.pid, SIGKILL);
            }
        }
        if (child.reader.joinable() && child.reader.get_id() != std::this_thread::get_id()) {
            child.reader.join();
        }
    }
}

// =============================================================================
// Spawning
// =============================================================================

core::Result<ProcessHandle, ProcessError> LinuxProcessPAL::spawn(
    const ProcessCommand& command,
    ProcessOutputCallback onStderrLine,
    ProcessExitCallback onExit
) {
    if (command.executable.empty()) {
        return core::Result<ProcessHandle, ProcessError>::error(
            ProcessError{ProcessErrorCode::InvalidCommand, "Executable is empty"});
    }

    reapFinished();

    int stderrPipe[2];
    if (pipe2(stderrPipe, O_CLOEXEC) < 0) {
        int err = errno;
        return core::Result<ProcessHandle, ProcessError>::error(
            ProcessError{ProcessErrorCode::PipeFailed,
                         "pipe2 failed: " + std::string(strerror(err)), err});
    }

    // Carries errno back from the child when exec fails; closes on success
    int statusPipe[2];
    if (pipe2(statusPipe, O_CLOEXEC) < 0) {
        int err = errno;
        close(stderrPipe[0]);
        close(stderrPipe[1]);
        return core::Result<ProcessHandle, ProcessError>::error(
            ProcessError{ProcessErrorCode::PipeFailed,
                         "pipe2 failed: " + std::string(strerror(err)), err});
    }

    // Build argv before fork; the child must not allocate
    std::vector<std::string> args;
    args.reserve(command.arguments.size() + 1);
    args.push_back(command.executable);
    args.insert(args.end(), command.arguments.begin(), command.arguments.end());
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    long maxFd = sysconf(_SC_OPEN_MAX);
    if (maxFd < 0 || maxFd > 4096) {
        maxFd = 4096;
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(stderrPipe[0]);
        close(stderrPipe[1]);
        close(statusPipe[0]);
        close(statusPipe[1]);
        return core::Result<ProcessHandle, ProcessError>::error(
            ProcessError{ProcessErrorCode::ForkFailed,
                         "fork failed: " + std::string(strerror(err)), err});
    }

    if (pid == 0) {
        // Child process
        int devNull = open("/dev/null", O_RDWR);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            dup2(devNull, STDOUT_FILENO);
        }
        dup2(stderrPipe[1], STDERR_FILENO);

        // Own process group so a terminal Ctrl-C reaches only the server
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);

        for (int fd = 3; fd < static_cast<int>(maxFd); ++fd) {
            if (fd != statusPipe[1]) {
                close(fd);
            }
        }

        if (!command.workingDirectory.empty() && chdir(command.workingDirectory.c_str()) < 0) {
            int err = errno;
            ssize_t ignored = write(statusPipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        execvp(argv[0], argv.data());

        int err = errno;
        ssize_t ignored = write(statusPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(stderrPipe[1]);
    close(statusPipe[1]);

    int childErrno = 0;
    ssize_t statusBytes;
    do {
        statusBytes = read(statusPipe[0], &childErrno, sizeof(childErrno));
    } while (statusBytes < 0 && errno == EINTR);
    close(statusPipe[0]);

    if (statusBytes == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close(stderrPipe[0]);
        return core::Result<ProcessHandle, ProcessError>::error(
            ProcessError{ProcessErrorCode::InvalidCommand,
                         "Cannot execute " + command.executable + ": " + strerror(childErrno),
                         childErrno});
    }

    auto child = std::make_shared<ChildProcess>();
    child->pid = pid;
    child->stderrFd = stderrPipe[0];
    child->onStderrLine = std::move(onStderrLine);
    child->onExit = std::move(onExit);

    uint64_t handleValue = nextHandle_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(childrenMutex_);
        children_[handleValue] = child;
    }

    child->reader = std::thread(&LinuxProcessPAL::readerLoop, child);

    return core::Result<ProcessHandle, ProcessError>::success(ProcessHandle{handleValue});
}

void LinuxProcessPAL::readerLoop(std::shared_ptr<ChildProcess> child) {
    {
        std::lock_guard<std::mutex> lock(child->stateMutex);
        child->readerId = std::this_thread::get_id();
    }

    std::string pending;
    char buffer[4096];

    auto emit = [&child](std::string& line) {
        if (!line.empty() && child->onStderrLine) {
            child->onStderrLine(line);
        }
        line.clear();
    };

    while (true) {
        ssize_t n = read(child->stderrFd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;
        }

        for (ssize_t i = 0; i < n; ++i) {
            char c = buffer[i];
            // ffmpeg rewrites its progress line with '\r'
            if (c == '\n' || c == '\r') {
                emit(pending);
            } else {
                pending.push_back(c);
            }
        }
    }
    emit(pending);
    close(child->stderrFd);
    child->stderrFd = -1;

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(child->pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    ProcessExit exitInfo = waited == child->pid ? decodeStatus(status) : ProcessExit{};
    {
        std::lock_guard<std::mutex> lock(child->stateMutex);
        child->exited = true;
        child->exitInfo = exitInfo;
    }
    child->exitCondition.notify_all();

    if (child->onExit) {
        child->onExit(exitInfo);
    }

    child->readerDone = true;
}

// =============================================================================
// Control
// =============================================================================

bool LinuxProcessPAL::isAlive(ProcessHandle handle) const {
    std::shared_ptr<ChildProcess> child;
    {
        std::lock_guard<std::mutex> lock(childrenMutex_);
        auto it = children_.find(handle.value);
        if (it == children_.end()) {
            return false;
        }
        child = it->second;
    }
    std::lock_guard<std::mutex> lock(child->stateMutex);
    return !child->exited;
}

core::Result<void, ProcessError> LinuxProcessPAL::terminate(
    ProcessHandle handle,
    std::chrono::milliseconds grace
) {
    if (handle == INVALID_PROCESS_HANDLE || handle.value >= nextHandle_.load()) {
        return core::Result<void, ProcessError>::error(
            ProcessError{ProcessErrorCode::InvalidHandle, "Invalid process handle"});
    }

    std::shared_ptr<ChildProcess> child;
    {
        std::lock_guard<std::mutex> lock(childrenMutex_);
        auto it = children_.find(handle.value);
        if (it == children_.end()) {
            // Already exited and reaped
            return core::Result<void, ProcessError>::success();
        }
        child = it->second;
    }

    bool onReaderThread;
    {
        std::lock_guard<std::mutex> lock(child->stateMutex);
        if (child->exited) {
            return core::Result<void, ProcessError>::success();
        }
        onReaderThread = child->readerId == std::this_thread::get_id();
    }

    if (kill(child->pid, SIGTERM) < 0 && errno != ESRCH) {
        int err = errno;
        return core::Result<void, ProcessError>::error(
            ProcessError{ProcessErrorCode::SignalFailed,
                         "kill(SIGTERM) failed: " + std::string(strerror(err)), err});
    }

    // Waiting here would block the thread that reports the exit
    if (onReaderThread) {
        return core::Result<void, ProcessError>::success();
    }

    if (waitForExit(*child, grace)) {
        return core::Result<void, ProcessError>::success();
    }

    if (kill(child->pid, SIGKILL) < 0 && errno != ESRCH) {
        int err = errno;
        return core::Result<void, ProcessError>::error(
            ProcessError{ProcessErrorCode::SignalFailed,
                         "kill(SIGKILL) failed: " + std::string(strerror(err)), err});
    }

    if (!waitForExit(*child, KILL_WAIT)) {
        return core::Result<void, ProcessError>::error(
            ProcessError{ProcessErrorCode::SignalFailed,
                         "Process " + std::to_string(child->pid) + " did not exit after SIGKILL"});
    }
    return core::Result<void, ProcessError>::success();
}

int LinuxProcessPAL::processId(ProcessHandle handle) const {
    std::lock_guard<std::mutex> lock(childrenMutex_);
    auto it = children_.find(handle.value);
    return it == children_.end() ? 0 : static_cast<int>(it->second->pid);
}

// =============================================================================
// Helpers
// =============================================================================

bool LinuxProcessPAL::waitForExit(ChildProcess& child, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(child.stateMutex);
    return child.exitCondition.wait_for(lock, timeout, [&child]() { return child.exited; });
}

void LinuxProcessPAL::reapFinished() {
    std::vector<std::shared_ptr<ChildProcess>> finished;
    {
        std::lock_guard<std::mutex> lock(childrenMutex_);
        for (auto it = children_.begin(); it != children_.end();) {
            if (it->second->readerDone.load()) {
                finished.push_back(it->second);
                it = children_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& child : finished) {
        if (child->reader.joinable()) {
            child->reader.join();
        }
    }
}

} // namespace linux
} // namespace pal
} // namespace mediarelay
