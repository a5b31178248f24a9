// MediaRelay - WebRTC SFU Signaling Server
// Linux Process PAL Implementation
//
// fork/execvp with a stderr pipe drained by one reader thread per child.

#ifndef MEDIARELAY_PAL_LINUX_LINUX_PROCESS_PAL_HPP
#define MEDIARELAY_PAL_LINUX_LINUX_PROCESS_PAL_HPP

#include "mediarelay/pal/process_pal.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <sys/types.h>

namespace mediarelay {
namespace pal {
namespace linux {

/**
 * @brief Linux implementation of IProcessPAL.
 *
 * The reader thread of a child reads stderr until EOF, then reaps the child
 * with waitpid() and reports the exit. exec failures are detected through a
 * close-on-exec status pipe, so spawn() fails synchronously when the
 * executable cannot be started.
 *
 * The destructor terminates every child that is still running.
 */
class LinuxProcessPAL : public IProcessPAL {
public:
    LinuxProcessPAL();
    ~LinuxProcessPAL() override;

    LinuxProcessPAL(const LinuxProcessPAL&) = delete;
    LinuxProcessPAL& operator=(const LinuxProcessPAL&) = delete;
    LinuxProcessPAL(LinuxProcessPAL&&) = delete;
    LinuxProcessPAL& operator=(LinuxProcessPAL&&) = delete;

    core::Result<ProcessHandle, ProcessError> spawn(
        const ProcessCommand& command,
        ProcessOutputCallback onStderrLine,
        ProcessExitCallback onExit
    ) override;

    bool isAlive(ProcessHandle handle) const override;

    core::Result<void, ProcessError> terminate(
        ProcessHandle handle,
        std::chrono::milliseconds grace
    ) override;

    int processId(ProcessHandle handle) const override;

private:
    struct ChildProcess {
        pid_t pid = -1;
        int stderrFd = -1;
        ProcessOutputCallback onStderrLine;
        ProcessExitCallback onExit;

        std::thread reader;
        std::thread::id readerId;

        std::mutex stateMutex;
        std::condition_variable exitCondition;
        bool exited = false;
        ProcessExit exitInfo;
        std::atomic<bool> readerDone{false};
    };

    static void readerLoop(std::shared_ptr<ChildProcess> child);

    /**
     * @brief Join and forget children whose reader thread has finished.
     */
    void reapFinished();

    bool waitForExit(ChildProcess& child, std::chrono::milliseconds timeout);

    std::atomic<uint64_t> nextHandle_{1};

    mutable std::mutex childrenMutex_;
    std::unordered_map<uint64_t, std::shared_ptr<ChildProcess>> children_;
};

} // namespace linux
} // namespace pal
} // namespace mediarelay

#endif // MEDIARELAY_PAL_LINUX_LINUX_PROCESS_PAL_HPP
