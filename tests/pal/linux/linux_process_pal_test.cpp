// MediaRelay - WebRTC SFU Signaling Server
// Tests for Linux Process PAL Implementation
//
// Spawns /bin/sh to exercise stderr line splitting, exit reporting and
// termination.

#include <gtest/gtest.h>
#include "mediarelay/pal/process_pal.hpp"
#include "mediarelay/pal/linux/linux_process_pal.hpp"

#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mediarelay {
namespace pal {
namespace test {

/**
 * @brief Collects the callbacks of one child process.
 */
class ProcessObserver {
public:
    ProcessOutputCallback lineCallback() {
        return [this](const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.push_back(line);
        };
    }

    ProcessExitCallback exitCallback() {
        return [this](const ProcessExit& exit) {
            std::lock_guard<std::mutex> lock(mutex_);
            exit_ = exit;
            ++exitCount_;
            cv_.notify_all();
        };
    }

    bool waitForExit(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return exitCount_ > 0; });
    }

    std::vector<std::string> lines() {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    ProcessExit exit() {
        std::lock_guard<std::mutex> lock(mutex_);
        return exit_;
    }

    int exitCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return exitCount_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> lines_;
    ProcessExit exit_;
    int exitCount_ = 0;
};

class LinuxProcessPALTest : public ::testing::Test {
protected:
    static ProcessCommand shell(const std::string& script) {
        ProcessCommand command;
        command.executable = "/bin/sh";
        command.arguments = {"-c", script};
        return command;
    }

    linux::LinuxProcessPAL processPal_;
};

TEST_F(LinuxProcessPALTest, ImplementsIProcessPALInterface) {
    IProcessPAL* interface = &processPal_;
    EXPECT_NE(interface, nullptr);
}

// =============================================================================
// Spawn
// =============================================================================

TEST_F(LinuxProcessPALTest, ReportsExitCode) {
    ProcessObserver observer;
    auto child = processPal_.spawn(shell("exit 3"),
        observer.lineCallback(), observer.exitCallback());
    ASSERT_TRUE(child.isSuccess());
    EXPECT_NE(child.value(), INVALID_PROCESS_HANDLE);

    ASSERT_TRUE(observer.waitForExit());
    EXPECT_EQ(observer.exit().exitCode, 3);
    EXPECT_EQ(observer.exit().signal, 0);
    EXPECT_EQ(observer.exitCount(), 1);
}

TEST_F(LinuxProcessPALTest, SplitsStderrIntoLines) {
    ProcessObserver observer;
    auto child = processPal_.spawn(
        shell("printf 'first\\nsecond\\rthird\\n' >&2"),
        observer.lineCallback(), observer.exitCallback());
    ASSERT_TRUE(child.isSuccess());
    ASSERT_TRUE(observer.waitForExit());

    auto lines = observer.lines();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "first");
    EXPECT_EQ(lines[1], "second");
    EXPECT_EQ(lines[2], "third");
}

TEST_F(LinuxProcessPALTest, StdoutIsDiscarded) {
    ProcessObserver observer;
    auto child = processPal_.spawn(shell("echo to-stdout; echo to-stderr >&2"),
        observer.lineCallback(), observer.exitCallback());
    ASSERT_TRUE(child.isSuccess());
    ASSERT_TRUE(observer.waitForExit());

    auto lines = observer.lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "to-stderr");
}

TEST_F(LinuxProcessPALTest, WorkingDirectoryIsApplied) {
    ProcessObserver observer;
    ProcessCommand command = shell("pwd >&2");
    command.workingDirectory = "/";

    auto child = processPal_.spawn(command, observer.lineCallback(), observer.exitCallback());
    ASSERT_TRUE(child.isSuccess());
    ASSERT_TRUE(observer.waitForExit());

    auto lines = observer.lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "/");
}

TEST_F(LinuxProcessPALTest, EmptyExecutableFails) {
    ProcessCommand command;

    auto child = processPal_.spawn(command, nullptr, nullptr);

    ASSERT_TRUE(child.isError());
    EXPECT_EQ(child.error().code, ProcessErrorCode::InvalidCommand);
}

TEST_F(LinuxProcessPALTest, MissingExecutableFailsSynchronously) {
    ProcessObserver observer;
    ProcessCommand command;
    command.executable = "mediarelay-no-such-program";

    auto child = processPal_.spawn(command, observer.lineCallback(), observer.exitCallback());

    ASSERT_TRUE(child.isError());
    EXPECT_EQ(child.error().code, ProcessErrorCode::InvalidCommand);
    EXPECT_NE(child.error().message.find("mediarelay-no-such-program"), std::string::npos);
    EXPECT_EQ(observer.exitCount(), 0);
}

// =============================================================================
// Liveness and Termination
// =============================================================================

TEST_F(LinuxProcessPALTest, IsAliveUntilExit) {
    ProcessObserver observer;
    auto child = processPal_.spawn(shell("exec sleep 10"),
        observer.lineCallback(), observer.exitCallback());
    ASSERT_TRUE(child.isSuccess());

    EXPECT_TRUE(processPal_.isAlive(child.value()));
    EXPECT_GT(processPal_.processId(child.value()), 0);

    ASSERT_TRUE(processPal_.terminate(child.value(), std::chrono::milliseconds(500)).isSuccess());
    ASSERT_TRUE(observer.waitForExit());
    EXPECT_FALSE(processPal_.isAlive(child.value()));
}

TEST_F(LinuxProcessPALTest, TerminateReportsSignal) {
    ProcessObserver observer;
    auto child = processPal_.spawn(shell("exec sleep 10"),
        observer.lineCallback(), observer.exitCallback());
    ASSERT_TRUE(child.isSuccess());

    ASSERT_TRUE(processPal_.terminate(child.value(), std::chrono::milliseconds(500)).isSuccess());
    ASSERT_TRUE(observer.waitForExit());

    EXPECT_EQ(observer.exit().exitCode, -1);
    EXPECT_EQ(observer.exit().signal, SIGTERM);
    EXPECT_EQ(observer.exitCount(), 1);
}

TEST_F(LinuxProcessPALTest, TerminateEscalatesToKill) {
    ProcessObserver observer;
    auto child = processPal_.spawn(shell("trap '' TERM; while true; do sleep 0.05; done"),
        observer.lineCallback(), observer.exitCallback());
    ASSERT_TRUE(child.isSuccess());

    // Give the shell time to install its trap
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    ASSERT_TRUE(processPal_.terminate(child.value(), std::chrono::milliseconds(100)).isSuccess());
    ASSERT_TRUE(observer.waitForExit());
    EXPECT_EQ(observer.exit().signal, SIGKILL);
}

TEST_F(LinuxProcessPALTest, TerminateAfterExitSucceeds) {
    ProcessObserver observer;
    auto child = processPal_.spawn(shell("exit 0"),
        observer.lineCallback(), observer.exitCallback());
    ASSERT_TRUE(child.isSuccess());
    ASSERT_TRUE(observer.waitForExit());

    EXPECT_TRUE(processPal_.terminate(child.value(), std::chrono::milliseconds(100)).isSuccess());
}

TEST_F(LinuxProcessPALTest, TerminateUnknownHandleFails) {
    auto result = processPal_.terminate(ProcessHandle{987654}, std::chrono::milliseconds(10));

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ProcessErrorCode::InvalidHandle);
}

TEST_F(LinuxProcessPALTest, UnknownHandleIsNotAlive) {
    EXPECT_FALSE(processPal_.isAlive(ProcessHandle{987654}));
    EXPECT_EQ(processPal_.processId(ProcessHandle{987654}), 0);
}

TEST_F(LinuxProcessPALTest, DestructorStopsRunningChildren) {
    ProcessObserver observer;
    {
        linux::LinuxProcessPAL localPal;
        auto child = localPal.spawn(shell("exec sleep 10"),
            observer.lineCallback(), observer.exitCallback());
        ASSERT_TRUE(child.isSuccess());
    }

    EXPECT_EQ(observer.exitCount(), 1);
}

} // namespace test
} // namespace pal
} // namespace mediarelay
