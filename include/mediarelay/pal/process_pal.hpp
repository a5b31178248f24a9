// MediaRelay - WebRTC SFU Signaling Server
// Platform Abstraction Layer - Child Process Interface
//
// Launches external programs (the HLS encoder), streams their stderr line by
// line and reports their exit.

#ifndef MEDIARELAY_PAL_PROCESS_PAL_HPP
#define MEDIARELAY_PAL_PROCESS_PAL_HPP

#include "mediarelay/pal/pal_types.hpp"
#include "mediarelay/core/result.hpp"

#include <chrono>

namespace mediarelay {
namespace pal {

/**
 * @brief Abstract interface for child process management.
 *
 * Callbacks of one process run on a reader thread owned by the PAL, in
 * order: every stderr line, then exactly one exit notification.
 */
class IProcessPAL {
public:
    virtual ~IProcessPAL() = default;

    /**
     * @brief Start a child process.
     *
     * stdin and stdout are connected to /dev/null; stderr is split into lines
     * (on '\n' and '\r') and handed to onStderrLine.
     *
     * Error conditions:
     * - InvalidCommand: empty executable or exec failed (e.g. not installed)
     * - PipeFailed / ForkFailed: system resources exhausted
     *
     * @code
     * ProcessCommand cmd;
     * cmd.executable = "ffmpeg";
     * cmd.arguments = {"-hide_banner", "-i", sdpPath, ...};
     * auto child = processPal->spawn(cmd,
     *     [](const std::string& line) { classify(line); },
     *     [](const ProcessExit& exit) { onEncoderExit(exit); });
     * @endcode
     */
    virtual core::Result<ProcessHandle, ProcessError> spawn(
        const ProcessCommand& command,
        ProcessOutputCallback onStderrLine,
        ProcessExitCallback onExit
    ) = 0;

    /**
     * @brief True until the exit of the process has been observed.
     */
    virtual bool isAlive(ProcessHandle handle) const = 0;

    /**
     * @brief Stop a process: SIGTERM, wait up to grace, then SIGKILL.
     *
     * Returns once the process is gone. Called from the process's own
     * callback it only sends the signals. Terminating a process that has
     * already exited succeeds.
     */
    virtual core::Result<void, ProcessError> terminate(
        ProcessHandle handle,
        std::chrono::milliseconds grace
    ) = 0;

    /**
     * @brief Operating system pid for log lines, 0 when unknown.
     */
    virtual int processId(ProcessHandle handle) const = 0;
};

} // namespace pal
} // namespace mediarelay

#endif // MEDIARELAY_PAL_PROCESS_PAL_HPP
