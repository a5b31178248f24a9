// MediaRelay - WebRTC SFU Signaling Server
// Platform Abstraction Layer - Common Types
//
// Handles, error codes, option structures and callback signatures shared by
// the network, thread, timer, process and log abstractions.

#ifndef MEDIARELAY_PAL_PAL_TYPES_HPP
#define MEDIARELAY_PAL_PAL_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mediarelay {

namespace core {
class Buffer;
template<typename T, typename E> class Result;
}

namespace pal {

// =============================================================================
// Handle Types
// =============================================================================

/**
 * @brief Platform-independent socket handle (wraps the file descriptor).
 */
struct SocketHandle {
    uint64_t value;

    bool operator==(const SocketHandle& other) const { return value == other.value; }
    bool operator!=(const SocketHandle& other) const { return value != other.value; }
};

struct ThreadPoolHandle {
    uint64_t value;

    bool operator==(const ThreadPoolHandle& other) const { return value == other.value; }
    bool operator!=(const ThreadPoolHandle& other) const { return value != other.value; }
};

struct TimerHandle {
    uint64_t value;

    bool operator==(const TimerHandle& other) const { return value == other.value; }
    bool operator!=(const TimerHandle& other) const { return value != other.value; }
};

/**
 * @brief Handle of a spawned child process (not the pid).
 */
struct ProcessHandle {
    uint64_t value;

    bool operator==(const ProcessHandle& other) const { return value == other.value; }
    bool operator!=(const ProcessHandle& other) const { return value != other.value; }
};

constexpr SocketHandle INVALID_SOCKET_HANDLE{UINT64_MAX};
constexpr ThreadPoolHandle INVALID_THREAD_POOL_HANDLE{0};
constexpr TimerHandle INVALID_TIMER_HANDLE{0};
constexpr ProcessHandle INVALID_PROCESS_HANDLE{0};

// =============================================================================
// Error Codes
// =============================================================================

enum class NetworkErrorCode : uint32_t {
    Success = 0,
    Unknown = 1,

    InitializationFailed = 100,
    AlreadyInitialized = 101,
    NotInitialized = 102,

    SocketCreationFailed = 200,
    BindFailed = 201,
    ListenFailed = 202,
    AcceptFailed = 203,
    ConnectionReset = 206,
    ConnectionRefused = 207,
    ConnectionClosed = 208,

    ReadFailed = 300,
    WriteFailed = 301,
    WouldBlock = 302,
    Timeout = 303,
    Interrupted = 304,

    AddressInUse = 400,
    AddressNotAvailable = 401,
    InvalidAddress = 402,
    HostUnreachable = 403,
    NetworkUnreachable = 404,

    TooManyOpenFiles = 500,
    OutOfMemory = 501,

    PermissionDenied = 600,
};

enum class ThreadErrorCode : uint32_t {
    Success = 0,
    Unknown = 1,
    CreationFailed = 100,
    InvalidHandle = 101,
    PoolCreationFailed = 500,
    PoolShutdown = 501,
    WorkQueueFull = 502,
};

enum class TimerErrorCode : uint32_t {
    Success = 0,
    Unknown = 1,
    CreationFailed = 100,
    InvalidHandle = 101,
    CancellationFailed = 102,
    AlreadyCancelled = 103,
};

enum class ProcessErrorCode : uint32_t {
    Success = 0,
    Unknown = 1,
    InvalidCommand = 100,
    PipeFailed = 101,
    ForkFailed = 102,
    InvalidHandle = 200,
    SignalFailed = 201,
};

/**
 * @brief Log severity levels understood by every sink.
 */
enum class LogLevel : uint32_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// =============================================================================
// Error Structures
// =============================================================================

struct NetworkError {
    NetworkErrorCode code;
    std::string message;
    int32_t systemErrorCode;  ///< errno at the point of failure

    NetworkError(NetworkErrorCode c = NetworkErrorCode::Unknown,
                 std::string msg = "",
                 int32_t sysErr = 0)
        : code(c)
        , message(std::move(msg))
        , systemErrorCode(sysErr) {}
};

struct ThreadError {
    ThreadErrorCode code;
    std::string message;

    ThreadError(ThreadErrorCode c = ThreadErrorCode::Unknown, std::string msg = "")
        : code(c), message(std::move(msg)) {}
};

struct TimerError {
    TimerErrorCode code;
    std::string message;

    TimerError(TimerErrorCode c = TimerErrorCode::Unknown, std::string msg = "")
        : code(c), message(std::move(msg)) {}
};

struct ProcessError {
    ProcessErrorCode code;
    std::string message;
    int32_t systemErrorCode;

    ProcessError(ProcessErrorCode c = ProcessErrorCode::Unknown,
                 std::string msg = "",
                 int32_t sysErr = 0)
        : code(c)
        , message(std::move(msg))
        , systemErrorCode(sysErr) {}
};

// =============================================================================
// Configuration Structures
// =============================================================================

struct ServerOptions {
    int backlog = 128;
    bool reuseAddr = true;
    bool reusePort = false;
    int receiveBufferSize = 0;   ///< 0 keeps the system default
    int sendBufferSize = 0;
};

struct ServerSocket {
    SocketHandle handle{INVALID_SOCKET_HANDLE};
    std::string address;
    uint16_t port = 0;
};

/**
 * @brief IPv4 endpoint of a socket (local or peer side).
 */
struct SocketAddress {
    std::string ip;
    uint16_t port = 0;
};

struct ThreadPoolOptions {
    std::string name;
    size_t queueSize = 4096;     ///< Maximum queued work items
};

/**
 * @brief Source location attached to a log record.
 */
struct LogContext {
    const char* file = nullptr;
    int line = 0;
    const char* function = nullptr;
};

/**
 * @brief Program to run as a child process.
 */
struct ProcessCommand {
    std::string executable;              ///< Resolved through PATH when it has no '/'
    std::vector<std::string> arguments;  ///< argv[1..]
    std::string workingDirectory;        ///< Empty keeps the parent's
};

/**
 * @brief How a child process ended.
 */
struct ProcessExit {
    int exitCode = -1;           ///< Exit status, -1 when killed by a signal
    int signal = 0;              ///< Terminating signal, 0 when exited normally
};

// =============================================================================
// Callback Types
// =============================================================================

using AcceptCallback = std::function<void(core::Result<SocketHandle, NetworkError>)>;
using ReadCallback = std::function<void(core::Result<core::Buffer, NetworkError>)>;
using WriteCallback = std::function<void(core::Result<size_t, NetworkError>)>;
using TimerCallback = std::function<void()>;
using WorkItem = std::function<void()>;
using ProcessOutputCallback = std::function<void(const std::string& line)>;
using ProcessExitCallback = std::function<void(const ProcessExit& exit)>;

class ILogSink;

} // namespace pal
} // namespace mediarelay

#endif // MEDIARELAY_PAL_PAL_TYPES_HPP
