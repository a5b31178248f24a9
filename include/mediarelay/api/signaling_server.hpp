// MediaRelay - WebRTC SFU Signaling Server
// SignalingServer Public API - Main server interface
//
// Responsibilities:
// - Own the platform services, the media engine and the signaling components
// - Expose initialize, start and stop lifecycle methods
// - Accept TCP connections and split them into WebSocket signaling and HTTP
//   playback requests
// - Map socket close to client disconnect
// - Report engine fatal errors to the embedding program

#ifndef MEDIARELAY_API_SIGNALING_SERVER_HPP
#define MEDIARELAY_API_SIGNALING_SERVER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "mediarelay/core/config_manager.hpp"
#include "mediarelay/core/result.hpp"
#include "mediarelay/core/structured_logger.hpp"

namespace mediarelay {
namespace api {

// =============================================================================
// Server State Enumeration
// =============================================================================

enum class ServerState {
    Uninitialized,  ///< initialize() not called yet
    Initialized,    ///< Engine ready, not listening
    Running,        ///< Accepting connections
    Stopped         ///< Stopped; cannot be restarted
};

inline const char* serverStateToString(ServerState state) {
    switch (state) {
        case ServerState::Uninitialized: return "Uninitialized";
        case ServerState::Initialized:   return "Initialized";
        case ServerState::Running:       return "Running";
        case ServerState::Stopped:       return "Stopped";
        default:                         return "Unknown";
    }
}

// =============================================================================
// Error Types
// =============================================================================

struct ServerError {
    enum class Code {
        InvalidConfiguration,   ///< Configuration is invalid
        InvalidState,           ///< Operation not allowed in current state
        EngineFailed,           ///< Media engine could not be created
        BindFailed,             ///< Failed to bind the signaling port
        StartFailed,            ///< Event loop or worker pool failed
        InternalError
    };

    Code code;
    std::string message;

    ServerError(Code c = Code::InternalError, std::string msg = "")
        : code(c), message(std::move(msg)) {}
};

/**
 * @brief Called once when the media engine reports an unrecoverable error.
 *
 * The server does not restart the engine; the embedding program is
 * expected to shut down and exit with a failure status.
 */
using FatalErrorCallback = std::function<void(const std::string& reason)>;

// =============================================================================
// SignalingServer Class
// =============================================================================

/**
 * @brief WebRTC SFU signaling server with HLS recording.
 *
 * @code
 * SignalingServer server;
 * server.setFatalErrorCallback([&](const std::string& reason) { requestExit(1); });
 *
 * auto init = server.initialize(config, logger);
 * if (init.isError()) { ... }
 *
 * auto started = server.start();
 * if (started.isError()) { ... }
 *
 * waitForSignal();
 * server.stop();
 * @endcode
 *
 * Thread Safety: lifecycle methods are thread-safe. Socket callbacks run on
 * the event loop thread; signaling work runs on the worker pool with one
 * serial executor per client.
 */
class SignalingServer {
public:
    SignalingServer();
    ~SignalingServer();

    SignalingServer(const SignalingServer&) = delete;
    SignalingServer& operator=(const SignalingServer&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle Methods
    // -------------------------------------------------------------------------

    /**
     * @brief Create the platform services and bring up the media engine.
     *
     * Can only be called once.
     */
    core::Result<void, ServerError> initialize(
        const core::Configuration& config,
        std::shared_ptr<core::StructuredLogger> logger
    );

    /**
     * @brief Bind the signaling port and start the event loop.
     */
    core::Result<void, ServerError> start();

    /**
     * @brief Disconnect every client, stop all recorders and the event loop.
     *
     * Idempotent.
     */
    core::Result<void, ServerError> stop();

    // -------------------------------------------------------------------------
    // Status
    // -------------------------------------------------------------------------

    [[nodiscard]] ServerState state() const;

    /**
     * @brief Port actually bound, 0 before start().
     */
    [[nodiscard]] uint16_t port() const;

    [[nodiscard]] size_t connectionCount() const;

    void setFatalErrorCallback(FatalErrorCallback callback);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace api
} // namespace mediarelay

#endif // MEDIARELAY_API_SIGNALING_SERVER_HPP
