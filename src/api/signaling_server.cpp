// MediaRelay - WebRTC SFU Signaling Server
// SignalingServer Public API Implementation
//
// Wires the Linux platform services, the local media engine, the session
// registries, the stream lifecycle manager and the protocol handlers into
// one listening server. Accept and plain HTTP run on the network event loop;
// upgraded connections move to Boost.Beast sessions on a separate io_context
// thread. Signaling requests run on the worker pool, serialized per client.

#include "mediarelay/api/signaling_server.hpp"
#include "mediarelay/core/buffer.hpp"
#include "mediarelay/core/serial_executor.hpp"
#include "mediarelay/engine/engine_facade.hpp"
#include "mediarelay/engine/local_router.hpp"
#include "mediarelay/pal/linux/linux_network_pal.hpp"
#include "mediarelay/pal/linux/linux_process_pal.hpp"
#include "mediarelay/pal/linux/linux_thread_pal.hpp"
#include "mediarelay/pal/linux/linux_timer_pal.hpp"
#include "mediarelay/protocol/http_message.hpp"
#include "mediarelay/protocol/playback_resolver.hpp"
#include "mediarelay/protocol/signaling_handler.hpp"
#include "mediarelay/protocol/signaling_message.hpp"
#include "mediarelay/protocol/websocket_session.hpp"
#include "mediarelay/session/client_registry.hpp"
#include "mediarelay/session/session_registry.hpp"
#include "mediarelay/streaming/encoder_port_pool.hpp"
#include "mediarelay/streaming/port_watcher.hpp"
#include "mediarelay/streaming/recording_bridge.hpp"
#include "mediarelay/streaming/stream_lifecycle.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include <openssl/rand.h>
#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <unordered_map>

namespace mediarelay {
namespace api {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {
    constexpr size_t READ_CHUNK_SIZE = 64 * 1024;
    constexpr size_t CLIENT_ID_BYTES = 8;
    constexpr const char* LOG_CATEGORY = "Server";
}

// =============================================================================
// Connection Context - Per-connection state
// =============================================================================

enum class ConnectionPhase {
    Http,           ///< Waiting for the request header
    Upgraded,       ///< Handed over to a WebSocket session
    Closing         ///< Final write queued, no more reads
};

/**
 * @brief Accepted socket still owned by the network PAL.
 */
struct ConnectionContext {
    pal::SocketHandle socket;
    core::ClientInfo info;

    // Touched only on the event loop thread
    ConnectionPhase phase = ConnectionPhase::Http;
    std::string httpBuffer;

    std::atomic<bool> closed{false};
};

/**
 * @brief Upgraded signaling client.
 */
struct ClientConnection {
    core::ClientId clientId;
    core::ClientInfo info;
    std::shared_ptr<protocol::WebSocketSession> session;
    std::shared_ptr<core::SerialExecutor> executor;

    // Registration and close race between the session strand and stop()
    std::mutex mutex;
    bool registered = false;
    bool closed = false;
};

// =============================================================================
// SignalingServer::Impl
// =============================================================================

class SignalingServer::Impl {
public:
    Impl() = default;

    ~Impl() {
        ServerState current;
        {
            std::shared_lock<std::shared_mutex> lock(stateMutex_);
            current = state_;
        }
        if (current == ServerState::Initialized || current == ServerState::Running) {
            auto stopped = stop();
            if (stopped.isError()) {
                MEDIARELAY_LOG_ERROR(logger_, LOG_CATEGORY,
                    "Shutdown failed: " + stopped.error().message);
            }
        }
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    core::Result<void, ServerError> initialize(
        const core::Configuration& config,
        std::shared_ptr<core::StructuredLogger> logger
    ) {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);

        if (state_ != ServerState::Uninitialized) {
            return core::Result<void, ServerError>::error(
                ServerError{ServerError::Code::InvalidState,
                    std::string("Cannot initialize in state ") + serverStateToString(state_)});
        }

        if (config.server.workerThreads == 0) {
            return core::Result<void, ServerError>::error(
                ServerError{ServerError::Code::InvalidConfiguration, "workerThreads must be positive"});
        }
        if (config.recording.encoderRtpPortMin > config.recording.encoderRtpPortMax) {
            return core::Result<void, ServerError>::error(
                ServerError{ServerError::Code::InvalidConfiguration, "Encoder RTP port range is empty"});
        }

        config_ = config;
        logger_ = std::move(logger);
        if (config_.recording.outputRoot.empty()) {
            std::error_code ec;
            auto cwd = std::filesystem::current_path(ec);
            if (ec) {
                return core::Result<void, ServerError>::error(
                    ServerError{ServerError::Code::InvalidConfiguration,
                        "No HLS output root and working directory unavailable: " + ec.message()});
            }
            config_.recording.outputRoot = (cwd / "public" / "hls").string();
        }

        auto netInit = networkPal_.initialize();
        if (netInit.isError()) {
            return core::Result<void, ServerError>::error(
                ServerError{ServerError::Code::StartFailed,
                    "Network initialization failed: " + netInit.error().message});
        }

        router_ = std::make_shared<engine::LocalRouter>(config_.engine, networkPal_, logger_);
        auto routerInit = router_->initialize();
        if (routerInit.isError()) {
            return core::Result<void, ServerError>::error(
                ServerError{ServerError::Code::EngineFailed,
                    "Media engine initialization failed: " + routerInit.error().message});
        }

        engine_ = std::make_unique<engine::EngineFacade>(router_, logger_);
        engine_->setFatalErrorHandler([this](const std::string& reason) {
            onEngineFatal(reason);
        });

        pal::ThreadPoolOptions poolOptions;
        poolOptions.name = "signaling";
        auto pool = threadPal_.createThreadPool(config_.server.workerThreads, poolOptions);
        if (pool.isError()) {
            router_->close();
            return core::Result<void, ServerError>::error(
                ServerError{ServerError::Code::StartFailed,
                    "Worker pool creation failed: " + pool.error().message});
        }
        workerPool_ = pool.value();

        portWatcher_ = std::make_unique<streaming::UdpPortWatcher>(networkPal_);
        encoderPorts_ = std::make_unique<streaming::EncoderPortPool>(
            config_.recording.encoderRtpPortMin, config_.recording.encoderRtpPortMax, *portWatcher_);

        streams_ = std::make_unique<streaming::StreamLifecycleManager>(
            sessions_, clients_,
            [this](const core::StreamKey& streamKey) { return createRecorder(streamKey); },
            logger_);

        handler_ = std::make_unique<protocol::SignalingHandler>(
            sessions_, clients_, *engine_, *streams_, logger_);

        playback_ = std::make_unique<protocol::PlaybackResolver>(
            config_.recording.outputRoot, config_.playback.pathPrefix, logger_);

        state_ = ServerState::Initialized;
        MEDIARELAY_LOG_INFO(logger_, LOG_CATEGORY,
            "Server initialized, announced IP " + router_->announcedIp());

        return core::Result<void, ServerError>::success();
    }

    core::Result<void, ServerError> start() {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);

        if (state_ != ServerState::Initialized) {
            return core::Result<void, ServerError>::error(
                ServerError{ServerError::Code::InvalidState,
                    std::string("Cannot start in state ") + serverStateToString(state_)});
        }

        pal::ServerOptions options;
        options.reuseAddr = true;
        auto server = networkPal_.createServer(
            config_.server.bindAddress, config_.server.port, options);
        if (server.isError()) {
            return core::Result<void, ServerError>::error(
                ServerError{ServerError::Code::BindFailed,
                    "Failed to bind " + config_.server.bindAddress + ":" +
                    std::to_string(config_.server.port) + ": " + server.error().message});
        }
        serverSocket_ = server.value();

        networkPal_.asyncAccept(serverSocket_,
            [this](core::Result<pal::SocketHandle, pal::NetworkError> result) {
                handleAccept(std::move(result));
            });

        eventLoopThread_ = std::thread([this]() {
            networkPal_.runEventLoop();
        });

        ioWork_.emplace(asio::make_work_guard(ioContext_));
        ioThread_ = std::thread([this]() {
            ioContext_.run();
        });

        state_ = ServerState::Running;
        MEDIARELAY_LOG_INFO(logger_, LOG_CATEGORY,
            "Signaling server listening on " + config_.server.bindAddress + ":" +
            std::to_string(serverSocket_.port));

        return core::Result<void, ServerError>::success();
    }

    core::Result<void, ServerError> stop() {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);

        if (state_ == ServerState::Stopped) {
            return core::Result<void, ServerError>::success();
        }
        if (state_ == ServerState::Uninitialized) {
            state_ = ServerState::Stopped;
            return core::Result<void, ServerError>::success();
        }

        MEDIARELAY_LOG_INFO(logger_, LOG_CATEGORY, "Server stopping");

        if (serverSocket_.handle != pal::INVALID_SOCKET_HANDLE) {
            networkPal_.closeSocket(serverSocket_.handle);
            serverSocket_ = pal::ServerSocket{};
        }

        closeAllConnections();
        closeAllClients();

        // Runs the queued disconnects before the recorders are stopped
        auto destroyed = threadPal_.destroyThreadPool(workerPool_);
        if (destroyed.isError()) {
            MEDIARELAY_LOG_WARNING(logger_, LOG_CATEGORY,
                "Worker pool shutdown failed: " + destroyed.error().message);
        }
        workerPool_ = pal::INVALID_THREAD_POOL_HANDLE;

        streams_->stopAll();

        // Finished sessions can leave Beast's idle timer armed, so run() is
        // stopped rather than drained. The shutdowns posted above and the
        // aborted operations they cause then run here.
        ioWork_.reset();
        ioContext_.stop();
        if (ioThread_.joinable()) {
            ioThread_.join();
        }
        ioContext_.restart();
        ioContext_.poll();

        networkPal_.stopEventLoop();
        if (eventLoopThread_.joinable()) {
            eventLoopThread_.join();
        }

        router_->close();

        state_ = ServerState::Stopped;
        MEDIARELAY_LOG_INFO(logger_, LOG_CATEGORY, "Server stopped");

        return core::Result<void, ServerError>::success();
    }

    // -------------------------------------------------------------------------
    // Status
    // -------------------------------------------------------------------------

    ServerState state() const {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        return state_;
    }

    uint16_t port() const {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        return serverSocket_.port;
    }

    size_t connectionCount() const {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        return connections_.size() + clientConnections_.size();
    }

    void setFatalErrorCallback(FatalErrorCallback callback) {
        std::lock_guard<std::mutex> lock(fatalMutex_);
        fatalCallback_ = std::move(callback);
    }

private:
    // -------------------------------------------------------------------------
    // Accept
    // -------------------------------------------------------------------------

    void handleAccept(core::Result<pal::SocketHandle, pal::NetworkError> result) {
        if (result.isError()) {
            MEDIARELAY_LOG_WARNING(logger_, LOG_CATEGORY,
                "Accept failed: " + result.error().message);
            return;
        }

        pal::SocketHandle socket = result.value();
        auto connection = std::make_shared<ConnectionContext>();
        connection->socket = socket;

        auto peer = networkPal_.getPeerAddress(socket);
        if (peer.isSuccess()) {
            connection->info.ip = peer.value().ip;
            connection->info.port = peer.value().port;
        }

        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            if (connections_.size() + clientConnections_.size() >= config_.server.maxConnections) {
                MEDIARELAY_LOG_WARNING(logger_, LOG_CATEGORY,
                    "Connection limit reached (" +
                    std::to_string(config_.server.maxConnections) + "), rejecting");
                networkPal_.closeSocket(socket);
                return;
            }
            connections_[socket.value] = connection;
        }

        MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY,
            "Accepted connection from " + connection->info.ip + ":" +
            std::to_string(connection->info.port));

        startReading(connection);
    }

    std::optional<core::ClientId> generateClientId() const {
        unsigned char bytes[CLIENT_ID_BYTES];
        if (RAND_bytes(bytes, static_cast<int>(sizeof(bytes))) != 1) {
            return std::nullopt;
        }

        static const char* hex = "0123456789abcdef";
        std::string id;
        id.reserve(sizeof(bytes) * 2);
        for (unsigned char byte : bytes) {
            id.push_back(hex[byte >> 4]);
            id.push_back(hex[byte & 0x0F]);
        }
        return id;
    }

    // -------------------------------------------------------------------------
    // Reading
    // -------------------------------------------------------------------------

    void startReading(const std::shared_ptr<ConnectionContext>& connection) {
        std::weak_ptr<ConnectionContext> weak = connection;
        networkPal_.asyncRead(connection->socket, READ_CHUNK_SIZE,
            [this, weak](core::Result<core::Buffer, pal::NetworkError> result) {
                auto conn = weak.lock();
                if (!conn || conn->closed) {
                    return;
                }
                onRead(conn, std::move(result));
            });
    }

    void onRead(
        const std::shared_ptr<ConnectionContext>& connection,
        core::Result<core::Buffer, pal::NetworkError> result
    ) {
        if (result.isError()) {
            if (result.error().code != pal::NetworkErrorCode::ConnectionClosed) {
                MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY,
                    "Read failed for " + connection->info.ip + ": " + result.error().message);
            }
            closeConnection(connection);
            return;
        }

        const core::Buffer& data = result.value();
        connection->httpBuffer.append(reinterpret_cast<const char*>(data.data()), data.size());
        processHttp(connection);

        if (connection->phase == ConnectionPhase::Http && !connection->closed) {
            startReading(connection);
        }
    }

    // -------------------------------------------------------------------------
    // HTTP
    // -------------------------------------------------------------------------

    void processHttp(const std::shared_ptr<ConnectionContext>& connection) {
        auto parsed = protocol::parseHttpRequest(connection->httpBuffer);
        if (parsed.isError()) {
            MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY,
                "Bad HTTP request from " + connection->info.ip + ": " + parsed.error().message);
            auto response = protocol::HttpResponse::text(
                parsed.error().statusCode(), parsed.error().message);
            response.setHeader("Connection", "close");
            sendAndClose(connection, core::Buffer(response.serialize()));
            return;
        }
        if (!parsed.value()) {
            return;
        }

        const protocol::HttpRequest& request = parsed.value()->request;
        if (request.isWebSocketUpgrade()) {
            // Beast re-reads the request; anything after it is WebSocket data
            std::string raw;
            raw.swap(connection->httpBuffer);
            upgrade(connection, request.header("user-agent"), std::move(raw));
            return;
        }
        connection->httpBuffer.clear();

        protocol::HttpResponse response;
        if (playback_->handles(request.path)) {
            response = playback_->respond(request);
        } else {
            core::JsonValue body = core::JsonValue::object();
            body.set("error", "Not found");
            response.status = 404;
            response.setHeader("Content-Type", "application/json");
            response.body = body.dump();
        }
        response.setHeader("Connection", "close");
        sendAndClose(connection, core::Buffer(response.serialize()));
    }

    void sendAndClose(const std::shared_ptr<ConnectionContext>& connection, const core::Buffer& data) {
        connection->phase = ConnectionPhase::Closing;
        std::weak_ptr<ConnectionContext> weak = connection;
        networkPal_.asyncWrite(connection->socket, data,
            [this, weak](core::Result<size_t, pal::NetworkError>) {
                if (auto conn = weak.lock()) {
                    closeConnection(conn);
                }
            });
    }

    void closeConnection(const std::shared_ptr<ConnectionContext>& connection) {
        if (connection->closed.exchange(true)) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            connections_.erase(connection->socket.value);
        }
        networkPal_.closeSocket(connection->socket);
    }

    void closeAllConnections() {
        std::unordered_map<uint64_t, std::shared_ptr<ConnectionContext>> connections;
        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            connections.swap(connections_);
        }

        for (auto& entry : connections) {
            if (!entry.second->closed.exchange(true)) {
                networkPal_.closeSocket(entry.second->socket);
            }
        }
    }

    // -------------------------------------------------------------------------
    // Upgrade
    // -------------------------------------------------------------------------

    void upgrade(
        const std::shared_ptr<ConnectionContext>& connection,
        const std::string& userAgent,
        std::string rawRequest
    ) {
        connection->phase = ConnectionPhase::Upgraded;
        connection->closed = true;
        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            connections_.erase(connection->socket.value);
        }

        auto released = networkPal_.releaseSocket(connection->socket);
        if (released.isError()) {
            MEDIARELAY_LOG_WARNING(logger_, LOG_CATEGORY,
                "Cannot hand over connection from " + connection->info.ip + ": " +
                released.error().message);
            networkPal_.closeSocket(connection->socket);
            return;
        }
        const int fd = released.value();

        auto clientId = generateClientId();
        if (!clientId) {
            MEDIARELAY_LOG_ERROR(logger_, LOG_CATEGORY,
                "Random source unavailable, rejecting connection");
            ::close(fd);
            return;
        }

        tcp::socket socket(asio::make_strand(ioContext_));
        boost::system::error_code ec;
        socket.assign(tcp::v4(), fd, ec);
        if (ec) {
            MEDIARELAY_LOG_ERROR(logger_, LOG_CATEGORY,
                "Cannot adopt connection from " + connection->info.ip + ": " + ec.message());
            ::close(fd);
            return;
        }

        auto client = std::make_shared<ClientConnection>();
        client->clientId = *clientId;
        client->info = connection->info;
        client->info.userAgent = userAgent;
        client->executor = std::make_shared<core::SerialExecutor>(threadPal_, workerPool_, logger_);

        std::weak_ptr<ClientConnection> weak = client;
        protocol::WebSocketHandlers handlers;
        handlers.onOpen = [this, weak]() {
            if (auto c = weak.lock()) {
                registerClient(c);
            }
        };
        handlers.onText = [this, weak](std::string text) {
            if (auto c = weak.lock()) {
                handleText(c, std::move(text));
            }
        };
        handlers.onClosed = [this, weak]() {
            if (auto c = weak.lock()) {
                closeClient(c);
            }
        };
        client->session = std::make_shared<protocol::WebSocketSession>(
            std::move(socket), std::move(handlers), logger_);

        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            if (stopping_) {
                // The session closes its socket when it goes away
                return;
            }
            clientConnections_[client->clientId] = client;
        }

        client->session->accept(std::move(rawRequest));
    }

    // -------------------------------------------------------------------------
    // Signaling clients
    // -------------------------------------------------------------------------

    void registerClient(const std::shared_ptr<ClientConnection>& client) {
        std::weak_ptr<ClientConnection> weak = client;
        session::EventSink sink = [weak](const std::string& event, const core::JsonValue& data) {
            if (auto c = weak.lock()) {
                c->session->sendText(protocol::serializeEvent(event, data));
            }
        };

        core::Result<void, pal::ThreadError> posted = core::Result<void, pal::ThreadError>::success();
        {
            std::lock_guard<std::mutex> lock(client->mutex);
            if (client->closed) {
                return;
            }
            core::ClientId clientId = client->clientId;
            core::ClientInfo info = client->info;
            posted = client->executor->post([this, clientId, info, sink]() {
                if (!handler_->onConnect(clientId, info, sink)) {
                    MEDIARELAY_LOG_WARNING(logger_, LOG_CATEGORY,
                        "Duplicate client id " + clientId);
                }
            });
            client->registered = posted.isSuccess();
        }

        if (posted.isError()) {
            MEDIARELAY_LOG_ERROR(logger_, LOG_CATEGORY,
                "Cannot schedule client registration: " + posted.error().message);
            client->session->close(protocol::websocket::CLOSE_GOING_AWAY, "Server busy");
        }
    }

    void handleText(const std::shared_ptr<ClientConnection>& client, std::string text) {
        {
            std::lock_guard<std::mutex> lock(client->mutex);
            if (!client->registered || client->closed) {
                return;
            }
        }

        core::ClientId clientId = client->clientId;
        std::weak_ptr<ClientConnection> weak = client;
        auto posted = client->executor->post(
            [this, clientId, weak, text = std::move(text)]() {
                auto reply = handler_->handleText(clientId, text);
                auto c = weak.lock();
                if (reply && c) {
                    c->session->sendText(*reply);
                }
            });
        if (posted.isError()) {
            MEDIARELAY_LOG_WARNING(logger_, LOG_CATEGORY,
                "Dropping connection " + clientId + ": " + posted.error().message);
            client->session->close(protocol::websocket::CLOSE_GOING_AWAY, "Server busy");
        }
    }

    /**
     * @brief Mark the client closed; true when it had been registered.
     */
    static std::optional<bool> markClosed(ClientConnection& client) {
        std::lock_guard<std::mutex> lock(client.mutex);
        if (client.closed) {
            return std::nullopt;
        }
        client.closed = true;
        return client.registered;
    }

    void closeClient(const std::shared_ptr<ClientConnection>& client) {
        auto wasRegistered = markClosed(*client);
        if (!wasRegistered) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            auto it = clientConnections_.find(client->clientId);
            if (it != clientConnections_.end() && it->second == client) {
                clientConnections_.erase(it);
            }
        }

        if (*wasRegistered) {
            disconnectClient(client);
        }
        MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY, "Connection closed: " + client->clientId);
    }

    void disconnectClient(const std::shared_ptr<ClientConnection>& client) {
        core::ClientId clientId = client->clientId;
        auto posted = client->executor->post([this, clientId]() {
            handler_->onDisconnect(clientId);
        });
        client->executor->close();

        if (posted.isError()) {
            // Pool is gone; nothing else runs for this client any more
            handler_->onDisconnect(clientId);
        }
    }

    void closeAllClients() {
        std::unordered_map<core::ClientId, std::shared_ptr<ClientConnection>> clients;
        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            stopping_ = true;
            clients.swap(clientConnections_);
        }

        for (auto& entry : clients) {
            auto& client = entry.second;
            auto wasRegistered = markClosed(*client);
            if (wasRegistered && *wasRegistered) {
                disconnectClient(client);
            }
            client->session->shutdown();
        }
    }

    // -------------------------------------------------------------------------
    // Engine and recording
    // -------------------------------------------------------------------------

    std::shared_ptr<streaming::RecordingBridge> createRecorder(const core::StreamKey& streamKey) {
        streaming::RecordingEnvironment environment;
        environment.engine = engine_.get();
        environment.processes = &processPal_;
        environment.threads = &threadPal_;
        environment.timers = &timerPal_;
        environment.portWatcher = portWatcher_.get();
        environment.ports = encoderPorts_.get();
        environment.config = config_.recording;
        environment.playbackPathPrefix = config_.playback.pathPrefix;
        environment.logger = logger_;
        return streaming::RecordingBridge::create(streamKey, std::move(environment));
    }

    void onEngineFatal(const std::string& reason) {
        if (logger_) {
            core::LogContext context;
            context.errorCode = static_cast<int32_t>(core::ErrorCode::EngineUnavailable);
            logger_->errorWithContext("Media engine failed: " + reason, context, "Engine");
        }

        FatalErrorCallback callback;
        {
            std::lock_guard<std::mutex> lock(fatalMutex_);
            callback = fatalCallback_;
        }
        if (callback) {
            callback(reason);
        }
    }

    // -------------------------------------------------------------------------
    // Members (declaration order is teardown order, reversed)
    // -------------------------------------------------------------------------

    mutable std::shared_mutex stateMutex_;
    ServerState state_ = ServerState::Uninitialized;
    core::Configuration config_;
    std::shared_ptr<core::StructuredLogger> logger_;

    pal::linux::LinuxNetworkPAL networkPal_;
    pal::linux::LinuxThreadPAL threadPal_;
    pal::linux::LinuxTimerPAL timerPal_;
    pal::linux::LinuxProcessPAL processPal_;
    pal::ThreadPoolHandle workerPool_{pal::INVALID_THREAD_POOL_HANDLE};

    std::shared_ptr<engine::LocalRouter> router_;
    std::unique_ptr<engine::EngineFacade> engine_;
    session::SessionRegistry sessions_;
    session::ClientRegistry clients_;
    std::unique_ptr<streaming::UdpPortWatcher> portWatcher_;
    std::unique_ptr<streaming::EncoderPortPool> encoderPorts_;
    std::unique_ptr<streaming::StreamLifecycleManager> streams_;
    std::unique_ptr<protocol::SignalingHandler> handler_;
    std::unique_ptr<protocol::PlaybackResolver> playback_;

    pal::ServerSocket serverSocket_;
    std::thread eventLoopThread_;

    // Sessions are bound to the context, so it outlives the client table
    asio::io_context ioContext_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> ioWork_;
    std::thread ioThread_;

    mutable std::mutex connectionsMutex_;
    std::unordered_map<uint64_t, std::shared_ptr<ConnectionContext>> connections_;
    std::unordered_map<core::ClientId, std::shared_ptr<ClientConnection>> clientConnections_;
    bool stopping_ = false;

    std::mutex fatalMutex_;
    FatalErrorCallback fatalCallback_;
};

// =============================================================================
// SignalingServer Public Interface
// =============================================================================

SignalingServer::SignalingServer()
    : impl_(std::make_unique<Impl>()) {}

SignalingServer::~SignalingServer() = default;

core::Result<void, ServerError> SignalingServer::initialize(
    const core::Configuration& config,
    std::shared_ptr<core::StructuredLogger> logger
) {
    return impl_->initialize(config, std::move(logger));
}

core::Result<void, ServerError> SignalingServer::start() {
    return impl_->start();
}

core::Result<void, ServerError> SignalingServer::stop() {
    return impl_->stop();
}

ServerState SignalingServer::state() const {
    return impl_->state();
}

uint16_t SignalingServer::port() const {
    return impl_->port();
}

size_t SignalingServer::connectionCount() const {
    return impl_->connectionCount();
}

void SignalingServer::setFatalErrorCallback(FatalErrorCallback callback) {
    impl_->setFatalErrorCallback(std::move(callback));
}

} // namespace api
} // namespace mediarelay
