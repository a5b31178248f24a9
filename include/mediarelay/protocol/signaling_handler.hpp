// MediaRelay - WebRTC SFU Signaling Server
// Signaling Handler - Signaling method processing
//
// Drives creation and teardown of each client's transports, producer and
// consumers, and forwards broadcast control to the stream lifecycle manager.
//
// Methods:
//   rtpCapabilities, setRtpCapabilities, createProducerTransport,
//   createConsumerTransport, connectProducerTransport,
//   connectConsumerTransport, produce, consume, resumeConsumer,
//   getProducers, startHLSStream, stopHLSStream, getActiveStreams,
//   healthCheck
//
// Events:
//   connected, newProducer, producerClosed (+ streamLive, streamEnded from
//   the stream lifecycle manager)

#ifndef MEDIARELAY_PROTOCOL_SIGNALING_HANDLER_HPP
#define MEDIARELAY_PROTOCOL_SIGNALING_HANDLER_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "mediarelay/core/error_codes.hpp"
#include "mediarelay/core/json.hpp"
#include "mediarelay/core/result.hpp"
#include "mediarelay/core/structured_logger.hpp"
#include "mediarelay/core/types.hpp"
#include "mediarelay/engine/engine_facade.hpp"
#include "mediarelay/session/client_registry.hpp"
#include "mediarelay/session/session_registry.hpp"
#include "mediarelay/streaming/stream_lifecycle.hpp"

namespace mediarelay {
namespace protocol {

/**
 * @brief Processes signaling messages of connected clients.
 *
 * The handler is synchronous: every call completes the operation, including
 * engine calls, before returning. The caller runs all calls of one client
 * on that client's serial executor, so a client never has two operations
 * in flight and replies leave in request order; calls of different clients
 * run in parallel.
 *
 * @code
 * SignalingHandler handler(sessions, clients, engine, streams, logger);
 * handler.onConnect("c1", info, sink);
 * auto reply = handler.handleText("c1", R"({"type":"request","id":1,"method":"rtpCapabilities"})");
 * if (reply) { connection->sendText(*reply); }
 * handler.onDisconnect("c1");
 * @endcode
 */
class SignalingHandler {
public:
    SignalingHandler(
        session::ISessionRegistry& sessions,
        session::ClientRegistry& clients,
        engine::EngineFacade& engine,
        streaming::IStreamLifecycleManager& streams,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );

    SignalingHandler(const SignalingHandler&) = delete;
    SignalingHandler& operator=(const SignalingHandler&) = delete;

    /**
     * @brief Register a client and send it the connected event.
     * @return false if the id is already connected
     */
    bool onConnect(
        const core::ClientId& clientId,
        const core::ClientInfo& info,
        session::EventSink sink
    );

    /**
     * @brief Release everything the client holds.
     *
     * Order: registry records and their engine resources (including other
     * clients' consumers of its producer), then stream memberships, then
     * producerClosed to the remaining clients.
     */
    void onDisconnect(const core::ClientId& clientId);

    /**
     * @brief Handle one text frame.
     *
     * @return Serialized response for requests, nullopt for notifications
     *         and for frames that cannot be correlated with a request
     */
    std::optional<std::string> handleText(const core::ClientId& clientId, const std::string& text);

    /**
     * @brief Execute one method.
     */
    core::Result<core::JsonValue, core::Error> handleRequest(
        const core::ClientId& clientId,
        const std::string& method,
        const core::JsonValue& data
    );

private:
    using MethodResult = core::Result<core::JsonValue, core::Error>;

    MethodResult dispatch(
        const core::ClientId& clientId,
        const std::string& method,
        const core::JsonValue& data,
        bool isNotify
    );

    MethodResult handleRtpCapabilities(const core::ClientId& clientId);
    MethodResult handleSetRtpCapabilities(const core::ClientId& clientId, const core::JsonValue& data);
    MethodResult handleCreateTransport(const core::ClientId& clientId, core::TransportRole role);
    MethodResult handleConnectTransport(
        const core::ClientId& clientId,
        core::TransportRole role,
        const core::JsonValue& data
    );
    MethodResult handleProduce(const core::ClientId& clientId, const core::JsonValue& data);
    MethodResult handleConsume(const core::ClientId& clientId, const core::JsonValue& data);
    MethodResult handleResumeConsumer(const core::ClientId& clientId, const core::JsonValue& data);
    MethodResult handleGetProducers(const core::ClientId& clientId);
    MethodResult handleStartStream(const core::ClientId& clientId, const core::JsonValue& data);
    MethodResult handleStopStream(const core::ClientId& clientId, const core::JsonValue& data);
    MethodResult handleGetActiveStreams();
    MethodResult handleHealthCheck();

    void releaseRemoved(const session::RemovedResources& removed);

    core::ClientInfo clientInfo(const core::ClientId& clientId);

    static core::JsonValue successPayload();

    session::ISessionRegistry& sessions_;
    session::ClientRegistry& clients_;
    engine::EngineFacade& engine_;
    streaming::IStreamLifecycleManager& streams_;
    std::shared_ptr<core::StructuredLogger> logger_;

    std::mutex infoMutex_;
    std::map<core::ClientId, core::ClientInfo> clientInfo_;
};

} // namespace protocol
} // namespace mediarelay

#endif // MEDIARELAY_PROTOCOL_SIGNALING_HANDLER_HPP
