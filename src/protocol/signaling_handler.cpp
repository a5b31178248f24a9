// MediaRelay - WebRTC SFU Signaling Server
// Signaling Handler Implementation
//
// Ordering defence: every method checks that the client has done the steps
// it depends on and answers PreconditionFailed otherwise:
// - setRtpCapabilities needs rtpCapabilities
// - consume needs setRtpCapabilities and a consuming transport
// - produce needs a producing transport
// - connect*Transport needs the transport

#include "mediarelay/protocol/signaling_handler.hpp"

#include "mediarelay/protocol/signaling_message.hpp"

#include <exception>

namespace mediarelay {
namespace protocol {

namespace {

const char* LOG_CATEGORY = "Signaling";

core::Error precondition(const std::string& message) {
    return core::Error{core::ErrorCode::PreconditionFailed, message};
}

core::Error invalidArgument(const std::string& message) {
    return core::Error{core::ErrorCode::InvalidArgument, message};
}

} // namespace

SignalingHandler::SignalingHandler(
    session::ISessionRegistry& sessions,
    session::ClientRegistry& clients,
    engine::EngineFacade& engine,
    streaming::IStreamLifecycleManager& streams,
    std::shared_ptr<core::StructuredLogger> logger
)
    : sessions_(sessions)
    , clients_(clients)
    , engine_(engine)
    , streams_(streams)
    , logger_(std::move(logger))
{
}

// =============================================================================
// Client Lifecycle
// =============================================================================

bool SignalingHandler::onConnect(
    const core::ClientId& clientId,
    const core::ClientInfo& info,
    session::EventSink sink
) {
    if (!clients_.add(clientId, std::move(sink))) {
        MEDIARELAY_LOG_WARNING(logger_, LOG_CATEGORY, "Duplicate client id " + clientId);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(infoMutex_);
        clientInfo_[clientId] = info;
    }

    if (logger_) {
        logger_->logConnectionEvent(core::ConnectionEventType::Connected, clientId, info);
    }

    core::JsonValue connected = core::JsonValue::object();
    connected.set("clientId", clientId);
    clients_.sendTo(clientId, "connected", connected);
    return true;
}

void SignalingHandler::onDisconnect(const core::ClientId& clientId) {
    clients_.remove(clientId);

    session::RemovedResources removed = sessions_.removeAllForClient(clientId);
    releaseRemoved(removed);

    streams_.removeClient(clientId);

    if (removed.producer) {
        core::JsonValue closed = core::JsonValue::object();
        closed.set("producerId", removed.producer->producerId);
        clients_.publish("producerClosed", closed, clientId);
    }

    core::ClientInfo info = clientInfo(clientId);
    {
        std::lock_guard<std::mutex> lock(infoMutex_);
        clientInfo_.erase(clientId);
    }
    if (logger_) {
        logger_->logConnectionEvent(core::ConnectionEventType::Disconnected, clientId, info);
    }
}

void SignalingHandler::releaseRemoved(const session::RemovedResources& removed) {
    for (const auto& consumer : removed.orphanedConsumers) {
        MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY,
            "Releasing consumer " + consumer.consumerId + " of " + consumer.clientId +
            " whose producer left");
        engine_.closeConsumer(consumer.consumerId);
    }
    for (const auto& consumer : removed.consumers) {
        engine_.closeConsumer(consumer.consumerId);
    }
    if (removed.producer) {
        engine_.closeProducer(removed.producer->producerId);
    }
    for (const auto& transport : removed.transports) {
        engine_.closeTransport(transport.id);
    }
}

core::ClientInfo SignalingHandler::clientInfo(const core::ClientId& clientId) {
    std::lock_guard<std::mutex> lock(infoMutex_);
    auto it = clientInfo_.find(clientId);
    return it == clientInfo_.end() ? core::ClientInfo{} : it->second;
}

// =============================================================================
// Message Entry Points
// =============================================================================

std::optional<std::string> SignalingHandler::handleText(
    const core::ClientId& clientId,
    const std::string& text
) {
    int64_t requestId = -1;
    auto parsed = parseSignalingMessage(text, &requestId);
    if (parsed.isError()) {
        MEDIARELAY_LOG_WARNING(logger_, LOG_CATEGORY,
            "Bad message from " + clientId + ": " + parsed.error().message);
        if (requestId >= 0) {
            return serializeErrorResponse(requestId, parsed.error());
        }
        return std::nullopt;
    }

    const SignalingMessage& message = parsed.value();
    switch (message.type) {
        case MessageType::Request: {
            auto result = dispatch(clientId, message.method, message.data, false);
            if (result.isError()) {
                return serializeErrorResponse(message.id, result.error());
            }
            return serializeResponse(message.id, result.value());
        }
        case MessageType::Notify: {
            auto result = dispatch(clientId, message.method, message.data, true);
            if (result.isError()) {
                MEDIARELAY_LOG_WARNING(logger_, LOG_CATEGORY,
                    "Notification " + message.method + " from " + clientId + " failed: " +
                    result.error().toString());
            }
            return std::nullopt;
        }
        case MessageType::Response:
        case MessageType::Event:
            MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY,
                std::string("Ignoring ") + messageTypeToString(message.type) + " from " + clientId);
            return std::nullopt;
    }
    return std::nullopt;
}

core::Result<core::JsonValue, core::Error> SignalingHandler::handleRequest(
    const core::ClientId& clientId,
    const std::string& method,
    const core::JsonValue& data
) {
    return dispatch(clientId, method, data, false);
}

SignalingHandler::MethodResult SignalingHandler::dispatch(
    const core::ClientId& clientId,
    const std::string& method,
    const core::JsonValue& data,
    bool isNotify
) {
    MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY, method + " from " + clientId);

    try {
        if (method == "rtpCapabilities") {
            return handleRtpCapabilities(clientId);
        } else if (method == "setRtpCapabilities") {
            auto result = handleSetRtpCapabilities(clientId, data);
            if (result.isSuccess() && isNotify) {
                return MethodResult::success(core::JsonValue());
            }
            return result;
        } else if (method == "createProducerTransport") {
            return handleCreateTransport(clientId, core::TransportRole::Producing);
        } else if (method == "createConsumerTransport") {
            return handleCreateTransport(clientId, core::TransportRole::Consuming);
        } else if (method == "connectProducerTransport") {
            return handleConnectTransport(clientId, core::TransportRole::Producing, data);
        } else if (method == "connectConsumerTransport") {
            return handleConnectTransport(clientId, core::TransportRole::Consuming, data);
        } else if (method == "produce") {
            return handleProduce(clientId, data);
        } else if (method == "consume") {
            return handleConsume(clientId, data);
        } else if (method == "resumeConsumer") {
            return handleResumeConsumer(clientId, data);
        } else if (method == "getProducers") {
            return handleGetProducers(clientId);
        } else if (method == "startHLSStream") {
            return handleStartStream(clientId, data);
        } else if (method == "stopHLSStream") {
            return handleStopStream(clientId, data);
        } else if (method == "getActiveStreams") {
            return handleGetActiveStreams();
        } else if (method == "healthCheck") {
            return handleHealthCheck();
        }
    } catch (const std::exception& e) {
        MEDIARELAY_LOG_ERROR(logger_, LOG_CATEGORY,
            method + " from " + clientId + " raised: " + e.what());
        return MethodResult::error(core::Error{core::ErrorCode::Internal, e.what()});
    }

    return MethodResult::error(core::Error{core::ErrorCode::NotFound, "Unknown method " + method});
}

// =============================================================================
// Capabilities
// =============================================================================

SignalingHandler::MethodResult SignalingHandler::handleRtpCapabilities(const core::ClientId& clientId) {
    auto capabilities = engine_.negotiateCapabilities();
    if (capabilities.isError()) {
        return MethodResult::error(capabilities.error());
    }

    sessions_.markCapabilitiesRequested(clientId);

    core::JsonValue payload = core::JsonValue::object();
    payload.set("rtpCapabilities", engine::toJson(capabilities.value()));
    return MethodResult::success(std::move(payload));
}

SignalingHandler::MethodResult SignalingHandler::handleSetRtpCapabilities(
    const core::ClientId& clientId,
    const core::JsonValue& data
) {
    if (!sessions_.capabilitiesRequested(clientId)) {
        return MethodResult::error(precondition("setRtpCapabilities before rtpCapabilities"));
    }

    // Accept both {rtpCapabilities: {...}} and the bare capabilities object
    const core::JsonValue& source = data.contains("rtpCapabilities") ? data["rtpCapabilities"] : data;
    auto capabilities = engine::rtpCapabilitiesFromJson(source);
    if (capabilities.isError()) {
        return MethodResult::error(capabilities.error());
    }

    sessions_.setCapabilities(clientId, capabilities.value());
    return MethodResult::success(successPayload());
}

// =============================================================================
// Transports
// =============================================================================

SignalingHandler::MethodResult SignalingHandler::handleCreateTransport(
    const core::ClientId& clientId,
    core::TransportRole role
) {
    if (sessions_.findTransport(clientId, role).isSuccess()) {
        return MethodResult::error(core::Error{core::ErrorCode::Conflict,
            std::string("A ") + core::transportRoleToString(role) + " transport already exists"});
    }

    auto transport = engine_.openTransport(role);
    if (transport.isError()) {
        return MethodResult::error(transport.error());
    }

    session::TransportRecord record;
    record.id = transport.value().id;
    record.role = role;
    record.clientId = clientId;
    auto stored = sessions_.upsertTransport(record);
    if (stored.isError()) {
        engine_.closeTransport(record.id);
        return MethodResult::error(session::toError(stored.error()));
    }

    MEDIARELAY_LOG_INFO(logger_, LOG_CATEGORY,
        std::string("Created ") + core::transportRoleToString(role) + " transport " + record.id +
        " for " + clientId);
    return MethodResult::success(engine::toJson(transport.value()));
}

SignalingHandler::MethodResult SignalingHandler::handleConnectTransport(
    const core::ClientId& clientId,
    core::TransportRole role,
    const core::JsonValue& data
) {
    if (!data["dtlsParameters"].isObject()) {
        return MethodResult::error(invalidArgument("dtlsParameters required"));
    }

    auto transport = sessions_.findTransport(clientId, role);
    if (transport.isError()) {
        return MethodResult::error(precondition(
            std::string("No ") + core::transportRoleToString(role) + " transport to connect"));
    }

    auto dtls = engine::dtlsParametersFromJson(data["dtlsParameters"]);
    if (dtls.isError()) {
        return MethodResult::error(dtls.error());
    }

    auto connected = engine_.connectTransport(transport.value().id, dtls.value());
    if (connected.isError()) {
        return MethodResult::error(connected.error());
    }
    return MethodResult::success(successPayload());
}

// =============================================================================
// Produce / Consume
// =============================================================================

SignalingHandler::MethodResult SignalingHandler::handleProduce(
    const core::ClientId& clientId,
    const core::JsonValue& data
) {
    auto kind = core::parseMediaKind(data["kind"].getString());
    if (!kind) {
        return MethodResult::error(invalidArgument("kind must be audio or video"));
    }
    if (!data["rtpParameters"].isObject()) {
        return MethodResult::error(invalidArgument("rtpParameters required"));
    }

    auto transport = sessions_.findTransport(clientId, core::TransportRole::Producing);
    if (transport.isError()) {
        return MethodResult::error(precondition("produce without a producing transport"));
    }
    if (sessions_.findProducer(clientId).isSuccess()) {
        return MethodResult::error(core::Error{core::ErrorCode::Conflict, "Client already produces"});
    }

    auto parameters = engine::rtpParametersFromJson(data["rtpParameters"]);
    if (parameters.isError()) {
        return MethodResult::error(parameters.error());
    }

    auto producer = engine_.produce(transport.value().id, *kind, parameters.value());
    if (producer.isError()) {
        return MethodResult::error(producer.error());
    }

    session::ProducerRecord record;
    record.producerId = producer.value().id;
    record.kind = *kind;
    record.clientId = clientId;
    auto stored = sessions_.upsertProducer(record);
    if (stored.isError()) {
        engine_.closeProducer(record.producerId);
        return MethodResult::error(session::toError(stored.error()));
    }

    MEDIARELAY_LOG_INFO(logger_, LOG_CATEGORY,
        std::string("Producer ") + record.producerId + " (" + core::mediaKindToString(*kind) +
        ") created for " + clientId);

    core::JsonValue announcement = core::JsonValue::object();
    announcement.set("producerId", record.producerId);
    announcement.set("clientId", clientId);
    clients_.publish("newProducer", announcement, clientId);

    core::JsonValue payload = core::JsonValue::object();
    payload.set("id", record.producerId);
    return MethodResult::success(std::move(payload));
}

SignalingHandler::MethodResult SignalingHandler::handleConsume(
    const core::ClientId& clientId,
    const core::JsonValue& data
) {
    const std::string producerId = data["producerId"].getString();
    if (producerId.empty()) {
        return MethodResult::error(invalidArgument("producerId required"));
    }

    auto capabilities = sessions_.capabilities(clientId);
    if (capabilities.isError()) {
        return MethodResult::error(precondition("consume before setRtpCapabilities"));
    }

    auto transport = sessions_.findTransport(clientId, core::TransportRole::Consuming);
    if (transport.isError()) {
        return MethodResult::error(precondition("consume without a consuming transport"));
    }

    if (sessions_.findProducerById(producerId).isError()) {
        return MethodResult::error(core::Error{core::ErrorCode::NotFound, "Producer not found"});
    }

    auto consumer = engine_.consume(transport.value().id, producerId, capabilities.value());
    if (consumer.isError()) {
        return MethodResult::error(consumer.error());
    }

    session::ConsumerRecord record;
    record.consumerId = consumer.value().id;
    record.producerId = producerId;
    record.clientId = clientId;
    record.kind = consumer.value().kind;
    record.paused = consumer.value().paused;
    auto stored = sessions_.upsertConsumer(record);
    if (stored.isError()) {
        engine_.closeConsumer(record.consumerId);
        return MethodResult::error(session::toError(stored.error()));
    }

    // The producer's owner may have left while the engine was busy; its
    // cleanup either took this record as orphan or ran before the upsert
    if (sessions_.findProducerById(producerId).isError()) {
        if (sessions_.releaseConsumer(clientId, record.consumerId).isSuccess()) {
            engine_.closeConsumer(record.consumerId);
        }
        return MethodResult::error(core::Error{core::ErrorCode::NotFound, "Producer closed"});
    }

    core::JsonValue payload = core::JsonValue::object();
    payload.set("id", record.consumerId);
    payload.set("producerId", producerId);
    payload.set("kind", core::mediaKindToString(record.kind));
    payload.set("rtpParameters", engine::toJson(consumer.value().rtpParameters));
    return MethodResult::success(std::move(payload));
}

SignalingHandler::MethodResult SignalingHandler::handleResumeConsumer(
    const core::ClientId& clientId,
    const core::JsonValue& data
) {
    const std::string consumerId = data["consumerId"].getString();
    if (consumerId.empty()) {
        return MethodResult::error(invalidArgument("consumerId required"));
    }

    auto consumer = sessions_.findConsumer(clientId, consumerId);
    if (consumer.isError()) {
        return MethodResult::error(core::Error{core::ErrorCode::NotFound, "Consumer not found"});
    }

    auto resumed = engine_.resumeConsumer(consumerId);
    if (resumed.isError()) {
        return MethodResult::error(resumed.error());
    }

    auto updated = sessions_.setConsumerPaused(clientId, consumerId, false);
    if (updated.isError()) {
        return MethodResult::error(session::toError(updated.error()));
    }

    MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY, "Consumer " + consumerId + " resumed for " + clientId);
    return MethodResult::success(successPayload());
}

SignalingHandler::MethodResult SignalingHandler::handleGetProducers(const core::ClientId& clientId) {
    core::JsonValue list = core::JsonValue::array();
    for (const auto& producer : sessions_.listProducersExcluding(clientId)) {
        core::JsonValue entry = core::JsonValue::object();
        entry.set("producerId", producer.producerId);
        entry.set("clientId", producer.clientId);
        list.push(std::move(entry));
    }

    core::JsonValue payload = core::JsonValue::object();
    payload.set("producerList", std::move(list));
    return MethodResult::success(std::move(payload));
}

// =============================================================================
// Broadcast
// =============================================================================

SignalingHandler::MethodResult SignalingHandler::handleStartStream(
    const core::ClientId& clientId,
    const core::JsonValue& data
) {
    const core::JsonValue& requested = data["streamId"];
    if (!requested.isNull() && !requested.isString()) {
        return MethodResult::error(invalidArgument("streamId must be a string"));
    }

    auto started = streams_.startBroadcast(requested.getString(), clientId);
    if (started.isError()) {
        return MethodResult::error(started.error());
    }

    const streaming::BroadcastResult& broadcast = started.value();
    if (logger_) {
        logger_->logConnectionEvent(core::ConnectionEventType::BroadcastStart, clientId,
                                    clientInfo(clientId), broadcast.streamKey);
    }

    core::JsonValue payload = core::JsonValue::object();
    payload.set("success", true);
    payload.set("streamId", broadcast.streamKey);
    if (!broadcast.playbackUrl.empty()) {
        payload.set("playlistUrl", broadcast.playbackUrl);
    }
    return MethodResult::success(std::move(payload));
}

SignalingHandler::MethodResult SignalingHandler::handleStopStream(
    const core::ClientId& clientId,
    const core::JsonValue& data
) {
    const std::string streamKey = data["streamId"].getString();
    if (streamKey.empty()) {
        return MethodResult::error(invalidArgument("streamId required"));
    }

    auto stopped = streams_.stopBroadcast(streamKey, clientId);
    if (stopped.isError()) {
        return MethodResult::error(stopped.error());
    }

    if (logger_) {
        logger_->logConnectionEvent(core::ConnectionEventType::BroadcastStop, clientId,
                                    clientInfo(clientId), streamKey);
    }
    return MethodResult::success(successPayload());
}

SignalingHandler::MethodResult SignalingHandler::handleGetActiveStreams() {
    core::JsonValue list = core::JsonValue::array();
    for (const auto& stream : streams_.activeStreams()) {
        core::JsonValue streamers = core::JsonValue::array();
        for (const auto& member : stream.members) {
            streamers.push(member);
        }

        core::JsonValue entry = core::JsonValue::object();
        entry.set("streamId", stream.streamKey);
        if (!stream.playbackUrl.empty()) {
            entry.set("playlistUrl", stream.playbackUrl);
        }
        entry.set("streamers", std::move(streamers));
        entry.set("isLive", stream.isLive);
        list.push(std::move(entry));
    }

    core::JsonValue payload = core::JsonValue::object();
    payload.set("streams", std::move(list));
    return MethodResult::success(std::move(payload));
}

SignalingHandler::MethodResult SignalingHandler::handleHealthCheck() {
    core::JsonValue payload = core::JsonValue::object();
    payload.set("status", "ok");
    payload.set("clients", static_cast<unsigned long long>(clients_.count()));
    payload.set("producers", static_cast<unsigned long long>(sessions_.producerCount()));
    payload.set("streams", static_cast<unsigned long long>(streams_.streamCount()));
    return MethodResult::success(std::move(payload));
}

core::JsonValue SignalingHandler::successPayload() {
    core::JsonValue payload = core::JsonValue::object();
    payload.set("success", true);
    return payload;
}

} // namespace protocol
} // namespace mediarelay
