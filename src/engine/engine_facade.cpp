// MediaRelay - WebRTC SFU Signaling Server
// Engine Facade Implementation

#include "mediarelay/engine/engine_facade.hpp"

namespace mediarelay {
namespace engine {

namespace {
const char* LOG_CATEGORY = "Engine";
}

EngineFacade::EngineFacade(
    std::shared_ptr<IMediaEngine> engine,
    std::shared_ptr<core::StructuredLogger> logger
)
    : engine_(std::move(engine))
    , logger_(std::move(logger))
{
}

// =============================================================================
// Client Operations
// =============================================================================

core::Result<RtpCapabilities, core::Error> EngineFacade::negotiateCapabilities() const {
    if (!engine_ || !engine_->isReady()) {
        return core::Result<RtpCapabilities, core::Error>::error(
            core::Error(core::ErrorCode::EngineUnavailable, "Router is not initialized"));
    }

    auto result = engine_->routerCapabilities();
    if (result.isError()) {
        return core::Result<RtpCapabilities, core::Error>::error(
            translate(result.error(), core::ErrorCode::EngineUnavailable));
    }
    return core::Result<RtpCapabilities, core::Error>::success(std::move(result).value());
}

core::Result<TransportHandle, core::Error> EngineFacade::openTransport(core::TransportRole role) {
    if (!engine_ || !engine_->isReady()) {
        return core::Result<TransportHandle, core::Error>::error(
            core::Error(core::ErrorCode::EngineUnavailable, "Router is not initialized"));
    }

    auto result = engine_->createWebRtcTransport(role);
    if (result.isError()) {
        return core::Result<TransportHandle, core::Error>::error(
            translate(result.error(), core::ErrorCode::Internal));
    }

    MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY,
        std::string("Created ") + core::transportRoleToString(role) +
        " transport " + result.value().id);
    return core::Result<TransportHandle, core::Error>::success(std::move(result).value());
}

core::Result<void, core::Error> EngineFacade::connectTransport(
    const core::TransportId& transportId,
    const DtlsParameters& dtlsParameters
) {
    auto result = engine_->connectTransport(transportId, dtlsParameters);
    if (result.isError()) {
        return core::Result<void, core::Error>::error(
            translate(result.error(), core::ErrorCode::ConnectError));
    }
    return core::Result<void, core::Error>::success();
}

core::Result<ProducerHandle, core::Error> EngineFacade::produce(
    const core::TransportId& transportId,
    core::MediaKind kind,
    const RtpParameters& rtpParameters
) {
    auto result = engine_->produce(transportId, kind, rtpParameters);
    if (result.isError()) {
        return core::Result<ProducerHandle, core::Error>::error(
            translate(result.error(), core::ErrorCode::ProduceError));
    }

    ProducerHandle producer = std::move(result).value();
    if (producer.paused) {
        auto resumed = engine_->resumeProducer(producer.id);
        if (resumed.isError()) {
            closeProducer(producer.id);
            return core::Result<ProducerHandle, core::Error>::error(
                translate(resumed.error(), core::ErrorCode::ProduceError));
        }
        producer.paused = false;
        MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY, "Producer " + producer.id + " resumed");
    }

    return core::Result<ProducerHandle, core::Error>::success(std::move(producer));
}

bool EngineFacade::canConsume(
    const core::ProducerId& producerId,
    const RtpCapabilities& capabilities
) const {
    auto producer = engine_->findProducer(producerId);
    if (producer.isError()) {
        return false;
    }
    return engine::canConsume(producer.value().rtpParameters, capabilities);
}

core::Result<ConsumerHandle, core::Error> EngineFacade::consume(
    const core::TransportId& transportId,
    const core::ProducerId& producerId,
    const RtpCapabilities& capabilities
) {
    auto producer = engine_->findProducer(producerId);
    if (producer.isError()) {
        return core::Result<ConsumerHandle, core::Error>::error(
            core::Error(core::ErrorCode::NotFound, "Producer not found: " + producerId));
    }

    if (!engine::canConsume(producer.value().rtpParameters, capabilities)) {
        return core::Result<ConsumerHandle, core::Error>::error(
            core::Error(core::ErrorCode::ConsumeError,
                        "Cannot consume producer " + producerId + " with the given capabilities"));
    }

    auto result = engine_->consume(transportId, producerId, capabilities, true);
    if (result.isError()) {
        return core::Result<ConsumerHandle, core::Error>::error(
            translate(result.error(), core::ErrorCode::ConsumeError));
    }
    return core::Result<ConsumerHandle, core::Error>::success(std::move(result).value());
}

core::Result<void, core::Error> EngineFacade::resumeConsumer(const core::ConsumerId& consumerId) {
    auto result = engine_->resumeConsumer(consumerId);
    if (result.isError()) {
        return core::Result<void, core::Error>::error(
            translate(result.error(), core::ErrorCode::ConsumeError));
    }
    return core::Result<void, core::Error>::success();
}

// =============================================================================
// Recording Tap
// =============================================================================

core::Result<PassiveTap, core::Error> EngineFacade::openPassiveTap(const std::string& listenAddress) {
    if (!engine_ || !engine_->isReady()) {
        return core::Result<PassiveTap, core::Error>::error(
            core::Error(core::ErrorCode::EngineUnavailable, "Router is not initialized"));
    }

    auto result = engine_->createPlainTransport(listenAddress);
    if (result.isError()) {
        return core::Result<PassiveTap, core::Error>::error(
            translate(result.error(), core::ErrorCode::Internal));
    }
    return core::Result<PassiveTap, core::Error>::success(std::move(result).value());
}

core::Result<ConsumerHandle, core::Error> EngineFacade::tapConsume(
    const core::TransportId& tapTransportId,
    const core::ProducerId& producerId
) {
    auto capabilities = negotiateCapabilities();
    if (capabilities.isError()) {
        return core::Result<ConsumerHandle, core::Error>::error(capabilities.error());
    }

    auto result = engine_->consume(tapTransportId, producerId, capabilities.value(), true);
    if (result.isError()) {
        return core::Result<ConsumerHandle, core::Error>::error(
            translate(result.error(), core::ErrorCode::ConsumeError));
    }
    return core::Result<ConsumerHandle, core::Error>::success(std::move(result).value());
}

core::Result<void, core::Error> EngineFacade::connectTap(
    const core::TransportId& tapTransportId,
    const std::string& ip,
    uint16_t port
) {
    auto result = engine_->connectPlainTransport(tapTransportId, ip, port);
    if (result.isError()) {
        return core::Result<void, core::Error>::error(
            translate(result.error(), core::ErrorCode::ConnectError));
    }
    return core::Result<void, core::Error>::success();
}

// =============================================================================
// Release
// =============================================================================

void EngineFacade::closeTransport(const core::TransportId& transportId) {
    auto result = engine_->closeTransport(transportId);
    if (result.isError()) {
        logReleaseFailure("transport", transportId, result.error());
    }
}

void EngineFacade::closeProducer(const core::ProducerId& producerId) {
    auto result = engine_->closeProducer(producerId);
    if (result.isError()) {
        logReleaseFailure("producer", producerId, result.error());
    }
}

void EngineFacade::closeConsumer(const core::ConsumerId& consumerId) {
    auto result = engine_->closeConsumer(consumerId);
    if (result.isError()) {
        logReleaseFailure("consumer", consumerId, result.error());
    }
}

void EngineFacade::setFatalErrorHandler(EngineFatalErrorHandler handler) {
    engine_->setFatalErrorHandler(std::move(handler));
}

// =============================================================================
// Helpers
// =============================================================================

core::Error EngineFacade::translate(const EngineError& error, core::ErrorCode operationCode) {
    switch (error.code) {
        case EngineError::Code::Unavailable:
            return core::Error(core::ErrorCode::EngineUnavailable, error.message);
        case EngineError::Code::NotFound:
            return core::Error(core::ErrorCode::NotFound, error.message);
        default:
            return core::Error(operationCode, error.message);
    }
}

void EngineFacade::logReleaseFailure(
    const std::string& what,
    const std::string& id,
    const EngineError& error
) {
    // Closing something the engine already dropped (e.g. a consumer closed
    // with its producer) is expected during cleanup
    if (error.code == EngineError::Code::NotFound) {
        MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY, "Release of " + what + " " + id + ": already closed");
        return;
    }
    MEDIARELAY_LOG_WARNING(logger_, LOG_CATEGORY,
        "Failed to close " + what + " " + id + ": " + error.message);
}

} // namespace engine
} // namespace mediarelay
