// MediaRelay - WebRTC SFU Signaling Server
// Engine Facade - the operations the orchestration layer needs from the engine
//
// Responsibilities:
// - Translate engine errors into the signaling error taxonomy
// - Check canConsume itself before every consume; clients are not trusted
// - Resume producers the engine created paused
// - Release engine resources, logging instead of failing on release errors

#ifndef MEDIARELAY_ENGINE_ENGINE_FACADE_HPP
#define MEDIARELAY_ENGINE_ENGINE_FACADE_HPP

#include <memory>
#include <string>

#include "mediarelay/core/error_codes.hpp"
#include "mediarelay/core/result.hpp"
#include "mediarelay/core/structured_logger.hpp"
#include "mediarelay/engine/media_engine.hpp"

namespace mediarelay {
namespace engine {

/**
 * @brief Thin adapter over IMediaEngine.
 *
 * Every fallible operation returns core::Error with the code the signaling
 * boundary reports: EngineUnavailable when no router exists, NotFound for
 * unknown ids, otherwise the operation's own code (ConnectError,
 * ProduceError, ConsumeError).
 *
 * @code
 * EngineFacade facade(engine, logger);
 * auto transport = facade.openTransport(core::TransportRole::Consuming);
 * if (transport.isSuccess() && facade.canConsume(producerId, caps)) {
 *     auto consumer = facade.consume(transport.value().id, producerId, caps);
 * }
 * @endcode
 *
 * Thread Safety: the facade holds no state of its own; thread safety is that
 * of the wrapped engine.
 */
class EngineFacade {
public:
    explicit EngineFacade(
        std::shared_ptr<IMediaEngine> engine,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );

    EngineFacade(const EngineFacade&) = delete;
    EngineFacade& operator=(const EngineFacade&) = delete;

    // -------------------------------------------------------------------------
    // Client Operations
    // -------------------------------------------------------------------------

    core::Result<RtpCapabilities, core::Error> negotiateCapabilities() const;

    core::Result<TransportHandle, core::Error> openTransport(core::TransportRole role);

    core::Result<void, core::Error> connectTransport(
        const core::TransportId& transportId,
        const DtlsParameters& dtlsParameters
    );

    /**
     * @brief Create a producer; a producer the engine reports paused is
     *        resumed before returning.
     */
    core::Result<ProducerHandle, core::Error> produce(
        const core::TransportId& transportId,
        core::MediaKind kind,
        const RtpParameters& rtpParameters
    );

    /**
     * @brief Whether the producer exists and can be received with the given
     *        capabilities.
     */
    bool canConsume(const core::ProducerId& producerId, const RtpCapabilities& capabilities) const;

    /**
     * @brief Create a paused consumer after checking canConsume.
     *
     * Fails with NotFound for an unknown producer and with ConsumeError when
     * the capabilities cannot receive it; the engine is not asked in either
     * case.
     */
    core::Result<ConsumerHandle, core::Error> consume(
        const core::TransportId& transportId,
        const core::ProducerId& producerId,
        const RtpCapabilities& capabilities
    );

    core::Result<void, core::Error> resumeConsumer(const core::ConsumerId& consumerId);

    // -------------------------------------------------------------------------
    // Recording Tap
    // -------------------------------------------------------------------------

    core::Result<PassiveTap, core::Error> openPassiveTap(const std::string& listenAddress);

    /**
     * @brief Consume a producer on a tap transport with the router's own
     *        capabilities. The consumer starts paused.
     */
    core::Result<ConsumerHandle, core::Error> tapConsume(
        const core::TransportId& tapTransportId,
        const core::ProducerId& producerId
    );

    core::Result<void, core::Error> connectTap(
        const core::TransportId& tapTransportId,
        const std::string& ip,
        uint16_t port
    );

    // -------------------------------------------------------------------------
    // Release
    // -------------------------------------------------------------------------

    void closeTransport(const core::TransportId& transportId);
    void closeProducer(const core::ProducerId& producerId);
    void closeConsumer(const core::ConsumerId& consumerId);

    void setFatalErrorHandler(EngineFatalErrorHandler handler);

private:
    static core::Error translate(const EngineError& error, core::ErrorCode operationCode);

    void logReleaseFailure(const std::string& what, const std::string& id, const EngineError& error);

    std::shared_ptr<IMediaEngine> engine_;
    std::shared_ptr<core::StructuredLogger> logger_;
};

} // namespace engine
} // namespace mediarelay

#endif // MEDIARELAY_ENGINE_ENGINE_FACADE_HPP
