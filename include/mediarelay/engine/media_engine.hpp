// MediaRelay - WebRTC SFU Signaling Server
// Media Engine Interface - capability surface of the SFU engine
//
// The engine owns ICE/DTLS negotiation and RTP forwarding. The signaling
// layer only creates, connects, and releases engine resources through this
// interface and never looks at media.

#ifndef MEDIARELAY_ENGINE_MEDIA_ENGINE_HPP
#define MEDIARELAY_ENGINE_MEDIA_ENGINE_HPP

#include <functional>
#include <string>

#include "mediarelay/core/result.hpp"
#include "mediarelay/core/types.hpp"
#include "mediarelay/engine/rtp_capabilities.hpp"

namespace mediarelay {
namespace engine {

// =============================================================================
// Error Types
// =============================================================================

/**
 * @brief Media engine error information.
 */
struct EngineError {
    enum class Code {
        Unavailable,         ///< No routing context (router not created yet)
        NotFound,            ///< Unknown transport, producer or consumer id
        InvalidParameters,   ///< Parameters rejected by the engine
        InvalidState,        ///< Operation not allowed in the current state
        ResourceExhausted,   ///< No free port or similar
        Internal
    };

    Code code;
    std::string message;

    EngineError(Code c = Code::Internal, std::string msg = "")
        : code(c), message(std::move(msg)) {}
};

/**
 * @brief Invoked once when the engine worker dies. The process is expected
 *        to exit; the engine is never restarted.
 */
using EngineFatalErrorHandler = std::function<void(const std::string& reason)>;

// =============================================================================
// Media Engine Interface
// =============================================================================

class IMediaEngine {
public:
    virtual ~IMediaEngine() = default;

    /**
     * @brief Whether the routing context exists.
     */
    virtual bool isReady() const = 0;

    /**
     * @brief RTP capabilities of the router.
     * @return Capabilities, or Unavailable before the router exists
     */
    virtual core::Result<RtpCapabilities, EngineError> routerCapabilities() const = 0;

    // -------------------------------------------------------------------------
    // WebRTC Transports
    // -------------------------------------------------------------------------

    virtual core::Result<TransportHandle, EngineError> createWebRtcTransport(
        core::TransportRole role
    ) = 0;

    virtual core::Result<void, EngineError> connectTransport(
        const core::TransportId& transportId,
        const DtlsParameters& dtlsParameters
    ) = 0;

    // -------------------------------------------------------------------------
    // Producers and Consumers
    // -------------------------------------------------------------------------

    virtual core::Result<ProducerHandle, EngineError> produce(
        const core::TransportId& transportId,
        core::MediaKind kind,
        const RtpParameters& rtpParameters
    ) = 0;

    virtual core::Result<void, EngineError> resumeProducer(const core::ProducerId& producerId) = 0;

    /**
     * @brief Current state of a producer, used for capability checks.
     */
    virtual core::Result<ProducerHandle, EngineError> findProducer(
        const core::ProducerId& producerId
    ) const = 0;

    virtual core::Result<ConsumerHandle, EngineError> consume(
        const core::TransportId& transportId,
        const core::ProducerId& producerId,
        const RtpCapabilities& capabilities,
        bool paused
    ) = 0;

    virtual core::Result<void, EngineError> resumeConsumer(const core::ConsumerId& consumerId) = 0;

    // -------------------------------------------------------------------------
    // Plain RTP Transports
    // -------------------------------------------------------------------------

    /**
     * @brief Plain RTP transport listening on listenIp; rtcpMux off, comedia,
     *        no SRTP.
     */
    virtual core::Result<PassiveTap, EngineError> createPlainTransport(const std::string& listenIp) = 0;

    /**
     * @brief Point a plain transport at its remote RTP endpoint.
     */
    virtual core::Result<void, EngineError> connectPlainTransport(
        const core::TransportId& transportId,
        const std::string& ip,
        uint16_t port
    ) = 0;

    // -------------------------------------------------------------------------
    // Release
    // -------------------------------------------------------------------------

    /**
     * @brief Close a transport together with its producers and consumers.
     */
    virtual core::Result<void, EngineError> closeTransport(const core::TransportId& transportId) = 0;

    /**
     * @brief Close a producer together with the consumers reading it.
     */
    virtual core::Result<void, EngineError> closeProducer(const core::ProducerId& producerId) = 0;

    virtual core::Result<void, EngineError> closeConsumer(const core::ConsumerId& consumerId) = 0;

    virtual void setFatalErrorHandler(EngineFatalErrorHandler handler) = 0;
};

} // namespace engine
} // namespace mediarelay

#endif // MEDIARELAY_ENGINE_MEDIA_ENGINE_HPP
