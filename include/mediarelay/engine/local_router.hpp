// MediaRelay - WebRTC SFU Signaling Server
// Local Router - in-process control plane of the media engine
//
// Responsibilities:
// - Own the router's codec table and DTLS identity
// - Reserve RTC ports by binding UDP sockets in the configured range
// - Build ICE parameters and host candidates for WebRTC transports
// - Validate DTLS and RTP parameters and track transports, producers and
//   consumers with their close cascades
// - Bind plain RTP transports for the recording tap

#ifndef MEDIARELAY_ENGINE_LOCAL_ROUTER_HPP
#define MEDIARELAY_ENGINE_LOCAL_ROUTER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "mediarelay/core/config_manager.hpp"
#include "mediarelay/core/structured_logger.hpp"
#include "mediarelay/engine/dtls_identity.hpp"
#include "mediarelay/engine/media_engine.hpp"
#include "mediarelay/pal/network_pal.hpp"

namespace mediarelay {
namespace engine {

/**
 * @brief IMediaEngine implementation that keeps the engine's resource model
 *        in process.
 *
 * Media forwarding itself is not done here. Each transport holds a bound UDP
 * socket so its announced port cannot be taken by anybody else while it is
 * alive.
 *
 * @code
 * LocalRouter router(config.engine, networkPal, logger);
 * auto init = router.initialize();
 * if (init.isError()) {
 *     // no router: negotiateCapabilities() reports EngineUnavailable
 * }
 * @endcode
 *
 * Thread Safety: all public methods are thread-safe.
 */
class LocalRouter : public IMediaEngine {
public:
    LocalRouter(
        core::EngineConfig config,
        pal::INetworkPAL& network,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );

    ~LocalRouter() override;

    LocalRouter(const LocalRouter&) = delete;
    LocalRouter& operator=(const LocalRouter&) = delete;

    /**
     * @brief Create the routing context: DTLS identity, announced address and
     *        codec table.
     */
    core::Result<void, EngineError> initialize();

    /**
     * @brief Close every transport and drop the routing context.
     */
    void close();

    [[nodiscard]] std::string announcedIp() const;
    [[nodiscard]] size_t transportCount() const;
    [[nodiscard]] size_t producerCount() const;
    [[nodiscard]] size_t consumerCount() const;

    // -------------------------------------------------------------------------
    // IMediaEngine
    // -------------------------------------------------------------------------

    bool isReady() const override;

    core::Result<RtpCapabilities, EngineError> routerCapabilities() const override;

    core::Result<TransportHandle, EngineError> createWebRtcTransport(
        core::TransportRole role
    ) override;

    core::Result<void, EngineError> connectTransport(
        const core::TransportId& transportId,
        const DtlsParameters& dtlsParameters
    ) override;

    core::Result<ProducerHandle, EngineError> produce(
        const core::TransportId& transportId,
        core::MediaKind kind,
        const RtpParameters& rtpParameters
    ) override;

    core::Result<void, EngineError> resumeProducer(const core::ProducerId& producerId) override;

    core::Result<ProducerHandle, EngineError> findProducer(
        const core::ProducerId& producerId
    ) const override;

    core::Result<ConsumerHandle, EngineError> consume(
        const core::TransportId& transportId,
        const core::ProducerId& producerId,
        const RtpCapabilities& capabilities,
        bool paused
    ) override;

    core::Result<void, EngineError> resumeConsumer(const core::ConsumerId& consumerId) override;

    core::Result<PassiveTap, EngineError> createPlainTransport(const std::string& listenIp) override;

    core::Result<void, EngineError> connectPlainTransport(
        const core::TransportId& transportId,
        const std::string& ip,
        uint16_t port
    ) override;

    core::Result<void, EngineError> closeTransport(const core::TransportId& transportId) override;
    core::Result<void, EngineError> closeProducer(const core::ProducerId& producerId) override;
    core::Result<void, EngineError> closeConsumer(const core::ConsumerId& consumerId) override;

    void setFatalErrorHandler(EngineFatalErrorHandler handler) override;

private:
    enum class TransportType {
        WebRtc,
        Plain
    };

    struct TransportState {
        core::TransportId id;
        TransportType type = TransportType::WebRtc;
        core::TransportRole role = core::TransportRole::Producing;
        pal::SocketHandle socket{pal::INVALID_SOCKET_HANDLE};
        uint16_t port = 0;
        bool connected = false;
        DtlsParameters remoteDtls;
        std::string remoteIp;
        uint16_t remotePort = 0;
        uint32_t nextMid = 0;
    };

    struct ProducerState {
        ProducerHandle handle;
        core::TransportId transportId;
    };

    struct ConsumerState {
        ConsumerHandle handle;
        core::TransportId transportId;
    };

    struct PortReservation {
        pal::SocketHandle socket;
        uint16_t port;
    };

    core::Result<PortReservation, EngineError> reservePort(const std::string& ip);

    std::vector<IceCandidate> buildCandidates(uint16_t port) const;

    std::string resolveAnnouncedIp() const;

    /**
     * @brief Remove consumers matching the predicate; caller holds mutex_.
     */
    template<typename Predicate>
    size_t eraseConsumersLocked(Predicate predicate);

    void reportFatal(const std::string& reason);

    core::EngineConfig config_;
    pal::INetworkPAL& network_;
    std::shared_ptr<core::StructuredLogger> logger_;

    std::atomic<bool> ready_{false};
    std::atomic<uint32_t> nextPortOffset_{0};
    std::atomic<bool> fatalReported_{false};

    mutable std::mutex mutex_;
    std::unique_ptr<DtlsIdentity> identity_;
    std::string announcedIp_;
    RtpCapabilities capabilities_;
    std::unordered_map<core::TransportId, TransportState> transports_;
    std::unordered_map<core::ProducerId, ProducerState> producers_;
    std::unordered_map<core::ConsumerId, ConsumerState> consumers_;
    EngineFatalErrorHandler fatalHandler_;
};

} // namespace engine
} // namespace mediarelay

#endif // MEDIARELAY_ENGINE_LOCAL_ROUTER_HPP
