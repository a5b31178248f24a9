// MediaRelay - WebRTC SFU Signaling Server
// Session Registry - per-client transports, producers and consumers
//
// Responsibilities:
// - Single source of truth for which client owns which engine resource
// - Release-before-replace: a second transport for the same (client, role)
//   or a second producer for the same client is a Conflict
// - Remove everything a client owns on disconnect, including other clients'
//   consumers of its producers, and hand the records back for engine release
// - Producer discovery for late joiners
//
// The registry is bookkeeping only: it never calls the media engine.

#ifndef MEDIARELAY_SESSION_SESSION_REGISTRY_HPP
#define MEDIARELAY_SESSION_SESSION_REGISTRY_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "mediarelay/core/error_codes.hpp"
#include "mediarelay/core/result.hpp"
#include "mediarelay/core/types.hpp"
#include "mediarelay/engine/rtp_capabilities.hpp"

namespace mediarelay {
namespace session {

// =============================================================================
// Records
// =============================================================================

struct TransportRecord {
    core::TransportId id;
    core::TransportRole role = core::TransportRole::Producing;
    core::ClientId clientId;
};

struct ProducerRecord {
    core::ProducerId producerId;
    core::MediaKind kind = core::MediaKind::Video;
    core::ClientId clientId;
    uint64_t sequence = 0;             ///< Creation order, assigned on upsert
};

struct ConsumerRecord {
    core::ConsumerId consumerId;
    core::ProducerId producerId;
    core::ClientId clientId;
    core::MediaKind kind = core::MediaKind::Video;
    bool paused = true;
};

/**
 * @brief Everything removeAllForClient() took out of the registry.
 */
struct RemovedResources {
    std::vector<TransportRecord> transports;
    std::optional<ProducerRecord> producer;
    std::vector<ConsumerRecord> consumers;          ///< The client's own consumers
    std::vector<ConsumerRecord> orphanedConsumers;  ///< Other clients' consumers of its producer

    [[nodiscard]] bool empty() const {
        return transports.empty() && !producer && consumers.empty() && orphanedConsumers.empty();
    }
};

// =============================================================================
// Error Types
// =============================================================================

struct SessionError {
    enum class Code {
        NotFound,     ///< No record for the key
        Conflict,     ///< A live record exists; release it first
        InvalidArgument
    };

    Code code;
    std::string message;

    SessionError(Code c = Code::NotFound, std::string msg = "")
        : code(c), message(std::move(msg)) {}
};

/**
 * @brief Map a registry error onto the signaling error taxonomy.
 */
core::Error toError(const SessionError& error);

// =============================================================================
// Session Registry Interface
// =============================================================================

class ISessionRegistry {
public:
    virtual ~ISessionRegistry() = default;

    // -------------------------------------------------------------------------
    // Upserts
    // -------------------------------------------------------------------------

    /**
     * @brief Record a transport for (clientId, role).
     * @return Conflict if one is already recorded for that key
     */
    virtual core::Result<void, SessionError> upsertTransport(const TransportRecord& record) = 0;

    /**
     * @brief Record the client's producer.
     * @return The stored record (with sequence), Conflict if the client
     *         already has one
     */
    virtual core::Result<ProducerRecord, SessionError> upsertProducer(const ProducerRecord& record) = 0;

    /**
     * @brief Add a consumer to the client's collection, keyed by consumer id.
     */
    virtual core::Result<void, SessionError> upsertConsumer(const ConsumerRecord& record) = 0;

    virtual core::Result<void, SessionError> setConsumerPaused(
        const core::ClientId& clientId,
        const core::ConsumerId& consumerId,
        bool paused
    ) = 0;

    // -------------------------------------------------------------------------
    // Release
    // -------------------------------------------------------------------------

    virtual core::Result<TransportRecord, SessionError> releaseTransport(
        const core::ClientId& clientId,
        core::TransportRole role
    ) = 0;

    virtual core::Result<ProducerRecord, SessionError> releaseProducer(const core::ClientId& clientId) = 0;

    virtual core::Result<ConsumerRecord, SessionError> releaseConsumer(
        const core::ClientId& clientId,
        const core::ConsumerId& consumerId
    ) = 0;

    /**
     * @brief Remove every record keyed by the client, plus other clients'
     *        consumers of the client's producer.
     */
    virtual RemovedResources removeAllForClient(const core::ClientId& clientId) = 0;

    // -------------------------------------------------------------------------
    // Lookup
    // -------------------------------------------------------------------------

    virtual core::Result<TransportRecord, SessionError> findTransport(
        const core::ClientId& clientId,
        core::TransportRole role
    ) const = 0;

    virtual core::Result<ProducerRecord, SessionError> findProducer(const core::ClientId& clientId) const = 0;

    virtual core::Result<ProducerRecord, SessionError> findProducerById(
        const core::ProducerId& producerId
    ) const = 0;

    virtual core::Result<ConsumerRecord, SessionError> findConsumer(
        const core::ClientId& clientId,
        const core::ConsumerId& consumerId
    ) const = 0;

    /**
     * @brief Consumers of a client, in consumer id order.
     */
    virtual std::vector<ConsumerRecord> consumersOf(const core::ClientId& clientId) const = 0;

    /**
     * @brief Producers of every other client, in creation order.
     */
    virtual std::vector<ProducerRecord> listProducersExcluding(const core::ClientId& clientId) const = 0;

    /**
     * @brief All video producers, in creation order.
     */
    virtual std::vector<ProducerRecord> videoProducers() const = 0;

    virtual bool hasVideoProducer() const = 0;

    virtual size_t producerCount() const = 0;

    /**
     * @brief Whether any record or capability state is keyed by the client.
     */
    virtual bool hasClient(const core::ClientId& clientId) const = 0;

    // -------------------------------------------------------------------------
    // Capability Negotiation State
    // -------------------------------------------------------------------------

    virtual void markCapabilitiesRequested(const core::ClientId& clientId) = 0;

    virtual bool capabilitiesRequested(const core::ClientId& clientId) const = 0;

    virtual void setCapabilities(
        const core::ClientId& clientId,
        const engine::RtpCapabilities& capabilities
    ) = 0;

    /**
     * @brief Receive capabilities the client declared.
     * @return NotFound before setCapabilities()
     */
    virtual core::Result<engine::RtpCapabilities, SessionError> capabilities(
        const core::ClientId& clientId
    ) const = 0;
};

// =============================================================================
// Session Registry Implementation
// =============================================================================

/**
 * @brief Thread-safe session registry.
 *
 * Thread Safety:
 * - All public methods are thread-safe (std::shared_mutex)
 * - Each method is one critical section; ordering of a client's operations
 *   comes from the caller's per-client serial executor
 */
class SessionRegistry : public ISessionRegistry {
public:
    SessionRegistry() = default;
    ~SessionRegistry() override = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    core::Result<void, SessionError> upsertTransport(const TransportRecord& record) override;
    core::Result<ProducerRecord, SessionError> upsertProducer(const ProducerRecord& record) override;
    core::Result<void, SessionError> upsertConsumer(const ConsumerRecord& record) override;
    core::Result<void, SessionError> setConsumerPaused(
        const core::ClientId& clientId,
        const core::ConsumerId& consumerId,
        bool paused
    ) override;

    core::Result<TransportRecord, SessionError> releaseTransport(
        const core::ClientId& clientId,
        core::TransportRole role
    ) override;
    core::Result<ProducerRecord, SessionError> releaseProducer(const core::ClientId& clientId) override;
    core::Result<ConsumerRecord, SessionError> releaseConsumer(
        const core::ClientId& clientId,
        const core::ConsumerId& consumerId
    ) override;
    RemovedResources removeAllForClient(const core::ClientId& clientId) override;

    core::Result<TransportRecord, SessionError> findTransport(
        const core::ClientId& clientId,
        core::TransportRole role
    ) const override;
    core::Result<ProducerRecord, SessionError> findProducer(const core::ClientId& clientId) const override;
    core::Result<ProducerRecord, SessionError> findProducerById(
        const core::ProducerId& producerId
    ) const override;
    core::Result<ConsumerRecord, SessionError> findConsumer(
        const core::ClientId& clientId,
        const core::ConsumerId& consumerId
    ) const override;
    std::vector<ConsumerRecord> consumersOf(const core::ClientId& clientId) const override;
    std::vector<ProducerRecord> listProducersExcluding(const core::ClientId& clientId) const override;
    std::vector<ProducerRecord> videoProducers() const override;
    bool hasVideoProducer() const override;
    size_t producerCount() const override;
    bool hasClient(const core::ClientId& clientId) const override;

    void markCapabilitiesRequested(const core::ClientId& clientId) override;
    bool capabilitiesRequested(const core::ClientId& clientId) const override;
    void setCapabilities(
        const core::ClientId& clientId,
        const engine::RtpCapabilities& capabilities
    ) override;
    core::Result<engine::RtpCapabilities, SessionError> capabilities(
        const core::ClientId& clientId
    ) const override;

private:
    struct ClientSession {
        std::optional<TransportRecord> producingTransport;
        std::optional<TransportRecord> consumingTransport;
        std::optional<ProducerRecord> producer;
        std::map<core::ConsumerId, ConsumerRecord> consumers;
        bool capabilitiesRequested = false;
        std::optional<engine::RtpCapabilities> capabilities;
    };

    static std::optional<TransportRecord>& transportSlot(ClientSession& session, core::TransportRole role);
    static const std::optional<TransportRecord>& transportSlot(
        const ClientSession& session, core::TransportRole role);

    const ClientSession* findSessionLocked(const core::ClientId& clientId) const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<core::ClientId, ClientSession> sessions_;
    std::unordered_map<core::ProducerId, core::ClientId> producerOwners_;
    uint64_t nextSequence_ = 1;
};

} // namespace session
} // namespace mediarelay

#endif // MEDIARELAY_SESSION_SESSION_REGISTRY_HPP
