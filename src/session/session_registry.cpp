// MediaRelay - WebRTC SFU Signaling Server
// Session Registry Implementation

#include "mediarelay/session/session_registry.hpp"

#include <algorithm>
#include <mutex>

namespace mediarelay {
namespace session {

namespace {

bool bySequence(const ProducerRecord& a, const ProducerRecord& b) {
    return a.sequence < b.sequence;
}

} // namespace

core::Error toError(const SessionError& error) {
    switch (error.code) {
        case SessionError::Code::NotFound:
            return core::Error(core::ErrorCode::NotFound, error.message);
        case SessionError::Code::Conflict:
            return core::Error(core::ErrorCode::Conflict, error.message);
        case SessionError::Code::InvalidArgument:
            return core::Error(core::ErrorCode::InvalidArgument, error.message);
    }
    return core::Error(core::ErrorCode::Internal, error.message);
}

// =============================================================================
// Upserts
// =============================================================================

core::Result<void, SessionError> SessionRegistry::upsertTransport(const TransportRecord& record) {
    if (record.id.empty() || record.clientId.empty()) {
        return core::Result<void, SessionError>::error(
            SessionError{SessionError::Code::InvalidArgument, "Transport record needs id and client"});
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    ClientSession& session = sessions_[record.clientId];
    std::optional<TransportRecord>& slot = transportSlot(session, record.role);
    if (slot) {
        return core::Result<void, SessionError>::error(
            SessionError{SessionError::Code::Conflict,
                         std::string("Client ") + record.clientId + " already has a " +
                         core::transportRoleToString(record.role) + " transport " + slot->id});
    }
    slot = record;
    return core::Result<void, SessionError>::success();
}

core::Result<ProducerRecord, SessionError> SessionRegistry::upsertProducer(const ProducerRecord& record) {
    if (record.producerId.empty() || record.clientId.empty()) {
        return core::Result<ProducerRecord, SessionError>::error(
            SessionError{SessionError::Code::InvalidArgument, "Producer record needs id and client"});
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    ClientSession& session = sessions_[record.clientId];
    if (session.producer) {
        return core::Result<ProducerRecord, SessionError>::error(
            SessionError{SessionError::Code::Conflict,
                         "Client " + record.clientId + " already has producer " +
                         session.producer->producerId});
    }

    ProducerRecord stored = record;
    stored.sequence = nextSequence_++;
    session.producer = stored;
    producerOwners_[stored.producerId] = stored.clientId;
    return core::Result<ProducerRecord, SessionError>::success(stored);
}

core::Result<void, SessionError> SessionRegistry::upsertConsumer(const ConsumerRecord& record) {
    if (record.consumerId.empty() || record.clientId.empty()) {
        return core::Result<void, SessionError>::error(
            SessionError{SessionError::Code::InvalidArgument, "Consumer record needs id and client"});
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    sessions_[record.clientId].consumers[record.consumerId] = record;
    return core::Result<void, SessionError>::success();
}

core::Result<void, SessionError> SessionRegistry::setConsumerPaused(
    const core::ClientId& clientId,
    const core::ConsumerId& consumerId,
    bool paused
) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(clientId);
    if (it != sessions_.end()) {
        auto consumerIt = it->second.consumers.find(consumerId);
        if (consumerIt != it->second.consumers.end()) {
            consumerIt->second.paused = paused;
            return core::Result<void, SessionError>::success();
        }
    }
    return core::Result<void, SessionError>::error(
        SessionError{SessionError::Code::NotFound, "Consumer not found: " + consumerId});
}

// =============================================================================
// Release
// =============================================================================

core::Result<TransportRecord, SessionError> SessionRegistry::releaseTransport(
    const core::ClientId& clientId,
    core::TransportRole role
) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(clientId);
    if (it != sessions_.end()) {
        std::optional<TransportRecord>& slot = transportSlot(it->second, role);
        if (slot) {
            TransportRecord released = *slot;
            slot.reset();
            return core::Result<TransportRecord, SessionError>::success(released);
        }
    }
    return core::Result<TransportRecord, SessionError>::error(
        SessionError{SessionError::Code::NotFound,
                     std::string("No ") + core::transportRoleToString(role) +
                     " transport for client " + clientId});
}

core::Result<ProducerRecord, SessionError> SessionRegistry::releaseProducer(const core::ClientId& clientId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(clientId);
    if (it == sessions_.end() || !it->second.producer) {
        return core::Result<ProducerRecord, SessionError>::error(
            SessionError{SessionError::Code::NotFound, "No producer for client " + clientId});
    }

    ProducerRecord released = *it->second.producer;
    it->second.producer.reset();
    producerOwners_.erase(released.producerId);
    return core::Result<ProducerRecord, SessionError>::success(released);
}

core::Result<ConsumerRecord, SessionError> SessionRegistry::releaseConsumer(
    const core::ClientId& clientId,
    const core::ConsumerId& consumerId
) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(clientId);
    if (it != sessions_.end()) {
        auto consumerIt = it->second.consumers.find(consumerId);
        if (consumerIt != it->second.consumers.end()) {
            ConsumerRecord released = consumerIt->second;
            it->second.consumers.erase(consumerIt);
            return core::Result<ConsumerRecord, SessionError>::success(released);
        }
    }
    return core::Result<ConsumerRecord, SessionError>::error(
        SessionError{SessionError::Code::NotFound, "Consumer not found: " + consumerId});
}

RemovedResources SessionRegistry::removeAllForClient(const core::ClientId& clientId) {
    RemovedResources removed;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(clientId);
    if (it == sessions_.end()) {
        return removed;
    }

    ClientSession& session = it->second;
    if (session.producingTransport) {
        removed.transports.push_back(*session.producingTransport);
    }
    if (session.consumingTransport) {
        removed.transports.push_back(*session.consumingTransport);
    }
    for (auto& entry : session.consumers) {
        removed.consumers.push_back(entry.second);
    }
    removed.producer = session.producer;
    sessions_.erase(it);

    if (removed.producer) {
        const core::ProducerId& producerId = removed.producer->producerId;
        producerOwners_.erase(producerId);

        for (auto& entry : sessions_) {
            auto& consumers = entry.second.consumers;
            for (auto consumerIt = consumers.begin(); consumerIt != consumers.end();) {
                if (consumerIt->second.producerId == producerId) {
                    removed.orphanedConsumers.push_back(consumerIt->second);
                    consumerIt = consumers.erase(consumerIt);
                } else {
                    ++consumerIt;
                }
            }
        }
    }

    return removed;
}

// =============================================================================
// Lookup
// =============================================================================

core::Result<TransportRecord, SessionError> SessionRegistry::findTransport(
    const core::ClientId& clientId,
    core::TransportRole role
) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const ClientSession* session = findSessionLocked(clientId);
    if (session != nullptr) {
        const std::optional<TransportRecord>& slot = transportSlot(*session, role);
        if (slot) {
            return core::Result<TransportRecord, SessionError>::success(*slot);
        }
    }
    return core::Result<TransportRecord, SessionError>::error(
        SessionError{SessionError::Code::NotFound,
                     std::string("No ") + core::transportRoleToString(role) +
                     " transport for client " + clientId});
}

core::Result<ProducerRecord, SessionError> SessionRegistry::findProducer(const core::ClientId& clientId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const ClientSession* session = findSessionLocked(clientId);
    if (session == nullptr || !session->producer) {
        return core::Result<ProducerRecord, SessionError>::error(
            SessionError{SessionError::Code::NotFound, "No producer for client " + clientId});
    }
    return core::Result<ProducerRecord, SessionError>::success(*session->producer);
}

core::Result<ProducerRecord, SessionError> SessionRegistry::findProducerById(
    const core::ProducerId& producerId
) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto owner = producerOwners_.find(producerId);
    if (owner != producerOwners_.end()) {
        const ClientSession* session = findSessionLocked(owner->second);
        if (session != nullptr && session->producer && session->producer->producerId == producerId) {
            return core::Result<ProducerRecord, SessionError>::success(*session->producer);
        }
    }
    return core::Result<ProducerRecord, SessionError>::error(
        SessionError{SessionError::Code::NotFound, "Producer not found: " + producerId});
}

core::Result<ConsumerRecord, SessionError> SessionRegistry::findConsumer(
    const core::ClientId& clientId,
    const core::ConsumerId& consumerId
) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const ClientSession* session = findSessionLocked(clientId);
    if (session != nullptr) {
        auto it = session->consumers.find(consumerId);
        if (it != session->consumers.end()) {
            return core::Result<ConsumerRecord, SessionError>::success(it->second);
        }
    }
    return core::Result<ConsumerRecord, SessionError>::error(
        SessionError{SessionError::Code::NotFound, "Consumer not found: " + consumerId});
}

std::vector<ConsumerRecord> SessionRegistry::consumersOf(const core::ClientId& clientId) const {
    std::vector<ConsumerRecord> result;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const ClientSession* session = findSessionLocked(clientId);
    if (session != nullptr) {
        for (const auto& entry : session->consumers) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<ProducerRecord> SessionRegistry::listProducersExcluding(const core::ClientId& clientId) const {
    std::vector<ProducerRecord> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& entry : sessions_) {
            if (entry.first != clientId && entry.second.producer) {
                result.push_back(*entry.second.producer);
            }
        }
    }
    std::sort(result.begin(), result.end(), bySequence);
    return result;
}

std::vector<ProducerRecord> SessionRegistry::videoProducers() const {
    std::vector<ProducerRecord> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& entry : sessions_) {
            if (entry.second.producer && entry.second.producer->kind == core::MediaKind::Video) {
                result.push_back(*entry.second.producer);
            }
        }
    }
    std::sort(result.begin(), result.end(), bySequence);
    return result;
}

bool SessionRegistry::hasVideoProducer() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& entry : sessions_) {
        if (entry.second.producer && entry.second.producer->kind == core::MediaKind::Video) {
            return true;
        }
    }
    return false;
}

size_t SessionRegistry::producerCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return producerOwners_.size();
}

bool SessionRegistry::hasClient(const core::ClientId& clientId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.find(clientId) != sessions_.end();
}

// =============================================================================
// Capability Negotiation State
// =============================================================================

void SessionRegistry::markCapabilitiesRequested(const core::ClientId& clientId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    sessions_[clientId].capabilitiesRequested = true;
}

bool SessionRegistry::capabilitiesRequested(const core::ClientId& clientId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const ClientSession* session = findSessionLocked(clientId);
    return session != nullptr && session->capabilitiesRequested;
}

void SessionRegistry::setCapabilities(
    const core::ClientId& clientId,
    const engine::RtpCapabilities& capabilities
) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    sessions_[clientId].capabilities = capabilities;
}

core::Result<engine::RtpCapabilities, SessionError> SessionRegistry::capabilities(
    const core::ClientId& clientId
) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const ClientSession* session = findSessionLocked(clientId);
    if (session == nullptr || !session->capabilities) {
        return core::Result<engine::RtpCapabilities, SessionError>::error(
            SessionError{SessionError::Code::NotFound, "RTP capabilities not set for client " + clientId});
    }
    return core::Result<engine::RtpCapabilities, SessionError>::success(*session->capabilities);
}

// =============================================================================
// Helpers
// =============================================================================

std::optional<TransportRecord>& SessionRegistry::transportSlot(
    ClientSession& session,
    core::TransportRole role
) {
    return role == core::TransportRole::Producing ? session.producingTransport : session.consumingTransport;
}

const std::optional<TransportRecord>& SessionRegistry::transportSlot(
    const ClientSession& session,
    core::TransportRole role
) {
    return role == core::TransportRole::Producing ? session.producingTransport : session.consumingTransport;
}

const SessionRegistry::ClientSession* SessionRegistry::findSessionLocked(const core::ClientId& clientId) const {
    auto it = sessions_.find(clientId);
    return it == sessions_.end() ? nullptr : &it->second;
}

} // namespace session
} // namespace mediarelay
