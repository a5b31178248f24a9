// MediaRelay - WebRTC SFU Signaling Server
// Client Registry Implementation

#include "mediarelay/session/client_registry.hpp"

#include <mutex>

namespace mediarelay {
namespace session {

bool ClientRegistry::add(const core::ClientId& clientId, EventSink sink) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return sinks_.emplace(clientId, std::move(sink)).second;
}

bool ClientRegistry::remove(const core::ClientId& clientId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return sinks_.erase(clientId) > 0;
}

bool ClientRegistry::contains(const core::ClientId& clientId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sinks_.find(clientId) != sinks_.end();
}

std::vector<core::ClientId> ClientRegistry::connectedClients() const {
    std::vector<core::ClientId> clients;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    clients.reserve(sinks_.size());
    for (const auto& entry : sinks_) {
        clients.push_back(entry.first);
    }
    return clients;
}

size_t ClientRegistry::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sinks_.size();
}

void ClientRegistry::publish(
    const std::string& event,
    const core::JsonValue& data,
    const core::ClientId& exceptClientId
) {
    std::vector<EventSink> targets;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        targets.reserve(sinks_.size());
        for (const auto& entry : sinks_) {
            if (entry.first != exceptClientId && entry.second) {
                targets.push_back(entry.second);
            }
        }
    }

    for (const auto& sink : targets) {
        sink(event, data);
    }
}

void ClientRegistry::publishAll(const std::string& event, const core::JsonValue& data) {
    publish(event, data, core::ClientId());
}

bool ClientRegistry::sendTo(
    const core::ClientId& clientId,
    const std::string& event,
    const core::JsonValue& data
) {
    EventSink sink;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = sinks_.find(clientId);
        if (it == sinks_.end() || !it->second) {
            return false;
        }
        sink = it->second;
    }
    sink(event, data);
    return true;
}

} // namespace session
} // namespace mediarelay
