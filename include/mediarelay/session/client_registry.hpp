// MediaRelay - WebRTC SFU Signaling Server
// Client Registry - who is connected, and event fan-out to them
//
// Responsibilities:
// - Own the set of connected clients and their event sinks
// - Publish server events to all clients, all but one, or a single client
// - Deliver outside the registry lock so a sink may call back into it

#ifndef MEDIARELAY_SESSION_CLIENT_REGISTRY_HPP
#define MEDIARELAY_SESSION_CLIENT_REGISTRY_HPP

#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "mediarelay/core/json.hpp"
#include "mediarelay/core/types.hpp"

namespace mediarelay {
namespace session {

/**
 * @brief Delivers one event to one client (usually a WebSocket write).
 */
using EventSink = std::function<void(const std::string& event, const core::JsonValue& data)>;

/**
 * @brief Publishing side of the client registry.
 *
 * Components that announce events (signaling handler, stream lifecycle)
 * depend on this interface only.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Send an event to every connected client except one.
     *
     * @param exceptClientId Client that does not receive the event (the
     *        sender); empty to reach everybody
     */
    virtual void publish(
        const std::string& event,
        const core::JsonValue& data,
        const core::ClientId& exceptClientId
    ) = 0;

    virtual void publishAll(const std::string& event, const core::JsonValue& data) = 0;

    /**
     * @brief Send an event to one client.
     * @return false if the client is not connected
     */
    virtual bool sendTo(
        const core::ClientId& clientId,
        const std::string& event,
        const core::JsonValue& data
    ) = 0;
};

/**
 * @brief Thread-safe registry of connected clients.
 *
 * @code
 * ClientRegistry clients;
 * clients.add("c1", [conn](const std::string& event, const core::JsonValue& data) {
 *     conn->sendEvent(event, data);
 * });
 * clients.publish("newProducer", payload, "c1");   // everybody but c1
 * @endcode
 */
class ClientRegistry : public IEventPublisher {
public:
    ClientRegistry() = default;
    ~ClientRegistry() override = default;

    ClientRegistry(const ClientRegistry&) = delete;
    ClientRegistry& operator=(const ClientRegistry&) = delete;

    /**
     * @brief Register a connected client.
     * @return false if the id is already registered
     */
    bool add(const core::ClientId& clientId, EventSink sink);

    /**
     * @brief Unregister a client; later publishes skip it.
     * @return false if the id was not registered
     */
    bool remove(const core::ClientId& clientId);

    [[nodiscard]] bool contains(const core::ClientId& clientId) const;

    /**
     * @brief Connected client ids in id order.
     */
    [[nodiscard]] std::vector<core::ClientId> connectedClients() const;

    [[nodiscard]] size_t count() const;

    void publish(
        const std::string& event,
        const core::JsonValue& data,
        const core::ClientId& exceptClientId
    ) override;

    void publishAll(const std::string& event, const core::JsonValue& data) override;

    bool sendTo(
        const core::ClientId& clientId,
        const std::string& event,
        const core::JsonValue& data
    ) override;

private:
    mutable std::shared_mutex mutex_;
    std::map<core::ClientId, EventSink> sinks_;
};

} // namespace session
} // namespace mediarelay

#endif // MEDIARELAY_SESSION_CLIENT_REGISTRY_HPP
