// MediaRelay - WebRTC SFU Signaling Server
// Port Watcher - has the encoder bound its RTP input port yet

#ifndef MEDIARELAY_STREAMING_PORT_WATCHER_HPP
#define MEDIARELAY_STREAMING_PORT_WATCHER_HPP

#include <cstdint>

#include "mediarelay/pal/network_pal.hpp"

namespace mediarelay {
namespace streaming {

class IPortWatcher {
public:
    virtual ~IPortWatcher() = default;

    /**
     * @brief Whether something is listening for RTP on the port.
     */
    virtual bool isListening(uint16_t port) const = 0;
};

/**
 * @brief Watcher backed by the kernel's UDP socket table.
 */
class UdpPortWatcher : public IPortWatcher {
public:
    explicit UdpPortWatcher(const pal::INetworkPAL& network)
        : network_(network) {}

    bool isListening(uint16_t port) const override {
        return network_.isUdpPortBound(port);
    }

private:
    const pal::INetworkPAL& network_;
};

} // namespace streaming
} // namespace mediarelay

#endif // MEDIARELAY_STREAMING_PORT_WATCHER_HPP
