// MediaRelay - WebRTC SFU Signaling Server
// Encoder Port Pool - RTP/RTCP port pairs for encoder inputs

#ifndef MEDIARELAY_STREAMING_ENCODER_PORT_POOL_HPP
#define MEDIARELAY_STREAMING_ENCODER_PORT_POOL_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <set>

#include "mediarelay/streaming/port_watcher.hpp"

namespace mediarelay {
namespace streaming {

/**
 * @brief Hands out even RTP ports (RTCP on port + 1) from a range.
 *
 * A port is skipped while another recorder holds it or while the port
 * watcher sees the port or its RTCP neighbour bound by some other process.
 *
 * Thread Safety: all public methods are thread-safe.
 */
class EncoderPortPool {
public:
    EncoderPortPool(uint16_t minPort, uint16_t maxPort, const IPortWatcher& watcher);

    EncoderPortPool(const EncoderPortPool&) = delete;
    EncoderPortPool& operator=(const EncoderPortPool&) = delete;

    /**
     * @return A free RTP port, or nullopt when the range is exhausted
     */
    std::optional<uint16_t> acquire();

    void release(uint16_t port);

    [[nodiscard]] size_t inUse() const;

private:
    uint16_t minPort_;
    uint16_t maxPort_;
    const IPortWatcher& portWatcher_;

    mutable std::mutex mutex_;
    std::set<uint16_t> reserved_;
};

} // namespace streaming
} // namespace mediarelay

#endif // MEDIARELAY_STREAMING_ENCODER_PORT_POOL_HPP
