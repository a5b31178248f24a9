// MediaRelay - WebRTC SFU Signaling Server
// Encoder Port Pool Implementation

#include "mediarelay/streaming/encoder_port_pool.hpp"

namespace mediarelay {
namespace streaming {

EncoderPortPool::EncoderPortPool(uint16_t minPort, uint16_t maxPort, const IPortWatcher& watcher)
    : minPort_(static_cast<uint16_t>(minPort + (minPort % 2)))
    , maxPort_(maxPort)
    , portWatcher_(watcher)
{
}

std::optional<uint16_t> EncoderPortPool::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t port = minPort_; port + 1 <= maxPort_; port += 2) {
        auto rtp = static_cast<uint16_t>(port);
        if (reserved_.count(rtp) > 0) {
            continue;
        }
        if (portWatcher_.isListening(rtp) || portWatcher_.isListening(static_cast<uint16_t>(rtp + 1))) {
            continue;
        }
        reserved_.insert(rtp);
        return rtp;
    }
    return std::nullopt;
}

void EncoderPortPool::release(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_.erase(port);
}

size_t EncoderPortPool::inUse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_.size();
}

} // namespace streaming
} // namespace mediarelay
