// MediaRelay - WebRTC SFU Signaling Server
// Common type definitions

#ifndef MEDIARELAY_CORE_TYPES_HPP
#define MEDIARELAY_CORE_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace mediarelay {
namespace core {

// Identifiers are opaque strings; clients see them verbatim.
using ClientId = std::string;
using TransportId = std::string;
using ProducerId = std::string;
using ConsumerId = std::string;
using StreamKey = std::string;

constexpr size_t MAX_STREAM_KEY_LENGTH = 64;

/**
 * @brief Stream keys name directories under the HLS output root, so only
 * [A-Za-z0-9_-]{1,64} is accepted.
 */
inline bool isValidStreamKey(const StreamKey& key) {
    if (key.empty() || key.size() > MAX_STREAM_KEY_LENGTH) {
        return false;
    }
    for (char c : key) {
        bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                       (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!allowed) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Media kind of a producer or consumer.
 */
enum class MediaKind : uint8_t {
    Audio,
    Video
};

/**
 * @brief Direction a client transport is used for.
 */
enum class TransportRole : uint8_t {
    Producing,
    Consuming
};

inline const char* mediaKindToString(MediaKind kind) {
    return kind == MediaKind::Audio ? "audio" : "video";
}

inline std::optional<MediaKind> parseMediaKind(const std::string& value) {
    if (value == "audio") {
        return MediaKind::Audio;
    }
    if (value == "video") {
        return MediaKind::Video;
    }
    return std::nullopt;
}

inline const char* transportRoleToString(TransportRole role) {
    return role == TransportRole::Producing ? "producing" : "consuming";
}

/**
 * @brief Remote peer information for log lines.
 */
struct ClientInfo {
    std::string ip;
    uint16_t port = 0;
    std::string userAgent;
};

using SteadyClock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;
using TimePoint = SteadyClock::time_point;

} // namespace core
} // namespace mediarelay

#endif // MEDIARELAY_CORE_TYPES_HPP
