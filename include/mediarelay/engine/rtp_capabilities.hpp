// MediaRelay - WebRTC SFU Signaling Server
// RTP capability, parameter and transport descriptors
//
// Responsibilities:
// - Describe router/client RTP capabilities and producer/consumer parameters
// - Describe ICE and DTLS parameters relayed to the browser
// - Convert all descriptors to and from their JSON wire form
// - Decide whether a consumer's capabilities can receive a producer

#ifndef MEDIARELAY_ENGINE_RTP_CAPABILITIES_HPP
#define MEDIARELAY_ENGINE_RTP_CAPABILITIES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mediarelay/core/error_codes.hpp"
#include "mediarelay/core/json.hpp"
#include "mediarelay/core/result.hpp"
#include "mediarelay/core/types.hpp"

namespace mediarelay {
namespace engine {

// Codec parameters keep their JSON types ("packetization-mode" is a number,
// "profile-level-id" a string); browsers compare them strictly.
using CodecParameters = core::JsonValue::Object;

// =============================================================================
// RTP Capabilities
// =============================================================================

struct RtcpFeedback {
    std::string type;
    std::string parameter;
};

/**
 * @brief One codec a router supports or a client is able to receive.
 */
struct RtpCodecCapability {
    core::MediaKind kind = core::MediaKind::Audio;
    std::string mimeType;                ///< e.g. "audio/opus", "video/H264"
    uint32_t clockRate = 0;
    uint32_t channels = 0;               ///< Audio only, 0 when not given
    CodecParameters parameters;
    int preferredPayloadType = -1;       ///< -1 when not assigned
    std::vector<RtcpFeedback> rtcpFeedback;
};

struct RtpCapabilities {
    std::vector<RtpCodecCapability> codecs;
};

// =============================================================================
// RTP Parameters
// =============================================================================

struct RtpCodecParameters {
    std::string mimeType;
    int payloadType = -1;
    uint32_t clockRate = 0;
    uint32_t channels = 0;
    CodecParameters parameters;
    std::vector<RtcpFeedback> rtcpFeedback;
};

struct RtpEncoding {
    uint32_t ssrc = 0;                   ///< 0 when the sender uses rid only
    std::string rid;
};

/**
 * @brief Parameters of a concrete RTP stream (producer or consumer side).
 */
struct RtpParameters {
    std::string mid;
    std::vector<RtpCodecParameters> codecs;
    std::vector<RtpEncoding> encodings;
    std::string cname;
};

// =============================================================================
// ICE / DTLS
// =============================================================================

struct IceParameters {
    std::string usernameFragment;
    std::string password;
    bool iceLite = true;
};

struct IceCandidate {
    std::string foundation;
    uint32_t priority = 0;
    std::string ip;
    uint16_t port = 0;
    std::string protocol;                ///< "udp" or "tcp"
    std::string type = "host";
    std::string tcpType;                 ///< "passive" for tcp candidates
};

struct DtlsFingerprint {
    std::string algorithm;               ///< e.g. "sha-256"
    std::string value;                   ///< Colon separated upper-case hex
};

struct DtlsParameters {
    std::string role = "auto";           ///< "auto", "client" or "server"
    std::vector<DtlsFingerprint> fingerprints;
};

// =============================================================================
// Engine Handles
// =============================================================================

/**
 * @brief Everything a browser needs to connect a transport.
 */
struct TransportHandle {
    core::TransportId id;
    IceParameters iceParameters;
    std::vector<IceCandidate> iceCandidates;
    DtlsParameters dtlsParameters;
};

struct ProducerHandle {
    core::ProducerId id;
    core::MediaKind kind = core::MediaKind::Video;
    RtpParameters rtpParameters;
    bool paused = false;
};

struct ConsumerHandle {
    core::ConsumerId id;
    core::ProducerId producerId;
    core::MediaKind kind = core::MediaKind::Video;
    RtpParameters rtpParameters;
    bool paused = false;
};

/**
 * @brief Plain RTP transport bound on a local address, used to hand media to
 *        a local process instead of a browser.
 */
struct PassiveTap {
    core::TransportId transportId;
    std::string localIp;
    uint16_t localPort = 0;
};

// =============================================================================
// Codec Table and Matching
// =============================================================================

/**
 * @brief Media codecs the router is configured with.
 *
 * audio/opus 48000/2, video/H264 90000 and video/H264 90000 with
 * packetization-mode=1, profile-level-id=42e01f, level-asymmetry-allowed=1.
 */
std::vector<RtpCodecCapability> defaultMediaCodecs();

/**
 * @brief Router capabilities: the media codecs with dynamic payload types
 *        assigned from 100 upwards.
 */
RtpCapabilities buildRouterCapabilities(const std::vector<RtpCodecCapability>& mediaCodecs);

/**
 * @brief Whether a stream codec and a capability codec describe the same
 *        format (mime type, clock rate, channels, H264 mode and profile).
 */
bool codecMatches(const RtpCodecParameters& codec, const RtpCodecCapability& capability);

/**
 * @brief Capability codec that can receive the producer's first media codec.
 * @return Matching capability, or nullopt when the consumer cannot receive it
 */
std::optional<RtpCodecCapability> selectConsumerCodec(
    const RtpParameters& producerParameters,
    const RtpCapabilities& capabilities
);

/**
 * @brief Whether a consumer with the given capabilities can receive a
 *        producer with the given parameters.
 */
bool canConsume(const RtpParameters& producerParameters, const RtpCapabilities& capabilities);

bool isRtxCodec(const std::string& mimeType);

/**
 * @brief Media kind implied by a mime type prefix ("audio/" or "video/").
 */
std::optional<core::MediaKind> mediaKindOfMimeType(const std::string& mimeType);

// =============================================================================
// JSON Conversion
// =============================================================================

core::JsonValue toJson(const RtpCapabilities& capabilities);
core::JsonValue toJson(const RtpParameters& parameters);
core::JsonValue toJson(const IceParameters& parameters);
core::JsonValue toJson(const IceCandidate& candidate);
core::JsonValue toJson(const DtlsParameters& parameters);

/**
 * @brief Transport options reply: {id, iceParameters, iceCandidates, dtlsParameters}.
 */
core::JsonValue toJson(const TransportHandle& transport);

core::Result<RtpCapabilities, core::Error> rtpCapabilitiesFromJson(const core::JsonValue& json);
core::Result<RtpParameters, core::Error> rtpParametersFromJson(const core::JsonValue& json);
core::Result<DtlsParameters, core::Error> dtlsParametersFromJson(const core::JsonValue& json);

} // namespace engine
} // namespace mediarelay

#endif // MEDIARELAY_ENGINE_RTP_CAPABILITIES_HPP
