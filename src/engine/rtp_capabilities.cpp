// MediaRelay - WebRTC SFU Signaling Server
// RTP descriptors, codec matching and JSON conversion

#include "mediarelay/engine/rtp_capabilities.hpp"

#include <algorithm>
#include <cctype>

namespace mediarelay {
namespace engine {

namespace {

constexpr int FIRST_DYNAMIC_PAYLOAD_TYPE = 100;

const char* DEFAULT_H264_PROFILE_LEVEL_ID = "42e01f";

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

/**
 * @brief Codec parameter rendered as text whatever its JSON type.
 */
std::string parameterText(const CodecParameters& parameters, const std::string& name,
                          const std::string& fallback) {
    auto it = parameters.find(name);
    if (it == parameters.end()) {
        return fallback;
    }
    if (it->second.isNumber()) {
        return std::to_string(it->second.getInt());
    }
    if (it->second.isString()) {
        return it->second.getString();
    }
    return fallback;
}

std::string h264ProfileIdc(const CodecParameters& parameters) {
    std::string profileLevelId = toLower(
        parameterText(parameters, "profile-level-id", DEFAULT_H264_PROFILE_LEVEL_ID));
    return profileLevelId.substr(0, 2);
}

core::Error invalid(const std::string& message) {
    return core::Error(core::ErrorCode::InvalidArgument, message);
}

core::JsonValue feedbackToJson(const std::vector<RtcpFeedback>& feedback) {
    core::JsonValue list = core::JsonValue::array();
    for (const auto& fb : feedback) {
        core::JsonValue entry = core::JsonValue::object();
        entry.set("type", fb.type);
        entry.set("parameter", fb.parameter);
        list.push(std::move(entry));
    }
    return list;
}

std::vector<RtcpFeedback> feedbackFromJson(const core::JsonValue& json) {
    std::vector<RtcpFeedback> feedback;
    if (!json.isArray()) {
        return feedback;
    }
    for (const auto& entry : json.items()) {
        if (entry.isObject() && entry["type"].isString()) {
            feedback.push_back(RtcpFeedback{entry["type"].getString(), entry["parameter"].getString()});
        }
    }
    return feedback;
}

std::vector<RtcpFeedback> videoFeedback() {
    return {
        {"nack", ""},
        {"nack", "pli"},
        {"ccm", "fir"},
        {"goog-remb", ""},
        {"transport-cc", ""},
    };
}

} // namespace

// =============================================================================
// Codec Table
// =============================================================================

std::vector<RtpCodecCapability> defaultMediaCodecs() {
    std::vector<RtpCodecCapability> codecs;

    RtpCodecCapability opus;
    opus.kind = core::MediaKind::Audio;
    opus.mimeType = "audio/opus";
    opus.clockRate = 48000;
    opus.channels = 2;
    opus.rtcpFeedback = {{"transport-cc", ""}};
    codecs.push_back(opus);

    RtpCodecCapability h264;
    h264.kind = core::MediaKind::Video;
    h264.mimeType = "video/H264";
    h264.clockRate = 90000;
    h264.rtcpFeedback = videoFeedback();
    codecs.push_back(h264);

    RtpCodecCapability h264Mode1 = h264;
    h264Mode1.parameters["packetization-mode"] = core::JsonValue(1);
    h264Mode1.parameters["profile-level-id"] = core::JsonValue("42e01f");
    h264Mode1.parameters["level-asymmetry-allowed"] = core::JsonValue(1);
    codecs.push_back(h264Mode1);

    return codecs;
}

RtpCapabilities buildRouterCapabilities(const std::vector<RtpCodecCapability>& mediaCodecs) {
    RtpCapabilities capabilities;
    int payloadType = FIRST_DYNAMIC_PAYLOAD_TYPE;
    for (auto codec : mediaCodecs) {
        codec.preferredPayloadType = payloadType++;
        capabilities.codecs.push_back(std::move(codec));
    }
    return capabilities;
}

// =============================================================================
// Matching
// =============================================================================

bool isRtxCodec(const std::string& mimeType) {
    const std::string suffix = "/rtx";
    return mimeType.size() >= suffix.size() &&
           equalsIgnoreCase(mimeType.substr(mimeType.size() - suffix.size()), suffix);
}

std::optional<core::MediaKind> mediaKindOfMimeType(const std::string& mimeType) {
    auto slash = mimeType.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }
    return core::parseMediaKind(toLower(mimeType.substr(0, slash)));
}

bool codecMatches(const RtpCodecParameters& codec, const RtpCodecCapability& capability) {
    if (!equalsIgnoreCase(codec.mimeType, capability.mimeType)) {
        return false;
    }
    if (codec.clockRate != capability.clockRate) {
        return false;
    }

    if (capability.kind == core::MediaKind::Audio) {
        uint32_t codecChannels = codec.channels == 0 ? 1 : codec.channels;
        uint32_t capabilityChannels = capability.channels == 0 ? 1 : capability.channels;
        if (codecChannels != capabilityChannels) {
            return false;
        }
    }

    if (equalsIgnoreCase(capability.mimeType, "video/H264")) {
        if (parameterText(codec.parameters, "packetization-mode", "0") !=
            parameterText(capability.parameters, "packetization-mode", "0")) {
            return false;
        }
        if (h264ProfileIdc(codec.parameters) != h264ProfileIdc(capability.parameters)) {
            return false;
        }
    }

    return true;
}

std::optional<RtpCodecCapability> selectConsumerCodec(
    const RtpParameters& producerParameters,
    const RtpCapabilities& capabilities
) {
    for (const auto& codec : producerParameters.codecs) {
        if (isRtxCodec(codec.mimeType)) {
            continue;
        }
        for (const auto& capability : capabilities.codecs) {
            if (codecMatches(codec, capability)) {
                return capability;
            }
        }
    }
    return std::nullopt;
}

bool canConsume(const RtpParameters& producerParameters, const RtpCapabilities& capabilities) {
    return selectConsumerCodec(producerParameters, capabilities).has_value();
}

// =============================================================================
// JSON Output
// =============================================================================

core::JsonValue toJson(const RtpCapabilities& capabilities) {
    core::JsonValue codecs = core::JsonValue::array();
    for (const auto& codec : capabilities.codecs) {
        core::JsonValue entry = core::JsonValue::object();
        entry.set("kind", core::mediaKindToString(codec.kind));
        entry.set("mimeType", codec.mimeType);
        entry.set("clockRate", codec.clockRate);
        if (codec.channels > 0) {
            entry.set("channels", codec.channels);
        }
        entry.set("parameters", core::JsonValue(codec.parameters));
        if (codec.preferredPayloadType >= 0) {
            entry.set("preferredPayloadType", codec.preferredPayloadType);
        }
        entry.set("rtcpFeedback", feedbackToJson(codec.rtcpFeedback));
        codecs.push(std::move(entry));
    }

    core::JsonValue json = core::JsonValue::object();
    json.set("codecs", std::move(codecs));
    json.set("headerExtensions", core::JsonValue::array());
    return json;
}

core::JsonValue toJson(const RtpParameters& parameters) {
    core::JsonValue json = core::JsonValue::object();
    if (!parameters.mid.empty()) {
        json.set("mid", parameters.mid);
    }

    core::JsonValue& codecs = json.set("codecs", core::JsonValue::array());
    for (const auto& codec : parameters.codecs) {
        core::JsonValue entry = core::JsonValue::object();
        entry.set("mimeType", codec.mimeType);
        entry.set("payloadType", codec.payloadType);
        entry.set("clockRate", codec.clockRate);
        if (codec.channels > 0) {
            entry.set("channels", codec.channels);
        }
        entry.set("parameters", core::JsonValue(codec.parameters));
        entry.set("rtcpFeedback", feedbackToJson(codec.rtcpFeedback));
        codecs.push(std::move(entry));
    }

    core::JsonValue& encodings = json.set("encodings", core::JsonValue::array());
    for (const auto& encoding : parameters.encodings) {
        core::JsonValue entry = core::JsonValue::object();
        if (encoding.ssrc != 0) {
            entry.set("ssrc", encoding.ssrc);
        }
        if (!encoding.rid.empty()) {
            entry.set("rid", encoding.rid);
        }
        encodings.push(std::move(entry));
    }

    json.set("headerExtensions", core::JsonValue::array());
    core::JsonValue& rtcp = json.set("rtcp", core::JsonValue::object());
    rtcp.set("cname", parameters.cname);
    rtcp.set("reducedSize", true);
    return json;
}

core::JsonValue toJson(const IceParameters& parameters) {
    core::JsonValue json = core::JsonValue::object();
    json.set("usernameFragment", parameters.usernameFragment);
    json.set("password", parameters.password);
    json.set("iceLite", parameters.iceLite);
    return json;
}

core::JsonValue toJson(const IceCandidate& candidate) {
    core::JsonValue json = core::JsonValue::object();
    json.set("foundation", candidate.foundation);
    json.set("priority", candidate.priority);
    json.set("ip", candidate.ip);
    json.set("address", candidate.ip);
    json.set("port", candidate.port);
    json.set("protocol", candidate.protocol);
    json.set("type", candidate.type);
    if (!candidate.tcpType.empty()) {
        json.set("tcpType", candidate.tcpType);
    }
    return json;
}

core::JsonValue toJson(const DtlsParameters& parameters) {
    core::JsonValue json = core::JsonValue::object();
    json.set("role", parameters.role);
    core::JsonValue& fingerprints = json.set("fingerprints", core::JsonValue::array());
    for (const auto& fingerprint : parameters.fingerprints) {
        core::JsonValue entry = core::JsonValue::object();
        entry.set("algorithm", fingerprint.algorithm);
        entry.set("value", fingerprint.value);
        fingerprints.push(std::move(entry));
    }
    return json;
}

core::JsonValue toJson(const TransportHandle& transport) {
    core::JsonValue json = core::JsonValue::object();
    json.set("id", transport.id);
    json.set("iceParameters", toJson(transport.iceParameters));
    core::JsonValue& candidates = json.set("iceCandidates", core::JsonValue::array());
    for (const auto& candidate : transport.iceCandidates) {
        candidates.push(toJson(candidate));
    }
    json.set("dtlsParameters", toJson(transport.dtlsParameters));
    return json;
}

// =============================================================================
// JSON Input
// =============================================================================

core::Result<RtpCapabilities, core::Error> rtpCapabilitiesFromJson(const core::JsonValue& json) {
    using R = core::Result<RtpCapabilities, core::Error>;

    if (!json.isObject() || !json["codecs"].isArray()) {
        return R::error(invalid("rtpCapabilities.codecs must be an array"));
    }

    RtpCapabilities capabilities;
    const auto& codecs = json["codecs"].items();
    for (size_t i = 0; i < codecs.size(); ++i) {
        const core::JsonValue& entry = codecs[i];
        std::string where = "rtpCapabilities.codecs[" + std::to_string(i) + "]";
        if (!entry.isObject()) {
            return R::error(invalid(where + " must be an object"));
        }
        if (!entry["mimeType"].isString()) {
            return R::error(invalid(where + ".mimeType is required"));
        }
        if (!entry["clockRate"].isNumber()) {
            return R::error(invalid(where + ".clockRate is required"));
        }

        RtpCodecCapability codec;
        codec.mimeType = entry["mimeType"].getString();

        std::optional<core::MediaKind> kind = entry["kind"].isString()
            ? core::parseMediaKind(entry["kind"].getString())
            : mediaKindOfMimeType(codec.mimeType);
        if (!kind) {
            return R::error(invalid(where + ".kind must be audio or video"));
        }
        codec.kind = *kind;
        codec.clockRate = static_cast<uint32_t>(entry["clockRate"].getInt());
        codec.channels = static_cast<uint32_t>(entry["channels"].getInt(0));
        if (entry["parameters"].isObject()) {
            codec.parameters = entry["parameters"].members();
        }
        codec.preferredPayloadType = static_cast<int>(entry["preferredPayloadType"].getInt(-1));
        codec.rtcpFeedback = feedbackFromJson(entry["rtcpFeedback"]);
        capabilities.codecs.push_back(std::move(codec));
    }

    return R::success(std::move(capabilities));
}

core::Result<RtpParameters, core::Error> rtpParametersFromJson(const core::JsonValue& json) {
    using R = core::Result<RtpParameters, core::Error>;

    if (!json.isObject()) {
        return R::error(invalid("rtpParameters must be an object"));
    }
    if (!json["codecs"].isArray() || json["codecs"].size() == 0) {
        return R::error(invalid("rtpParameters.codecs must be a non-empty array"));
    }

    RtpParameters parameters;
    parameters.mid = json["mid"].getString();
    parameters.cname = json["rtcp"]["cname"].getString();

    const auto& codecs = json["codecs"].items();
    for (size_t i = 0; i < codecs.size(); ++i) {
        const core::JsonValue& entry = codecs[i];
        std::string where = "rtpParameters.codecs[" + std::to_string(i) + "]";
        if (!entry.isObject() || !entry["mimeType"].isString()) {
            return R::error(invalid(where + ".mimeType is required"));
        }
        if (!entry["payloadType"].isNumber()) {
            return R::error(invalid(where + ".payloadType is required"));
        }
        if (!entry["clockRate"].isNumber()) {
            return R::error(invalid(where + ".clockRate is required"));
        }

        RtpCodecParameters codec;
        codec.mimeType = entry["mimeType"].getString();
        codec.payloadType = static_cast<int>(entry["payloadType"].getInt());
        codec.clockRate = static_cast<uint32_t>(entry["clockRate"].getInt());
        codec.channels = static_cast<uint32_t>(entry["channels"].getInt(0));
        if (entry["parameters"].isObject()) {
            codec.parameters = entry["parameters"].members();
        }
        codec.rtcpFeedback = feedbackFromJson(entry["rtcpFeedback"]);
        parameters.codecs.push_back(std::move(codec));
    }

    if (json["encodings"].isArray()) {
        for (const auto& entry : json["encodings"].items()) {
            RtpEncoding encoding;
            encoding.ssrc = static_cast<uint32_t>(entry["ssrc"].getInt(0));
            encoding.rid = entry["rid"].getString();
            parameters.encodings.push_back(std::move(encoding));
        }
    }

    return R::success(std::move(parameters));
}

core::Result<DtlsParameters, core::Error> dtlsParametersFromJson(const core::JsonValue& json) {
    using R = core::Result<DtlsParameters, core::Error>;

    if (!json.isObject()) {
        return R::error(invalid("dtlsParameters must be an object"));
    }
    if (!json["fingerprints"].isArray()) {
        return R::error(invalid("dtlsParameters.fingerprints must be an array"));
    }

    DtlsParameters parameters;
    parameters.role = json["role"].getString("auto");
    for (const auto& entry : json["fingerprints"].items()) {
        if (!entry["algorithm"].isString() || !entry["value"].isString()) {
            return R::error(invalid("dtlsParameters.fingerprints entries need algorithm and value"));
        }
        parameters.fingerprints.push_back(
            DtlsFingerprint{entry["algorithm"].getString(), entry["value"].getString()});
    }

    return R::success(std::move(parameters));
}

} // namespace engine
} // namespace mediarelay
