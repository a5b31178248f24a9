// MediaRelay - WebRTC SFU Signaling Server
// HLS Encoder Command Implementation

#include "mediarelay/streaming/hls_encoder_command.hpp"

#include <filesystem>
#include <sstream>

namespace mediarelay {
namespace streaming {

namespace {

std::string formatParameters(const engine::CodecParameters& parameters) {
    std::string fmtp;
    for (const auto& entry : parameters) {
        if (!fmtp.empty()) {
            fmtp += ";";
        }
        fmtp += entry.first + "=";
        if (entry.second.isNumber()) {
            fmtp += std::to_string(entry.second.getInt());
        } else {
            fmtp += entry.second.getString();
        }
    }
    return fmtp;
}

bool contains(const std::string& text, const char* token) {
    return text.find(token) != std::string::npos;
}

} // namespace

std::string buildSessionDescription(
    const engine::RtpParameters& rtpParameters,
    const std::string& ip,
    uint16_t port,
    const std::string& sessionName
) {
    const engine::RtpCodecParameters* codec = nullptr;
    for (const auto& candidate : rtpParameters.codecs) {
        if (!engine::isRtxCodec(candidate.mimeType)) {
            codec = &candidate;
            break;
        }
    }

    std::ostringstream sdp;
    sdp << "v=0\r\n"
        << "o=- 0 0 IN IP4 " << ip << "\r\n"
        << "s=" << sessionName << "\r\n"
        << "c=IN IP4 " << ip << "\r\n"
        << "t=0 0\r\n";

    if (codec == nullptr) {
        return sdp.str();
    }

    std::string media = "video";
    std::string encodingName = codec->mimeType;
    auto slash = codec->mimeType.find('/');
    if (slash != std::string::npos) {
        media = codec->mimeType.substr(0, slash);
        encodingName = codec->mimeType.substr(slash + 1);
    }

    sdp << "m=" << media << " " << port << " RTP/AVP " << codec->payloadType << "\r\n"
        << "a=rtpmap:" << codec->payloadType << " " << encodingName << "/" << codec->clockRate;
    if (codec->channels > 1) {
        sdp << "/" << codec->channels;
    }
    sdp << "\r\n";

    std::string fmtp = formatParameters(codec->parameters);
    if (!fmtp.empty()) {
        sdp << "a=fmtp:" << codec->payloadType << " " << fmtp << "\r\n";
    }
    sdp << "a=recvonly\r\n";
    return sdp.str();
}

pal::ProcessCommand buildEncoderCommand(
    const core::RecordingConfig& config,
    const std::string& outputDirectory,
    const std::string& sdpPath
) {
    const std::filesystem::path out(outputDirectory);
    const uint32_t kbps = config.videoBitrateKbps;

    pal::ProcessCommand command;
    command.executable = config.encoderPath;
    command.arguments = {
        "-hide_banner",
        "-loglevel", "info",

        // Input
        "-protocol_whitelist", "file,udp,rtp",
        "-fflags", "+genpts+igndts",
        "-thread_queue_size", "1024",
        "-buffer_size", "65536",
        "-i", sdpPath,

        // Video encoding
        "-c:v", "libx264",
        "-preset", "veryfast",
        "-tune", "zerolatency",
        "-profile:v", "baseline",
        "-level", "3.0",
        "-pix_fmt", "yuv420p",
        "-g", "60",
        "-keyint_min", "60",
        "-sc_threshold", "0",
        "-b:v", std::to_string(kbps) + "k",
        "-maxrate", std::to_string(kbps * 6 / 5) + "k",
        "-bufsize", std::to_string(kbps * 2) + "k",
        "-an",

        // HLS output
        "-f", "hls",
        "-hls_time", std::to_string(config.segmentSeconds),
        "-hls_list_size", std::to_string(config.playlistSize),
        "-hls_flags", "delete_segments+independent_segments",
        "-hls_start_number_source", "epoch",
        "-hls_segment_filename", (out / SEGMENT_FILE_PATTERN).string(),
        (out / PLAYLIST_FILE_NAME).string(),
    };
    return command;
}

EncoderLineKind classifyEncoderLine(const std::string& line) {
    if (contains(line, "frame=") && contains(line, "fps=")) {
        return EncoderLineKind::Progress;
    }
    if (contains(line, "Error") || contains(line, "Failed")) {
        return EncoderLineKind::Error;
    }
    if (contains(line, "Stream #") || contains(line, "Video:") || contains(line, "Opening")) {
        return EncoderLineKind::StreamInfo;
    }
    return EncoderLineKind::Other;
}

} // namespace streaming
} // namespace mediarelay
