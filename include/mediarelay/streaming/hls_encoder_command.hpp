// MediaRelay - WebRTC SFU Signaling Server
// HLS Encoder Command - session description and encoder command line
//
// The encoder reads the tap's RTP through an SDP file and writes a sliding
// window HLS playlist with its segments into the stream's output directory.

#ifndef MEDIARELAY_STREAMING_HLS_ENCODER_COMMAND_HPP
#define MEDIARELAY_STREAMING_HLS_ENCODER_COMMAND_HPP

#include <cstdint>
#include <string>

#include "mediarelay/core/config_manager.hpp"
#include "mediarelay/engine/rtp_capabilities.hpp"
#include "mediarelay/pal/pal_types.hpp"

namespace mediarelay {
namespace streaming {

constexpr const char* PLAYLIST_FILE_NAME = "playlist.m3u8";
constexpr const char* SESSION_DESCRIPTION_FILE_NAME = "stream.sdp";
constexpr const char* SEGMENT_FILE_PATTERN = "segment_%03d.ts";

/**
 * @brief SDP describing the RTP stream the tap sends to the encoder.
 *
 * @param rtpParameters Tap consumer parameters; the first media codec is
 *        described
 * @param ip Address the encoder listens on
 * @param port RTP port the encoder listens on (RTCP on port + 1)
 * @param sessionName SDP session name
 */
std::string buildSessionDescription(
    const engine::RtpParameters& rtpParameters,
    const std::string& ip,
    uint16_t port,
    const std::string& sessionName
);

/**
 * @brief Encoder command line for one stream.
 *
 * @param config Recording section (encoder path, segment length, playlist
 *        size, bitrate)
 * @param outputDirectory Directory receiving playlist and segments
 * @param sdpPath Session description written by buildSessionDescription()
 */
pal::ProcessCommand buildEncoderCommand(
    const core::RecordingConfig& config,
    const std::string& outputDirectory,
    const std::string& sdpPath
);

/**
 * @brief Encoder stderr line categories used for logging and state.
 */
enum class EncoderLineKind {
    Progress,       ///< "frame=... fps=..." status line
    Error,          ///< Contains "Error" or "Failed"
    StreamInfo,     ///< "Stream #", "Video:" or "Opening" lines
    Other
};

EncoderLineKind classifyEncoderLine(const std::string& line);

} // namespace streaming
} // namespace mediarelay

#endif // MEDIARELAY_STREAMING_HLS_ENCODER_COMMAND_HPP
