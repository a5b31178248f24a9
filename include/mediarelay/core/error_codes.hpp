// MediaRelay - WebRTC SFU Signaling Server
// Signaling error taxonomy and Error structure

#ifndef MEDIARELAY_CORE_ERROR_CODES_HPP
#define MEDIARELAY_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>

namespace mediarelay {
namespace core {

/**
 * @brief Error codes reported to signaling clients.
 *
 * The numeric values are grouped by origin. The string token returned by
 * errorCodeToken() is what travels on the wire in the "code" field of an
 * error reply.
 */
enum class ErrorCode : uint32_t {
    // General (0-99)
    Success = 0,
    Internal = 1,
    InvalidArgument = 2,
    NotFound = 3,
    Conflict = 4,

    // Protocol ordering (100-199)
    PreconditionFailed = 100,

    // Media engine (200-299)
    EngineUnavailable = 200,
    ConnectError = 201,
    ProduceError = 202,
    ConsumeError = 203,

    // Recording (300-399)
    RecorderStartFailed = 300,

    // Playback retrieval (400-499)
    Forbidden = 400,
};

/**
 * @brief Human readable description of an error code.
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Internal: return "Internal error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::Conflict: return "Resource already exists";
        case ErrorCode::PreconditionFailed: return "Protocol used out of order";
        case ErrorCode::EngineUnavailable: return "Media engine unavailable";
        case ErrorCode::ConnectError: return "Transport connect failed";
        case ErrorCode::ProduceError: return "Produce failed";
        case ErrorCode::ConsumeError: return "Consume failed";
        case ErrorCode::RecorderStartFailed: return "Recorder start failed";
        case ErrorCode::Forbidden: return "Forbidden";
        default: return "Unknown error";
    }
}

/**
 * @brief Stable wire token for an error code.
 */
inline const char* errorCodeToken(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::Conflict: return "Conflict";
        case ErrorCode::PreconditionFailed: return "PreconditionFailed";
        case ErrorCode::EngineUnavailable: return "EngineUnavailable";
        case ErrorCode::ConnectError: return "ConnectError";
        case ErrorCode::ProduceError: return "ProduceError";
        case ErrorCode::ConsumeError: return "ConsumeError";
        case ErrorCode::RecorderStartFailed: return "RecorderStartFailed";
        case ErrorCode::Forbidden: return "Forbidden";
        default: return "Internal";
    }
}

/**
 * @brief Error value carried to the signaling boundary.
 */
struct Error {
    ErrorCode code = ErrorCode::Internal;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] std::string toString() const {
        std::string result = errorCodeToString(code);
        if (!message.empty()) {
            result += ": " + message;
        }
        return result;
    }
};

} // namespace core
} // namespace mediarelay

#endif // MEDIARELAY_CORE_ERROR_CODES_HPP
