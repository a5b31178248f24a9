// MediaRelay - WebRTC SFU Signaling Server
// Signaling Message - JSON envelope carried in WebSocket text frames
//
//   request   {"type":"request","id":N,"method":"<name>","data":{...}}
//   response  {"type":"response","id":N,"data":{...}}
//   notify    {"type":"notify","method":"<name>","data":{...}}
//   event     {"type":"event","event":"<name>","data":{...}}
//
// Failed requests answer with data {"error":"<message>","code":"<token>"}.

#ifndef MEDIARELAY_PROTOCOL_SIGNALING_MESSAGE_HPP
#define MEDIARELAY_PROTOCOL_SIGNALING_MESSAGE_HPP

#include <cstdint>
#include <string>

#include "mediarelay/core/error_codes.hpp"
#include "mediarelay/core/json.hpp"
#include "mediarelay/core/result.hpp"

namespace mediarelay {
namespace protocol {

enum class MessageType {
    Request,
    Response,
    Notify,
    Event
};

const char* messageTypeToString(MessageType type);

struct SignalingMessage {
    MessageType type = MessageType::Request;
    int64_t id = 0;             ///< Request/response correlation
    std::string method;         ///< Method of a request or notify, name of an event
    core::JsonValue data;       ///< Always an object; {} when absent
};

/**
 * @brief Parse one envelope.
 *
 * Fails with InvalidArgument on malformed JSON, an unknown type, a request
 * without a numeric id or a request/notify without a method. When the text
 * was JSON with a numeric id, that id is reported through requestId so the
 * caller can still answer.
 */
core::Result<SignalingMessage, core::Error> parseSignalingMessage(
    const std::string& text,
    int64_t* requestId = nullptr
);

/**
 * @brief {"error": message, "code": token}
 */
core::JsonValue errorPayload(const core::Error& error);

std::string serializeResponse(int64_t id, const core::JsonValue& data);
std::string serializeErrorResponse(int64_t id, const core::Error& error);
std::string serializeEvent(const std::string& event, const core::JsonValue& data);

/**
 * @brief Client-side encodings, used by tests and tooling.
 */
std::string serializeRequest(int64_t id, const std::string& method, const core::JsonValue& data);
std::string serializeNotify(const std::string& method, const core::JsonValue& data);

} // namespace protocol
} // namespace mediarelay

#endif // MEDIARELAY_PROTOCOL_SIGNALING_MESSAGE_HPP
