// MediaRelay - WebRTC SFU Signaling Server
// Signaling Message Implementation

#include "mediarelay/protocol/signaling_message.hpp"

#include <cmath>

namespace mediarelay {
namespace protocol {

namespace {

core::Error invalid(const std::string& message) {
    return core::Error{core::ErrorCode::InvalidArgument, message};
}

bool isIntegral(const core::JsonValue& value) {
    if (!value.isNumber()) {
        return false;
    }
    double number = value.getDouble();
    return std::isfinite(number) && std::floor(number) == number;
}

} // namespace

const char* messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::Request: return "request";
        case MessageType::Response: return "response";
        case MessageType::Notify: return "notify";
        case MessageType::Event: return "event";
    }
    return "unknown";
}

core::Result<SignalingMessage, core::Error> parseSignalingMessage(
    const std::string& text,
    int64_t* requestId
) {
    using Outcome = core::Result<SignalingMessage, core::Error>;

    auto parsed = core::JsonValue::parse(text);
    if (parsed.isError()) {
        return Outcome::error(invalid("Malformed JSON: " + parsed.error().message));
    }

    const core::JsonValue& root = parsed.value();
    if (!root.isObject()) {
        return Outcome::error(invalid("Message is not an object"));
    }

    SignalingMessage message;
    const core::JsonValue& id = root["id"];
    if (isIntegral(id)) {
        message.id = id.getInt();
        if (requestId != nullptr) {
            *requestId = message.id;
        }
    }

    const std::string type = root["type"].getString();
    if (type == "request") {
        message.type = MessageType::Request;
    } else if (type == "notify") {
        message.type = MessageType::Notify;
    } else if (type == "response") {
        message.type = MessageType::Response;
    } else if (type == "event") {
        message.type = MessageType::Event;
    } else {
        return Outcome::error(invalid("Unknown message type '" + type + "'"));
    }

    if (message.type == MessageType::Request && !isIntegral(id)) {
        return Outcome::error(invalid("Request without numeric id"));
    }

    if (message.type == MessageType::Event) {
        message.method = root["event"].getString();
    } else {
        message.method = root["method"].getString();
    }
    if (message.method.empty() &&
        (message.type == MessageType::Request || message.type == MessageType::Notify)) {
        return Outcome::error(invalid("Missing method"));
    }

    const core::JsonValue& data = root["data"];
    if (data.isNull()) {
        message.data = core::JsonValue::object();
    } else if (data.isObject()) {
        message.data = data;
    } else {
        return Outcome::error(invalid("data must be an object"));
    }

    return Outcome::success(std::move(message));
}

core::JsonValue errorPayload(const core::Error& error) {
    core::JsonValue payload = core::JsonValue::object();
    payload.set("error", error.message.empty() ? std::string(core::errorCodeToString(error.code))
                                               : error.message);
    payload.set("code", core::errorCodeToken(error.code));
    return payload;
}

std::string serializeResponse(int64_t id, const core::JsonValue& data) {
    core::JsonValue envelope = core::JsonValue::object();
    envelope.set("type", "response");
    envelope.set("id", static_cast<long long>(id));
    envelope.set("data", data);
    return envelope.dump();
}

std::string serializeErrorResponse(int64_t id, const core::Error& error) {
    return serializeResponse(id, errorPayload(error));
}

std::string serializeEvent(const std::string& event, const core::JsonValue& data) {
    core::JsonValue envelope = core::JsonValue::object();
    envelope.set("type", "event");
    envelope.set("event", event);
    envelope.set("data", data);
    return envelope.dump();
}

std::string serializeRequest(int64_t id, const std::string& method, const core::JsonValue& data) {
    core::JsonValue envelope = core::JsonValue::object();
    envelope.set("type", "request");
    envelope.set("id", static_cast<long long>(id));
    envelope.set("method", method);
    envelope.set("data", data);
    return envelope.dump();
}

std::string serializeNotify(const std::string& method, const core::JsonValue& data) {
    core::JsonValue envelope = core::JsonValue::object();
    envelope.set("type", "notify");
    envelope.set("method", method);
    envelope.set("data", data);
    return envelope.dump();
}

} // namespace protocol
} // namespace mediarelay
