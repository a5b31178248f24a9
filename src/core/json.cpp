// MediaRelay - WebRTC SFU Signaling Server
// JSON value, parser and serializer implementation

#include "mediarelay/core/json.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace mediarelay {
namespace core {

// =============================================================================
// Parser
// =============================================================================

namespace {

constexpr size_t MAX_NESTING_DEPTH = 64;

class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input), pos_(0) {}

    Result<JsonValue, JsonError> parse() {
        skipWhitespace();
        auto result = parseValue(0);
        if (result.isError()) {
            return result;
        }
        skipWhitespace();
        if (pos_ < input_.size()) {
            return fail(JsonError::Code::UnexpectedCharacter,
                        "Unexpected characters after JSON value");
        }
        return result;
    }

private:
    const std::string& input_;
    size_t pos_;

    Result<JsonValue, JsonError> fail(JsonError::Code code, const std::string& message) const {
        return Result<JsonValue, JsonError>::error(JsonError(code, message, pos_));
    }

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            pos_++;
        }
    }

    char peek() const {
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }

    char consume() {
        return pos_ < input_.size() ? input_[pos_++] : '\0';
    }

    bool match(char c) {
        if (pos_ < input_.size() && input_[pos_] == c) {
            pos_++;
            return true;
        }
        return false;
    }

    Result<JsonValue, JsonError> parseValue(size_t depth) {
        if (depth > MAX_NESTING_DEPTH) {
            return fail(JsonError::Code::TooDeep, "JSON nesting too deep");
        }

        skipWhitespace();
        if (pos_ >= input_.size()) {
            return fail(JsonError::Code::UnexpectedEnd, "Unexpected end of input");
        }

        char c = peek();
        if (c == '"') return parseString();
        if (c == '{') return parseObject(depth);
        if (c == '[') return parseArray(depth);
        if (c == 't' || c == 'f') return parseBool();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();

        return fail(JsonError::Code::UnexpectedCharacter,
                    "Unexpected character: " + std::string(1, c));
    }

    static void appendUtf8(std::string& out, uint32_t codepoint) {
        if (codepoint < 0x80) {
            out += static_cast<char>(codepoint);
        } else if (codepoint < 0x800) {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else if (codepoint < 0x10000) {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }

    bool readHex4(uint32_t& out) {
        if (pos_ + 4 > input_.size()) {
            return false;
        }
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char h = input_[pos_++];
            value <<= 4;
            if (h >= '0' && h <= '9') value |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') value |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') value |= static_cast<uint32_t>(h - 'A' + 10);
            else return false;
        }
        out = value;
        return true;
    }

    Result<std::string, JsonError> parseRawString() {
        if (!match('"')) {
            return Result<std::string, JsonError>::error(
                JsonError(JsonError::Code::UnexpectedCharacter, "Expected '\"'", pos_));
        }

        std::string result;
        while (pos_ < input_.size() && peek() != '"') {
            char c = consume();
            if (c != '\\') {
                result += c;
                continue;
            }
            char escaped = consume();
            switch (escaped) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    uint32_t codepoint = 0;
                    if (!readHex4(codepoint)) {
                        return Result<std::string, JsonError>::error(
                            JsonError(JsonError::Code::InvalidEscape, "Invalid \\u escape", pos_));
                    }
                    // Surrogate pair
                    if (codepoint >= 0xD800 && codepoint <= 0xDBFF &&
                        match('\\') && match('u')) {
                        uint32_t low = 0;
                        if (!readHex4(low) || low < 0xDC00 || low > 0xDFFF) {
                            return Result<std::string, JsonError>::error(
                                JsonError(JsonError::Code::InvalidEscape,
                                          "Invalid surrogate pair", pos_));
                        }
                        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                    }
                    appendUtf8(result, codepoint);
                    break;
                }
                default:
                    return Result<std::string, JsonError>::error(
                        JsonError(JsonError::Code::InvalidEscape,
                                  "Invalid escape character", pos_));
            }
        }

        if (!match('"')) {
            return Result<std::string, JsonError>::error(
                JsonError(JsonError::Code::UnexpectedEnd, "Unterminated string", pos_));
        }
        return Result<std::string, JsonError>::success(std::move(result));
    }

    Result<JsonValue, JsonError> parseString() {
        auto raw = parseRawString();
        if (raw.isError()) {
            return Result<JsonValue, JsonError>::error(raw.error());
        }
        return Result<JsonValue, JsonError>::success(JsonValue(std::move(raw.value())));
    }

    Result<JsonValue, JsonError> parseNumber() {
        size_t start = pos_;
        if (peek() == '-') consume();

        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return fail(JsonError::Code::InvalidNumber, "Invalid number");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) consume();

        if (peek() == '.') {
            consume();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                return fail(JsonError::Code::InvalidNumber, "Invalid number fraction");
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        if (peek() == 'e' || peek() == 'E') {
            consume();
            if (peek() == '+' || peek() == '-') consume();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                return fail(JsonError::Code::InvalidNumber, "Invalid number exponent");
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        std::string numStr = input_.substr(start, pos_ - start);
        char* end = nullptr;
        double value = std::strtod(numStr.c_str(), &end);
        if (end == nullptr || *end != '\0') {
            return fail(JsonError::Code::InvalidNumber, "Invalid number: " + numStr);
        }
        return Result<JsonValue, JsonError>::success(JsonValue(value));
    }

    Result<JsonValue, JsonError> parseBool() {
        if (input_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return Result<JsonValue, JsonError>::success(JsonValue(true));
        }
        if (input_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return Result<JsonValue, JsonError>::success(JsonValue(false));
        }
        return fail(JsonError::Code::UnexpectedCharacter, "Expected 'true' or 'false'");
    }

    Result<JsonValue, JsonError> parseNull() {
        if (input_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return Result<JsonValue, JsonError>::success(JsonValue());
        }
        return fail(JsonError::Code::UnexpectedCharacter, "Expected 'null'");
    }

    Result<JsonValue, JsonError> parseArray(size_t depth) {
        match('[');
        JsonValue value = JsonValue::array();

        skipWhitespace();
        if (match(']')) {
            return Result<JsonValue, JsonError>::success(std::move(value));
        }

        while (true) {
            auto element = parseValue(depth + 1);
            if (element.isError()) {
                return element;
            }
            value.push(std::move(element.value()));

            skipWhitespace();
            if (match(']')) break;
            if (!match(',')) {
                return fail(pos_ >= input_.size() ? JsonError::Code::UnexpectedEnd
                                                  : JsonError::Code::UnexpectedCharacter,
                            "Expected ',' or ']' in array");
            }
        }

        return Result<JsonValue, JsonError>::success(std::move(value));
    }

    Result<JsonValue, JsonError> parseObject(size_t depth) {
        match('{');
        JsonValue value = JsonValue::object();

        skipWhitespace();
        if (match('}')) {
            return Result<JsonValue, JsonError>::success(std::move(value));
        }

        while (true) {
            skipWhitespace();
            auto key = parseRawString();
            if (key.isError()) {
                return Result<JsonValue, JsonError>::error(key.error());
            }

            skipWhitespace();
            if (!match(':')) {
                return fail(JsonError::Code::UnexpectedCharacter, "Expected ':' after key");
            }

            auto member = parseValue(depth + 1);
            if (member.isError()) {
                return member;
            }
            value.set(key.value(), std::move(member.value()));

            skipWhitespace();
            if (match('}')) break;
            if (!match(',')) {
                return fail(pos_ >= input_.size() ? JsonError::Code::UnexpectedEnd
                                                  : JsonError::Code::UnexpectedCharacter,
                            "Expected ',' or '}' in object");
            }
        }

        return Result<JsonValue, JsonError>::success(std::move(value));
    }
};

const JsonValue& nullValue() {
    static const JsonValue value;
    return value;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

JsonValue::JsonValue(bool value) : type_(JsonType::Boolean), boolValue_(value) {}
JsonValue::JsonValue(int value) : type_(JsonType::Number), numberValue_(value) {}
JsonValue::JsonValue(long value)
    : type_(JsonType::Number), numberValue_(static_cast<double>(value)) {}
JsonValue::JsonValue(long long value)
    : type_(JsonType::Number), numberValue_(static_cast<double>(value)) {}
JsonValue::JsonValue(unsigned value) : type_(JsonType::Number), numberValue_(value) {}
JsonValue::JsonValue(unsigned long value)
    : type_(JsonType::Number), numberValue_(static_cast<double>(value)) {}
JsonValue::JsonValue(unsigned long long value)
    : type_(JsonType::Number), numberValue_(static_cast<double>(value)) {}
JsonValue::JsonValue(double value) : type_(JsonType::Number), numberValue_(value) {}
JsonValue::JsonValue(const char* value)
    : type_(JsonType::String), stringValue_(value != nullptr ? value : "") {}
JsonValue::JsonValue(std::string value)
    : type_(JsonType::String), stringValue_(std::move(value)) {}
JsonValue::JsonValue(Array values)
    : type_(JsonType::Array), arrayValue_(std::move(values)) {}
JsonValue::JsonValue(Object members)
    : type_(JsonType::Object), objectValue_(std::move(members)) {}

JsonValue JsonValue::array() {
    return JsonValue(Array{});
}

JsonValue JsonValue::object() {
    return JsonValue(Object{});
}

Result<JsonValue, JsonError> JsonValue::parse(const std::string& text) {
    JsonParser parser(text);
    return parser.parse();
}

// =============================================================================
// Accessors
// =============================================================================

bool JsonValue::getBool(bool defaultValue) const {
    return isBool() ? boolValue_ : defaultValue;
}

int64_t JsonValue::getInt(int64_t defaultValue) const {
    if (!isNumber() || !std::isfinite(numberValue_)) {
        return defaultValue;
    }
    return static_cast<int64_t>(numberValue_);
}

double JsonValue::getDouble(double defaultValue) const {
    return isNumber() ? numberValue_ : defaultValue;
}

std::string JsonValue::getString(const std::string& defaultValue) const {
    return isString() ? stringValue_ : defaultValue;
}

bool JsonValue::contains(const std::string& key) const {
    return isObject() && objectValue_.find(key) != objectValue_.end();
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    if (!isObject()) {
        return nullValue();
    }
    auto it = objectValue_.find(key);
    return it != objectValue_.end() ? it->second : nullValue();
}

const JsonValue& JsonValue::at(size_t index) const {
    if (!isArray() || index >= arrayValue_.size()) {
        return nullValue();
    }
    return arrayValue_[index];
}

JsonValue& JsonValue::set(const std::string& key, JsonValue value) {
    if (!isObject()) {
        *this = object();
    }
    JsonValue& slot = objectValue_[key];
    slot = std::move(value);
    return slot;
}

void JsonValue::push(JsonValue value) {
    if (!isArray()) {
        *this = array();
    }
    arrayValue_.push_back(std::move(value));
}

size_t JsonValue::size() const noexcept {
    if (isArray()) return arrayValue_.size();
    if (isObject()) return objectValue_.size();
    return 0;
}

bool JsonValue::operator==(const JsonValue& other) const {
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
        case JsonType::Null: return true;
        case JsonType::Boolean: return boolValue_ == other.boolValue_;
        case JsonType::Number: return numberValue_ == other.numberValue_;
        case JsonType::String: return stringValue_ == other.stringValue_;
        case JsonType::Array: return arrayValue_ == other.arrayValue_;
        case JsonType::Object: return objectValue_ == other.objectValue_;
    }
    return false;
}

// =============================================================================
// Serialization
// =============================================================================

std::string JsonValue::escape(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 2);
    for (char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char hex[8];
                    std::snprintf(hex, sizeof(hex), "\\u%04x", static_cast<unsigned>(c));
                    out += hex;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string JsonValue::dump() const {
    std::string out;
    dumpTo(out);
    return out;
}

void JsonValue::dumpTo(std::string& out) const {
    switch (type_) {
        case JsonType::Null:
            out += "null";
            break;
        case JsonType::Boolean:
            out += boolValue_ ? "true" : "false";
            break;
        case JsonType::Number: {
            char buf[32];
            if (!std::isfinite(numberValue_)) {
                out += "null";
            } else if (std::floor(numberValue_) == numberValue_ &&
                       std::fabs(numberValue_) < 9.007199254740992e15) {
                std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(numberValue_));
                out += buf;
            } else {
                std::snprintf(buf, sizeof(buf), "%.17g", numberValue_);
                out += buf;
            }
            break;
        }
        case JsonType::String:
            out += '"';
            out += escape(stringValue_);
            out += '"';
            break;
        case JsonType::Array: {
            out += '[';
            bool first = true;
            for (const auto& element : arrayValue_) {
                if (!first) out += ',';
                first = false;
                element.dumpTo(out);
            }
            out += ']';
            break;
        }
        case JsonType::Object: {
            out += '{';
            bool first = true;
            for (const auto& member : objectValue_) {
                if (!first) out += ',';
                first = false;
                out += '"';
                out += escape(member.first);
                out += "\":";
                member.second.dumpTo(out);
            }
            out += '}';
            break;
        }
    }
}

} // namespace core
} // namespace mediarelay
