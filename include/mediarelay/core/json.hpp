// MediaRelay - WebRTC SFU Signaling Server
// JSON value, parser and serializer
//
// Responsibilities:
// - Represent signaling payloads and configuration documents
// - Parse UTF-8 JSON text with detailed error positions
// - Serialize values to compact JSON text

#ifndef MEDIARELAY_CORE_JSON_HPP
#define MEDIARELAY_CORE_JSON_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "mediarelay/core/result.hpp"

namespace mediarelay {
namespace core {

enum class JsonType {
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object
};

/**
 * @brief Error produced while parsing JSON text.
 */
struct JsonError {
    enum class Code {
        None,
        UnexpectedCharacter,
        UnexpectedEnd,
        InvalidNumber,
        InvalidEscape,
        TooDeep
    };

    Code code = Code::None;
    std::string message;
    size_t offset = 0;   ///< Byte offset in the input where parsing failed

    JsonError() = default;
    JsonError(Code c, std::string msg, size_t off)
        : code(c), message(std::move(msg)), offset(off) {}
};

/**
 * @brief Dynamically typed JSON value.
 *
 * Accessors never throw: reading a member of a non-object, or a value of the
 * wrong type, yields the supplied default (or a shared null value for
 * operator[]).
 *
 * @code
 * JsonValue reply = JsonValue::object();
 * reply.set("id", "p1");
 * reply.set("paused", false);
 * std::string text = reply.dump();   // {"id":"p1","paused":false}
 * @endcode
 */
class JsonValue {
public:
    using Array = std::vector<JsonValue>;
    using Object = std::map<std::string, JsonValue>;

    JsonValue() = default;
    JsonValue(std::nullptr_t) {}
    JsonValue(bool value);
    JsonValue(int value);
    JsonValue(long value);
    JsonValue(long long value);
    JsonValue(unsigned value);
    JsonValue(unsigned long value);
    JsonValue(unsigned long long value);
    JsonValue(double value);
    JsonValue(const char* value);
    JsonValue(std::string value);
    JsonValue(Array values);
    JsonValue(Object members);

    static JsonValue array();
    static JsonValue object();

    /**
     * @brief Parse JSON text.
     * @param text Complete JSON document
     * @return Parsed value or JsonError with the failing offset
     */
    static Result<JsonValue, JsonError> parse(const std::string& text);

    [[nodiscard]] JsonType type() const noexcept { return type_; }
    [[nodiscard]] bool isNull() const noexcept { return type_ == JsonType::Null; }
    [[nodiscard]] bool isBool() const noexcept { return type_ == JsonType::Boolean; }
    [[nodiscard]] bool isNumber() const noexcept { return type_ == JsonType::Number; }
    [[nodiscard]] bool isString() const noexcept { return type_ == JsonType::String; }
    [[nodiscard]] bool isArray() const noexcept { return type_ == JsonType::Array; }
    [[nodiscard]] bool isObject() const noexcept { return type_ == JsonType::Object; }

    [[nodiscard]] bool getBool(bool defaultValue = false) const;
    [[nodiscard]] int64_t getInt(int64_t defaultValue = 0) const;
    [[nodiscard]] double getDouble(double defaultValue = 0.0) const;
    [[nodiscard]] std::string getString(const std::string& defaultValue = "") const;

    [[nodiscard]] bool contains(const std::string& key) const;

    /**
     * @brief Member lookup; returns a null value when absent.
     */
    const JsonValue& operator[](const std::string& key) const;

    /**
     * @brief Element lookup; returns a null value when out of range.
     */
    const JsonValue& at(size_t index) const;

    /**
     * @brief Set an object member, converting a null value to an object.
     * @return Reference to the stored member
     */
    JsonValue& set(const std::string& key, JsonValue value);

    /**
     * @brief Append an array element, converting a null value to an array.
     */
    void push(JsonValue value);

    [[nodiscard]] size_t size() const noexcept;
    [[nodiscard]] const Array& items() const noexcept { return arrayValue_; }
    [[nodiscard]] const Object& members() const noexcept { return objectValue_; }

    /**
     * @brief Serialize to compact JSON text.
     */
    [[nodiscard]] std::string dump() const;

    bool operator==(const JsonValue& other) const;
    bool operator!=(const JsonValue& other) const { return !(*this == other); }

    /**
     * @brief Escape a string for embedding in JSON output.
     */
    static std::string escape(const std::string& text);

private:
    void dumpTo(std::string& out) const;

    JsonType type_ = JsonType::Null;
    bool boolValue_ = false;
    double numberValue_ = 0.0;
    std::string stringValue_;
    Array arrayValue_;
    Object objectValue_;
};

} // namespace core
} // namespace mediarelay

#endif // MEDIARELAY_CORE_JSON_HPP
