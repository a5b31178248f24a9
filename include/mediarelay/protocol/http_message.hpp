// MediaRelay - WebRTC SFU Signaling Server
// HTTP/1.1 request parsing and response serialization
//
// Covers what the signaling port needs: the WebSocket upgrade handshake and
// GET requests for playback files. No bodies, no chunked encoding.

#ifndef MEDIARELAY_PROTOCOL_HTTP_MESSAGE_HPP
#define MEDIARELAY_PROTOCOL_HTTP_MESSAGE_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "mediarelay/core/result.hpp"

namespace mediarelay {
namespace protocol {

namespace http {
    constexpr size_t MAX_HEADER_SIZE = 16 * 1024;
    constexpr const char* HEADER_TERMINATOR = "\r\n\r\n";
}

struct HttpError {
    enum class Code {
        MalformedRequest,
        HeaderTooLarge,
        UnsupportedVersion
    };

    Code code;
    std::string message;

    HttpError(Code c = Code::MalformedRequest, std::string msg = "")
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] int statusCode() const {
        switch (code) {
            case Code::HeaderTooLarge: return 431;
            case Code::UnsupportedVersion: return 505;
            default: return 400;
        }
    }
};

/**
 * @brief Parsed request line and headers.
 *
 * Header names are stored lower-cased.
 */
struct HttpRequest {
    std::string method;
    std::string target;      ///< As sent, including the query
    std::string path;        ///< target without the query
    std::string query;
    std::string version;
    std::map<std::string, std::string> headers;

    /**
     * @brief Header value by case-insensitive name, empty when absent.
     */
    [[nodiscard]] std::string header(const std::string& name) const;

    /**
     * @brief Whether a comma-separated header contains token (case-insensitive).
     */
    [[nodiscard]] bool headerHasToken(const std::string& name, const std::string& token) const;

    [[nodiscard]] bool isWebSocketUpgrade() const;
};

/**
 * @brief Parsed request plus the number of bytes its header occupied.
 */
struct ParsedHttpRequest {
    HttpRequest request;
    size_t bytesConsumed = 0;
};

/**
 * @brief Parse a request header block.
 *
 * @return nullopt while the header terminator has not arrived yet
 */
core::Result<std::optional<ParsedHttpRequest>, HttpError> parseHttpRequest(const std::string& data);

struct HttpResponse {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    void setHeader(const std::string& name, const std::string& value);

    /**
     * @brief Status line, headers (Content-Length added unless present) and body.
     */
    [[nodiscard]] std::string serialize() const;

    static HttpResponse text(int status, const std::string& body);
};

const char* httpReasonPhrase(int status);

} // namespace protocol
} // namespace mediarelay

#endif // MEDIARELAY_PROTOCOL_HTTP_MESSAGE_HPP
