// MediaRelay - WebRTC SFU Signaling Server
// HTTP Message Implementation

#include "mediarelay/protocol/http_message.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace mediarelay {
namespace protocol {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

} // namespace

// =============================================================================
// Request
// =============================================================================

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it == headers.end() ? std::string() : it->second;
}

bool HttpRequest::headerHasToken(const std::string& name, const std::string& token) const {
    std::istringstream stream(toLower(header(name)));
    std::string item;
    const std::string wanted = toLower(token);
    while (std::getline(stream, item, ',')) {
        if (trim(item) == wanted) {
            return true;
        }
    }
    return false;
}

bool HttpRequest::isWebSocketUpgrade() const {
    return method == "GET" &&
           headerHasToken("Connection", "upgrade") &&
           toLower(header("Upgrade")) == "websocket";
}

core::Result<std::optional<ParsedHttpRequest>, HttpError> parseHttpRequest(const std::string& data) {
    using ParseOutcome = core::Result<std::optional<ParsedHttpRequest>, HttpError>;

    const size_t terminator = data.find(http::HEADER_TERMINATOR);
    if (terminator == std::string::npos) {
        if (data.size() > http::MAX_HEADER_SIZE) {
            return ParseOutcome::error(HttpError(HttpError::Code::HeaderTooLarge,
                                                 "Request header exceeds limit"));
        }
        return ParseOutcome::success(std::nullopt);
    }
    if (terminator > http::MAX_HEADER_SIZE) {
        return ParseOutcome::error(HttpError(HttpError::Code::HeaderTooLarge,
                                             "Request header exceeds limit"));
    }

    ParsedHttpRequest parsed;
    parsed.bytesConsumed = terminator + 4;
    HttpRequest& request = parsed.request;

    const std::string head = data.substr(0, terminator);
    size_t lineEnd = head.find("\r\n");
    const std::string requestLine = head.substr(0, lineEnd);

    std::istringstream line(requestLine);
    if (!(line >> request.method >> request.target >> request.version)) {
        return ParseOutcome::error(HttpError(HttpError::Code::MalformedRequest,
                                             "Malformed request line"));
    }
    if (request.version != "HTTP/1.1" && request.version != "HTTP/1.0") {
        return ParseOutcome::error(HttpError(HttpError::Code::UnsupportedVersion,
                                             "Unsupported version " + request.version));
    }

    const size_t queryStart = request.target.find('?');
    request.path = request.target.substr(0, queryStart);
    if (queryStart != std::string::npos) {
        request.query = request.target.substr(queryStart + 1);
    }

    size_t position = lineEnd == std::string::npos ? head.size() : lineEnd + 2;
    while (position < head.size()) {
        size_t next = head.find("\r\n", position);
        if (next == std::string::npos) {
            next = head.size();
        }
        const std::string headerLine = head.substr(position, next - position);
        position = next + 2;

        const size_t colon = headerLine.find(':');
        if (colon == std::string::npos || colon == 0) {
            return ParseOutcome::error(HttpError(HttpError::Code::MalformedRequest,
                                                 "Malformed header line"));
        }
        const std::string name = toLower(headerLine.substr(0, colon));
        const std::string value = trim(headerLine.substr(colon + 1));

        auto existing = request.headers.find(name);
        if (existing != request.headers.end()) {
            existing->second += ", " + value;
        } else {
            request.headers.emplace(name, value);
        }
    }

    return ParseOutcome::success(std::move(parsed));
}

// =============================================================================
// Response
// =============================================================================

void HttpResponse::setHeader(const std::string& name, const std::string& value) {
    const std::string lowered = toLower(name);
    for (auto& header : headers) {
        if (toLower(header.first) == lowered) {
            header.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

std::string HttpResponse::serialize() const {
    std::string out = "HTTP/1.1 " + std::to_string(status) + " " + httpReasonPhrase(status) + "\r\n";

    bool hasLength = false;
    for (const auto& header : headers) {
        if (toLower(header.first) == "content-length") {
            hasLength = true;
        }
        out += header.first + ": " + header.second + "\r\n";
    }
    if (!hasLength && status != 101) {
        out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    }
    out += "\r\n";
    out += body;
    return out;
}

HttpResponse HttpResponse::text(int status, const std::string& body) {
    HttpResponse response;
    response.status = status;
    response.setHeader("Content-Type", "text/plain; charset=utf-8");
    response.body = body;
    return response;
}

const char* httpReasonPhrase(int status) {
    switch (status) {
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 426: return "Upgrade Required";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 505: return "HTTP Version Not Supported";
        default: return "Unknown";
    }
}

} // namespace protocol
} // namespace mediarelay
