// MediaRelay - WebRTC SFU Signaling Server
// Playback Resolver Implementation

#include "mediarelay/protocol/playback_resolver.hpp"

#include "mediarelay/core/json.hpp"
#include "mediarelay/core/path_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <system_error>
#include <vector>

namespace mediarelay {
namespace protocol {

namespace fs = std::filesystem;

namespace {

const char* LOG_CATEGORY = "Playback";

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::string> percentDecode(const std::string& segment) {
    std::string decoded;
    decoded.reserve(segment.size());
    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] != '%') {
            decoded.push_back(segment[i]);
            continue;
        }
        if (i + 2 >= segment.size()) {
            return std::nullopt;
        }
        int high = hexValue(segment[i + 1]);
        int low = hexValue(segment[i + 2]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        decoded.push_back(static_cast<char>(high * 16 + low));
        i += 2;
    }
    return decoded;
}

void applyPlaybackHeaders(HttpResponse& response) {
    response.setHeader("Access-Control-Allow-Origin", "*");
    response.setHeader("Cache-Control", "no-cache, no-store, must-revalidate");
}

} // namespace

int PlaybackError::statusCode() const {
    switch (code) {
        case Code::BadRequest: return 400;
        case Code::Forbidden: return 403;
        case Code::NotFound: return 404;
        case Code::MethodNotAllowed: return 405;
        case Code::ReadFailed: return 500;
    }
    return 500;
}

// =============================================================================
// Construction
// =============================================================================

PlaybackResolver::PlaybackResolver(
    std::string outputRoot,
    std::string pathPrefix,
    std::shared_ptr<core::StructuredLogger> logger
)
    : outputRoot_(std::move(outputRoot))
    , pathPrefix_(std::move(pathPrefix))
    , logger_(std::move(logger))
{
    while (pathPrefix_.size() > 1 && pathPrefix_.back() == '/') {
        pathPrefix_.pop_back();
    }
}

bool PlaybackResolver::handles(const std::string& requestPath) const {
    return requestPath.size() > pathPrefix_.size() &&
           requestPath.compare(0, pathPrefix_.size(), pathPrefix_) == 0 &&
           requestPath[pathPrefix_.size()] == '/';
}

// =============================================================================
// Resolution
// =============================================================================

core::Result<std::string, PlaybackError> PlaybackResolver::resolvePath(
    const std::string& requestPath
) const {
    using Outcome = core::Result<std::string, PlaybackError>;

    if (!handles(requestPath)) {
        return Outcome::error(PlaybackError(PlaybackError::Code::NotFound, "Not a playback path"));
    }

    const std::string relative = requestPath.substr(pathPrefix_.size() + 1);
    if (relative.empty()) {
        return Outcome::error(PlaybackError(PlaybackError::Code::NotFound, "No file named"));
    }
    if (relative.front() == '/') {
        return Outcome::error(PlaybackError(PlaybackError::Code::Forbidden, "Absolute path component"));
    }

    std::vector<std::string> segments;
    size_t position = 0;
    while (position <= relative.size()) {
        size_t slash = relative.find('/', position);
        if (slash == std::string::npos) {
            slash = relative.size();
        }
        const std::string raw = relative.substr(position, slash - position);
        position = slash + 1;

        auto decoded = percentDecode(raw);
        if (!decoded) {
            return Outcome::error(PlaybackError(PlaybackError::Code::BadRequest, "Invalid escape in path"));
        }
        if (*decoded == "..") {
            return Outcome::error(PlaybackError(PlaybackError::Code::Forbidden, "Parent directory segment"));
        }
        if (decoded->find('/') != std::string::npos ||
            decoded->find('\\') != std::string::npos ||
            decoded->find('\0') != std::string::npos) {
            return Outcome::error(PlaybackError(PlaybackError::Code::Forbidden, "Separator inside segment"));
        }
        if (decoded->empty() || *decoded == ".") {
            continue;
        }
        segments.push_back(*decoded);
    }

    if (segments.empty()) {
        return Outcome::error(PlaybackError(PlaybackError::Code::NotFound, "No file named"));
    }

    std::error_code ec;
    fs::path root = fs::absolute(outputRoot_, ec);
    if (!ec) {
        root = fs::weakly_canonical(root, ec);
    }
    if (ec) {
        return Outcome::error(PlaybackError(PlaybackError::Code::NotFound, "Output root unavailable"));
    }

    fs::path candidate = root;
    for (const auto& segment : segments) {
        candidate /= segment;
    }

    if (!fs::exists(candidate, ec)) {
        return Outcome::error(PlaybackError(PlaybackError::Code::NotFound, "File not found"));
    }

    // Symlinks may still lead out of the root
    const fs::path canonical = fs::canonical(candidate, ec);
    if (ec) {
        return Outcome::error(PlaybackError(PlaybackError::Code::NotFound, "File not found"));
    }
    if (!core::isPathWithin(root, canonical)) {
        return Outcome::error(PlaybackError(PlaybackError::Code::Forbidden, "Outside of the output root"));
    }
    if (!fs::is_regular_file(canonical, ec)) {
        return Outcome::error(PlaybackError(PlaybackError::Code::NotFound, "Not a file"));
    }

    return Outcome::success(canonical.string());
}

core::Result<PlaybackFile, PlaybackError> PlaybackResolver::load(
    const std::string& method,
    const std::string& requestPath
) const {
    using Outcome = core::Result<PlaybackFile, PlaybackError>;

    if (method != "GET" && method != "HEAD") {
        return Outcome::error(PlaybackError(PlaybackError::Code::MethodNotAllowed,
                                            "Method " + method + " not allowed"));
    }

    auto resolved = resolvePath(requestPath);
    if (resolved.isError()) {
        return Outcome::error(resolved.error());
    }

    PlaybackFile file;
    file.filePath = resolved.value();
    file.contentType = contentTypeFor(file.filePath);

    std::ifstream stream(file.filePath, std::ios::binary);
    if (!stream) {
        return Outcome::error(PlaybackError(PlaybackError::Code::ReadFailed, "Cannot open file"));
    }
    file.body.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
    if (stream.bad()) {
        return Outcome::error(PlaybackError(PlaybackError::Code::ReadFailed, "Cannot read file"));
    }

    return Outcome::success(std::move(file));
}

HttpResponse PlaybackResolver::respond(const HttpRequest& request) const {
    auto loaded = load(request.method, request.path);
    if (loaded.isError()) {
        const PlaybackError& error = loaded.error();
        if (error.code == PlaybackError::Code::Forbidden) {
            MEDIARELAY_LOG_WARNING(logger_, LOG_CATEGORY,
                "Rejected playback path " + request.path + ": " + error.message);
        } else {
            MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY,
                "Playback " + request.path + ": " + error.message);
        }

        core::JsonValue body = core::JsonValue::object();
        body.set("error", error.message);

        HttpResponse response;
        response.status = error.statusCode();
        response.setHeader("Content-Type", "application/json");
        if (error.code == PlaybackError::Code::MethodNotAllowed) {
            response.setHeader("Allow", "GET, HEAD");
        }
        applyPlaybackHeaders(response);
        response.body = body.dump();
        return response;
    }

    PlaybackFile& file = loaded.value();
    HttpResponse response;
    response.status = 200;
    response.setHeader("Content-Type", file.contentType);
    applyPlaybackHeaders(response);
    response.setHeader("Content-Length", std::to_string(file.body.size()));
    if (request.method != "HEAD") {
        response.body = std::move(file.body);
    }
    return response;
}

const char* PlaybackResolver::contentTypeFor(const std::string& filePath) {
    const std::string extension = fs::path(filePath).extension().string();
    if (extension == ".m3u8") {
        return "application/vnd.apple.mpegurl";
    }
    if (extension == ".ts") {
        return "video/mp2t";
    }
    return "application/octet-stream";
}

} // namespace protocol
} // namespace mediarelay
