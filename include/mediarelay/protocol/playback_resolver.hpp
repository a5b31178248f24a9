// MediaRelay - WebRTC SFU Signaling Server
// Playback Resolver - Serves HLS playlists and segments from the output root
//
// Request form: GET <pathPrefix>/<streamKey>/<file>
//
// Any ".." segment, absolute component or a canonical location outside the
// output root is rejected with 403 before the filesystem is read.

#ifndef MEDIARELAY_PROTOCOL_PLAYBACK_RESOLVER_HPP
#define MEDIARELAY_PROTOCOL_PLAYBACK_RESOLVER_HPP

#include <memory>
#include <string>

#include "mediarelay/core/result.hpp"
#include "mediarelay/core/structured_logger.hpp"
#include "mediarelay/protocol/http_message.hpp"

namespace mediarelay {
namespace protocol {

struct PlaybackError {
    enum class Code {
        BadRequest,         ///< Undecodable percent escape
        Forbidden,          ///< Traversal attempt
        NotFound,
        MethodNotAllowed,
        ReadFailed
    };

    Code code;
    std::string message;

    PlaybackError(Code c = Code::NotFound, std::string msg = "")
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] int statusCode() const;
};

/**
 * @brief A playback file ready to be sent.
 */
struct PlaybackFile {
    std::string filePath;
    std::string contentType;
    std::string body;
};

/**
 * @brief Maps playback URLs onto files below the recording output root.
 *
 * @code
 * PlaybackResolver playback(config.recording.outputRoot, config.playback.pathPrefix);
 * if (playback.handles(request.path)) {
 *     send(playback.respond(request).serialize());
 * }
 * @endcode
 *
 * Thread Safety: immutable after construction.
 */
class PlaybackResolver {
public:
    PlaybackResolver(
        std::string outputRoot,
        std::string pathPrefix,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );

    /**
     * @brief Whether the request path lies under the playback prefix.
     */
    [[nodiscard]] bool handles(const std::string& requestPath) const;

    /**
     * @brief Map a request path to a file path under the output root.
     *
     * The returned file exists and is a regular file.
     */
    core::Result<std::string, PlaybackError> resolvePath(const std::string& requestPath) const;

    core::Result<PlaybackFile, PlaybackError> load(
        const std::string& method,
        const std::string& requestPath
    ) const;

    /**
     * @brief Complete HTTP response, including error responses.
     */
    HttpResponse respond(const HttpRequest& request) const;

    static const char* contentTypeFor(const std::string& filePath);

private:
    std::string outputRoot_;
    std::string pathPrefix_;
    std::shared_ptr<core::StructuredLogger> logger_;
};

} // namespace protocol
} // namespace mediarelay

#endif // MEDIARELAY_PROTOCOL_PLAYBACK_RESOLVER_HPP
