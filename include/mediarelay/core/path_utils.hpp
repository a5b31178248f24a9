// MediaRelay - WebRTC SFU Signaling Server
// Filesystem path helpers

#ifndef MEDIARELAY_CORE_PATH_UTILS_HPP
#define MEDIARELAY_CORE_PATH_UTILS_HPP

#include <filesystem>

namespace mediarelay {
namespace core {

/**
 * @brief True when candidate equals root or lies beneath it.
 *
 * Both paths must already be normalized (canonical or weakly_canonical);
 * the comparison is element-wise and does not touch the filesystem.
 */
inline bool isPathWithin(const std::filesystem::path& root, const std::filesystem::path& candidate) {
    auto rootIt = root.begin();
    auto candidateIt = candidate.begin();
    for (; rootIt != root.end(); ++rootIt, ++candidateIt) {
        if (rootIt->empty()) {
            // Trailing separator of the root
            continue;
        }
        if (candidateIt == candidate.end() || *rootIt != *candidateIt) {
            return false;
        }
    }
    return true;
}

} // namespace core
} // namespace mediarelay

#endif // MEDIARELAY_CORE_PATH_UTILS_HPP
