// MediaRelay - WebRTC SFU Signaling Server
// Main header file

#ifndef MEDIARELAY_MEDIARELAY_HPP
#define MEDIARELAY_MEDIARELAY_HPP

/**
 * @file mediarelay.hpp
 * @brief Main header file for the MediaRelay library
 *
 * MediaRelay is the signaling layer of a selective forwarding unit: clients
 * negotiate WebRTC transports over a WebSocket, publish one media stream
 * each and subscribe to the streams of others. Broadcasts can additionally
 * be recorded to HLS by an external encoder and served over HTTP.
 */

#define MEDIARELAY_VERSION_MAJOR 0
#define MEDIARELAY_VERSION_MINOR 1
#define MEDIARELAY_VERSION_PATCH 0
#define MEDIARELAY_VERSION_STRING "0.1.0"

// Core types
#include "mediarelay/core/result.hpp"
#include "mediarelay/core/error_codes.hpp"
#include "mediarelay/core/types.hpp"
#include "mediarelay/core/config_manager.hpp"
#include "mediarelay/core/structured_logger.hpp"

// Server
#include "mediarelay/api/signaling_server.hpp"

namespace mediarelay {

/**
 * @brief Library version in "major.minor.patch" form.
 */
inline const char* version() {
    return MEDIARELAY_VERSION_STRING;
}

} // namespace mediarelay

#endif // MEDIARELAY_MEDIARELAY_HPP
