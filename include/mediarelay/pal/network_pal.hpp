// MediaRelay - WebRTC SFU Signaling Server
// Platform Abstraction Layer - Network Interface
//
// Non-blocking TCP listeners and connections driven by one event loop
// thread, plus plain UDP binds used for port reservation and probing.

#ifndef MEDIARELAY_PAL_NETWORK_PAL_HPP
#define MEDIARELAY_PAL_NETWORK_PAL_HPP

#include "mediarelay/pal/pal_types.hpp"
#include "mediarelay/core/result.hpp"
#include "mediarelay/core/buffer.hpp"

#include <string>
#include <vector>

namespace mediarelay {
namespace pal {

/**
 * @brief Abstract interface for socket I/O.
 *
 * ## Event Loop Model
 * 1. initialize() once
 * 2. runEventLoop() on a dedicated thread (blocks)
 * 3. Async operations may be issued from any thread
 * 4. stopEventLoop() from any thread makes runEventLoop() return
 *
 * ## Callback Guarantees
 * - Every callback runs on the event loop thread
 * - No internal lock is held while a callback runs, so callbacks may issue
 *   further operations (including closeSocket) on any socket
 * - After closeSocket() returns, no new callback for that socket starts;
 *   one that had already been picked up may still complete
 *
 * Operations on a handle that is not open fail immediately, on the calling
 * thread.
 *
 * Socket handles are never reused within one PAL instance, so a late
 * callback cannot be confused with a newer connection.
 */
class INetworkPAL {
public:
    virtual ~INetworkPAL() = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    virtual core::Result<void, NetworkError> initialize() = 0;

    /**
     * @brief Process socket events until stopEventLoop() is called.
     */
    virtual void runEventLoop() = 0;

    virtual void stopEventLoop() = 0;

    virtual bool isRunning() const = 0;

    // =========================================================================
    // TCP
    // =========================================================================

    /**
     * @brief Bind and listen on an IPv4 address.
     *
     * Port 0 binds an ephemeral port; the returned ServerSocket carries the
     * port actually bound.
     *
     * Error conditions:
     * - InvalidAddress: address is not a dotted IPv4 literal
     * - BindFailed / AddressInUse: the port is taken
     */
    virtual core::Result<ServerSocket, NetworkError> createServer(
        const std::string& address,
        uint16_t port,
        const ServerOptions& options
    ) = 0;

    /**
     * @brief Install the accept callback of a listener.
     *
     * The callback stays armed and is invoked once per accepted connection
     * until the listener is closed.
     */
    virtual void asyncAccept(
        const ServerSocket& server,
        AcceptCallback callback
    ) = 0;

    /**
     * @brief Read once from a connection.
     *
     * The callback receives up to maxBytes bytes, or ConnectionClosed when
     * the peer shut the connection down. Re-arm by calling asyncRead again.
     */
    virtual void asyncRead(
        SocketHandle socket,
        size_t maxBytes,
        ReadCallback callback
    ) = 0;

    /**
     * @brief Queue data for writing.
     *
     * Writes on one socket complete in the order they were queued. The
     * callback, which may be empty, reports the bytes written once the whole
     * buffer has been handed to the kernel.
     */
    virtual void asyncWrite(
        SocketHandle socket,
        const core::Buffer& data,
        WriteCallback callback
    ) = 0;

    /**
     * @brief Close a socket of any kind; unknown handles are ignored.
     */
    virtual void closeSocket(SocketHandle socket) = 0;

    /**
     * @brief Hand a connected TCP socket over to another I/O layer.
     *
     * The socket leaves the event loop without being closed and the caller
     * owns the returned descriptor. Fails for unknown handles, server and
     * datagram sockets, and sockets with a read or write still pending.
     */
    virtual core::Result<int, NetworkError> releaseSocket(SocketHandle socket) = 0;

    virtual core::Result<SocketAddress, NetworkError> getPeerAddress(
        SocketHandle socket
    ) const = 0;

    // =========================================================================
    // UDP
    // =========================================================================

    /**
     * @brief Bind a UDP socket without registering it with the event loop.
     *
     * Holding the socket reserves the port; AddressInUse tells that some
     * other socket (possibly in another process) already owns it.
     */
    virtual core::Result<SocketHandle, NetworkError> bindUdp(
        const std::string& address,
        uint16_t port
    ) = 0;

    virtual core::Result<SocketAddress, NetworkError> getLocalAddress(
        SocketHandle socket
    ) const = 0;

    /**
     * @brief Whether any process has a UDP socket bound to the port.
     *
     * Looks at the kernel's socket table without binding, so it never
     * competes with the process that is about to bind the port.
     */
    virtual bool isUdpPortBound(uint16_t port) const = 0;

    // =========================================================================
    // Interfaces
    // =========================================================================

    /**
     * @brief IPv4 addresses of the interfaces that are up, loopback excluded.
     */
    virtual core::Result<std::vector<std::string>, NetworkError> listLocalIPv4Addresses() const = 0;
};

} // namespace pal
} // namespace mediarelay

#endif // MEDIARELAY_PAL_NETWORK_PAL_HPP
