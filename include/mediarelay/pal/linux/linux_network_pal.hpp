// MediaRelay - WebRTC SFU Signaling Server
// Linux Network PAL Implementation
//
// Uses epoll for event notification and BSD sockets for networking

#ifndef MEDIARELAY_PAL_LINUX_LINUX_NETWORK_PAL_HPP
#define MEDIARELAY_PAL_LINUX_LINUX_NETWORK_PAL_HPP

#include "mediarelay/pal/network_pal.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace mediarelay {
namespace pal {
namespace linux {

/**
 * @brief Linux implementation of INetworkPAL using epoll.
 *
 * This implementation uses:
 * - epoll in level-triggered mode; interest is recomputed from the pending
 *   accept/read/write state of each socket
 * - an eventfd to wake epoll_wait on stop
 * - send(MSG_NOSIGNAL) so a vanished peer never raises SIGPIPE
 *
 * Handles carry a generation counter in the upper 32 bits and the file
 * descriptor in the lower 32 bits.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Callbacks are invoked from the event loop thread with no lock held
 */
class LinuxNetworkPAL : public INetworkPAL {
public:
    LinuxNetworkPAL();

    /**
     * @brief Stops the event loop and closes all sockets.
     */
    ~LinuxNetworkPAL() override;

    LinuxNetworkPAL(const LinuxNetworkPAL&) = delete;
    LinuxNetworkPAL& operator=(const LinuxNetworkPAL&) = delete;
    LinuxNetworkPAL(LinuxNetworkPAL&&) = delete;
    LinuxNetworkPAL& operator=(LinuxNetworkPAL&&) = delete;

    // =========================================================================
    // INetworkPAL Implementation
    // =========================================================================

    core::Result<void, NetworkError> initialize() override;
    void runEventLoop() override;
    void stopEventLoop() override;
    bool isRunning() const override;

    core::Result<ServerSocket, NetworkError> createServer(
        const std::string& address,
        uint16_t port,
        const ServerOptions& options
    ) override;

    void asyncAccept(const ServerSocket& server, AcceptCallback callback) override;

    void asyncRead(SocketHandle socket, size_t maxBytes, ReadCallback callback) override;

    void asyncWrite(SocketHandle socket, const core::Buffer& data,
                    WriteCallback callback) override;

    void closeSocket(SocketHandle socket) override;

    core::Result<int, NetworkError> releaseSocket(SocketHandle socket) override;

    core::Result<SocketAddress, NetworkError> getPeerAddress(
        SocketHandle socket
    ) const override;

    core::Result<SocketHandle, NetworkError> bindUdp(
        const std::string& address,
        uint16_t port
    ) override;

    core::Result<SocketAddress, NetworkError> getLocalAddress(
        SocketHandle socket
    ) const override;

    bool isUdpPortBound(uint16_t port) const override;

    core::Result<std::vector<std::string>, NetworkError> listLocalIPv4Addresses() const override;

private:
    struct PendingWrite {
        core::Buffer data;
        size_t offset = 0;
        WriteCallback callback;
    };

    struct SocketInfo {
        int fd = -1;
        bool isServer = false;
        bool isDatagram = false;
        bool registered = false;      ///< Currently in the epoll set
        uint32_t interest = 0;        ///< Last mask given to epoll
        AcceptCallback acceptCallback;
        ReadCallback readCallback;
        size_t maxReadBytes = 0;
        std::deque<PendingWrite> writeQueue;
    };

    using Completion = std::function<void()>;

    SocketHandle makeHandle(int fd);

    bool setNonBlocking(int fd);

    /**
     * @brief Bring the epoll registration in line with the socket state.
     *
     * Caller holds socketsMutex_.
     */
    void updateInterest(uint64_t key, SocketInfo& info);

    void processEvents();
    void handleEvent(uint64_t key, uint32_t events, std::vector<Completion>& completions);
    void handleAccept(SocketInfo& info, std::vector<Completion>& completions);
    void handleReadable(SocketInfo& info, std::vector<Completion>& completions);
    void handleWritable(SocketInfo& info, std::vector<Completion>& completions);
    void failPendingWrites(SocketInfo& info, const NetworkError& error,
                           std::vector<Completion>& completions);

    void wake();

    static core::Result<SocketAddress, NetworkError> socketAddress(int fd, bool peer);

    NetworkError errnoToNetworkError(int err) const;

    // Reserved epoll key for the wake eventfd
    static constexpr uint64_t WAKE_KEY = 0;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};

    int epollFd_{-1};
    int wakeEventFd_{-1};

    std::atomic<uint32_t> generation_{1};

    mutable std::mutex socketsMutex_;
    std::unordered_map<uint64_t, SocketInfo> sockets_;
};

} // namespace linux
} // namespace pal
} // namespace mediarelay

#endif // MEDIARELAY_PAL_LINUX_LINUX_NETWORK_PAL_HPP
