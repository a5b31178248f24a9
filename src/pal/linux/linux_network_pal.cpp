// MediaRelay - WebRTC SFU Signaling Server
// Linux Network PAL Implementation using epoll

#include "mediarelay/pal/linux/linux_network_pal.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace mediarelay {
namespace pal {
namespace linux {

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxNetworkPAL::LinuxNetworkPAL() = default;

LinuxNetworkPAL::~LinuxNetworkPAL() {
    stopEventLoop();

    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        for (auto& pair : sockets_) {
            if (pair.second.fd >= 0) {
                close(pair.second.fd);
            }
        }
        sockets_.clear();
    }

    if (wakeEventFd_ >= 0) {
        close(wakeEventFd_);
        wakeEventFd_ = -1;
    }

    if (epollFd_ >= 0) {
        close(epollFd_);
        epollFd_ = -1;
    }
}

// =============================================================================
// Initialization
// =============================================================================

core::Result<void, NetworkError> LinuxNetworkPAL::initialize() {
    if (initialized_.load()) {
        return core::Result<void, NetworkError>::error(
            NetworkError{NetworkErrorCode::AlreadyInitialized, "Network PAL already initialized", 0}
        );
    }

    epollFd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0) {
        int err = errno;
        return core::Result<void, NetworkError>::error(
            NetworkError{NetworkErrorCode::InitializationFailed,
                         "epoll_create1 failed: " + std::string(strerror(err)), err}
        );
    }

    wakeEventFd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeEventFd_ < 0) {
        int err = errno;
        close(epollFd_);
        epollFd_ = -1;
        return core::Result<void, NetworkError>::error(
            NetworkError{NetworkErrorCode::InitializationFailed,
                         "eventfd failed: " + std::string(strerror(err)), err}
        );
    }

    struct epoll_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.events = EPOLLIN;
    ev.data.u64 = WAKE_KEY;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, wakeEventFd_, &ev) < 0) {
        int err = errno;
        close(wakeEventFd_);
        close(epollFd_);
        wakeEventFd_ = -1;
        epollFd_ = -1;
        return core::Result<void, NetworkError>::error(
            NetworkError{NetworkErrorCode::InitializationFailed,
                         "epoll_ctl failed: " + std::string(strerror(err)), err}
        );
    }

    initialized_ = true;
    return core::Result<void, NetworkError>::success();
}

// =============================================================================
// Event Loop
// =============================================================================

void LinuxNetworkPAL::runEventLoop() {
    if (!initialized_.load()) {
        return;
    }

    running_ = true;

    while (!stopRequested_.load()) {
        processEvents();
    }

    running_ = false;
}

void LinuxNetworkPAL::stopEventLoop() {
    stopRequested_ = true;
    wake();
}

bool LinuxNetworkPAL::isRunning() const {
    return running_.load();
}

void LinuxNetworkPAL::wake() {
    if (wakeEventFd_ >= 0) {
        uint64_t val = 1;
        if (write(wakeEventFd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
            // eventfd already signalled or being torn down
            return;
        }
    }
}

void LinuxNetworkPAL::processEvents() {
    const int maxEvents = 64;
    struct epoll_event events[maxEvents];

    int nfds = epoll_wait(epollFd_, events, maxEvents, 100);
    if (nfds < 0) {
        return;
    }

    std::vector<Completion> completions;

    for (int i = 0; i < nfds; ++i) {
        uint64_t key = events[i].data.u64;

        if (key == WAKE_KEY) {
            uint64_t val;
            while (read(wakeEventFd_, &val, sizeof(val)) > 0) {
            }
            continue;
        }

        handleEvent(key, events[i].events, completions);
    }

    // Invoke callbacks outside the lock
    for (auto& completion : completions) {
        completion();
    }
}

void LinuxNetworkPAL::handleEvent(uint64_t key, uint32_t events,
                                  std::vector<Completion>& completions) {
    std::lock_guard<std::mutex> lock(socketsMutex_);

    auto it = sockets_.find(key);
    if (it == sockets_.end()) {
        return;
    }
    SocketInfo& info = it->second;

    if (info.isServer) {
        if ((events & EPOLLIN) && info.acceptCallback) {
            handleAccept(info, completions);
        }
        updateInterest(key, info);
        return;
    }

    if ((events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR)) && info.readCallback) {
        handleReadable(info, completions);
    }

    if ((events & EPOLLOUT) && !info.writeQueue.empty()) {
        handleWritable(info, completions);
    }

    if ((events & (EPOLLHUP | EPOLLERR)) && !info.writeQueue.empty()) {
        failPendingWrites(info,
            NetworkError{NetworkErrorCode::ConnectionReset, "Connection reset by peer", 0},
            completions);
    }

    updateInterest(key, info);
}

void LinuxNetworkPAL::handleAccept(SocketInfo& info, std::vector<Completion>& completions) {
    AcceptCallback callback = info.acceptCallback;

    while (true) {
        int clientFd = accept4(info.fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (clientFd < 0) {
            int err = errno;
            if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
                return;
            }
            NetworkError error = errnoToNetworkError(err);
            completions.push_back([callback, error]() {
                callback(core::Result<SocketHandle, NetworkError>::error(error));
            });
            return;
        }

        SocketHandle clientHandle = makeHandle(clientFd);
        SocketInfo clientInfo;
        clientInfo.fd = clientFd;
        // Element references survive rehashing, so `info` stays valid
        sockets_[clientHandle.value] = std::move(clientInfo);

        completions.push_back([callback, clientHandle]() {
            callback(core::Result<SocketHandle, NetworkError>::success(clientHandle));
        });
    }
}

void LinuxNetworkPAL::handleReadable(SocketInfo& info, std::vector<Completion>& completions) {
    core::Buffer buffer(info.maxReadBytes);

    ssize_t bytesRead = recv(info.fd, buffer.data(), buffer.size(), 0);
    if (bytesRead < 0) {
        int err = errno;
        if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
            return;
        }
        ReadCallback cb = std::move(info.readCallback);
        info.readCallback = nullptr;
        NetworkError error = errnoToNetworkError(err);
        completions.push_back([cb, error]() {
            cb(core::Result<core::Buffer, NetworkError>::error(error));
        });
        return;
    }

    ReadCallback cb = std::move(info.readCallback);
    info.readCallback = nullptr;

    if (bytesRead == 0) {
        completions.push_back([cb]() {
            cb(core::Result<core::Buffer, NetworkError>::error(
                NetworkError{NetworkErrorCode::ConnectionClosed, "Connection closed by peer", 0}));
        });
        return;
    }

    buffer.resize(static_cast<size_t>(bytesRead));
    completions.push_back([cb, buffer]() {
        cb(core::Result<core::Buffer, NetworkError>::success(buffer));
    });
}

void LinuxNetworkPAL::handleWritable(SocketInfo& info, std::vector<Completion>& completions) {
    while (!info.writeQueue.empty()) {
        PendingWrite& pending = info.writeQueue.front();
        const uint8_t* data = pending.data.data() + pending.offset;
        size_t remaining = pending.data.size() - pending.offset;

        ssize_t bytesWritten = send(info.fd, data, remaining, MSG_NOSIGNAL);
        if (bytesWritten < 0) {
            int err = errno;
            if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
                return;
            }
            failPendingWrites(info, errnoToNetworkError(err), completions);
            return;
        }

        pending.offset += static_cast<size_t>(bytesWritten);
        if (pending.offset < pending.data.size()) {
            return;
        }

        if (pending.callback) {
            WriteCallback cb = std::move(pending.callback);
            size_t total = pending.data.size();
            completions.push_back([cb, total]() {
                cb(core::Result<size_t, NetworkError>::success(total));
            });
        }
        info.writeQueue.pop_front();
    }
}

void LinuxNetworkPAL::failPendingWrites(SocketInfo& info, const NetworkError& error,
                                        std::vector<Completion>& completions) {
    for (auto& pending : info.writeQueue) {
        if (pending.callback) {
            WriteCallback cb = std::move(pending.callback);
            completions.push_back([cb, error]() {
                cb(core::Result<size_t, NetworkError>::error(error));
            });
        }
    }
    info.writeQueue.clear();
}

// =============================================================================
// Server Socket Operations
// =============================================================================

core::Result<ServerSocket, NetworkError> LinuxNetworkPAL::createServer(
    const std::string& address,
    uint16_t port,
    const ServerOptions& options
) {
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return core::Result<ServerSocket, NetworkError>::error(
            NetworkError{NetworkErrorCode::InvalidAddress, "Invalid IPv4 address: " + address, 0}
        );
    }

    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        int err = errno;
        return core::Result<ServerSocket, NetworkError>::error(
            NetworkError{NetworkErrorCode::SocketCreationFailed,
                         "socket failed: " + std::string(strerror(err)), err}
        );
    }

    int opt = 1;
    if (options.reuseAddr) {
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    }
    if (options.reusePort) {
        setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt));
    }
    if (options.receiveBufferSize > 0) {
        setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &options.receiveBufferSize,
                   sizeof(options.receiveBufferSize));
    }
    if (options.sendBufferSize > 0) {
        setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &options.sendBufferSize,
                   sizeof(options.sendBufferSize));
    }

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close(fd);
        NetworkError error = errnoToNetworkError(err);
        if (error.code != NetworkErrorCode::AddressInUse) {
            error.code = NetworkErrorCode::BindFailed;
        }
        error.message = "bind " + address + ":" + std::to_string(port) + " failed: " + strerror(err);
        return core::Result<ServerSocket, NetworkError>::error(error);
    }

    if (listen(fd, options.backlog) < 0) {
        int err = errno;
        close(fd);
        return core::Result<ServerSocket, NetworkError>::error(
            NetworkError{NetworkErrorCode::ListenFailed,
                         "listen failed: " + std::string(strerror(err)), err}
        );
    }

    setNonBlocking(fd);

    auto local = socketAddress(fd, false);

    SocketHandle handle = makeHandle(fd);
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        SocketInfo info;
        info.fd = fd;
        info.isServer = true;
        sockets_[handle.value] = std::move(info);
    }

    ServerSocket server;
    server.handle = handle;
    server.address = address;
    server.port = local.isSuccess() ? local.value().port : port;

    return core::Result<ServerSocket, NetworkError>::success(server);
}

// =============================================================================
// Async I/O Operations
// =============================================================================

void LinuxNetworkPAL::asyncAccept(const ServerSocket& server, AcceptCallback callback) {
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        auto it = sockets_.find(server.handle.value);
        if (it != sockets_.end() && it->second.isServer) {
            it->second.acceptCallback = std::move(callback);
            updateInterest(it->first, it->second);
            return;
        }
    }

    if (callback) {
        callback(core::Result<SocketHandle, NetworkError>::error(
            NetworkError{NetworkErrorCode::AcceptFailed, "Unknown listener handle", 0}));
    }
}

void LinuxNetworkPAL::asyncRead(SocketHandle socket, size_t maxBytes, ReadCallback callback) {
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        auto it = sockets_.find(socket.value);
        if (it != sockets_.end() && !it->second.isServer && !it->second.isDatagram) {
            it->second.readCallback = std::move(callback);
            it->second.maxReadBytes = maxBytes > 0 ? maxBytes : 4096;
            updateInterest(it->first, it->second);
            return;
        }
    }

    if (callback) {
        callback(core::Result<core::Buffer, NetworkError>::error(
            NetworkError{NetworkErrorCode::ReadFailed, "Socket not found", 0}));
    }
}

void LinuxNetworkPAL::asyncWrite(SocketHandle socket, const core::Buffer& data,
                                 WriteCallback callback) {
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        auto it = sockets_.find(socket.value);
        if (it != sockets_.end() && !it->second.isServer && !it->second.isDatagram) {
            PendingWrite pending;
            pending.data = data;
            pending.callback = std::move(callback);
            it->second.writeQueue.push_back(std::move(pending));
            updateInterest(it->first, it->second);
            return;
        }
    }

    if (callback) {
        callback(core::Result<size_t, NetworkError>::error(
            NetworkError{NetworkErrorCode::WriteFailed, "Socket not found", 0}));
    }
}

// =============================================================================
// Socket Management
// =============================================================================

void LinuxNetworkPAL::closeSocket(SocketHandle socket) {
    if (socket == INVALID_SOCKET_HANDLE) {
        return;
    }

    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        auto it = sockets_.find(socket.value);
        if (it == sockets_.end()) {
            return;
        }
        fd = it->second.fd;
        if (it->second.registered) {
            epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr);
        }
        sockets_.erase(it);
        // Close under the lock so the fd number cannot be recycled into a
        // socket registered before the old entry is gone
        close(fd);
    }
}

core::Result<int, NetworkError> LinuxNetworkPAL::releaseSocket(SocketHandle socket) {
    std::lock_guard<std::mutex> lock(socketsMutex_);
    auto it = sockets_.find(socket.value);
    if (it == sockets_.end()) {
        return core::Result<int, NetworkError>::error(
            NetworkError{NetworkErrorCode::InvalidAddress, "Unknown socket", 0});
    }

    SocketInfo& info = it->second;
    if (info.isServer || info.isDatagram) {
        return core::Result<int, NetworkError>::error(
            NetworkError{NetworkErrorCode::Unknown, "Only connected TCP sockets can be released", 0});
    }
    if (info.readCallback || !info.writeQueue.empty()) {
        return core::Result<int, NetworkError>::error(
            NetworkError{NetworkErrorCode::WouldBlock, "Socket has pending I/O", 0});
    }

    int fd = info.fd;
    if (info.registered && epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        int err = errno;
        return core::Result<int, NetworkError>::error(
            NetworkError{NetworkErrorCode::Unknown,
                         "epoll_ctl failed: " + std::string(strerror(err)), err});
    }
    sockets_.erase(it);
    return core::Result<int, NetworkError>::success(fd);
}

core::Result<SocketAddress, NetworkError> LinuxNetworkPAL::getPeerAddress(
    SocketHandle socket
) const {
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        auto it = sockets_.find(socket.value);
        if (it == sockets_.end()) {
            return core::Result<SocketAddress, NetworkError>::error(
                NetworkError{NetworkErrorCode::InvalidAddress, "Socket not found", 0});
        }
        fd = it->second.fd;
    }
    return socketAddress(fd, true);
}

core::Result<SocketHandle, NetworkError> LinuxNetworkPAL::bindUdp(
    const std::string& address,
    uint16_t port
) {
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return core::Result<SocketHandle, NetworkError>::error(
            NetworkError{NetworkErrorCode::InvalidAddress, "Invalid IPv4 address: " + address, 0}
        );
    }

    int fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        int err = errno;
        return core::Result<SocketHandle, NetworkError>::error(
            NetworkError{NetworkErrorCode::SocketCreationFailed,
                         "socket failed: " + std::string(strerror(err)), err}
        );
    }

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close(fd);
        return core::Result<SocketHandle, NetworkError>::error(errnoToNetworkError(err));
    }

    SocketHandle handle = makeHandle(fd);
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        SocketInfo info;
        info.fd = fd;
        info.isDatagram = true;
        sockets_[handle.value] = std::move(info);
    }
    return core::Result<SocketHandle, NetworkError>::success(handle);
}

core::Result<SocketAddress, NetworkError> LinuxNetworkPAL::getLocalAddress(
    SocketHandle socket
) const {
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        auto it = sockets_.find(socket.value);
        if (it == sockets_.end()) {
            return core::Result<SocketAddress, NetworkError>::error(
                NetworkError{NetworkErrorCode::InvalidAddress, "Socket not found", 0});
        }
        fd = it->second.fd;
    }
    return socketAddress(fd, false);
}

bool LinuxNetworkPAL::isUdpPortBound(uint16_t port) const {
    // Rows look like "  0: 0100007F:C350 00000000:0000 07 ..."; the local
    // port is the hex number after the colon of the second column
    for (const char* table : {"/proc/net/udp", "/proc/net/udp6"}) {
        std::ifstream in(table);
        if (!in) {
            continue;
        }

        std::string line;
        std::getline(in, line);  // header
        while (std::getline(in, line)) {
            std::istringstream row(line);
            std::string slot;
            std::string local;
            if (!(row >> slot >> local)) {
                continue;
            }
            auto colon = local.rfind(':');
            if (colon == std::string::npos) {
                continue;
            }
            unsigned long localPort = std::strtoul(local.c_str() + colon + 1, nullptr, 16);
            if (localPort == port) {
                return true;
            }
        }
    }
    return false;
}

core::Result<std::vector<std::string>, NetworkError> LinuxNetworkPAL::listLocalIPv4Addresses() const {
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) < 0) {
        int err = errno;
        return core::Result<std::vector<std::string>, NetworkError>::error(
            NetworkError{NetworkErrorCode::Unknown,
                         "Failed to enumerate network interfaces: " + std::string(strerror(err)), err});
    }

    std::vector<std::string> addresses;
    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((ifa->ifa_flags & IFF_UP) == 0 || (ifa->ifa_flags & IFF_LOOPBACK) != 0) {
            continue;
        }

        char text[INET_ADDRSTRLEN];
        auto* sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        if (inet_ntop(AF_INET, &sin->sin_addr, text, sizeof(text)) != nullptr) {
            addresses.emplace_back(text);
        }
    }
    freeifaddrs(ifaddr);

    return core::Result<std::vector<std::string>, NetworkError>::success(std::move(addresses));
}

// =============================================================================
// Helper Functions
// =============================================================================

SocketHandle LinuxNetworkPAL::makeHandle(int fd) {
    uint64_t generation = generation_.fetch_add(1);
    return SocketHandle{(generation << 32) | static_cast<uint32_t>(fd)};
}

bool LinuxNetworkPAL::setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
}

void LinuxNetworkPAL::updateInterest(uint64_t key, SocketInfo& info) {
    if (info.isDatagram || epollFd_ < 0) {
        return;
    }

    uint32_t mask = 0;
    if (info.isServer) {
        if (info.acceptCallback) {
            mask |= EPOLLIN;
        }
    } else {
        if (info.readCallback) {
            mask |= EPOLLIN | EPOLLRDHUP;
        }
        if (!info.writeQueue.empty()) {
            mask |= EPOLLOUT;
        }
    }

    // An idle socket leaves the epoll set; otherwise HUP/ERR, which epoll
    // always reports, would spin the loop until somebody reads or closes
    if (mask == 0) {
        if (info.registered) {
            epoll_ctl(epollFd_, EPOLL_CTL_DEL, info.fd, nullptr);
            info.registered = false;
            info.interest = 0;
        }
        return;
    }

    if (info.registered && info.interest == mask) {
        return;
    }

    struct epoll_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.events = mask;
    ev.data.u64 = key;
    int op = info.registered ? EPOLL_CTL_MOD : EPOLL_CTL_ADD;
    if (epoll_ctl(epollFd_, op, info.fd, &ev) == 0) {
        info.registered = true;
        info.interest = mask;
    }
}

core::Result<SocketAddress, NetworkError> LinuxNetworkPAL::socketAddress(int fd, bool peer) {
    struct sockaddr_in addr;
    socklen_t addrLen = sizeof(addr);
    memset(&addr, 0, sizeof(addr));

    int rc = peer
        ? getpeername(fd, reinterpret_cast<struct sockaddr*>(&addr), &addrLen)
        : getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &addrLen);
    if (rc < 0) {
        int err = errno;
        return core::Result<SocketAddress, NetworkError>::error(
            NetworkError{NetworkErrorCode::InvalidAddress,
                         std::string(peer ? "getpeername" : "getsockname") + " failed: " +
                         strerror(err), err});
    }

    char addrStr[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr.sin_addr, addrStr, sizeof(addrStr)) == nullptr) {
        int err = errno;
        return core::Result<SocketAddress, NetworkError>::error(
            NetworkError{NetworkErrorCode::InvalidAddress, "inet_ntop failed", err});
    }

    SocketAddress result;
    result.ip = addrStr;
    result.port = ntohs(addr.sin_port);
    return core::Result<SocketAddress, NetworkError>::success(result);
}

NetworkError LinuxNetworkPAL::errnoToNetworkError(int err) const {
    NetworkErrorCode code;
    std::string message;

    switch (err) {
        case ECONNREFUSED:
            code = NetworkErrorCode::ConnectionRefused;
            message = "Connection refused";
            break;
        case ECONNRESET:
        case EPIPE:
            code = NetworkErrorCode::ConnectionReset;
            message = "Connection reset by peer";
            break;
        case EADDRINUSE:
            code = NetworkErrorCode::AddressInUse;
            message = "Address already in use";
            break;
        case EADDRNOTAVAIL:
            code = NetworkErrorCode::AddressNotAvailable;
            message = "Address not available";
            break;
        case ENETUNREACH:
            code = NetworkErrorCode::NetworkUnreachable;
            message = "Network unreachable";
            break;
        case EHOSTUNREACH:
            code = NetworkErrorCode::HostUnreachable;
            message = "Host unreachable";
            break;
        case ETIMEDOUT:
            code = NetworkErrorCode::Timeout;
            message = "Connection timed out";
            break;
        case EINTR:
            code = NetworkErrorCode::Interrupted;
            message = "Operation interrupted";
            break;
        case EACCES:
        case EPERM:
            code = NetworkErrorCode::PermissionDenied;
            message = "Permission denied";
            break;
        case EMFILE:
        case ENFILE:
            code = NetworkErrorCode::TooManyOpenFiles;
            message = "Too many open files";
            break;
        case ENOMEM:
            code = NetworkErrorCode::OutOfMemory;
            message = "Out of memory";
            break;
        default:
            code = NetworkErrorCode::Unknown;
            message = "Unknown error: " + std::string(strerror(err));
            break;
    }

    return NetworkError{code, message, err};
}

} // namespace linux
} // namespace pal
} // namespace mediarelay
