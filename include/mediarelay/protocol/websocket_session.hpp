// MediaRelay - WebRTC SFU Signaling Server
// WebSocket Session - one upgraded signaling connection on Boost.Beast
//
// The HTTP side of the server reads and parses the upgrade request itself;
// the raw request bytes are handed to the session, which completes the
// handshake and then carries text messages in both directions.

#ifndef MEDIARELAY_PROTOCOL_WEBSOCKET_SESSION_HPP
#define MEDIARELAY_PROTOCOL_WEBSOCKET_SESSION_HPP

#include "mediarelay/core/structured_logger.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mediarelay {
namespace protocol {

namespace websocket {
    constexpr size_t DEFAULT_MAX_MESSAGE_SIZE = 1024 * 1024;

    constexpr uint16_t CLOSE_NORMAL = 1000;
    constexpr uint16_t CLOSE_GOING_AWAY = 1001;
    constexpr uint16_t CLOSE_UNSUPPORTED_DATA = 1003;
}

/**
 * @brief Callbacks of a session. All run on the session's strand.
 */
struct WebSocketHandlers {
    /// Handshake completed; no message is delivered before this returns
    std::function<void()> onOpen;
    std::function<void(std::string)> onText;
    /// Connection gone, whether the handshake succeeded or not. Called once.
    std::function<void()> onClosed;
};

/**
 * @brief Server side of one WebSocket connection.
 *
 * Binary messages are answered with close code 1003; pings are answered by
 * Beast. Outgoing text messages are queued and written one at a time, so
 * sendText() may be called from any thread in any number.
 *
 * Must be owned by a shared_ptr: pending operations keep it alive.
 *
 * @code
 * tcp::socket socket(asio::make_strand(ioContext));
 * socket.assign(tcp::v4(), fd);
 * auto session = std::make_shared<WebSocketSession>(std::move(socket), handlers, logger);
 * session->accept(rawUpgradeRequest);
 * session->sendText(R"({"event":"clientId"})");
 * @endcode
 */
class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
public:
    using Socket = boost::asio::ip::tcp::socket;

    WebSocketSession(
        Socket socket,
        WebSocketHandlers handlers,
        std::shared_ptr<core::StructuredLogger> logger = nullptr,
        size_t maxMessageSize = websocket::DEFAULT_MAX_MESSAGE_SIZE
    );

    WebSocketSession(const WebSocketSession&) = delete;
    WebSocketSession& operator=(const WebSocketSession&) = delete;

    /**
     * @brief Complete the handshake for an upgrade request already read.
     *
     * Bytes after the request are kept as the first WebSocket data. Beast
     * answers an invalid upgrade with an HTTP error status and onClosed runs.
     */
    void accept(std::string upgradeRequest);

    /**
     * @brief Queue a text message; dropped once closing has started.
     */
    void sendText(std::string text);

    /**
     * @brief Start the closing handshake after the queued messages are written.
     */
    void close(uint16_t code, std::string reason = "");

    /**
     * @brief Drop the TCP connection without a closing handshake.
     */
    void shutdown();

private:
    void onAccept(boost::beast::error_code ec);
    void doRead();
    void onRead(boost::beast::error_code ec);

    void enqueue(std::shared_ptr<std::string> text);
    void doWrite();
    void onWrite(boost::beast::error_code ec);

    void startClose(uint16_t code, std::string reason);
    void doClose();

    void closeSocket();
    void finish();

    boost::beast::websocket::stream<Socket> ws_;
    boost::beast::flat_buffer buffer_;
    WebSocketHandlers handlers_;
    std::shared_ptr<core::StructuredLogger> logger_;
    size_t maxMessageSize_;

    // Strand state
    std::deque<std::shared_ptr<std::string>> outbox_;
    bool writing_ = false;
    bool closing_ = false;
    std::optional<boost::beast::websocket::close_reason> pendingClose_;

    std::atomic<bool> finished_{false};
};

} // namespace protocol
} // namespace mediarelay

#endif // MEDIARELAY_PROTOCOL_WEBSOCKET_SESSION_HPP
