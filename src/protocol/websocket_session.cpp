// MediaRelay - WebRTC SFU Signaling Server
// WebSocket Session Implementation

#include "mediarelay/protocol/websocket_session.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket/error.hpp>

namespace mediarelay {
namespace protocol {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ws = beast::websocket;

namespace {

const char* LOG_CATEGORY = "WebSocket";

constexpr size_t MAX_CLOSE_REASON = 123;

} // namespace

WebSocketSession::WebSocketSession(
    Socket socket,
    WebSocketHandlers handlers,
    std::shared_ptr<core::StructuredLogger> logger,
    size_t maxMessageSize
)
    : ws_(std::move(socket))
    , handlers_(std::move(handlers))
    , logger_(std::move(logger))
    , maxMessageSize_(maxMessageSize)
{
}

// =============================================================================
// Handshake
// =============================================================================

void WebSocketSession::accept(std::string upgradeRequest) {
    auto request = std::make_shared<std::string>(std::move(upgradeRequest));
    asio::dispatch(ws_.get_executor(), [self = shared_from_this(), request]() {
        self->ws_.set_option(ws::stream_base::timeout::suggested(beast::role_type::server));
        self->ws_.set_option(ws::stream_base::decorator([](ws::response_type& response) {
            response.set(http::field::server, "MediaRelay");
        }));
        self->ws_.read_message_max(self->maxMessageSize_);

        self->ws_.async_accept(asio::buffer(*request),
            [self, request](beast::error_code ec) {
                self->onAccept(ec);
            });
    });
}

void WebSocketSession::onAccept(beast::error_code ec) {
    if (ec) {
        MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY, "Handshake failed: " + ec.message());
        finish();
        return;
    }

    if (handlers_.onOpen) {
        handlers_.onOpen();
    }
    doRead();
}

// =============================================================================
// Reading
// =============================================================================

void WebSocketSession::doRead() {
    ws_.async_read(buffer_, [self = shared_from_this()](beast::error_code ec, size_t) {
        self->onRead(ec);
    });
}

void WebSocketSession::onRead(beast::error_code ec) {
    if (ec) {
        if (ec != ws::error::closed) {
            MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY, "Read ended: " + ec.message());
        }
        finish();
        return;
    }

    if (!ws_.got_text()) {
        buffer_.consume(buffer_.size());
        startClose(websocket::CLOSE_UNSUPPORTED_DATA, "Binary frames are not supported");
        // The peer's close frame arrives through the read loop
        doRead();
        return;
    }

    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    if (!closing_ && handlers_.onText) {
        handlers_.onText(std::move(text));
    }
    doRead();
}

// =============================================================================
// Writing
// =============================================================================

void WebSocketSession::sendText(std::string text) {
    auto message = std::make_shared<std::string>(std::move(text));
    asio::post(ws_.get_executor(), [self = shared_from_this(), message]() {
        self->enqueue(message);
    });
}

void WebSocketSession::enqueue(std::shared_ptr<std::string> text) {
    if (closing_ || finished_) {
        return;
    }
    outbox_.push_back(std::move(text));
    if (!writing_) {
        writing_ = true;
        doWrite();
    }
}

void WebSocketSession::doWrite() {
    auto message = outbox_.front();
    ws_.text(true);
    ws_.async_write(asio::buffer(*message),
        [self = shared_from_this(), message](beast::error_code ec, size_t) {
            self->onWrite(ec);
        });
}

void WebSocketSession::onWrite(beast::error_code ec) {
    if (ec) {
        MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY, "Write failed: " + ec.message());
        outbox_.clear();
        writing_ = false;
        closeSocket();
        return;
    }

    outbox_.pop_front();
    if (!outbox_.empty()) {
        doWrite();
        return;
    }
    writing_ = false;
    if (pendingClose_) {
        doClose();
    }
}

// =============================================================================
// Closing
// =============================================================================

void WebSocketSession::close(uint16_t code, std::string reason) {
    asio::post(ws_.get_executor(), [self = shared_from_this(), code, reason = std::move(reason)]() {
        self->startClose(code, reason);
    });
}

void WebSocketSession::startClose(uint16_t code, std::string reason) {
    if (closing_ || finished_) {
        return;
    }
    closing_ = true;

    if (reason.size() > MAX_CLOSE_REASON) {
        reason.resize(MAX_CLOSE_REASON);
    }
    pendingClose_ = ws::close_reason(static_cast<ws::close_code>(code), reason);

    // With a write in flight the close frame follows the last queued message
    if (!writing_) {
        doClose();
    }
}

void WebSocketSession::doClose() {
    ws::close_reason reason = *pendingClose_;
    pendingClose_.reset();
    ws_.async_close(reason, [self = shared_from_this()](beast::error_code ec) {
        if (ec) {
            MEDIARELAY_LOG_DEBUG(self->logger_, LOG_CATEGORY, "Close failed: " + ec.message());
            self->closeSocket();
        }
    });
}

void WebSocketSession::shutdown() {
    asio::post(ws_.get_executor(), [self = shared_from_this()]() {
        self->closeSocket();
    });
}

void WebSocketSession::closeSocket() {
    if (finished_) {
        return;
    }
    auto& socket = beast::get_lowest_layer(ws_);
    if (!socket.is_open()) {
        return;
    }

    beast::error_code ec;
    socket.shutdown(Socket::shutdown_both, ec);
    if (ec && ec != asio::error::not_connected) {
        MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY, "Socket shutdown: " + ec.message());
    }
    // Pending operations complete with operation_aborted and reach finish()
    socket.close(ec);
    if (ec) {
        MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY, "Socket close: " + ec.message());
    }
}

void WebSocketSession::finish() {
    if (finished_.exchange(true)) {
        return;
    }

    auto& socket = beast::get_lowest_layer(ws_);
    if (socket.is_open()) {
        beast::error_code ec;
        socket.close(ec);
        if (ec) {
            MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY, "Socket close: " + ec.message());
        }
    }

    outbox_.clear();
    if (handlers_.onClosed) {
        handlers_.onClosed();
    }
}

} // namespace protocol
} // namespace mediarelay
