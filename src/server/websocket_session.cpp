#include "server/websocket_session.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/http.hpp>

#include <plog/Log.h>

namespace meshrtc {
namespace {

namespace beast = boost::beast;
namespace websocket = beast::websocket;

std::string RemoteAddress(const boost::asio::ip::tcp::socket& socket) {
    boost::system::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

WebsocketSession::WebsocketSession(boost::asio::ip::tcp::socket&& socket, 
                                   Observer* observer, 
                                   size_t max_message_size) 
    : ws_(std::move(socket)),
      observer_(observer),
      max_message_size_(max_message_size),
      remote_address_(RemoteAddress(beast::get_lowest_layer(ws_).socket())) {}

WebsocketSession::~WebsocketSession() {
    PLOG_VERBOSE << __FUNCTION__ << ": " << remote_address_;
}

void WebsocketSession::Start() {
    // We need to be executing within a strand to perform async operations
    // on the I/O objects in this session.
    boost::asio::dispatch(ws_.get_executor(), beast::bind_front_handler(&WebsocketSession::OnRun, shared_from_this()));
}

void WebsocketSession::Send(std::string text) {
    boost::asio::post(ws_.get_executor(), [this, self=shared_from_this(), text=std::move(text)]() mutable {
        if (closing_ || closed_) {
            PLOG_VERBOSE << "Drop message to closed connection: " << remote_address_;
            return;
        }
        write_queue_.push_back(std::move(text));
        // Only one write may be outstanding.
        if (accepted_ && write_queue_.size() == 1) {
            DoWrite();
        }
    });
}

void WebsocketSession::Close() {
    boost::asio::post(ws_.get_executor(), [this, self=shared_from_this()](){
        if (closing_ || closed_) {
            return;
        }
        closing_ = true;
        if (accepted_) {
            // Flush the queued messages before closing.
            if (write_queue_.empty()) {
                DoClose();
            }
        } else {
            beast::get_lowest_layer(ws_).close();
            NotifyClosed();
        }
    });
}

// Private methods
void WebsocketSession::OnRun() {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(beast::http::field::server, "meshrtc-signaling");
    }));
    ws_.read_message_max(max_message_size_);
    ws_.async_accept(beast::bind_front_handler(&WebsocketSession::OnAccept, shared_from_this()));
}

void WebsocketSession::OnAccept(beast::error_code ec) {
    if (ec) {
        PLOG_WARNING << "WebSocket handshake with " << remote_address_ << " failed: " << ec.message();
        NotifyClosed();
        return;
    }
    if (closing_) {
        return;
    }
    accepted_ = true;
    PLOG_DEBUG << "Accepted connection: " << remote_address_;
    if (!write_queue_.empty()) {
        DoWrite();
    }
    DoRead();
}

void WebsocketSession::DoRead() {
    ws_.async_read(read_buffer_, beast::bind_front_handler(&WebsocketSession::OnRead, shared_from_this()));
}

void WebsocketSession::OnRead(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (ec) {
        if (ec != websocket::error::closed && ec != boost::asio::error::operation_aborted) {
            PLOG_DEBUG << "Read from " << remote_address_ << " failed: " << ec.message();
        }
        NotifyClosed();
        return;
    }

    if (ws_.got_text()) {
        std::string text = beast::buffers_to_string(read_buffer_.data());
        read_buffer_.consume(read_buffer_.size());
        observer_->OnSessionMessage(shared_from_this(), std::move(text));
    } else {
        PLOG_WARNING << "Ignore binary frame from " << remote_address_;
        read_buffer_.consume(read_buffer_.size());
    }
    if (!closed_) {
        DoRead();
    }
}

void WebsocketSession::DoWrite() {
    ws_.text(true);
    ws_.async_write(boost::asio::buffer(write_queue_.front()), beast::bind_front_handler(&WebsocketSession::OnWrite, shared_from_this()));
}

void WebsocketSession::OnWrite(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (ec) {
        PLOG_DEBUG << "Write to " << remote_address_ << " failed: " << ec.message();
        write_queue_.clear();
        beast::get_lowest_layer(ws_).close();
        NotifyClosed();
        return;
    }
    write_queue_.pop_front();
    if (closed_) {
        write_queue_.clear();
    } else if (!write_queue_.empty()) {
        DoWrite();
    } else if (closing_) {
        DoClose();
    }
}

void WebsocketSession::DoClose() {
    ws_.async_close(websocket::close_code::normal, beast::bind_front_handler(&WebsocketSession::OnClose, shared_from_this()));
}

void WebsocketSession::OnClose(beast::error_code ec) {
    if (ec) {
        PLOG_DEBUG << "Close " << remote_address_ << " with error: " << ec.message();
    }
    NotifyClosed();
}

void WebsocketSession::NotifyClosed() {
    if (closed_) {
        return;
    }
    closed_ = true;
    observer_->OnSessionClosed(shared_from_this());
}

} // namespace meshrtc
