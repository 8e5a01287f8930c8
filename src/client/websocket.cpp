#include "client/websocket.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <chrono>

namespace meshrtc {
namespace {

namespace beast = boost::beast;
namespace websocket = beast::websocket;

constexpr auto kConnectTimeout = std::chrono::seconds(30);

bool IsValidPort(const std::string& port) {
    if (port.empty() || port.size() > 5 ||
        !std::all_of(port.begin(), port.end(), [](unsigned char c){ return std::isdigit(c); })) {
        return false;
    }
    return std::stoi(port) <= 65535;
}

} // namespace

// URLParts
std::string URLParts::GetPort() const {
    if (!port.empty()) {
        return port;
    }
    return scheme == "wss" || scheme == "https" ? "443" : "80";
}

bool URLParts::Parse(const std::string& url, URLParts& parts) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return false;
    }
    URLParts result;
    result.scheme = url.substr(0, scheme_end);
    std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(), [](unsigned char c){
        return static_cast<char>(std::tolower(c));
    });

    const auto rest = url.substr(scheme_end + 3);
    const auto path_begin = rest.find_first_of("/?#");
    auto authority = rest.substr(0, path_begin);
    if (path_begin == std::string::npos) {
        result.path_query_fragment = "/";
    } else if (rest[path_begin] != '/') {
        result.path_query_fragment = "/" + rest.substr(path_begin);
    } else {
        result.path_query_fragment = rest.substr(path_begin);
    }

    // Drop the user info.
    if (auto at = authority.rfind('@'); at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return false;
        }
        result.host = authority.substr(1, close - 1);
        auto remaining = authority.substr(close + 1);
        if (!remaining.empty()) {
            if (remaining[0] != ':') {
                return false;
            }
            result.port = remaining.substr(1);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string::npos) {
        result.host = authority.substr(0, colon);
        result.port = authority.substr(colon + 1);
    } else {
        result.host = authority;
    }

    if (result.host.empty()) {
        return false;
    }
    if (!result.port.empty() && !IsValidPort(result.port)) {
        return false;
    }
    parts = std::move(result);
    return true;
}

// Websocket
std::shared_ptr<Websocket> Websocket::Create(boost::asio::io_context& ioc) {
    return std::shared_ptr<Websocket>(new Websocket(ioc));
}

Websocket::Websocket(boost::asio::io_context& ioc) 
    : ws_(boost::asio::make_strand(ioc)),
      resolver_(ws_.get_executor()) {}

Websocket::~Websocket() {
    PLOG_VERBOSE << __FUNCTION__;
}

void Websocket::Connect(URLParts parts, ConnectCallback on_connect) {
    boost::asio::post(ws_.get_executor(), [this, self=shared_from_this(), parts=std::move(parts), on_connect=std::move(on_connect)]() mutable {
        parts_ = std::move(parts);
        connect_callback_ = std::move(on_connect);
        resolver_.async_resolve(parts_.host, parts_.GetPort(), beast::bind_front_handler(&Websocket::OnResolve, shared_from_this()));
    });
}

void Websocket::Read(ReadCallback on_read) {
    boost::asio::post(ws_.get_executor(), [this, self=shared_from_this(), on_read=std::move(on_read)]() mutable {
        if (!connected_) {
            on_read(boost::asio::error::not_connected, 0, "");
            return;
        }
        read_callback_ = std::move(on_read);
        ws_.async_read(read_buffer_, beast::bind_front_handler(&Websocket::OnRead, shared_from_this()));
    });
}

void Websocket::WriteText(std::string text) {
    boost::asio::post(ws_.get_executor(), [this, self=shared_from_this(), text=std::move(text)]() mutable {
        if (!connected_ || closing_) {
            PLOG_WARNING << "Drop message written to a closed websocket.";
            return;
        }
        write_queue_.push_back(std::move(text));
        // Only one write may be outstanding.
        if (write_queue_.size() == 1) {
            DoWrite();
        }
    });
}

void Websocket::Close(CloseCallback on_close) {
    boost::asio::post(ws_.get_executor(), [this, self=shared_from_this(), on_close=std::move(on_close)]() mutable {
        if (closing_) {
            return;
        }
        closing_ = true;
        close_callback_ = std::move(on_close);
        if (!connected_) {
            // Aborts the pending resolve or connect.
            resolver_.cancel();
            beast::get_lowest_layer(ws_).close();
            OnClose({});
        } else if (write_queue_.empty()) {
            DoClose();
        }
    });
}

// Private methods
void Websocket::OnResolve(beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results) {
    if (!ec && closing_) {
        ec = boost::asio::error::operation_aborted;
    }
    if (ec) {
        CompleteConnect(ec);
        return;
    }
    beast::get_lowest_layer(ws_).expires_after(kConnectTimeout);
    beast::get_lowest_layer(ws_).async_connect(results, beast::bind_front_handler(&Websocket::OnConnect, shared_from_this()));
}

void Websocket::OnConnect(beast::error_code ec, boost::asio::ip::tcp::resolver::results_type::endpoint_type endpoint) {
    if (!ec && closing_) {
        ec = boost::asio::error::operation_aborted;
    }
    if (ec) {
        CompleteConnect(ec);
        return;
    }
    // The websocket stream has its own timeout system.
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " meshrtc");
    }));
    const std::string host = parts_.host + ":" + std::to_string(endpoint.port());
    ws_.async_handshake(host, parts_.path_query_fragment, beast::bind_front_handler(&Websocket::OnHandshake, shared_from_this()));
}

void Websocket::OnHandshake(beast::error_code ec) {
    if (!ec && closing_) {
        ec = boost::asio::error::operation_aborted;
    }
    connected_ = !ec;
    CompleteConnect(ec);
}

void Websocket::CompleteConnect(beast::error_code ec) {
    auto callback = std::move(connect_callback_);
    connect_callback_ = nullptr;
    if (callback) {
        callback(ec);
    }
}

void Websocket::OnRead(beast::error_code ec, std::size_t bytes_transferred) {
    auto callback = std::move(read_callback_);
    read_callback_ = nullptr;
    std::string text;
    if (ec) {
        connected_ = false;
    } else {
        text = beast::buffers_to_string(read_buffer_.data());
    }
    read_buffer_.consume(read_buffer_.size());
    if (callback) {
        callback(ec, bytes_transferred, std::move(text));
    }
}

void Websocket::DoWrite() {
    ws_.text(true);
    ws_.async_write(boost::asio::buffer(write_queue_.front()), beast::bind_front_handler(&Websocket::OnWrite, shared_from_this()));
}

void Websocket::OnWrite(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (ec) {
        PLOG_WARNING << "Failed to write: " << ec.message();
        write_queue_.clear();
        if (closing_) {
            OnClose(ec);
        }
        return;
    }
    write_queue_.pop_front();
    if (!write_queue_.empty()) {
        DoWrite();
    } else if (closing_) {
        DoClose();
    }
}

void Websocket::DoClose() {
    ws_.async_close(websocket::close_code::normal, beast::bind_front_handler(&Websocket::OnClose, shared_from_this()));
}

void Websocket::OnClose(beast::error_code ec) {
    connected_ = false;
    auto callback = std::move(close_callback_);
    close_callback_ = nullptr;
    if (callback) {
        callback(ec);
    }
}

} // namespace meshrtc
