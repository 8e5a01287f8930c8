#ifndef _CLIENT_WEBSOCKET_H_
#define _CLIENT_WEBSOCKET_H_

#include "base/defines.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace meshrtc {

// URLParts
struct MESHRTC_EXPORT URLParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path_query_fragment;

    // Returns the port, or the default one of the scheme.
    std::string GetPort() const;

    // Supports `scheme://host[:port][/path][?query][#fragment]`, the host can 
    // be a bracketed IPv6 address.
    static bool Parse(const std::string& url, URLParts& parts);
};

// Websocket
// A plain WebSocket client, all operations are serialized on a strand.
// Callbacks are invoked on the strand.
class MESHRTC_EXPORT Websocket : public std::enable_shared_from_this<Websocket> {
public:
    using ConnectCallback = std::function<void(boost::system::error_code ec)>;
    using ReadCallback = std::function<void(boost::system::error_code ec, 
                                            std::size_t bytes_transferred, 
                                            std::string text)>;
    using CloseCallback = std::function<void(boost::system::error_code ec)>;
public:
    static std::shared_ptr<Websocket> Create(boost::asio::io_context& ioc);
    ~Websocket();

    void Connect(URLParts parts, ConnectCallback on_connect);
    // Reads one message.
    void Read(ReadCallback on_read);
    // Messages are queued until the previous one was written.
    void WriteText(std::string text);
    // Closes after the queued messages were written.
    void Close(CloseCallback on_close);

private:
    explicit Websocket(boost::asio::io_context& ioc);

    void OnResolve(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results);
    void OnConnect(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type::endpoint_type endpoint);
    void OnHandshake(boost::beast::error_code ec);
    void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
    void DoWrite();
    void OnWrite(boost::beast::error_code ec, std::size_t bytes_transferred);
    void DoClose();
    void OnClose(boost::beast::error_code ec);
    void CompleteConnect(boost::beast::error_code ec);

private:
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::asio::ip::tcp::resolver resolver_;

    URLParts parts_;
    boost::beast::flat_buffer read_buffer_;
    std::deque<std::string> write_queue_;

    ConnectCallback connect_callback_;
    ReadCallback read_callback_;
    CloseCallback close_callback_;

    bool connected_ = false;
    bool closing_ = false;
};

} // namespace meshrtc

#endif
