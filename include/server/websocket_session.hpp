#ifndef _SERVER_WEBSOCKET_SESSION_H_
#define _SERVER_WEBSOCKET_SESSION_H_

#include "base/defines.hpp"
#include "server/signaling_transport.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <deque>
#include <memory>
#include <string>

namespace meshrtc {

// One accepted WebSocket connection. Reads and writes are serialized 
// on the strand of the underlying socket.
class MESHRTC_EXPORT WebsocketSession : public SignalingTransport,
                                        public std::enable_shared_from_this<WebsocketSession> {
public:
    class Observer {
    public:
        virtual ~Observer() = default;
        // Called on the session's strand for every text frame.
        virtual void OnSessionMessage(const std::shared_ptr<WebsocketSession>& session, std::string text) = 0;
        // Called once, on the session's strand.
        virtual void OnSessionClosed(const std::shared_ptr<WebsocketSession>& session) = 0;
    };
public:
    WebsocketSession(boost::asio::ip::tcp::socket&& socket, 
                     Observer* observer, 
                     size_t max_message_size);
    ~WebsocketSession() override;

    void Start();

    // Implements SignalingTransport
    void Send(std::string text) override;
    void Close() override;
    std::string remote_address() const override { return remote_address_; }

private:
    void OnRun();
    void OnAccept(boost::beast::error_code ec);
    void DoRead();
    void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
    void DoWrite();
    void OnWrite(boost::beast::error_code ec, std::size_t bytes_transferred);
    void DoClose();
    void OnClose(boost::beast::error_code ec);
    void NotifyClosed();

private:
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    Observer* const observer_;
    const size_t max_message_size_;
    const std::string remote_address_;

    boost::beast::flat_buffer read_buffer_;
    std::deque<std::string> write_queue_;
    bool accepted_ = false;
    bool closing_ = false;
    bool closed_ = false;
};

} // namespace meshrtc

#endif
