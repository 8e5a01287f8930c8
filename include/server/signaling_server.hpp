#ifndef _SERVER_SIGNALING_SERVER_H_
#define _SERVER_SIGNALING_SERVER_H_

#include "base/defines.hpp"
#include "common/clock.hpp"
#include "common/repeating_task.hpp"
#include "common/task_queue.hpp"
#include "server/room_registry.hpp"
#include "server/signaling_router.hpp"
#include "server/websocket_session.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/thread/thread.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace meshrtc {

// The WebSocket front-end of the signaling service.
class MESHRTC_EXPORT SignalingServer : public WebsocketSession::Observer {
public:
    struct Configuration {
        std::string address = "0.0.0.0";
        // 0 picks an ephemeral port, see port().
        uint16_t port = 8080;
        size_t num_threads = 1;
        size_t max_message_size = 64 * 1024;
        RoomRegistry::Configuration registry;
    };
public:
    // The real-time clock is used if `clock` is null.
    explicit SignalingServer(Configuration config, std::shared_ptr<Clock> clock = nullptr);
    ~SignalingServer() override;

    const Configuration& config() const { return config_; }
    RoomRegistry* registry() { return &registry_; }

    // Binds the listening socket and starts serving.
    // Throws boost::system::system_error if binding fails.
    void Start();
    // Closes every connection and waits for the I/O threads to exit.
    void Stop();

    bool is_running() const;
    // The bound port, valid after Start().
    uint16_t port() const;

private:
    void DoAccept();
    void OnAccept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);

    // Implements WebsocketSession::Observer
    void OnSessionMessage(const std::shared_ptr<WebsocketSession>& session, std::string text) override;
    void OnSessionClosed(const std::shared_ptr<WebsocketSession>& session) override;

private:
    const Configuration config_;
    std::shared_ptr<Clock> clock_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::thread_group io_threads_;

    RoomRegistry registry_;
    SignalingRouter router_;

    std::unique_ptr<TaskQueue> sweep_queue_;
    std::unique_ptr<RepeatingTask> sweep_task_;

    mutable std::mutex mutex_;
    std::unordered_set<std::shared_ptr<WebsocketSession>> sessions_;
    bool running_ = false;
    uint16_t bound_port_ = 0;

    DISALLOW_COPY_AND_ASSIGN(SignalingServer);
};

} // namespace meshrtc

#endif
