#include "server/signaling_server.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>

#include <plog/Log.h>

#include <algorithm>
#include <stdexcept>

namespace meshrtc {

SignalingServer::SignalingServer(Configuration config, std::shared_ptr<Clock> clock) 
    : config_(std::move(config)),
      clock_(clock ? std::move(clock) : Clock::GetRealTimeClock()),
      acceptor_(boost::asio::make_strand(ioc_)),
      registry_(config_.registry, clock_.get()),
      router_(&registry_) {}

SignalingServer::~SignalingServer() {
    Stop();
}

void SignalingServer::Start() {
    std::lock_guard lock(mutex_);
    if (running_) {
        return;
    }
    if (ioc_.stopped()) {
        throw std::logic_error("A stopped signaling server can not be restarted.");
    }
    namespace net = boost::asio;
    const net::ip::tcp::endpoint endpoint(net::ip::make_address(config_.address), config_.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
    bound_port_ = acceptor_.local_endpoint().port();
    running_ = true;

    DoAccept();

    const size_t num_threads = std::max<size_t>(config_.num_threads, 1);
    for (size_t i = 0; i < num_threads; ++i) {
        io_threads_.create_thread([this](){
            ioc_.run();
        });
    }

    sweep_queue_ = std::make_unique<TaskQueue>("signaling.sweep");
    const TimeInterval sweep_interval_ms = config_.registry.sweep_interval_ms;
    sweep_task_ = RepeatingTask::DelayedStart(clock_.get(), sweep_queue_->Get(), sweep_interval_ms, [this, sweep_interval_ms](){
        registry_.Sweep();
        return sweep_interval_ms;
    });

    PLOG_INFO << "Signaling server listening on " << config_.address << ":" << bound_port_ 
              << " with " << num_threads << " thread(s).";
}

void SignalingServer::Stop() {
    std::unordered_set<std::shared_ptr<WebsocketSession>> sessions;
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        sessions.swap(sessions_);
    }
    PLOG_INFO << "Stopping signaling server.";

    if (sweep_task_) {
        sweep_task_->Stop();
        sweep_task_.reset();
    }
    // Waits for a running sweep.
    sweep_queue_.reset();

    for (auto& session : sessions) {
        session->Close();
    }
    sessions.clear();

    ioc_.stop();
    io_threads_.join_all();

    boost::system::error_code ec;
    acceptor_.close(ec);
    PLOG_INFO << "Signaling server stopped.";
}

bool SignalingServer::is_running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

uint16_t SignalingServer::port() const {
    std::lock_guard lock(mutex_);
    return bound_port_;
}

// Private methods
void SignalingServer::DoAccept() {
    // The new connection gets its own strand.
    acceptor_.async_accept(boost::asio::make_strand(ioc_), [this](boost::system::error_code ec, boost::asio::ip::tcp::socket socket){
        OnAccept(ec, std::move(socket));
    });
}

void SignalingServer::OnAccept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
    if (ec) {
        if (ec != boost::asio::error::operation_aborted) {
            PLOG_WARNING << "Failed to accept connection: " << ec.message();
        }
    } else {
        auto session = std::make_shared<WebsocketSession>(std::move(socket), this, config_.max_message_size);
        {
            std::lock_guard lock(mutex_);
            if (!running_) {
                return;
            }
            sessions_.insert(session);
        }
        session->Start();
    }
    if (acceptor_.is_open()) {
        DoAccept();
    }
}

void SignalingServer::OnSessionMessage(const std::shared_ptr<WebsocketSession>& session, std::string text) {
    PLOG_VERBOSE << "Received from " << session->remote_address() << ": " << text;
    std::shared_ptr<SignalingTransport> transport = session;
    router_.OnTransportMessage(transport, text);
}

void SignalingServer::OnSessionClosed(const std::shared_ptr<WebsocketSession>& session) {
    router_.OnTransportClosed(session.get());
    std::lock_guard lock(mutex_);
    sessions_.erase(session);
}

} // namespace meshrtc
