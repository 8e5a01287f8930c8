#include "client/signaling_channel.hpp"
#include "client/websocket.hpp"

#include <boost/core/ignore_unused.hpp>

#include <plog/Log.h>

#include <mutex>

namespace meshrtc {

// ChannelImpl declaration
class ChannelImpl : public SignalingChannel, 
                    public std::enable_shared_from_this<ChannelImpl> {
public:
    explicit ChannelImpl(boost::asio::io_context& ioc);
    ~ChannelImpl() override;
    
    void Connect(std::string signaling_url) override;
    void Close() override;
    void Send(std::string msg) override;
    void RegisterObserver(Observer* observer) override;
    void DeregisterObserver(Observer* observer) override;

private:
    void OnConnect(std::shared_ptr<Websocket> ws, boost::system::error_code ec);
    void OnRead(std::shared_ptr<Websocket> ws,
                boost::system::error_code ec,
                std::size_t bytes_transferred,
                std::string text);

    void DoRead(std::shared_ptr<Websocket> ws);
    void CloseInternal();

private:
    boost::asio::io_context& ioc_;
    // Held while calling the observer, which may call back into the channel.
    std::recursive_mutex mutex_;
    std::shared_ptr<Websocket> ws_;
    Observer* observer_;
    bool is_connected_;
};

// ChannelImpl implement
ChannelImpl::ChannelImpl(boost::asio::io_context& ioc)
    : ioc_(ioc),
      observer_(nullptr),
      is_connected_(false) {}

ChannelImpl::~ChannelImpl() {
    CloseInternal();
}

void ChannelImpl::Connect(std::string signaling_url) {
    std::lock_guard lock(mutex_);
    if (ws_) {
        PLOG_WARNING << "Signaling channel is connected or connecting already.";
        return;
    }
    URLParts parts;
    std::string error;
    if (!URLParts::Parse(signaling_url, parts)) {
        error = "Invalid signaling url: " + signaling_url;
    } else if (parts.scheme != "ws") {
        error = "Unsupported signaling scheme: " + parts.scheme;
    }
    if (!error.empty()) {
        PLOG_WARNING << error;
        if (observer_) {
            observer_->OnClosed(error);
        }
        return;
    }
    PLOG_INFO << "Connecting to " << signaling_url;
    ws_ = Websocket::Create(ioc_);
    ws_->Connect(std::move(parts), weak_bind(&ChannelImpl::OnConnect, this, ws_, std::placeholders::_1));
}

void ChannelImpl::Close() {
    std::lock_guard lock(mutex_);
    CloseInternal();
}

void ChannelImpl::Send(std::string msg) {
    if (msg.empty()) {
        return;
    }
    std::lock_guard lock(mutex_);
    if (!ws_ || !is_connected_) {
        PLOG_WARNING << "Drop message sent before the signaling channel is connected.";
        return;
    }
    ws_->WriteText(std::move(msg));
}

void ChannelImpl::RegisterObserver(Observer* observer) {
    std::lock_guard lock(mutex_);
    observer_ = observer;
}

void ChannelImpl::DeregisterObserver(Observer* observer) {
    std::lock_guard lock(mutex_);
    if (observer_ == observer) {
        observer_ = nullptr;
    }
}

// Private methods
void ChannelImpl::CloseInternal() {
    if (!ws_) {
        return;
    }
    auto ws = std::move(ws_);
    ws_.reset();
    is_connected_ = false;
    ws->Close([](boost::system::error_code ec){
        if (ec) {
            PLOG_DEBUG << "Signaling channel closed with error: " << ec.message();
        }
    });
}

void ChannelImpl::OnConnect(std::shared_ptr<Websocket> ws, boost::system::error_code ec) {
    std::lock_guard lock(mutex_);
    // Closed or replaced in the meantime.
    if (ws != ws_) {
        return;
    }
    if (ec) {
        PLOG_WARNING << "Failed to connect signaling channel: " << ec.message();
        ws_.reset();
        if (observer_) {
            observer_->OnClosed(ec.message());
        }
        return;
    }
    is_connected_ = true;
    PLOG_INFO << "Signaling channel connected.";
    if (observer_) {
        observer_->OnConnected();
    }
    DoRead(std::move(ws));
}

void ChannelImpl::OnRead(std::shared_ptr<Websocket> ws,
                         boost::system::error_code ec,
                         std::size_t bytes_transferred,
                         std::string text) {
    boost::ignore_unused(bytes_transferred);

    std::lock_guard lock(mutex_);
    if (ws != ws_) {
        return;
    }

    if (ec) {
        std::string reason = ec == boost::beast::websocket::error::closed ? "Closed by server" : ec.message();
        PLOG_WARNING << "Signaling channel closed: " << reason;
        ws_.reset();
        is_connected_ = false;
        if (observer_) {
            observer_->OnClosed(reason);
        }
        return;
    }

    // Check if we need to read more.
    if (observer_ && !observer_->OnRead(std::move(text))) {
        return;
    }

    // Read more data.
    DoRead(std::move(ws));
}

void ChannelImpl::DoRead(std::shared_ptr<Websocket> ws) {
    ws->Read(weak_bind(&ChannelImpl::OnRead, this, ws, 
                       std::placeholders::_1, 
                       std::placeholders::_2,
                       std::placeholders::_3));
}

// CreateDefaultSignalingChannel
std::shared_ptr<SignalingChannel> CreateDefaultSignalingChannel(boost::asio::io_context& ioc) {
    return std::make_shared<ChannelImpl>(ioc);
}

} // namespace meshrtc
