#ifndef _CLIENT_SIGNALING_CHANNEL_H_
#define _CLIENT_SIGNALING_CHANNEL_H_

#include "base/defines.hpp"

#include <boost/asio/io_context.hpp>

#include <memory>
#include <string>

namespace meshrtc {

// SignalingChannel
// The connection of a client to the signaling server. The observer is
// called on the I/O thread, and never after Close() or DeregisterObserver().
class MESHRTC_EXPORT SignalingChannel {
public:
    class Observer {
    public:
        virtual ~Observer() = default;
        virtual void OnConnected() = 0;
        // The connection failed or was closed by the remote.
        virtual void OnClosed(const std::string reason) = 0;
        // Return true for reading more.
        virtual bool OnRead(const std::string msg) = 0;
    };
public:
    virtual ~SignalingChannel() = default;
    virtual void Connect(std::string signaling_url) = 0;
    virtual void Close() = 0;
    virtual void Send(std::string msg) = 0;
    virtual void RegisterObserver(Observer* observer) = 0;
    virtual void DeregisterObserver(Observer* observer) = 0;
};

// Creates a WebSocket signaling channel running on `ioc`.
MESHRTC_EXPORT std::shared_ptr<SignalingChannel> CreateDefaultSignalingChannel(boost::asio::io_context& ioc);

} // namespace meshrtc

#endif
