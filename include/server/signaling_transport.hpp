#ifndef _SERVER_SIGNALING_TRANSPORT_H_
#define _SERVER_SIGNALING_TRANSPORT_H_

#include "base/defines.hpp"

#include <string>

namespace meshrtc {

// The server end of one client connection.
class MESHRTC_EXPORT SignalingTransport {
public:
    virtual ~SignalingTransport() = default;

    // Enqueues a text frame, never blocks. Safe to call from any thread.
    virtual void Send(std::string text) = 0;
    // Closes the connection, the router observes the close afterwards.
    virtual void Close() = 0;
    
    // For logging only.
    virtual std::string remote_address() const = 0;
};

} // namespace meshrtc

#endif
