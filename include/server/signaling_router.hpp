#ifndef _SERVER_SIGNALING_ROUTER_H_
#define _SERVER_SIGNALING_ROUTER_H_

#include "base/defines.hpp"
#include "server/room_registry.hpp"
#include "server/signaling_transport.hpp"

#include <memory>
#include <string_view>

namespace meshrtc {

// Dispatches inbound frames to the registry. Never inspects SDP or
// candidate payloads. Every failure is answered with an `error` 
// message and the connection stays open.
class MESHRTC_EXPORT SignalingRouter {
public:
    explicit SignalingRouter(RoomRegistry* registry);
    ~SignalingRouter();

    void OnTransportMessage(const std::shared_ptr<SignalingTransport>& transport, std::string_view text);
    void OnTransportClosed(SignalingTransport* transport);

private:
    void SendError(SignalingTransport* transport, std::string error) const;

private:
    RoomRegistry* const registry_;

    DISALLOW_COPY_AND_ASSIGN(SignalingRouter);
};

} // namespace meshrtc

#endif
