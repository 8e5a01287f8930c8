#include "client/peer_transport.hpp"

namespace meshrtc {

std::string PeerTransport::ToString(ConnectionState state) {
    switch (state) {
    case ConnectionState::NEW:
        return "new";
    case ConnectionState::CONNECTING:
        return "connecting";
    case ConnectionState::CONNECTED:
        return "connected";
    case ConnectionState::DISCONNECTED:
        return "disconnected";
    case ConnectionState::FAILED:
        return "failed";
    case ConnectionState::CLOSED:
        return "closed";
    default:
        RTC_NOTREACHED();
        return "unknown";
    }
}

} // namespace meshrtc
