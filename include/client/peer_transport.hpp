#ifndef _CLIENT_PEER_TRANSPORT_H_
#define _CLIENT_PEER_TRANSPORT_H_

#include "base/defines.hpp"
#include "client/media_stream.hpp"
#include "client/session_description.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace meshrtc {

// PeerTransport
// The direct connection to one remote participant. Implementations may
// complete the asynchronous operations and fire the observer on any thread,
// but must not touch the observer after Close() returns.
class MESHRTC_EXPORT PeerTransport {
public:
    // Configuration
    struct Configuration {
        std::vector<std::string> ice_servers = {
            "stun:stun.l.google.com:19302",
            "stun:stun1.l.google.com:19302"
        };
    };

    // ConnectionState
    enum class ConnectionState: int {
        NEW = 0,
        CONNECTING,
        CONNECTED,
        DISCONNECTED,
        FAILED,
        CLOSED
    };

    // Observer
    class Observer {
    public:
        virtual ~Observer() = default;
        virtual void OnLocalCandidate(Candidate candidate) = 0;
        virtual void OnRemoteTrack(std::shared_ptr<MediaTrack> track) = 0;
        virtual void OnConnectionStateChanged(ConnectionState state) = 0;
    };

    using SDPCreateSuccessCallback = std::function<void(SessionDescription sdp)>;
    using SDPSetSuccessCallback = std::function<void()>;
    using FailureCallback = std::function<void(const std::exception_ptr)>;
public:
    virtual ~PeerTransport() = default;

    // Throws if the track can not be attached.
    virtual void AddTrack(std::shared_ptr<MediaTrack> track) = 0;

    virtual void CreateOffer(SDPCreateSuccessCallback on_success, 
                             FailureCallback on_failure) = 0;
    virtual void CreateAnswer(SDPCreateSuccessCallback on_success, 
                              FailureCallback on_failure) = 0;

    virtual void SetLocalDescription(SessionDescription sdp,
                                     SDPSetSuccessCallback on_success, 
                                     FailureCallback on_failure) = 0;
    virtual void SetRemoteDescription(SessionDescription sdp,
                                      SDPSetSuccessCallback on_success, 
                                      FailureCallback on_failure) = 0;

    virtual void AddRemoteCandidate(Candidate candidate, 
                                    FailureCallback on_failure) = 0;

    virtual void Close() = 0;

    static std::string ToString(ConnectionState state);
};

// PeerTransportFactory
class MESHRTC_EXPORT PeerTransportFactory {
public:
    virtual ~PeerTransportFactory() = default;
    // Throws a std::exception if the transport can not be created.
    virtual std::shared_ptr<PeerTransport> Create(const PeerTransport::Configuration& config, 
                                                  PeerTransport::Observer* observer) = 0;
};

} // namespace meshrtc

#endif
