#ifndef _CLIENT_MESH_SESSION_H_
#define _CLIENT_MESH_SESSION_H_

#include "base/defines.hpp"
#include "client/capture_device.hpp"
#include "client/negotiation_controller.hpp"
#include "client/peer_set_manager.hpp"
#include "client/peer_transport.hpp"
#include "client/remote_stream_table.hpp"
#include "client/signaling_channel.hpp"
#include "common/pending_task_safety_flag.hpp"
#include "common/task_queue.hpp"
#include "signaling/messages.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meshrtc {

// MeshSession
// One call: joins a room through the signaling channel and connects
// to every other participant. Join() and Leave() block until they have
// run on `task_queue`. The observer is called on it from a posted task, 
// never from within the session's own processing.
class MESHRTC_EXPORT MeshSession : public SignalingChannel::Observer,
                                   public PeerSetManager::Observer {
public:
    enum class ErrorKind {
        MEDIA_ACQUISITION,
        TRANSPORT_CREATION,
        NEGOTIATION,
        SIGNALING,
        SERVER
    };

    enum class State {
        IDLE,
        CONNECTING,
        JOINING,
        JOINED
    };

    // Configuration
    struct Configuration {
        std::string signaling_url = "ws://localhost:8080";
        PeerTransport::Configuration transport;
        NegotiationController::Policy negotiation;
    };

    // Observer
    class Observer {
    public:
        virtual ~Observer() = default;
        virtual void OnJoined(const std::string& room_id, size_t participant_count) = 0;
        virtual void OnParticipantJoined(const std::string& participant_id, const std::optional<std::string>& name) = 0;
        virtual void OnParticipantLeft(const std::string& participant_id) = 0;
        virtual void OnRemoteStreamsChanged(std::vector<RemoteStreamTable::Entry> entries) = 0;
        virtual void OnPeerStateChanged(const std::string& participant_id, NegotiationController::State state) = 0;
        virtual void OnError(ErrorKind kind, const std::string& message) = 0;
    };
public:
    MeshSession(Configuration config,
                CaptureDevice* capture_device,
                PeerTransportFactory* transport_factory,
                std::shared_ptr<SignalingChannel> channel,
                TaskQueue* task_queue,
                Observer* observer);
    ~MeshSession() override;

    // 8 random lowercase alphanumerics, fixed for the lifetime of the session.
    const std::string& participant_id() const { return participant_id_; }
    const std::string& room_id() const { return room_id_; }
    const std::string& display_name() const { return display_name_; }
    State state() const { return state_; }
    const std::vector<std::shared_ptr<MediaTrack>>& local_tracks() const { return local_tracks_; }
    // Null while idle.
    const PeerSetManager* peers() const { return peers_.get(); }

    // Leaves the current room first. Returns false if the room id is empty 
    // or the capture device can not be opened, nothing is left open then.
    bool Join(std::string room_id, std::optional<std::string> display_name = std::nullopt);
    // Releases every transport, every local track and the signaling channel.
    void Leave();

    // 6 random uppercase alphanumerics.
    static std::string GenerateRoomId();
    // Trims the whitespaces and upper-cases.
    static std::string NormalizeRoomId(std::string_view room_id);
    static std::string ToString(ErrorKind kind);

private:
    // Implements SignalingChannel::Observer
    void OnConnected() override;
    void OnClosed(const std::string reason) override;
    bool OnRead(const std::string msg) override;

    // Implements PeerSetManager::Observer
    void OnOutgoingMessage(signaling::Message message) override;
    void OnRemoteStreamsChanged(std::vector<RemoteStreamTable::Entry> entries) override;
    void OnPeerStateChanged(const std::string& peer_id, NegotiationController::State state) override;
    void OnPeerFailed(const std::string& peer_id, 
                      NegotiationController::FailureKind kind, 
                      const std::string& reason) override;

private:
    bool JoinInternal(std::string room_id, std::optional<std::string> display_name);
    void LeaveInternal();
    void Teardown();
    void SendMessage(const signaling::Message& message);
    void NotifyError(ErrorKind kind, const std::string& message);
    void PostToObserver(std::function<void(Observer*)> notification);

    void HandleConnected(uint64_t connection_id);
    void HandleChannelClosed(uint64_t connection_id, const std::string& reason);
    void HandleMessage(uint64_t connection_id, const std::string& text);

private:
    const Configuration config_;
    CaptureDevice* const capture_device_;
    PeerTransportFactory* const transport_factory_;
    const std::shared_ptr<SignalingChannel> channel_;
    TaskQueue* const task_queue_;
    Observer* observer_;

    const std::string participant_id_;
    std::string room_id_;
    std::string display_name_;
    State state_ = State::IDLE;
    // Tags the channel events with the connection they belong to.
    std::atomic<uint64_t> connection_id_ = 0;

    std::vector<std::shared_ptr<MediaTrack>> local_tracks_;
    std::unique_ptr<PeerSetManager> peers_;

    ScopedTaskSafety task_safety_;
};

} // namespace meshrtc

#endif
