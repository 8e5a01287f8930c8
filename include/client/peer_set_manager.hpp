#ifndef _CLIENT_PEER_SET_MANAGER_H_
#define _CLIENT_PEER_SET_MANAGER_H_

#include "base/defines.hpp"
#include "client/negotiation_controller.hpp"
#include "client/remote_stream_table.hpp"
#include "common/task_queue.hpp"
#include "signaling/messages.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace meshrtc {

// PeerSetManager
// Tracks the other participants of the room and owns one negotiation
// controller per participant. Every method must be called on `task_queue`.
class MESHRTC_EXPORT PeerSetManager : public NegotiationController::Observer {
public:
    class Observer {
    public:
        virtual ~Observer() = default;
        virtual void OnOutgoingMessage(signaling::Message message) = 0;
        virtual void OnRemoteStreamsChanged(std::vector<RemoteStreamTable::Entry> entries) = 0;
        virtual void OnPeerStateChanged(const std::string& peer_id, NegotiationController::State state) = 0;
        virtual void OnPeerFailed(const std::string& peer_id, 
                                  NegotiationController::FailureKind kind, 
                                  const std::string& reason) = 0;
    };
public:
    PeerSetManager(std::string self_id,
                   std::vector<std::shared_ptr<MediaTrack>> local_tracks,
                   PeerTransportFactory* transport_factory,
                   PeerTransport::Configuration transport_config,
                   NegotiationController::Policy policy,
                   TaskQueue* task_queue,
                   Observer* observer);
    ~PeerSetManager() override;

    const std::string& self_id() const { return self_id_; }
    const Roster& roster() const { return roster_; }
    const RemoteStreamTable& streams() const { return streams_; }
    // Returns nullptr if there is no controller for the peer.
    NegotiationController* controller(const std::string& peer_id) const;
    size_t controller_count() const { return controllers_.size(); }

    void OnExistingParticipants(const signaling::ExistingParticipants& message);
    void OnParticipantJoined(const signaling::ParticipantJoined& message);
    void OnParticipantLeft(const signaling::ParticipantLeft& message);
    void OnOffer(const signaling::Offer& message);
    void OnAnswer(const signaling::Answer& message);
    void OnIceCandidate(const signaling::IceCandidate& message);

    // Closes every controller and forgets every peer.
    void CloseAll();

private:
    // Implements NegotiationController::Observer
    void OnOutgoingMessage(const std::string& peer_id, signaling::Message message) override;
    void OnRemoteTrack(const std::string& peer_id, std::shared_ptr<MediaTrack> track) override;
    void OnStateChanged(const std::string& peer_id, NegotiationController::State state) override;
    void OnNegotiationFailed(const std::string& peer_id, 
                             NegotiationController::FailureKind kind, 
                             const std::string& reason) override;

private:
    bool AddToRoster(const std::string& peer_id, const std::optional<std::string>& name);
    NegotiationController* GetOrCreateController(const std::string& peer_id);
    NegotiationController* FindSender(const signaling::RelayedMessage& message, std::string_view type) const;
    void OfferIfOwed(const std::string& peer_id);
    void ReconcileNames();
    void NotifyStreamsChanged();

private:
    const std::string self_id_;
    const std::vector<std::shared_ptr<MediaTrack>> local_tracks_;
    PeerTransportFactory* const transport_factory_;
    const PeerTransport::Configuration transport_config_;
    const NegotiationController::Policy policy_;
    TaskQueue* const task_queue_;
    Observer* const observer_;

    Roster roster_;
    std::map<std::string, std::unique_ptr<NegotiationController>> controllers_;
    RemoteStreamTable streams_;
};

} // namespace meshrtc

#endif
