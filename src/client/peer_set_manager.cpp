#include "client/peer_set_manager.hpp"
#include "client/offer_policy.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace meshrtc {

PeerSetManager::PeerSetManager(std::string self_id,
                               std::vector<std::shared_ptr<MediaTrack>> local_tracks,
                               PeerTransportFactory* transport_factory,
                               PeerTransport::Configuration transport_config,
                               NegotiationController::Policy policy,
                               TaskQueue* task_queue,
                               Observer* observer) 
    : self_id_(std::move(self_id)),
      local_tracks_(std::move(local_tracks)),
      transport_factory_(transport_factory),
      transport_config_(std::move(transport_config)),
      policy_(policy),
      task_queue_(task_queue),
      observer_(observer) {
    if (self_id_.empty()) {
        throw std::invalid_argument("Participant id is empty");
    }
}

PeerSetManager::~PeerSetManager() = default;

NegotiationController* PeerSetManager::controller(const std::string& peer_id) const {
    auto it = controllers_.find(peer_id);
    return it != controllers_.end() ? it->second.get() : nullptr;
}

void PeerSetManager::OnExistingParticipants(const signaling::ExistingParticipants& message) {
    RTC_RUN_ON(task_queue_);
    std::vector<std::string> peer_ids;
    for (const auto& participant : message.participants) {
        if (participant.id == self_id_) {
            continue;
        }
        AddToRoster(participant.id, participant.name);
        peer_ids.push_back(participant.id);
    }
    PLOG_INFO << "Found " << peer_ids.size() << " participants in the room.";
    ReconcileNames();
    for (const auto& peer_id : peer_ids) {
        OfferIfOwed(peer_id);
    }
}

void PeerSetManager::OnParticipantJoined(const signaling::ParticipantJoined& message) {
    RTC_RUN_ON(task_queue_);
    if (message.participant_id == self_id_) {
        return;
    }
    if (!AddToRoster(message.participant_id, message.name)) {
        PLOG_INFO << "Participant " << message.participant_id << " joined again.";
    }
    ReconcileNames();
    // A known peer is offered again, the controller replaces the old transport.
    OfferIfOwed(message.participant_id);
}

void PeerSetManager::OnParticipantLeft(const signaling::ParticipantLeft& message) {
    RTC_RUN_ON(task_queue_);
    const auto& peer_id = message.participant_id;
    auto it = controllers_.find(peer_id);
    if (it != controllers_.end()) {
        it->second->Close();
        controllers_.erase(it);
    }
    roster_.erase(peer_id);
    if (streams_.Remove(peer_id)) {
        NotifyStreamsChanged();
    }
    PLOG_INFO << "Participant " << peer_id << " left.";
}

void PeerSetManager::OnOffer(const signaling::Offer& message) {
    RTC_RUN_ON(task_queue_);
    if (!message.from_participant_id || *message.from_participant_id == self_id_) {
        PLOG_WARNING << "Discard offer without a valid sender.";
        return;
    }
    const auto& peer_id = *message.from_participant_id;
    try {
        auto offer = SessionDescription::FromJson(message.payload);
        // An offer can arrive before the join announcement.
        if (AddToRoster(peer_id, std::nullopt)) {
            ReconcileNames();
        }
        GetOrCreateController(peer_id)->HandleRemoteOffer(std::move(offer));
    } catch (const std::invalid_argument& e) {
        PLOG_WARNING << "Discard malformed offer from " << peer_id << ": " << e.what();
    }
}

void PeerSetManager::OnAnswer(const signaling::Answer& message) {
    RTC_RUN_ON(task_queue_);
    auto* controller = FindSender(message, "answer");
    if (!controller) {
        return;
    }
    try {
        controller->HandleRemoteAnswer(SessionDescription::FromJson(message.payload));
    } catch (const std::invalid_argument& e) {
        PLOG_WARNING << "Discard malformed answer from " << controller->peer_id() << ": " << e.what();
    }
}

void PeerSetManager::OnIceCandidate(const signaling::IceCandidate& message) {
    RTC_RUN_ON(task_queue_);
    auto* controller = FindSender(message, "ice-candidate");
    if (!controller) {
        return;
    }
    try {
        controller->HandleRemoteCandidate(Candidate::FromJson(message.payload));
    } catch (const std::invalid_argument& e) {
        PLOG_WARNING << "Discard malformed candidate from " << controller->peer_id() << ": " << e.what();
    }
}

void PeerSetManager::CloseAll() {
    RTC_RUN_ON(task_queue_);
    for (auto& [peer_id, controller] : controllers_) {
        controller->Close();
    }
    controllers_.clear();
    roster_.clear();
    if (!streams_.empty()) {
        streams_.Clear();
        NotifyStreamsChanged();
    }
}

// Private methods
void PeerSetManager::OnOutgoingMessage(const std::string& peer_id, signaling::Message message) {
    PLOG_VERBOSE << "Send " << signaling::TypeName(message) << " to " << peer_id;
    observer_->OnOutgoingMessage(std::move(message));
}

void PeerSetManager::OnRemoteTrack(const std::string& peer_id, std::shared_ptr<MediaTrack> track) {
    if (controllers_.find(peer_id) == controllers_.end()) {
        return;
    }
    if (streams_.AddTrack(peer_id, std::move(track))) {
        streams_.ReconcileNames(roster_);
        NotifyStreamsChanged();
    }
}

void PeerSetManager::OnStateChanged(const std::string& peer_id, NegotiationController::State state) {
    // The stream belongs to the transport, which is replaced or gone now.
    if (state != NegotiationController::State::CONNECTED && streams_.Remove(peer_id)) {
        NotifyStreamsChanged();
    }
    observer_->OnPeerStateChanged(peer_id, state);
}

void PeerSetManager::OnNegotiationFailed(const std::string& peer_id, 
                                         NegotiationController::FailureKind kind, 
                                         const std::string& reason) {
    observer_->OnPeerFailed(peer_id, kind, reason);
}

bool PeerSetManager::AddToRoster(const std::string& peer_id, const std::optional<std::string>& name) {
    auto [it, inserted] = roster_.emplace(peer_id, name);
    if (!inserted && name) {
        it->second = name;
    }
    return inserted;
}

NegotiationController* PeerSetManager::GetOrCreateController(const std::string& peer_id) {
    auto it = controllers_.find(peer_id);
    if (it == controllers_.end()) {
        auto controller = std::make_unique<NegotiationController>(peer_id, 
                                                                  local_tracks_, 
                                                                  transport_factory_, 
                                                                  transport_config_, 
                                                                  policy_, 
                                                                  task_queue_, 
                                                                  this);
        it = controllers_.emplace(peer_id, std::move(controller)).first;
    }
    return it->second.get();
}

NegotiationController* PeerSetManager::FindSender(const signaling::RelayedMessage& message, std::string_view type) const {
    if (!message.from_participant_id) {
        PLOG_WARNING << "Discard " << type << " without a sender.";
        return nullptr;
    }
    auto* controller = this->controller(*message.from_participant_id);
    if (!controller) {
        PLOG_VERBOSE << "Discard " << type << " from unknown peer: " << *message.from_participant_id;
    }
    return controller;
}

void PeerSetManager::OfferIfOwed(const std::string& peer_id) {
    if (ShouldOffer(self_id_, peer_id)) {
        GetOrCreateController(peer_id)->Offer();
    } else {
        PLOG_VERBOSE << "Wait for the offer from " << peer_id;
    }
}

void PeerSetManager::ReconcileNames() {
    if (streams_.ReconcileNames(roster_)) {
        NotifyStreamsChanged();
    }
}

void PeerSetManager::NotifyStreamsChanged() {
    observer_->OnRemoteStreamsChanged(streams_.entries());
}

} // namespace meshrtc
