#include "client/negotiation_controller.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace meshrtc {
namespace {

std::string Describe(const std::exception_ptr& error) {
    try {
        if (error) {
            std::rethrow_exception(error);
        }
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
    return "unknown error";
}

} // namespace

// TransportObserver
class NegotiationController::TransportObserver : public PeerTransport::Observer {
public:
    TransportObserver(NegotiationController* controller,
                      uint64_t generation,
                      TaskQueue* task_queue,
                      std::shared_ptr<PendingTaskSafetyFlag> safety_flag) 
        : controller_(controller),
          generation_(generation),
          task_queue_(task_queue),
          safety_flag_(std::move(safety_flag)) {}

    void OnLocalCandidate(Candidate candidate) override {
        task_queue_->Post(ToSafeTask(safety_flag_, [controller=controller_, generation=generation_, candidate=std::move(candidate)]() {
            controller->OnLocalCandidate(generation, candidate);
        }));
    }

    void OnRemoteTrack(std::shared_ptr<MediaTrack> track) override {
        task_queue_->Post(ToSafeTask(safety_flag_, [controller=controller_, generation=generation_, track=std::move(track)]() {
            controller->OnRemoteTrack(generation, track);
        }));
    }

    void OnConnectionStateChanged(PeerTransport::ConnectionState state) override {
        task_queue_->Post(ToSafeTask(safety_flag_, [controller=controller_, generation=generation_, state]() {
            controller->OnConnectionStateChanged(generation, state);
        }));
    }

private:
    NegotiationController* const controller_;
    const uint64_t generation_;
    TaskQueue* const task_queue_;
    const std::shared_ptr<PendingTaskSafetyFlag> safety_flag_;
};

// NegotiationController
NegotiationController::NegotiationController(std::string peer_id,
                                             std::vector<std::shared_ptr<MediaTrack>> local_tracks,
                                             PeerTransportFactory* transport_factory,
                                             PeerTransport::Configuration transport_config,
                                             Policy policy,
                                             TaskQueue* task_queue,
                                             Observer* observer) 
    : peer_id_(std::move(peer_id)),
      local_tracks_(std::move(local_tracks)),
      transport_factory_(transport_factory),
      transport_config_(std::move(transport_config)),
      policy_(policy),
      task_queue_(task_queue),
      observer_(observer) {
    if (!transport_factory_ || !task_queue_ || !observer_) {
        throw std::invalid_argument("NegotiationController requires a transport factory, a task queue and an observer");
    }
}

NegotiationController::~NegotiationController() {
    CloseTransport();
}

template <typename Handler>
auto NegotiationController::BindToCurrentTransport(Handler handler) {
    return [this, task_queue=task_queue_, flag=task_safety_.flag(), generation=generation_, handler=std::move(handler)](auto... args) {
        task_queue->Post(ToSafeTask(flag, [this, generation, handler, args...]() {
            if (generation != generation_) {
                PLOG_VERBOSE << "Ignore completion of a replaced transport, peer: " << peer_id_;
                return;
            }
            handler(args...);
        }));
    };
}

PeerTransport::FailureCallback NegotiationController::FailureHandler(std::string operation) {
    return BindToCurrentTransport([this, operation=std::move(operation)](std::exception_ptr error){
        Fail(FailureKind::NEGOTIATION, operation + " failed: " + Describe(error));
    });
}

NegotiationController::State NegotiationController::state() const {
    return state_;
}

bool NegotiationController::has_transport() const {
    return transport_ != nullptr;
}

bool NegotiationController::local_description_applied() const {
    return local_description_applied_;
}

bool NegotiationController::remote_description_applied() const {
    return remote_description_applied_;
}

size_t NegotiationController::pending_candidate_count() const {
    return pending_candidates_.size();
}

int NegotiationController::offer_attempts() const {
    return offer_attempts_;
}

void NegotiationController::Offer() {
    RTC_RUN_ON(task_queue_);
    if (state_ == State::CLOSED) {
        PLOG_WARNING << "Ignore offer to closed peer: " << peer_id_;
        return;
    }
    offer_attempts_ = 0;
    StartOffer();
}

void NegotiationController::HandleRemoteOffer(SessionDescription offer) {
    RTC_RUN_ON(task_queue_);
    if (state_ == State::CLOSED) {
        PLOG_WARNING << "Ignore offer from closed peer: " << peer_id_;
        return;
    }
    if (offer.type() != SessionDescription::Type::OFFER) {
        PLOG_WARNING << "Expected an offer from " << peer_id_ << ", got " << SessionDescription::ToString(offer.type());
        return;
    }
    if (!CreateTransport()) {
        return;
    }
    offer_attempts_ = 0;
    UpdateState(State::ANSWERING);
    ArmNegotiationTimer();
    
    remote_description_pending_ = true;
    transport_->SetRemoteDescription(std::move(offer), BindToCurrentTransport([this](){
        remote_description_pending_ = false;
        remote_description_applied_ = true;
        FlushPendingCandidates();
        transport_->CreateAnswer(BindToCurrentTransport([this](SessionDescription answer){
            transport_->SetLocalDescription(answer, BindToCurrentTransport([this, answer](){
                local_description_applied_ = true;
                signaling::Answer message;
                message.target_participant_id = peer_id_;
                message.payload = answer.ToJson();
                observer_->OnOutgoingMessage(peer_id_, std::move(message));
                UpdateState(State::CONNECTED);
            }), FailureHandler("Setting local answer"));
        }), FailureHandler("Creating answer"));
    }), FailureHandler("Setting remote offer"));
}

void NegotiationController::HandleRemoteAnswer(SessionDescription answer) {
    RTC_RUN_ON(task_queue_);
    // The answer belongs to the offer set on the current transport.
    if (state_ != State::OFFERING || !transport_ || !local_description_applied_ ||
        remote_description_pending_ || remote_description_applied_) {
        PLOG_VERBOSE << "Discard answer from " << peer_id_ << " in state " << ToString(state_);
        return;
    }
    if (answer.type() != SessionDescription::Type::ANSWER) {
        PLOG_WARNING << "Expected an answer from " << peer_id_ << ", got " << SessionDescription::ToString(answer.type());
        return;
    }
    remote_description_pending_ = true;
    transport_->SetRemoteDescription(std::move(answer), BindToCurrentTransport([this](){
        remote_description_pending_ = false;
        remote_description_applied_ = true;
        FlushPendingCandidates();
        UpdateState(State::CONNECTED);
    }), FailureHandler("Setting remote answer"));
}

void NegotiationController::HandleRemoteCandidate(Candidate candidate) {
    RTC_RUN_ON(task_queue_);
    if (!transport_) {
        PLOG_VERBOSE << "Discard candidate from " << peer_id_ << " without transport.";
        return;
    }
    if (remote_description_applied_) {
        ApplyRemoteCandidate(std::move(candidate));
    } else {
        pending_candidates_.push_back(std::move(candidate));
    }
}

void NegotiationController::Close() {
    RTC_RUN_ON(task_queue_);
    if (state_ == State::CLOSED) {
        return;
    }
    CloseTransport();
    UpdateState(State::CLOSED);
}

std::string NegotiationController::ToString(State state) {
    switch (state) {
    case State::ABSENT:
        return "absent";
    case State::OFFERING:
        return "offering";
    case State::ANSWERING:
        return "answering";
    case State::CONNECTED:
        return "connected";
    case State::CLOSED:
        return "closed";
    default:
        RTC_NOTREACHED();
        return "unknown";
    }
}

// Private methods
void NegotiationController::StartOffer() {
    if (!CreateTransport()) {
        return;
    }
    ++offer_attempts_;
    UpdateState(State::OFFERING);
    ArmNegotiationTimer();

    transport_->CreateOffer(BindToCurrentTransport([this](SessionDescription offer){
        transport_->SetLocalDescription(offer, BindToCurrentTransport([this, offer](){
            local_description_applied_ = true;
            signaling::Offer message;
            message.target_participant_id = peer_id_;
            message.payload = offer.ToJson();
            observer_->OnOutgoingMessage(peer_id_, std::move(message));
        }), FailureHandler("Setting local offer"));
    }), FailureHandler("Creating offer"));
}

bool NegotiationController::CreateTransport() {
    // Only one live transport per peer.
    CloseTransport();

    auto transport_observer = std::make_unique<TransportObserver>(this, generation_, task_queue_, task_safety_.flag());
    std::shared_ptr<PeerTransport> transport;
    try {
        transport = transport_factory_->Create(transport_config_, transport_observer.get());
        if (!transport) {
            throw std::runtime_error("no transport returned");
        }
        for (const auto& track : local_tracks_) {
            transport->AddTrack(track);
        }
    } catch (const std::exception& e) {
        if (transport) {
            transport->Close();
        }
        Fail(FailureKind::TRANSPORT_CREATION, std::string("Failed to create peer transport: ") + e.what());
        return false;
    }
    PLOG_DEBUG << "Created peer transport for " << peer_id_ << ", generation: " << generation_;
    transport_ = std::move(transport);
    transport_observer_ = std::move(transport_observer);
    return true;
}

void NegotiationController::CloseTransport() {
    ++generation_;
    if (transport_) {
        transport_->Close();
        transport_.reset();
    }
    transport_observer_.reset();
    local_description_applied_ = false;
    remote_description_applied_ = false;
    remote_description_pending_ = false;
    pending_candidates_.clear();
}

void NegotiationController::ArmNegotiationTimer() {
    if (policy_.negotiation_timeout_ms <= 0) {
        return;
    }
    task_queue_->PostDelayed(policy_.negotiation_timeout_ms, ToSafeTask(task_safety_.flag(), [this, generation=generation_](){
        OnNegotiationTimeout(generation);
    }));
}

void NegotiationController::FlushPendingCandidates() {
    while (!pending_candidates_.empty()) {
        auto candidate = std::move(pending_candidates_.front());
        pending_candidates_.pop_front();
        ApplyRemoteCandidate(std::move(candidate));
    }
}

void NegotiationController::ApplyRemoteCandidate(Candidate candidate) {
    transport_->AddRemoteCandidate(std::move(candidate), FailureHandler("Adding remote candidate"));
}

void NegotiationController::UpdateState(State state) {
    if (state_ == state) {
        return;
    }
    PLOG_DEBUG << "Peer " << peer_id_ << ": " << ToString(state_) << " -> " << ToString(state);
    state_ = state;
    observer_->OnStateChanged(peer_id_, state);
}

void NegotiationController::Fail(FailureKind kind, const std::string& reason) {
    PLOG_WARNING << "Negotiation with " << peer_id_ << " failed: " << reason;
    CloseTransport();
    UpdateState(State::ABSENT);
    observer_->OnNegotiationFailed(peer_id_, kind, reason);
}

// Transport events
void NegotiationController::OnLocalCandidate(uint64_t generation, Candidate candidate) {
    RTC_RUN_ON(task_queue_);
    if (generation != generation_) {
        return;
    }
    signaling::IceCandidate message;
    message.target_participant_id = peer_id_;
    message.payload = candidate.ToJson();
    observer_->OnOutgoingMessage(peer_id_, std::move(message));
}

void NegotiationController::OnRemoteTrack(uint64_t generation, std::shared_ptr<MediaTrack> track) {
    RTC_RUN_ON(task_queue_);
    if (generation != generation_ || !track) {
        return;
    }
    observer_->OnRemoteTrack(peer_id_, std::move(track));
}

void NegotiationController::OnConnectionStateChanged(uint64_t generation, PeerTransport::ConnectionState state) {
    RTC_RUN_ON(task_queue_);
    if (generation != generation_) {
        return;
    }
    PLOG_DEBUG << "Transport to " << peer_id_ << " is " << PeerTransport::ToString(state);
}

void NegotiationController::OnNegotiationTimeout(uint64_t generation) {
    if (generation != generation_ || 
        state_ == State::CONNECTED || 
        state_ == State::CLOSED) {
        return;
    }
    if (state_ == State::OFFERING && offer_attempts_ < policy_.max_offer_attempts) {
        PLOG_INFO << "Negotiation with " << peer_id_ << " timed out, re-offer (attempt " 
                  << offer_attempts_ + 1 << "/" << policy_.max_offer_attempts << ").";
        StartOffer();
        return;
    }
    Fail(FailureKind::TIMEOUT, "Negotiation with " + peer_id_ + " timed out");
}

} // namespace meshrtc
