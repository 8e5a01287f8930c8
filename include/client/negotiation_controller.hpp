#ifndef _CLIENT_NEGOTIATION_CONTROLLER_H_
#define _CLIENT_NEGOTIATION_CONTROLLER_H_

#include "base/defines.hpp"
#include "client/media_stream.hpp"
#include "client/peer_transport.hpp"
#include "client/session_description.hpp"
#include "common/pending_task_safety_flag.hpp"
#include "common/task_queue.hpp"
#include "signaling/messages.hpp"

#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace meshrtc {

// NegotiationController
// Drives the offer/answer exchange with one remote participant. Every 
// method must be called on `task_queue`, the transport events and 
// completions are posted back onto it.
class MESHRTC_EXPORT NegotiationController {
public:
    enum class State {
        ABSENT,
        OFFERING,
        ANSWERING,
        CONNECTED,
        CLOSED
    };

    enum class FailureKind {
        TRANSPORT_CREATION,
        NEGOTIATION,
        TIMEOUT
    };

    // Policy
    struct Policy {
        // Zero disables the timeout.
        TimeInterval negotiation_timeout_ms = 30 * 1000;
        // Including the first offer.
        int max_offer_attempts = 3;
    };

    // Observer
    class Observer {
    public:
        virtual ~Observer() = default;
        // An offer, answer or ice-candidate addressed to the peer.
        virtual void OnOutgoingMessage(const std::string& peer_id, signaling::Message message) = 0;
        virtual void OnRemoteTrack(const std::string& peer_id, std::shared_ptr<MediaTrack> track) = 0;
        virtual void OnStateChanged(const std::string& peer_id, State state) = 0;
        // The transport is closed and the state is back to ABSENT.
        virtual void OnNegotiationFailed(const std::string& peer_id, FailureKind kind, const std::string& reason) = 0;
    };
public:
    NegotiationController(std::string peer_id,
                          std::vector<std::shared_ptr<MediaTrack>> local_tracks,
                          PeerTransportFactory* transport_factory,
                          PeerTransport::Configuration transport_config,
                          Policy policy,
                          TaskQueue* task_queue,
                          Observer* observer);
    ~NegotiationController();

    const std::string& peer_id() const { return peer_id_; }
    State state() const;
    bool has_transport() const;
    bool local_description_applied() const;
    bool remote_description_applied() const;
    size_t pending_candidate_count() const;
    int offer_attempts() const;

    // Closes any existing transport and starts a new offer.
    void Offer();
    void HandleRemoteOffer(SessionDescription offer);
    void HandleRemoteAnswer(SessionDescription answer);
    void HandleRemoteCandidate(Candidate candidate);
    void Close();

    static std::string ToString(State state);

private:
    class TransportObserver;

    void StartOffer();
    bool CreateTransport();
    void CloseTransport();
    void ArmNegotiationTimer();
    void FlushPendingCandidates();
    void ApplyRemoteCandidate(Candidate candidate);
    void UpdateState(State state);
    void Fail(FailureKind kind, const std::string& reason);
    PeerTransport::FailureCallback FailureHandler(std::string operation);

    // Wraps a transport completion so that it runs on the task queue
    // and only while the transport it belongs to is still the current one.
    template <typename Handler>
    auto BindToCurrentTransport(Handler handler);

    // Transport events
    void OnLocalCandidate(uint64_t generation, Candidate candidate);
    void OnRemoteTrack(uint64_t generation, std::shared_ptr<MediaTrack> track);
    void OnConnectionStateChanged(uint64_t generation, PeerTransport::ConnectionState state);
    void OnNegotiationTimeout(uint64_t generation);

private:
    const std::string peer_id_;
    const std::vector<std::shared_ptr<MediaTrack>> local_tracks_;
    PeerTransportFactory* const transport_factory_;
    const PeerTransport::Configuration transport_config_;
    const Policy policy_;
    TaskQueue* const task_queue_;
    Observer* const observer_;

    State state_ = State::ABSENT;
    // Bumped whenever the transport is replaced or closed.
    uint64_t generation_ = 0;
    std::shared_ptr<PeerTransport> transport_;
    std::unique_ptr<TransportObserver> transport_observer_;
    bool local_description_applied_ = false;
    bool remote_description_applied_ = false;
    bool remote_description_pending_ = false;
    std::deque<Candidate> pending_candidates_;
    int offer_attempts_ = 0;

    ScopedTaskSafety task_safety_;
};

} // namespace meshrtc

#endif
