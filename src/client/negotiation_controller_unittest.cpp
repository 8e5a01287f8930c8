#include "client/negotiation_controller.hpp"
#include "testing/fake_media.hpp"
#include "testing/fake_peer_transport.hpp"
#include "testing/simulated_time_controller.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;

#define ENABLE_UNIT_TESTS 1
#include "../testing/unittest_defines.hpp"

namespace meshrtc {
namespace test {
namespace {

using State = NegotiationController::State;
using FailureKind = NegotiationController::FailureKind;
using json = nlohmann::json;

constexpr int64_t kStartTimeMs = 1000 * 1000;
constexpr TimeInterval kTimeoutMs = 1000;
const char kPeerId[] = "peer";

} // namespace

class MockNegotiationObserver : public NegotiationController::Observer {
public:
    void OnOutgoingMessage(const std::string& peer_id, signaling::Message message) override {
        EXPECT_EQ(peer_id, kPeerId);
        messages_.push_back(std::move(message));
    }
    MOCK_METHOD(void, OnRemoteTrack, (const std::string& peer_id, std::shared_ptr<MediaTrack> track), (override));
    MOCK_METHOD(void, OnStateChanged, (const std::string& peer_id, State state), (override));
    MOCK_METHOD(void, OnNegotiationFailed, (const std::string& peer_id, FailureKind kind, const std::string& reason), (override));

    template <typename T>
    std::vector<T> MessagesOf() const {
        std::vector<T> result;
        for (const auto& message : messages_) {
            if (auto* m = std::get_if<T>(&message)) {
                result.push_back(*m);
            }
        }
        return result;
    }

private:
    std::vector<signaling::Message> messages_;
};

class T(NegotiationControllerTest) : public ::testing::Test {
public:
    T(NegotiationControllerTest)() 
        : time_controller_(kStartTimeMs),
          task_queue_(time_controller_.CreateTaskQueue()),
          audio_(std::make_shared<FakeMediaTrack>("audio", MediaTrack::Kind::AUDIO)),
          video_(std::make_shared<FakeMediaTrack>("video", MediaTrack::Kind::VIDEO)) {}

    std::unique_ptr<NegotiationController> CreateController(NegotiationController::Policy policy = NegotiationController::Policy()) {
        std::vector<std::shared_ptr<MediaTrack>> local_tracks = {audio_, video_};
        return std::make_unique<NegotiationController>(kPeerId, 
                                                       local_tracks, 
                                                       &factory_, 
                                                       PeerTransport::Configuration(), 
                                                       policy, 
                                                       task_queue_.get(), 
                                                       &observer_);
    }

    void Run(std::function<void()> task) {
        time_controller_.SendTask(task_queue_.get(), std::move(task));
    }

    // Releases the completions `transport` holds back, and runs what they post.
    void CompletePending(const std::shared_ptr<FakePeerTransport>& transport) {
        transport->CompletePending();
        time_controller_.AdvanceTime(0);
    }

    static SessionDescription RemoteOffer(std::string sdp = "remote-offer") {
        return SessionDescription(SessionDescription::Type::OFFER, std::move(sdp));
    }

    static SessionDescription RemoteAnswer(std::string sdp = "remote-answer") {
        return SessionDescription(SessionDescription::Type::ANSWER, std::move(sdp));
    }

protected:
    SimulatedTimeController time_controller_;
    std::unique_ptr<TaskQueue> task_queue_;
    std::shared_ptr<FakeMediaTrack> audio_;
    std::shared_ptr<FakeMediaTrack> video_;
    FakePeerTransportFactory factory_;
    NiceMock<MockNegotiationObserver> observer_;
};

MY_TEST_F(NegotiationControllerTest, OfferAttachesTracksAndSendsOffer) {
    auto controller = CreateController();
    EXPECT_CALL(observer_, OnStateChanged(kPeerId, State::OFFERING)).Times(1);
    Run([&](){ controller->Offer(); });

    auto transport = factory_.last();
    ASSERT_TRUE(transport);
    EXPECT_EQ(transport->operations(), std::vector<std::string>({"AddTrack", "AddTrack", "CreateOffer", "SetLocalDescription:offer"}));
    EXPECT_EQ(transport->tracks().size(), 2u);

    auto offers = observer_.MessagesOf<signaling::Offer>();
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(offers[0].target_participant_id, std::optional<std::string>(kPeerId));
    EXPECT_EQ(offers[0].payload, json({{"type", "offer"}, {"sdp", "offer-0"}}));
    EXPECT_EQ(controller->state(), State::OFFERING);
    EXPECT_EQ(controller->offer_attempts(), 1);
}

MY_TEST_F(NegotiationControllerTest, AnswerCompletesOffer) {
    auto controller = CreateController();
    Run([&](){ controller->Offer(); });

    EXPECT_CALL(observer_, OnStateChanged(kPeerId, State::CONNECTED)).Times(1);
    Run([&](){ controller->HandleRemoteAnswer(RemoteAnswer()); });

    EXPECT_EQ(controller->state(), State::CONNECTED);
    EXPECT_TRUE(controller->remote_description_applied());
    ASSERT_TRUE(factory_.last()->remote_description());
    EXPECT_EQ(factory_.last()->remote_description()->sdp(), "remote-answer");
}

MY_TEST_F(NegotiationControllerTest, RemoteOfferIsAnswered) {
    auto controller = CreateController();
    {
        ::testing::InSequence seq;
        EXPECT_CALL(observer_, OnStateChanged(kPeerId, State::ANSWERING)).Times(1);
        EXPECT_CALL(observer_, OnStateChanged(kPeerId, State::CONNECTED)).Times(1);
    }
    Run([&](){ controller->HandleRemoteOffer(RemoteOffer()); });

    auto transport = factory_.last();
    EXPECT_EQ(transport->operations(), std::vector<std::string>({"AddTrack", "AddTrack", "SetRemoteDescription:offer", "CreateAnswer", "SetLocalDescription:answer"}));
    auto answers = observer_.MessagesOf<signaling::Answer>();
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0].target_participant_id, std::optional<std::string>(kPeerId));
    EXPECT_EQ(answers[0].payload, json({{"type", "answer"}, {"sdp", "answer-0"}}));
    EXPECT_TRUE(observer_.MessagesOf<signaling::Offer>().empty());
    EXPECT_EQ(controller->state(), State::CONNECTED);
}

MY_TEST_F(NegotiationControllerTest, CandidatesQueuedUntilRemoteDescriptionLands) {
    const std::vector<Candidate> candidates = {
        Candidate("candidate:1", "0", 0),
        Candidate("candidate:2", "0", 0),
        Candidate("candidate:3", "1", 1)
    };

    // Candidates arrive before the answer.
    auto early = CreateController();
    Run([&](){ early->Offer(); });
    Run([&](){
        early->HandleRemoteCandidate(candidates[0]);
        early->HandleRemoteCandidate(candidates[1]);
    });
    EXPECT_EQ(early->pending_candidate_count(), 2u);
    EXPECT_TRUE(factory_.last()->remote_candidates().empty());
    Run([&](){ early->HandleRemoteAnswer(RemoteAnswer()); });
    EXPECT_EQ(early->pending_candidate_count(), 0u);
    Run([&](){ early->HandleRemoteCandidate(candidates[2]); });
    auto early_applied = factory_.last()->remote_candidates();

    // Candidates arrive after the answer.
    auto late = CreateController();
    Run([&](){ late->Offer(); });
    Run([&](){ late->HandleRemoteAnswer(RemoteAnswer()); });
    Run([&](){
        for (const auto& candidate : candidates) {
            late->HandleRemoteCandidate(candidate);
        }
    });
    auto late_applied = factory_.last()->remote_candidates();

    EXPECT_EQ(early_applied, candidates);
    EXPECT_EQ(late_applied, early_applied);
    EXPECT_EQ(early->state(), State::CONNECTED);
}

MY_TEST_F(NegotiationControllerTest, CandidatesQueuedOnAnsweringSide) {
    auto controller = CreateController();
    // The candidate is queued while the remote offer is being applied.
    Run([&](){ 
        controller->HandleRemoteOffer(RemoteOffer());
        controller->HandleRemoteCandidate(Candidate("candidate:1"));
        EXPECT_EQ(controller->pending_candidate_count(), 1u);
    });
    EXPECT_EQ(controller->pending_candidate_count(), 0u);
    EXPECT_EQ(factory_.last()->remote_candidates(), std::vector<Candidate>({Candidate("candidate:1")}));
}

MY_TEST_F(NegotiationControllerTest, CandidateWithoutTransportIsDiscarded) {
    auto controller = CreateController();
    Run([&](){ controller->HandleRemoteCandidate(Candidate("candidate:1")); });
    EXPECT_FALSE(controller->has_transport());
    EXPECT_EQ(controller->pending_candidate_count(), 0u);
    EXPECT_TRUE(factory_.transports().empty());
}

MY_TEST_F(NegotiationControllerTest, AnswerWithoutOfferIsDiscarded) {
    auto controller = CreateController();
    EXPECT_CALL(observer_, OnStateChanged(_, _)).Times(0);
    EXPECT_CALL(observer_, OnNegotiationFailed(_, _, _)).Times(0);
    Run([&](){ controller->HandleRemoteAnswer(RemoteAnswer()); });
    EXPECT_EQ(controller->state(), State::ABSENT);
    EXPECT_TRUE(factory_.transports().empty());
}

MY_TEST_F(NegotiationControllerTest, DuplicateAnswerIsDiscarded) {
    auto controller = CreateController();
    Run([&](){ controller->Offer(); });
    Run([&](){ controller->HandleRemoteAnswer(RemoteAnswer()); });
    Run([&](){ controller->HandleRemoteAnswer(RemoteAnswer("second")); });
    EXPECT_EQ(factory_.last()->remote_description()->sdp(), "remote-answer");
    EXPECT_EQ(controller->state(), State::CONNECTED);
}

MY_TEST_F(NegotiationControllerTest, ReofferClosesPriorTransportFirst) {
    auto controller = CreateController();
    Run([&](){ controller->Offer(); });
    auto first = factory_.last();
    Run([&](){ controller->HandleRemoteAnswer(RemoteAnswer()); });

    Run([&](){ controller->Offer(); });
    auto second = factory_.last();
    ASSERT_NE(first, second);
    EXPECT_TRUE(first->closed());
    EXPECT_FALSE(second->closed());
    EXPECT_EQ(factory_.live_count(), 1u);
    EXPECT_EQ(controller->state(), State::OFFERING);
    EXPECT_FALSE(controller->remote_description_applied());
    EXPECT_EQ(observer_.MessagesOf<signaling::Offer>().size(), 2u);
}

MY_TEST_F(NegotiationControllerTest, RemoteOfferReplacesExistingTransport) {
    auto controller = CreateController();
    Run([&](){ controller->HandleRemoteOffer(RemoteOffer()); });
    Run([&](){ controller->HandleRemoteOffer(RemoteOffer("renegotiate")); });
    ASSERT_EQ(factory_.transports().size(), 2u);
    EXPECT_TRUE(factory_.transports()[0]->closed());
    EXPECT_EQ(factory_.live_count(), 1u);
    EXPECT_EQ(observer_.MessagesOf<signaling::Answer>().size(), 2u);
}

MY_TEST_F(NegotiationControllerTest, ForwardsLocalCandidates) {
    auto controller = CreateController();
    Run([&](){ controller->Offer(); });
    factory_.last()->EmitLocalCandidate(Candidate("candidate:local", "0", 0));
    time_controller_.AdvanceTime(0);

    auto candidates = observer_.MessagesOf<signaling::IceCandidate>();
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].target_participant_id, std::optional<std::string>(kPeerId));
    EXPECT_EQ(candidates[0].payload, json({{"candidate", "candidate:local"}, {"sdpMid", "0"}, {"sdpMLineIndex", 0}}));
}

MY_TEST_F(NegotiationControllerTest, ReportsRemoteTracks) {
    auto controller = CreateController();
    Run([&](){ controller->HandleRemoteOffer(RemoteOffer()); });
    auto track = std::make_shared<FakeMediaTrack>("remote-video", MediaTrack::Kind::VIDEO);
    EXPECT_CALL(observer_, OnRemoteTrack(kPeerId, std::shared_ptr<MediaTrack>(track))).Times(1);
    factory_.last()->EmitRemoteTrack(track);
    time_controller_.AdvanceTime(0);
}

MY_TEST_F(NegotiationControllerTest, IgnoresEventsOfReplacedTransport) {
    auto controller = CreateController();
    Run([&](){ controller->Offer(); });
    auto stale = factory_.last();
    Run([&](){ controller->Offer(); });

    EXPECT_CALL(observer_, OnRemoteTrack(_, _)).Times(0);
    stale->EmitLocalCandidate(Candidate("candidate:stale"));
    stale->EmitRemoteTrack(std::make_shared<FakeMediaTrack>("stale", MediaTrack::Kind::AUDIO));
    time_controller_.AdvanceTime(0);
    EXPECT_TRUE(observer_.MessagesOf<signaling::IceCandidate>().empty());
}

MY_TEST_F(NegotiationControllerTest, MalformedAnswerLeavesPeerAbsent) {
    auto controller = CreateController();
    Run([&](){ controller->Offer(); });
    auto transport = factory_.last();

    EXPECT_CALL(observer_, OnStateChanged(kPeerId, State::ABSENT)).Times(1);
    EXPECT_CALL(observer_, OnNegotiationFailed(kPeerId, FailureKind::NEGOTIATION, HasSubstr("Setting remote answer"))).Times(1);
    Run([&](){ controller->HandleRemoteAnswer(RemoteAnswer("malformed")); });

    EXPECT_EQ(controller->state(), State::ABSENT);
    EXPECT_FALSE(controller->has_transport());
    EXPECT_TRUE(transport->closed());
}

MY_TEST_F(NegotiationControllerTest, RejectedCandidateLeavesPeerAbsent) {
    factory_.set_failing_operations({"AddRemoteCandidate"});
    auto controller = CreateController();
    Run([&](){ controller->HandleRemoteOffer(RemoteOffer()); });
    EXPECT_CALL(observer_, OnNegotiationFailed(kPeerId, FailureKind::NEGOTIATION, _)).Times(1);
    Run([&](){ controller->HandleRemoteCandidate(Candidate("candidate:1")); });
    EXPECT_EQ(controller->state(), State::ABSENT);
    EXPECT_EQ(factory_.live_count(), 0u);
}

MY_TEST_F(NegotiationControllerTest, TransportCreationFailure) {
    factory_.set_fail_creation(true);
    auto controller = CreateController();
    EXPECT_CALL(observer_, OnNegotiationFailed(kPeerId, FailureKind::TRANSPORT_CREATION, HasSubstr("No transport available"))).Times(1);
    Run([&](){ controller->Offer(); });
    EXPECT_EQ(controller->state(), State::ABSENT);
    EXPECT_FALSE(controller->has_transport());
    EXPECT_TRUE(observer_.MessagesOf<signaling::Offer>().empty());
}

MY_TEST_F(NegotiationControllerTest, FailedTrackAttachClosesTransport) {
    factory_.set_failing_operations({"AddTrack"});
    auto controller = CreateController();
    EXPECT_CALL(observer_, OnNegotiationFailed(kPeerId, FailureKind::TRANSPORT_CREATION, _)).Times(1);
    Run([&](){ controller->HandleRemoteOffer(RemoteOffer()); });
    ASSERT_EQ(factory_.transports().size(), 1u);
    EXPECT_TRUE(factory_.transports()[0]->closed());
    EXPECT_EQ(controller->state(), State::ABSENT);
}

MY_TEST_F(NegotiationControllerTest, StalledOfferIsRetriedThenAbandoned) {
    NegotiationController::Policy policy;
    policy.negotiation_timeout_ms = kTimeoutMs;
    policy.max_offer_attempts = 3;
    auto controller = CreateController(policy);
    Run([&](){ controller->Offer(); });

    time_controller_.AdvanceTime(kTimeoutMs);
    EXPECT_EQ(controller->offer_attempts(), 2);
    EXPECT_EQ(factory_.transports().size(), 2u);
    EXPECT_EQ(factory_.live_count(), 1u);

    time_controller_.AdvanceTime(kTimeoutMs);
    EXPECT_EQ(controller->offer_attempts(), 3);
    EXPECT_EQ(observer_.MessagesOf<signaling::Offer>().size(), 3u);

    EXPECT_CALL(observer_, OnNegotiationFailed(kPeerId, FailureKind::TIMEOUT, _)).Times(1);
    time_controller_.AdvanceTime(kTimeoutMs);
    EXPECT_EQ(controller->state(), State::ABSENT);
    EXPECT_EQ(factory_.live_count(), 0u);

    // No more attempts.
    time_controller_.AdvanceTime(10 * kTimeoutMs);
    EXPECT_EQ(factory_.transports().size(), 3u);
}

MY_TEST_F(NegotiationControllerTest, ConnectedPeerIsNotTimedOut) {
    NegotiationController::Policy policy;
    policy.negotiation_timeout_ms = kTimeoutMs;
    auto controller = CreateController(policy);
    Run([&](){ controller->Offer(); });
    Run([&](){ controller->HandleRemoteAnswer(RemoteAnswer()); });

    EXPECT_CALL(observer_, OnNegotiationFailed(_, _, _)).Times(0);
    time_controller_.AdvanceTime(5 * kTimeoutMs);
    EXPECT_EQ(controller->state(), State::CONNECTED);
    EXPECT_EQ(factory_.transports().size(), 1u);
}

MY_TEST_F(NegotiationControllerTest, ZeroTimeoutDisablesRetry) {
    NegotiationController::Policy policy;
    policy.negotiation_timeout_ms = 0;
    auto controller = CreateController(policy);
    Run([&](){ controller->Offer(); });
    time_controller_.AdvanceTime(60 * 60 * 1000);
    EXPECT_EQ(controller->state(), State::OFFERING);
    EXPECT_EQ(factory_.transports().size(), 1u);
}

MY_TEST_F(NegotiationControllerTest, CloseReleasesTransport) {
    auto controller = CreateController();
    Run([&](){ controller->Offer(); });
    Run([&](){ controller->HandleRemoteCandidate(Candidate("candidate:1")); });
    auto transport = factory_.last();

    EXPECT_CALL(observer_, OnStateChanged(kPeerId, State::CLOSED)).Times(1);
    Run([&](){ controller->Close(); });
    EXPECT_TRUE(transport->closed());
    EXPECT_EQ(controller->state(), State::CLOSED);
    EXPECT_EQ(controller->pending_candidate_count(), 0u);

    // A closed peer stays closed.
    Run([&](){ 
        controller->Offer();
        controller->HandleRemoteOffer(RemoteOffer());
        controller->HandleRemoteAnswer(RemoteAnswer());
    });
    EXPECT_EQ(factory_.transports().size(), 1u);
    EXPECT_EQ(controller->state(), State::CLOSED);
}

MY_TEST_F(NegotiationControllerTest, AnswerWaitsForLocalOffer) {
    factory_.set_deferred(true);
    NegotiationController::Policy policy;
    policy.negotiation_timeout_ms = kTimeoutMs;
    auto controller = CreateController(policy);
    Run([&](){ controller->Offer(); });
    auto first = factory_.last();
    CompletePending(first);
    CompletePending(first);
    ASSERT_EQ(observer_.MessagesOf<signaling::Offer>().size(), 1u);
    EXPECT_TRUE(controller->local_description_applied());

    // The retry is still creating its offer when the answer to the first one lands.
    time_controller_.AdvanceTime(kTimeoutMs);
    auto second = factory_.last();
    ASSERT_NE(first, second);
    EXPECT_EQ(second->pending_count(), 1u);
    EXPECT_FALSE(controller->local_description_applied());

    EXPECT_CALL(observer_, OnNegotiationFailed(_, _, _)).Times(0);
    Run([&](){ controller->HandleRemoteAnswer(RemoteAnswer("answer-to-first-offer")); });
    EXPECT_EQ(second->operations(), std::vector<std::string>({"AddTrack", "AddTrack", "CreateOffer"}));
    EXPECT_EQ(controller->state(), State::OFFERING);

    CompletePending(second);
    CompletePending(second);
    auto offers = observer_.MessagesOf<signaling::Offer>();
    ASSERT_EQ(offers.size(), 2u);
    EXPECT_EQ(offers[1].payload, json({{"type", "offer"}, {"sdp", "offer-1"}}));

    Run([&](){ controller->HandleRemoteAnswer(RemoteAnswer()); });
    CompletePending(second);
    EXPECT_EQ(controller->state(), State::CONNECTED);
    EXPECT_EQ(second->remote_description()->sdp(), "remote-answer");
}

MY_TEST_F(NegotiationControllerTest, DropsLateCompletionOfReplacedTransport) {
    factory_.set_deferred(true);
    auto controller = CreateController();
    Run([&](){ controller->Offer(); });
    auto stale = factory_.last();
    Run([&](){ controller->Offer(); });
    auto current = factory_.last();
    ASSERT_NE(stale, current);
    EXPECT_TRUE(stale->closed());

    // The offer created by the closed transport arrives after the re-offer.
    EXPECT_EQ(stale->CompletePending(), 1u);
    time_controller_.AdvanceTime(0);
    EXPECT_EQ(stale->operations(), std::vector<std::string>({"AddTrack", "AddTrack", "CreateOffer", "Close"}));
    EXPECT_TRUE(observer_.MessagesOf<signaling::Offer>().empty());
    EXPECT_FALSE(controller->local_description_applied());

    CompletePending(current);
    CompletePending(current);
    auto offers = observer_.MessagesOf<signaling::Offer>();
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(offers[0].payload, json({{"type", "offer"}, {"sdp", "offer-1"}}));
}

MY_TEST_F(NegotiationControllerTest, CandidatesWaitWhileRemoteAnswerIsApplied) {
    factory_.set_deferred(true);
    auto controller = CreateController();
    Run([&](){ controller->Offer(); });
    auto transport = factory_.last();
    CompletePending(transport);
    CompletePending(transport);

    Run([&](){ controller->HandleRemoteAnswer(RemoteAnswer()); });
    // Arrives while the answer is being applied.
    Run([&](){ 
        controller->HandleRemoteCandidate(Candidate("candidate:1"));
        controller->HandleRemoteAnswer(RemoteAnswer("duplicate"));
    });
    EXPECT_EQ(controller->pending_candidate_count(), 1u);
    EXPECT_EQ(controller->state(), State::OFFERING);

    CompletePending(transport);
    EXPECT_EQ(controller->state(), State::CONNECTED);
    EXPECT_EQ(controller->pending_candidate_count(), 0u);
    EXPECT_EQ(transport->operations(), std::vector<std::string>({"AddTrack", "AddTrack", 
                                                                 "CreateOffer", "SetLocalDescription:offer", 
                                                                 "SetRemoteDescription:answer", "AddRemoteCandidate:candidate:1"}));
}

} // namespace test
} // namespace meshrtc
