#include "client/peer_set_manager.hpp"
#include "testing/fake_media.hpp"
#include "testing/fake_peer_transport.hpp"
#include "testing/simulated_time_controller.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using ::testing::_;
using ::testing::IsEmpty;
using ::testing::NiceMock;
using ::testing::SizeIs;

#define ENABLE_UNIT_TESTS 1
#include "../testing/unittest_defines.hpp"

namespace meshrtc {
namespace test {
namespace {

using State = NegotiationController::State;
using json = nlohmann::json;

constexpr int64_t kStartTimeMs = 1000 * 1000;

signaling::ParticipantJoined Joined(std::string id, std::optional<std::string> name = std::nullopt) {
    signaling::ParticipantJoined message;
    message.participant_id = std::move(id);
    message.name = std::move(name);
    return message;
}

signaling::ParticipantLeft Left(std::string id) {
    signaling::ParticipantLeft message;
    message.participant_id = std::move(id);
    return message;
}

template <typename T>
T From(std::string from, json payload) {
    T message;
    message.from_participant_id = std::move(from);
    message.payload = std::move(payload);
    return message;
}

json OfferPayload(std::string sdp = "remote-offer") {
    return {{"type", "offer"}, {"sdp", std::move(sdp)}};
}

json AnswerPayload(std::string sdp = "remote-answer") {
    return {{"type", "answer"}, {"sdp", std::move(sdp)}};
}

} // namespace

class MockPeerSetObserver : public PeerSetManager::Observer {
public:
    void OnOutgoingMessage(signaling::Message message) override {
        messages_.push_back(std::move(message));
    }
    MOCK_METHOD(void, OnRemoteStreamsChanged, (std::vector<RemoteStreamTable::Entry> entries), (override));
    MOCK_METHOD(void, OnPeerStateChanged, (const std::string& peer_id, State state), (override));
    MOCK_METHOD(void, OnPeerFailed, (const std::string& peer_id, NegotiationController::FailureKind kind, const std::string& reason), (override));

    std::vector<signaling::Message> TakeMessages() {
        auto messages = std::move(messages_);
        messages_.clear();
        return messages;
    }

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

class T(PeerSetManagerTest) : public ::testing::Test {
public:
    T(PeerSetManagerTest)() 
        : time_controller_(kStartTimeMs),
          task_queue_(time_controller_.CreateTaskQueue()) {}

    std::unique_ptr<PeerSetManager> CreateManager(std::string self_id, 
                                                  MockPeerSetObserver* observer, 
                                                  FakePeerTransportFactory* factory) {
        std::vector<std::shared_ptr<MediaTrack>> local_tracks = {
            std::make_shared<FakeMediaTrack>(self_id + "-audio", MediaTrack::Kind::AUDIO),
            std::make_shared<FakeMediaTrack>(self_id + "-video", MediaTrack::Kind::VIDEO)
        };
        return std::make_unique<PeerSetManager>(std::move(self_id), 
                                                local_tracks, 
                                                factory, 
                                                PeerTransport::Configuration(), 
                                                NegotiationController::Policy(), 
                                                task_queue_.get(), 
                                                observer);
    }

    void Run(std::function<void()> task) {
        time_controller_.SendTask(task_queue_.get(), std::move(task));
    }

    // Delivers the relayed messages of `sender` the way the server does.
    void Relay(const std::string& sender_id, MockPeerSetObserver& sender, PeerSetManager& receiver) {
        for (auto& message : sender.TakeMessages()) {
            Run([&](){
                std::visit(overloaded {
                    [&](signaling::Offer& m) { m.from_participant_id = sender_id; receiver.OnOffer(m); },
                    [&](signaling::Answer& m) { m.from_participant_id = sender_id; receiver.OnAnswer(m); },
                    [&](signaling::IceCandidate& m) { m.from_participant_id = sender_id; receiver.OnIceCandidate(m); },
                    [&](auto&) { FAIL() << "Unexpected message"; }
                }, message);
            });
        }
    }

protected:
    SimulatedTimeController time_controller_;
    std::unique_ptr<TaskQueue> task_queue_;
    FakePeerTransportFactory factory_;
    NiceMock<MockPeerSetObserver> observer_;
};

MY_TEST_F(PeerSetManagerTest, ExistingParticipantsOffersToHigherIdsOnly) {
    auto manager = CreateManager("m", &observer_, &factory_);
    signaling::ExistingParticipants existing;
    existing.participants = {{"a", std::nullopt}, {"z", "Zed"}};
    Run([&](){ manager->OnExistingParticipants(existing); });

    EXPECT_EQ(manager->roster().size(), 2u);
    EXPECT_EQ(manager->roster().at("z"), std::optional<std::string>("Zed"));
    EXPECT_EQ(manager->controller_count(), 1u);
    ASSERT_NE(manager->controller("z"), nullptr);
    EXPECT_EQ(manager->controller("z")->state(), State::OFFERING);
    EXPECT_EQ(manager->controller("a"), nullptr);

    auto offers = observer_.MessagesOf<signaling::Offer>();
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(offers[0].target_participant_id, std::optional<std::string>("z"));
}

MY_TEST_F(PeerSetManagerTest, ParticipantJoinedAppliesTieBreak) {
    auto manager = CreateManager("p1", &observer_, &factory_);
    Run([&](){ 
        manager->OnParticipantJoined(Joined("p2"));
        manager->OnParticipantJoined(Joined("p0"));
        // Our own announcement is ignored.
        manager->OnParticipantJoined(Joined("p1"));
    });
    EXPECT_EQ(manager->roster().size(), 2u);
    EXPECT_NE(manager->controller("p2"), nullptr);
    EXPECT_EQ(manager->controller("p0"), nullptr);
    EXPECT_EQ(observer_.MessagesOf<signaling::Offer>().size(), 1u);
}

MY_TEST_F(PeerSetManagerTest, MutualDiscoveryProducesExactlyOneOffer) {
    FakePeerTransportFactory factory1, factory2;
    NiceMock<MockPeerSetObserver> observer1, observer2;
    auto p1 = CreateManager("p1", &observer1, &factory1);
    auto p2 = CreateManager("p2", &observer2, &factory2);

    Run([&](){
        p1->OnParticipantJoined(Joined("p2"));
        p2->OnParticipantJoined(Joined("p1"));
    });
    EXPECT_EQ(observer1.MessagesOf<signaling::Offer>().size(), 1u);
    EXPECT_TRUE(observer2.MessagesOf<signaling::Offer>().empty());

    Relay("p1", observer1, *p2);
    EXPECT_EQ(observer2.MessagesOf<signaling::Answer>().size(), 1u);
    Relay("p2", observer2, *p1);

    ASSERT_NE(p1->controller("p2"), nullptr);
    ASSERT_NE(p2->controller("p1"), nullptr);
    EXPECT_EQ(p1->controller("p2")->state(), State::CONNECTED);
    EXPECT_EQ(p2->controller("p1")->state(), State::CONNECTED);
    EXPECT_EQ(factory1.transports().size(), 1u);
    EXPECT_EQ(factory2.transports().size(), 1u);
}

MY_TEST_F(PeerSetManagerTest, DuplicateJoinReoffersWithOneLiveTransport) {
    auto manager = CreateManager("p1", &observer_, &factory_);
    Run([&](){ manager->OnParticipantJoined(Joined("p2")); });
    auto first = factory_.last();
    Run([&](){ manager->OnParticipantJoined(Joined("p2")); });

    ASSERT_EQ(factory_.transports().size(), 2u);
    EXPECT_TRUE(first->closed());
    EXPECT_EQ(factory_.live_count(), 1u);
    EXPECT_EQ(manager->controller_count(), 1u);
    EXPECT_EQ(observer_.MessagesOf<signaling::Offer>().size(), 2u);
}

MY_TEST_F(PeerSetManagerTest, ParticipantLeftClearsControllerAndStream) {
    auto manager = CreateManager("p1", &observer_, &factory_);
    Run([&](){ manager->OnParticipantJoined(Joined("p2", "Bob")); });
    Run([&](){ manager->OnAnswer(From<signaling::Answer>("p2", AnswerPayload())); });
    auto transport = factory_.last();

    EXPECT_CALL(observer_, OnRemoteStreamsChanged(SizeIs(1))).Times(1);
    transport->EmitRemoteTrack(std::make_shared<FakeMediaTrack>("remote", MediaTrack::Kind::VIDEO));
    time_controller_.AdvanceTime(0);
    ASSERT_TRUE(manager->streams().Find("p2"));
    EXPECT_EQ(manager->streams().Find("p2")->name, std::optional<std::string>("Bob"));

    EXPECT_CALL(observer_, OnPeerStateChanged("p2", State::CLOSED)).Times(1);
    EXPECT_CALL(observer_, OnRemoteStreamsChanged(IsEmpty())).Times(1);
    Run([&](){ manager->OnParticipantLeft(Left("p2")); });

    EXPECT_EQ(manager->controller("p2"), nullptr);
    EXPECT_FALSE(manager->streams().Contains("p2"));
    EXPECT_TRUE(manager->roster().empty());
    EXPECT_TRUE(transport->closed());
}

MY_TEST_F(PeerSetManagerTest, OfferFromUnknownPeerCreatesController) {
    auto manager = CreateManager("p2", &observer_, &factory_);
    Run([&](){ manager->OnOffer(From<signaling::Offer>("p1", OfferPayload())); });

    EXPECT_EQ(manager->roster().count("p1"), 1u);
    ASSERT_NE(manager->controller("p1"), nullptr);
    EXPECT_EQ(manager->controller("p1")->state(), State::CONNECTED);
    auto answers = observer_.MessagesOf<signaling::Answer>();
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0].target_participant_id, std::optional<std::string>("p1"));
}

MY_TEST_F(PeerSetManagerTest, DiscardsMessagesFromUnknownPeers) {
    auto manager = CreateManager("p1", &observer_, &factory_);
    Run([&](){
        manager->OnAnswer(From<signaling::Answer>("p9", AnswerPayload()));
        manager->OnIceCandidate(From<signaling::IceCandidate>("p9", {{"candidate", "candidate:1"}}));
        // No sender at all.
        manager->OnOffer(signaling::Offer());
    });
    EXPECT_EQ(manager->controller_count(), 0u);
    EXPECT_TRUE(manager->roster().empty());
    EXPECT_TRUE(factory_.transports().empty());
}

MY_TEST_F(PeerSetManagerTest, DiscardsMalformedPayloads) {
    auto manager = CreateManager("p2", &observer_, &factory_);
    Run([&](){ manager->OnOffer(From<signaling::Offer>("p1", {{"sdp", "no type"}})); });
    EXPECT_EQ(manager->controller_count(), 0u);
    EXPECT_TRUE(factory_.transports().empty());
}

MY_TEST_F(PeerSetManagerTest, NameArrivesAfterMedia) {
    auto manager = CreateManager("p2", &observer_, &factory_);
    Run([&](){ manager->OnOffer(From<signaling::Offer>("p1", OfferPayload())); });
    factory_.last()->EmitRemoteTrack(std::make_shared<FakeMediaTrack>("remote", MediaTrack::Kind::VIDEO));
    time_controller_.AdvanceTime(0);
    ASSERT_TRUE(manager->streams().Find("p1"));
    EXPECT_FALSE(manager->streams().Find("p1")->name);

    EXPECT_CALL(observer_, OnRemoteStreamsChanged(SizeIs(1))).Times(1);
    Run([&](){ manager->OnParticipantJoined(Joined("p1", "Ann")); });
    EXPECT_EQ(manager->streams().Find("p1")->name, std::optional<std::string>("Ann"));
    // The lower id offers, so no new transport.
    EXPECT_EQ(factory_.transports().size(), 1u);
}

MY_TEST_F(PeerSetManagerTest, FailedNegotiationRemovesStream) {
    auto manager = CreateManager("p1", &observer_, &factory_);
    Run([&](){ manager->OnParticipantJoined(Joined("p2")); });
    factory_.last()->EmitRemoteTrack(std::make_shared<FakeMediaTrack>("early", MediaTrack::Kind::AUDIO));
    time_controller_.AdvanceTime(0);
    EXPECT_TRUE(manager->streams().Contains("p2"));

    EXPECT_CALL(observer_, OnPeerFailed("p2", NegotiationController::FailureKind::NEGOTIATION, _)).Times(1);
    Run([&](){ manager->OnAnswer(From<signaling::Answer>("p2", AnswerPayload("malformed"))); });
    EXPECT_FALSE(manager->streams().Contains("p2"));
    ASSERT_NE(manager->controller("p2"), nullptr);
    EXPECT_EQ(manager->controller("p2")->state(), State::ABSENT);
    EXPECT_EQ(factory_.live_count(), 0u);
}

MY_TEST_F(PeerSetManagerTest, FailureOfOnePeerKeepsOthers) {
    auto manager = CreateManager("p1", &observer_, &factory_);
    signaling::ExistingParticipants existing;
    existing.participants = {{"p2", std::nullopt}, {"p3", std::nullopt}};
    Run([&](){ manager->OnExistingParticipants(existing); });
    Run([&](){
        manager->OnAnswer(From<signaling::Answer>("p2", AnswerPayload("malformed")));
        manager->OnAnswer(From<signaling::Answer>("p3", AnswerPayload()));
    });
    EXPECT_EQ(manager->controller("p2")->state(), State::ABSENT);
    EXPECT_EQ(manager->controller("p3")->state(), State::CONNECTED);
    EXPECT_EQ(factory_.live_count(), 1u);
}

MY_TEST_F(PeerSetManagerTest, CloseAllReleasesEverything) {
    auto manager = CreateManager("p1", &observer_, &factory_);
    Run([&](){ 
        manager->OnParticipantJoined(Joined("p2"));
        manager->OnParticipantJoined(Joined("p3"));
    });
    factory_.last()->EmitRemoteTrack(std::make_shared<FakeMediaTrack>("remote", MediaTrack::Kind::VIDEO));
    time_controller_.AdvanceTime(0);

    Run([&](){ manager->CloseAll(); });
    EXPECT_EQ(manager->controller_count(), 0u);
    EXPECT_TRUE(manager->roster().empty());
    EXPECT_TRUE(manager->streams().empty());
    EXPECT_EQ(factory_.live_count(), 0u);
}

MY_TEST_F(PeerSetManagerTest, PeersNegotiateIndependently) {
    factory_.set_deferred(true);
    auto manager = CreateManager("m", &observer_, &factory_);
    signaling::ExistingParticipants existing;
    existing.participants = {{"x", std::nullopt}, {"y", std::nullopt}};
    Run([&](){ manager->OnExistingParticipants(existing); });
    auto transports = factory_.transports();
    ASSERT_EQ(transports.size(), 2u);
    auto to_x = transports[0];
    auto to_y = transports[1];

    // The offer to y completes while the one to x is still being created.
    to_y->CompletePending();
    time_controller_.AdvanceTime(0);
    to_y->CompletePending();
    time_controller_.AdvanceTime(0);
    auto offers = observer_.MessagesOf<signaling::Offer>();
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(offers[0].target_participant_id, std::optional<std::string>("y"));

    Run([&](){
        manager->OnAnswer(From<signaling::Answer>("y", AnswerPayload()));
        manager->OnIceCandidate(From<signaling::IceCandidate>("x", {{"candidate", "candidate:x"}}));
    });
    to_y->CompletePending();
    time_controller_.AdvanceTime(0);
    EXPECT_EQ(manager->controller("y")->state(), State::CONNECTED);
    EXPECT_EQ(manager->controller("x")->state(), State::OFFERING);
    EXPECT_EQ(manager->controller("x")->pending_candidate_count(), 1u);

    to_x->CompletePending();
    time_controller_.AdvanceTime(0);
    to_x->CompletePending();
    time_controller_.AdvanceTime(0);
    offers = observer_.MessagesOf<signaling::Offer>();
    ASSERT_EQ(offers.size(), 2u);
    EXPECT_EQ(offers[1].target_participant_id, std::optional<std::string>("x"));
    EXPECT_EQ(factory_.live_count(), 2u);
}

} // namespace test
} // namespace meshrtc
