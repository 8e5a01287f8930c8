#include "client/mesh_session.hpp"
#include "testing/fake_media.hpp"
#include "testing/fake_peer_transport.hpp"
#include "testing/fake_signaling_channel.hpp"
#include "testing/simulated_time_controller.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::NiceMock;

#define ENABLE_UNIT_TESTS 1
#include "../testing/unittest_defines.hpp"

namespace meshrtc {
namespace test {
namespace {

using ErrorKind = MeshSession::ErrorKind;
using json = nlohmann::json;

constexpr int64_t kStartTimeMs = 1000 * 1000;
constexpr char kSignalingUrl[] = "ws://signaling.test:8080";
// Sorts after and before every generated participant id.
constexpr char kHigherPeerId[] = "zzzzzzzzz";
constexpr char kLowerPeerId[] = "0";

bool IsLowerAlphanumeric(const std::string& str) {
    return std::all_of(str.begin(), str.end(), [](char c){
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z');
    });
}

} // namespace

class MockMeshSessionObserver : public MeshSession::Observer {
public:
    MOCK_METHOD(void, OnJoined, (const std::string& room_id, size_t participant_count), (override));
    MOCK_METHOD(void, OnParticipantJoined, (const std::string& participant_id, const std::optional<std::string>& name), (override));
    MOCK_METHOD(void, OnParticipantLeft, (const std::string& participant_id), (override));
    MOCK_METHOD(void, OnRemoteStreamsChanged, (std::vector<RemoteStreamTable::Entry> entries), (override));
    MOCK_METHOD(void, OnPeerStateChanged, (const std::string& participant_id, NegotiationController::State state), (override));
    MOCK_METHOD(void, OnError, (ErrorKind kind, const std::string& message), (override));
};

class T(MeshSessionTest) : public ::testing::Test {
public:
    T(MeshSessionTest)() 
        : time_controller_(kStartTimeMs),
          task_queue_(time_controller_.CreateTaskQueue()),
          channel_(std::make_shared<FakeSignalingChannel>()) {
        MeshSession::Configuration config;
        config.signaling_url = kSignalingUrl;
        session_ = std::make_unique<MeshSession>(config, 
                                                 &capture_device_, 
                                                 &factory_, 
                                                 channel_, 
                                                 task_queue_.get(), 
                                                 &observer_);
    }

    ~T(MeshSessionTest)() override {
        // The destructor leaves on the task queue.
        Run([this](){ session_.reset(); });
    }

    void Run(std::function<void()> task) {
        time_controller_.SendTask(task_queue_.get(), std::move(task));
    }

    bool Join(std::string room_id, std::optional<std::string> name = std::nullopt) {
        bool joined = false;
        Run([&](){ joined = session_->Join(std::move(room_id), std::move(name)); });
        return joined;
    }

    void Deliver(const signaling::Message& message) {
        channel_->Deliver(message);
        time_controller_.AdvanceTime(0);
    }

    // Joins the room and receives the server's replies.
    void JoinAndConnect(const std::string& room_id, std::vector<signaling::ParticipantInfo> others = {}) {
        ASSERT_TRUE(Join(room_id, "Alice"));
        channel_->SimulateConnected();
        time_controller_.AdvanceTime(0);

        signaling::JoinedRoom joined;
        joined.room_id = MeshSession::NormalizeRoomId(room_id);
        joined.participant_id = session_->participant_id();
        joined.participant_count = others.size() + 1;
        Deliver(joined);

        signaling::ExistingParticipants existing;
        existing.participants = std::move(others);
        Deliver(existing);
    }

protected:
    SimulatedTimeController time_controller_;
    std::unique_ptr<TaskQueue> task_queue_;
    FakeCaptureDevice capture_device_;
    FakePeerTransportFactory factory_;
    std::shared_ptr<FakeSignalingChannel> channel_;
    NiceMock<MockMeshSessionObserver> observer_;
    std::unique_ptr<MeshSession> session_;
};

MY_TEST_F(MeshSessionTest, GeneratesIds) {
    const auto& id = session_->participant_id();
    EXPECT_EQ(id.size(), 8u);
    EXPECT_TRUE(IsLowerAlphanumeric(id)) << id;

    auto room_id = MeshSession::GenerateRoomId();
    EXPECT_EQ(room_id.size(), 6u);
    EXPECT_EQ(MeshSession::NormalizeRoomId(room_id), room_id);
}

MY_TEST_F(MeshSessionTest, NormalizesRoomIds) {
    EXPECT_EQ(MeshSession::NormalizeRoomId("  ab1c \n"), "AB1C");
    EXPECT_EQ(MeshSession::NormalizeRoomId("ROOM"), "ROOM");
    EXPECT_EQ(MeshSession::NormalizeRoomId("   "), "");
}

MY_TEST_F(MeshSessionTest, JoinSendsJoinRoomOnceConnected) {
    ASSERT_TRUE(Join(" abc ", "Alice"));
    EXPECT_EQ(channel_->connect_urls(), std::vector<std::string>({kSignalingUrl}));
    EXPECT_EQ(session_->state(), MeshSession::State::CONNECTING);
    EXPECT_EQ(session_->local_tracks().size(), 2u);

    channel_->SimulateConnected();
    time_controller_.AdvanceTime(0);
    auto joins = channel_->MessagesOf<signaling::JoinRoom>();
    ASSERT_EQ(joins.size(), 1u);
    EXPECT_EQ(joins[0].room_id, "ABC");
    EXPECT_EQ(joins[0].participant_id, session_->participant_id());
    EXPECT_EQ(joins[0].name, std::optional<std::string>("Alice"));
    EXPECT_EQ(session_->state(), MeshSession::State::JOINING);

    EXPECT_CALL(observer_, OnJoined("ABC", 1u)).Times(1);
    signaling::JoinedRoom joined;
    joined.room_id = "ABC";
    joined.participant_id = session_->participant_id();
    joined.participant_count = 1;
    Deliver(joined);
    EXPECT_EQ(session_->state(), MeshSession::State::JOINED);
}

MY_TEST_F(MeshSessionTest, DefaultDisplayName) {
    ASSERT_TRUE(Join("abc"));
    EXPECT_EQ(session_->display_name(), "User " + session_->participant_id().substr(0, 4));
}

MY_TEST_F(MeshSessionTest, MediaFailureAbortsJoin) {
    capture_device_.set_denied(true);
    EXPECT_CALL(observer_, OnError(ErrorKind::MEDIA_ACQUISITION, HasSubstr("Permission denied"))).Times(1);
    EXPECT_FALSE(Join("abc"));
    EXPECT_EQ(session_->state(), MeshSession::State::IDLE);
    EXPECT_TRUE(channel_->connect_urls().empty());
    EXPECT_EQ(session_->peers(), nullptr);
}

MY_TEST_F(MeshSessionTest, EmptyRoomIdIsRejected) {
    EXPECT_CALL(observer_, OnError(ErrorKind::SIGNALING, _)).Times(1);
    EXPECT_FALSE(Join("  "));
    EXPECT_EQ(capture_device_.open_count(), 0);
}

MY_TEST_F(MeshSessionTest, OffersToExistingParticipantsWithHigherIds) {
    JoinAndConnect("abc", {{kHigherPeerId, "Zed"}, {kLowerPeerId, std::nullopt}});

    auto offers = channel_->MessagesOf<signaling::Offer>();
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(offers[0].target_participant_id, std::optional<std::string>(kHigherPeerId));
    ASSERT_NE(session_->peers(), nullptr);
    EXPECT_EQ(session_->peers()->roster().size(), 2u);

    // The lower id offers to us.
    signaling::Offer offer;
    offer.from_participant_id = kLowerPeerId;
    offer.payload = {{"type", "offer"}, {"sdp", "remote-offer"}};
    Deliver(offer);
    auto answers = channel_->MessagesOf<signaling::Answer>();
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0].target_participant_id, std::optional<std::string>(kLowerPeerId));
}

MY_TEST_F(MeshSessionTest, ParticipantEventsReachObserver) {
    JoinAndConnect("abc");

    EXPECT_CALL(observer_, OnParticipantJoined(kHigherPeerId, std::optional<std::string>("Zed"))).Times(1);
    signaling::ParticipantJoined joined;
    joined.participant_id = kHigherPeerId;
    joined.name = "Zed";
    joined.participant_count = 2;
    Deliver(joined);
    EXPECT_EQ(channel_->MessagesOf<signaling::Offer>().size(), 1u);

    EXPECT_CALL(observer_, OnParticipantLeft(kHigherPeerId)).Times(1);
    signaling::ParticipantLeft left;
    left.participant_id = kHigherPeerId;
    left.participant_count = 1;
    Deliver(left);
    EXPECT_EQ(session_->peers()->controller_count(), 0u);
    EXPECT_EQ(factory_.live_count(), 0u);
}

MY_TEST_F(MeshSessionTest, ServerErrorIsSurfaced) {
    JoinAndConnect("abc");
    EXPECT_CALL(observer_, OnError(ErrorKind::SERVER, "Target participant not found")).Times(1);
    signaling::Error error;
    error.error = "Target participant not found";
    Deliver(error);
    EXPECT_EQ(session_->state(), MeshSession::State::JOINED);
}

MY_TEST_F(MeshSessionTest, InvalidServerMessageIsIgnored) {
    JoinAndConnect("abc");
    EXPECT_CALL(observer_, OnError(_, _)).Times(0);
    channel_->DeliverText("not json");
    channel_->DeliverText(json({{"type", "unknown"}}).dump());
    time_controller_.AdvanceTime(0);
    EXPECT_EQ(session_->state(), MeshSession::State::JOINED);
}

MY_TEST_F(MeshSessionTest, PeerFailureIsReported) {
    JoinAndConnect("abc", {{kHigherPeerId, std::nullopt}});
    EXPECT_CALL(observer_, OnError(ErrorKind::NEGOTIATION, HasSubstr(kHigherPeerId))).Times(1);
    signaling::Answer answer;
    answer.from_participant_id = kHigherPeerId;
    answer.payload = {{"type", "answer"}, {"sdp", "malformed"}};
    Deliver(answer);
    EXPECT_EQ(session_->peers()->controller(kHigherPeerId)->state(), NegotiationController::State::ABSENT);
}

MY_TEST_F(MeshSessionTest, TransportCreationFailureIsReported) {
    factory_.set_fail_creation(true);
    EXPECT_CALL(observer_, OnError(ErrorKind::TRANSPORT_CREATION, _)).Times(1);
    JoinAndConnect("abc", {{kHigherPeerId, std::nullopt}});
    EXPECT_EQ(session_->state(), MeshSession::State::JOINED);
}

MY_TEST_F(MeshSessionTest, LeaveReleasesEverything) {
    JoinAndConnect("abc", {{kHigherPeerId, std::nullopt}});
    auto audio = capture_device_.audio();
    auto video = capture_device_.video();

    Run([&](){ session_->Leave(); });

    EXPECT_EQ(channel_->MessagesOf<signaling::LeaveRoom>().size(), 1u);
    EXPECT_TRUE(audio->stopped());
    EXPECT_TRUE(video->stopped());
    EXPECT_EQ(factory_.live_count(), 0u);
    EXPECT_EQ(channel_->close_count(), 1);
    EXPECT_EQ(session_->state(), MeshSession::State::IDLE);
    EXPECT_EQ(session_->peers(), nullptr);
    EXPECT_TRUE(session_->room_id().empty());

    // Leaving twice is a no-op.
    Run([&](){ session_->Leave(); });
    EXPECT_EQ(channel_->close_count(), 1);
}

MY_TEST_F(MeshSessionTest, ChannelCloseTearsDownSession) {
    JoinAndConnect("abc", {{kHigherPeerId, std::nullopt}});
    auto audio = capture_device_.audio();

    EXPECT_CALL(observer_, OnError(ErrorKind::SIGNALING, HasSubstr("connection reset"))).Times(1);
    channel_->SimulateClosed("connection reset");
    time_controller_.AdvanceTime(0);

    EXPECT_TRUE(audio->stopped());
    EXPECT_EQ(factory_.live_count(), 0u);
    EXPECT_EQ(session_->state(), MeshSession::State::IDLE);
}

MY_TEST_F(MeshSessionTest, RejoinLeavesPreviousRoomFirst) {
    JoinAndConnect("abc", {{kHigherPeerId, std::nullopt}});
    auto first_audio = capture_device_.audio();

    ASSERT_TRUE(Join("def"));
    EXPECT_EQ(channel_->MessagesOf<signaling::LeaveRoom>().size(), 1u);
    EXPECT_TRUE(first_audio->stopped());
    EXPECT_EQ(factory_.live_count(), 0u);
    EXPECT_EQ(channel_->connect_urls().size(), 2u);
    EXPECT_EQ(session_->room_id(), "DEF");
    EXPECT_EQ(capture_device_.open_count(), 2);
}

MY_TEST_F(MeshSessionTest, IgnoresEventsOfPreviousConnection) {
    ASSERT_TRUE(Join("abc"));
    // The connected event of the old connection runs after the session left.
    Run([&](){
        channel_->SimulateConnected();
        session_->Leave();
    });
    EXPECT_TRUE(channel_->MessagesOf<signaling::JoinRoom>().empty());

    signaling::ExistingParticipants existing;
    existing.participants = {{kHigherPeerId, std::nullopt}};
    Deliver(existing);
    EXPECT_TRUE(factory_.transports().empty());
}

MY_TEST_F(MeshSessionTest, DestructorLeavesRoom) {
    JoinAndConnect("abc", {{kHigherPeerId, std::nullopt}});
    auto audio = capture_device_.audio();
    Run([this](){ session_.reset(); });
    EXPECT_EQ(channel_->MessagesOf<signaling::LeaveRoom>().size(), 1u);
    EXPECT_TRUE(audio->stopped());
    EXPECT_EQ(factory_.live_count(), 0u);
}

MY_TEST_F(MeshSessionTest, ObserverMayLeaveFromOnError) {
    factory_.set_fail_creation(true);
    EXPECT_CALL(observer_, OnError(ErrorKind::TRANSPORT_CREATION, _))
        .WillOnce([this](ErrorKind, const std::string&){ session_->Leave(); })
        .WillRepeatedly(Return());
    JoinAndConnect("abc", {{kHigherPeerId, std::nullopt}, {std::string(kHigherPeerId) + "z", std::nullopt}});

    EXPECT_EQ(session_->state(), MeshSession::State::IDLE);
    EXPECT_EQ(session_->peers(), nullptr);
    EXPECT_EQ(channel_->MessagesOf<signaling::LeaveRoom>().size(), 1u);
    EXPECT_EQ(factory_.live_count(), 0u);
}

MY_TEST_F(MeshSessionTest, ObserverMayLeaveWhenPeerCloses) {
    JoinAndConnect("abc", {{kHigherPeerId, std::nullopt}});
    auto audio = capture_device_.audio();
    EXPECT_CALL(observer_, OnPeerStateChanged(kHigherPeerId, NegotiationController::State::CLOSED))
        .WillOnce([this](const std::string&, NegotiationController::State){ session_->Leave(); });
    EXPECT_CALL(observer_, OnParticipantLeft(kHigherPeerId)).Times(1);

    signaling::ParticipantLeft left;
    left.participant_id = kHigherPeerId;
    left.participant_count = 1;
    Deliver(left);

    EXPECT_EQ(session_->state(), MeshSession::State::IDLE);
    EXPECT_TRUE(audio->stopped());
    EXPECT_EQ(factory_.live_count(), 0u);
    EXPECT_EQ(channel_->MessagesOf<signaling::LeaveRoom>().size(), 1u);
}

MY_TEST_F(MeshSessionTest, ObserverMayRejoinFromOnJoined) {
    bool rejoined = false;
    EXPECT_CALL(observer_, OnJoined("ABC", _))
        .WillOnce([&](const std::string&, size_t){ rejoined = session_->Join("def"); });
    JoinAndConnect("abc");

    EXPECT_TRUE(rejoined);
    EXPECT_EQ(session_->room_id(), "DEF");
    EXPECT_EQ(session_->state(), MeshSession::State::CONNECTING);
    EXPECT_EQ(channel_->MessagesOf<signaling::LeaveRoom>().size(), 1u);
}

} // namespace test
} // namespace meshrtc
