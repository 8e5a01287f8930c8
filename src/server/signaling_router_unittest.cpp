#include "server/signaling_router.hpp"
#include "testing/fake_signaling_transport.hpp"
#include "testing/simulated_clock.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "../testing/unittest_defines.hpp"

namespace meshrtc {
namespace test {
namespace {

using json = nlohmann::json;

std::string LastError(FakeSignalingTransport& transport) {
    auto errors = transport.MessagesOf<signaling::Error>();
    return errors.empty() ? "" : errors.back().error;
}

} // namespace

class T(SignalingRouterTest) : public ::testing::Test {
public:
    T(SignalingRouterTest)() 
        : clock_(0),
          registry_(RoomRegistry::Configuration(), &clock_),
          router_(&registry_) {}

    void Send(const std::shared_ptr<FakeSignalingTransport>& transport, const json& message) {
        router_.OnTransportMessage(transport, message.dump());
    }

    std::shared_ptr<FakeSignalingTransport> Join(const std::string& room_id, const std::string& participant_id) {
        auto transport = std::make_shared<FakeSignalingTransport>(participant_id);
        Send(transport, {{"type", "join-room"}, {"roomId", room_id}, {"participantId", participant_id}});
        return transport;
    }

protected:
    SimulatedClock clock_;
    RoomRegistry registry_;
    SignalingRouter router_;
};

MY_TEST_F(SignalingRouterTest, FirstJoinRepliesJoinedAndEmptyExistingParticipants) {
    auto p1 = Join("R1", "p1");
    auto messages = p1->messages();
    ASSERT_EQ(messages.size(), 2u);
    ASSERT_TRUE(std::holds_alternative<signaling::JoinedRoom>(messages[0]));
    const auto& joined = std::get<signaling::JoinedRoom>(messages[0]);
    EXPECT_EQ(joined.room_id, "R1");
    EXPECT_EQ(joined.participant_id, "p1");
    EXPECT_EQ(joined.participant_count, 1u);
    ASSERT_TRUE(std::holds_alternative<signaling::ExistingParticipants>(messages[1]));
    EXPECT_TRUE(std::get<signaling::ExistingParticipants>(messages[1]).participants.empty());
}

MY_TEST_F(SignalingRouterTest, SecondJoinSeesFirstParticipant) {
    auto p1 = Join("R1", "p1");
    p1->TakeMessages();
    auto p2 = Join("R1", "p2");

    auto announced = p1->MessagesOf<signaling::ParticipantJoined>();
    ASSERT_EQ(announced.size(), 1u);
    EXPECT_EQ(announced[0].participant_id, "p2");
    EXPECT_EQ(announced[0].participant_count, 2u);

    auto existing = p2->MessagesOf<signaling::ExistingParticipants>();
    ASSERT_EQ(existing.size(), 1u);
    ASSERT_EQ(existing[0].participants.size(), 1u);
    EXPECT_EQ(existing[0].participants[0].id, "p1");
    auto joined = p2->MessagesOf<signaling::JoinedRoom>();
    ASSERT_EQ(joined.size(), 1u);
    EXPECT_EQ(joined[0].participant_count, 2u);
}

MY_TEST_F(SignalingRouterTest, RelaysOfferAnswerAndCandidate) {
    auto p1 = Join("R1", "p1");
    auto p2 = Join("R1", "p2");
    p1->TakeMessages();
    p2->TakeMessages();

    const json sdp_offer = {{"type", "offer"}, {"sdp", "v=0 offer"}};
    Send(p1, {{"type", "offer"}, {"targetParticipantId", "p2"}, {"offer", sdp_offer}});
    const json sdp_answer = {{"type", "answer"}, {"sdp", "v=0 answer"}};
    Send(p2, {{"type", "answer"}, {"targetParticipantId", "p1"}, {"answer", sdp_answer}});
    const json candidate = {{"candidate", "candidate:1"}, {"sdpMid", "0"}, {"sdpMLineIndex", 0}};
    Send(p2, {{"type", "ice-candidate"}, {"targetParticipantId", "p1"}, {"candidate", candidate}});

    auto offers = p2->MessagesOf<signaling::Offer>();
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(offers[0].from_participant_id, std::optional<std::string>("p1"));
    EXPECT_EQ(offers[0].payload, sdp_offer);

    auto answers = p1->MessagesOf<signaling::Answer>();
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0].from_participant_id, std::optional<std::string>("p2"));
    EXPECT_EQ(answers[0].payload, sdp_answer);

    auto candidates = p1->MessagesOf<signaling::IceCandidate>();
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].payload, candidate);
    EXPECT_TRUE(p1->MessagesOf<signaling::Error>().empty());
    EXPECT_TRUE(p2->MessagesOf<signaling::Error>().empty());
}

MY_TEST_F(SignalingRouterTest, RelayErrorsAreReportedToSender) {
    auto p1 = Join("R1", "p1");
    Send(p1, {{"type", "offer"}, {"targetParticipantId", "ghost"}, {"offer", {{"type", "offer"}, {"sdp", ""}}}});
    EXPECT_EQ(LastError(*p1), "Target participant not found");

    Send(p1, {{"type", "answer"}, {"answer", {{"type", "answer"}, {"sdp", ""}}}});
    EXPECT_EQ(LastError(*p1), "Missing target participant");

    auto stranger = std::make_shared<FakeSignalingTransport>();
    Send(stranger, {{"type", "ice-candidate"}, {"targetParticipantId", "p1"}, {"candidate", {{"candidate", ""}}}});
    EXPECT_EQ(LastError(*stranger), "Participant not found");
}

MY_TEST_F(SignalingRouterTest, InvalidMessagesKeepConnectionOpen) {
    auto p1 = Join("R1", "p1");

    router_.OnTransportMessage(p1, "this is not json");
    EXPECT_EQ(LastError(*p1), "Invalid JSON message");

    Send(p1, {{"type", "mute-everyone"}});
    EXPECT_EQ(LastError(*p1), "Unknown message type: mute-everyone");

    Send(p1, {{"type", "join-room"}, {"roomId", "R2"}});
    EXPECT_EQ(LastError(*p1), "Malformed join-room message");

    Send(p1, {{"type", "participant-left"}, {"participantId", "p9"}, {"participantCount", 0}});
    EXPECT_EQ(LastError(*p1), "Unexpected message type: participant-left");

    EXPECT_FALSE(p1->closed());
    EXPECT_EQ(registry_.participant_count("R1"), 1u);
}

MY_TEST_F(SignalingRouterTest, LeaveRoomAndTransportClose) {
    auto p1 = Join("R1", "p1");
    auto p2 = Join("R1", "p2");
    auto p3 = Join("R1", "p3");
    p3->TakeMessages();

    Send(p1, {{"type", "leave-room"}});
    router_.OnTransportClosed(p2.get());
    // Closing after an explicit leave is a no-op.
    router_.OnTransportClosed(p1.get());

    auto left = p3->MessagesOf<signaling::ParticipantLeft>();
    ASSERT_EQ(left.size(), 2u);
    EXPECT_EQ(left[0].participant_id, "p1");
    EXPECT_EQ(left[0].participant_count, 2u);
    EXPECT_EQ(left[1].participant_id, "p2");
    EXPECT_EQ(left[1].participant_count, 1u);
    EXPECT_TRUE(registry_.HasRoom("R1"));
}

} // namespace test
} // namespace meshrtc
