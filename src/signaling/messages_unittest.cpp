#include "signaling/messages.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "../testing/unittest_defines.hpp"

namespace meshrtc {
namespace signaling {
namespace test {

using json = nlohmann::json;

MY_TEST(SignalingMessagesTest, ParseJoinRoom) {
    auto message = Parse(R"({"type":"join-room","roomId":"R1","participantId":"p1","name":"Alice"})");
    ASSERT_TRUE(std::holds_alternative<JoinRoom>(message));
    const auto& join = std::get<JoinRoom>(message);
    EXPECT_EQ(join.room_id, "R1");
    EXPECT_EQ(join.participant_id, "p1");
    ASSERT_TRUE(join.name.has_value());
    EXPECT_EQ(*join.name, "Alice");
    EXPECT_EQ(TypeName(message), "join-room");
}

MY_TEST(SignalingMessagesTest, ParseJoinRoomWithoutName) {
    auto message = Parse(R"({"type":"join-room","roomId":"R1","participantId":"p1","name":null})");
    ASSERT_TRUE(std::holds_alternative<JoinRoom>(message));
    EXPECT_FALSE(std::get<JoinRoom>(message).name.has_value());
}

MY_TEST(SignalingMessagesTest, ParseExistingParticipants) {
    auto message = Parse(R"({"type":"existing-participants","participants":[{"id":"p1","name":"Alice"},{"id":"p2"}]})");
    ASSERT_TRUE(std::holds_alternative<ExistingParticipants>(message));
    const auto& participants = std::get<ExistingParticipants>(message).participants;
    ASSERT_EQ(participants.size(), 2u);
    EXPECT_EQ(participants[0].id, "p1");
    EXPECT_EQ(participants[0].name, std::optional<std::string>("Alice"));
    EXPECT_EQ(participants[1].id, "p2");
    EXPECT_FALSE(participants[1].name.has_value());
}

MY_TEST(SignalingMessagesTest, RelayedPayloadKeptVerbatim) {
    const json sdp = {{"type", "offer"}, {"sdp", "v=0\r\no=- 1 2 IN IP4 127.0.0.1\r\n"}, {"extra", {1, 2, 3}}};
    json object = {{"type", "offer"}, {"targetParticipantId", "p2"}, {"offer", sdp}};
    auto message = Parse(object.dump());
    ASSERT_TRUE(std::holds_alternative<Offer>(message));
    const auto& offer = std::get<Offer>(message);
    EXPECT_EQ(offer.target_participant_id, std::optional<std::string>("p2"));
    EXPECT_FALSE(offer.from_participant_id.has_value());
    EXPECT_EQ(offer.payload, sdp);

    Offer forwarded;
    forwarded.from_participant_id = "p1";
    forwarded.payload = offer.payload;
    auto serialized = json::parse(Serialize(forwarded));
    EXPECT_EQ(serialized["type"], "offer");
    EXPECT_EQ(serialized["fromParticipantId"], "p1");
    EXPECT_FALSE(serialized.contains("targetParticipantId"));
    EXPECT_EQ(serialized["offer"], sdp);
}

MY_TEST(SignalingMessagesTest, IceCandidateUsesCandidateKey) {
    IceCandidate candidate;
    candidate.target_participant_id = "p2";
    candidate.payload = {{"candidate", "candidate:1 1 udp 2122260223 10.0.0.1 50000 typ host"}, {"sdpMid", "0"}, {"sdpMLineIndex", 0}};
    auto serialized = json::parse(Serialize(candidate));
    EXPECT_EQ(serialized["type"], "ice-candidate");
    EXPECT_EQ(serialized["targetParticipantId"], "p2");
    EXPECT_EQ(serialized["candidate"]["sdpMid"], "0");
}

MY_TEST(SignalingMessagesTest, RelayedMessageWithoutTargetIsAccepted) {
    auto message = Parse(R"({"type":"answer","answer":{"type":"answer","sdp":"v=0"}})");
    ASSERT_TRUE(std::holds_alternative<Answer>(message));
    EXPECT_FALSE(std::get<Answer>(message).target_participant_id.has_value());
}

MY_TEST(SignalingMessagesTest, SerializeServerMessages) {
    auto joined = json::parse(Serialize(JoinedRoom{"R1", "p1", 1}));
    EXPECT_EQ(joined, json::parse(R"({"type":"joined-room","roomId":"R1","participantId":"p1","participantCount":1})"));

    auto existing = json::parse(Serialize(ExistingParticipants{}));
    EXPECT_EQ(existing, json::parse(R"({"type":"existing-participants","participants":[]})"));

    auto participant_joined = json::parse(Serialize(ParticipantJoined{"p2", std::nullopt, 2}));
    EXPECT_FALSE(participant_joined.contains("name"));
    EXPECT_EQ(participant_joined["participantCount"], 2);

    auto left = json::parse(Serialize(ParticipantLeft{"p1", 1}));
    EXPECT_EQ(left, json::parse(R"({"type":"participant-left","participantId":"p1","participantCount":1})"));

    auto error = json::parse(Serialize(Error{"Room not found"}));
    EXPECT_EQ(error, json::parse(R"({"type":"error","error":"Room not found"})"));

    auto leave = json::parse(Serialize(LeaveRoom{}));
    EXPECT_EQ(leave, json::parse(R"({"type":"leave-room"})"));
}

MY_TEST(SignalingMessagesTest, InvalidJson) {
    try {
        Parse("{not json");
        FAIL() << "Expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.kind(), ParseError::Kind::INVALID_JSON);
        EXPECT_STREQ(e.what(), "Invalid JSON message");
    }
    EXPECT_THROW(Parse("[1, 2]"), ParseError);
}

MY_TEST(SignalingMessagesTest, UnknownType) {
    try {
        Parse(R"({"type":"kick-participant"})");
        FAIL() << "Expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.kind(), ParseError::Kind::UNKNOWN_TYPE);
        EXPECT_EQ(e.type(), "kick-participant");
        EXPECT_STREQ(e.what(), "Unknown message type: kick-participant");
    }
}

MY_TEST(SignalingMessagesTest, MalformedMessages) {
    const char* malformed[] = {
        R"({"type":"join-room","participantId":"p1"})",
        R"({"type":"join-room","roomId":"","participantId":"p1"})",
        R"({"type":"join-room","roomId":"R1","participantId":42})",
        R"({"type":"offer","targetParticipantId":"p2"})",
        R"({"type":"ice-candidate","targetParticipantId":7,"candidate":{}})",
        R"({"type":"participant-left","participantId":"p1"})",
        R"({"type":"existing-participants","participants":[{"name":"x"}]})",
    };
    for (const char* text : malformed) {
        try {
            Parse(text);
            ADD_FAILURE() << "Expected ParseError for " << text;
        } catch (const ParseError& e) {
            EXPECT_EQ(e.kind(), ParseError::Kind::MALFORMED) << text;
        }
    }
    try {
        Parse(R"({"type":"offer"})");
    } catch (const ParseError& e) {
        EXPECT_STREQ(e.what(), "Malformed offer message");
    }
}

} // namespace test
} // namespace signaling
} // namespace meshrtc
