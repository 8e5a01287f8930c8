#include "server/room_registry.hpp"
#include "testing/fake_signaling_transport.hpp"
#include "testing/simulated_clock.hpp"

#include <gtest/gtest.h>

#include <thread>

#define ENABLE_UNIT_TESTS 1
#include "../testing/unittest_defines.hpp"

namespace meshrtc {
namespace test {
namespace {

constexpr TimeInterval kMinuteMs = 60 * 1000;

std::vector<std::string> Ids(const std::vector<signaling::ParticipantInfo>& participants) {
    std::vector<std::string> ids;
    for (const auto& participant : participants) {
        ids.push_back(participant.id);
    }
    return ids;
}

} // namespace

class T(RoomRegistryTest) : public ::testing::Test {
public:
    T(RoomRegistryTest)() 
        : clock_(1000 * 1000),
          registry_(RoomRegistry::Configuration(), &clock_) {}

    std::shared_ptr<FakeSignalingTransport> Connect() {
        return std::make_shared<FakeSignalingTransport>();
    }

protected:
    SimulatedClock clock_;
    RoomRegistry registry_;
};

MY_TEST_F(RoomRegistryTest, SnapshotContainsPriorParticipantsStillPresent) {
    std::vector<std::shared_ptr<FakeSignalingTransport>> transports;
    std::vector<std::string> present;
    for (int i = 0; i < 6; ++i) {
        auto transport = Connect();
        transports.push_back(transport);
        const std::string id = "p" + std::to_string(i);
        auto result = registry_.Join("R1", id, std::nullopt, transport);
        EXPECT_EQ(Ids(result.others), present);
        EXPECT_EQ(result.participant_count, present.size() + 1);
        present.push_back(id);
        // The second participant leaves once the fourth one has joined.
        if (i == 3) {
            registry_.Leave(transports[1].get());
            present.erase(present.begin() + 1);
        }
    }
    EXPECT_EQ(registry_.participant_count("R1"), 5u);
}

MY_TEST_F(RoomRegistryTest, CreatesRoomOnFirstJoin) {
    EXPECT_FALSE(registry_.HasRoom("R1"));
    auto result = registry_.Join("R1", "p1", std::string("Alice"), Connect());
    EXPECT_TRUE(registry_.HasRoom("R1"));
    EXPECT_TRUE(result.others.empty());
    EXPECT_EQ(result.participant_count, 1u);
    EXPECT_EQ(registry_.room_count(), 1u);
}

MY_TEST_F(RoomRegistryTest, JoinBroadcastsToOtherMembersOnly) {
    auto t1 = Connect();
    auto t2 = Connect();
    registry_.Join("R1", "p1", std::string("Alice"), t1);
    auto result = registry_.Join("R1", "p2", std::string("Bob"), t2);

    ASSERT_EQ(result.others.size(), 1u);
    EXPECT_EQ(result.others[0].id, "p1");
    EXPECT_EQ(result.others[0].name, std::optional<std::string>("Alice"));

    auto joined = t1->MessagesOf<signaling::ParticipantJoined>();
    ASSERT_EQ(joined.size(), 1u);
    EXPECT_EQ(joined[0].participant_id, "p2");
    EXPECT_EQ(joined[0].name, std::optional<std::string>("Bob"));
    EXPECT_EQ(joined[0].participant_count, 2u);
    EXPECT_TRUE(t2->messages().empty());
}

MY_TEST_F(RoomRegistryTest, LeaveBroadcastsParticipantLeft) {
    auto t1 = Connect();
    auto t2 = Connect();
    auto t3 = Connect();
    registry_.Join("R1", "p1", std::nullopt, t1);
    registry_.Join("R1", "p2", std::nullopt, t2);
    registry_.Join("R1", "p3", std::nullopt, t3);
    t2->TakeMessages();
    t3->TakeMessages();

    registry_.Leave(t1.get());

    for (auto& transport : {t2, t3}) {
        auto left = transport->MessagesOf<signaling::ParticipantLeft>();
        ASSERT_EQ(left.size(), 1u);
        EXPECT_EQ(left[0].participant_id, "p1");
        EXPECT_EQ(left[0].participant_count, 2u);
    }
    EXPECT_FALSE(registry_.participant_id(t1.get()).has_value());
    EXPECT_EQ(registry_.participant_count("R1"), 2u);
}

MY_TEST_F(RoomRegistryTest, LeaveUnboundTransportIsNoop) {
    auto t1 = Connect();
    auto stranger = Connect();
    registry_.Join("R1", "p1", std::nullopt, t1);
    registry_.Leave(stranger.get());
    registry_.Leave(stranger.get());
    EXPECT_EQ(registry_.participant_count("R1"), 1u);
    EXPECT_TRUE(t1->messages().empty());
}

MY_TEST_F(RoomRegistryTest, DuplicateParticipantIdReplacesPriorEntry) {
    auto t1 = Connect();
    auto t2 = Connect();
    auto duplicate = Connect();
    registry_.Join("R1", "p1", std::nullopt, t1);
    registry_.Join("R1", "p2", std::nullopt, t2);
    t2->TakeMessages();

    auto result = registry_.Join("R1", "p1", std::nullopt, duplicate);
    EXPECT_EQ(result.participant_count, 2u);
    EXPECT_EQ(Ids(result.others), std::vector<std::string>({"p2"}));
    EXPECT_EQ(registry_.participant_id(duplicate.get()), std::optional<std::string>("p1"));
    EXPECT_FALSE(registry_.participant_id(t1.get()).has_value());

    // The replaced connection closing later has no effect.
    t2->TakeMessages();
    registry_.Leave(t1.get());
    EXPECT_TRUE(t2->messages().empty());
    EXPECT_EQ(registry_.participant_count("R1"), 2u);
}

MY_TEST_F(RoomRegistryTest, RejoinLeavesPreviousRoomFirst) {
    auto t1 = Connect();
    auto t2 = Connect();
    registry_.Join("R1", "p1", std::nullopt, t1);
    registry_.Join("R1", "p2", std::nullopt, t2);
    t2->TakeMessages();

    registry_.Join("R2", "p1", std::nullopt, t1);
    EXPECT_EQ(registry_.participant_count("R1"), 1u);
    EXPECT_EQ(registry_.participant_count("R2"), 1u);
    auto left = t2->MessagesOf<signaling::ParticipantLeft>();
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].participant_id, "p1");
    EXPECT_EQ(left[0].participant_count, 1u);
}

MY_TEST_F(RoomRegistryTest, RelayRewritesTargetToSender) {
    auto t1 = Connect();
    auto t2 = Connect();
    registry_.Join("R1", "p1", std::nullopt, t1);
    registry_.Join("R1", "p2", std::nullopt, t2);
    t1->TakeMessages();

    signaling::Offer offer;
    offer.target_participant_id = "p1";
    offer.payload = {{"type", "offer"}, {"sdp", "v=0"}};
    EXPECT_FALSE(registry_.Relay(t2.get(), offer).has_value());

    auto offers = t1->MessagesOf<signaling::Offer>();
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(offers[0].from_participant_id, std::optional<std::string>("p2"));
    EXPECT_FALSE(offers[0].target_participant_id.has_value());
    EXPECT_EQ(offers[0].payload, offer.payload);
    EXPECT_TRUE(t2->messages().empty());
}

MY_TEST_F(RoomRegistryTest, RelayFailures) {
    auto t1 = Connect();
    auto t2 = Connect();
    auto stranger = Connect();
    registry_.Join("R1", "p1", std::nullopt, t1);
    registry_.Join("R2", "p2", std::nullopt, t2);

    signaling::IceCandidate candidate;
    candidate.payload = {{"candidate", "candidate:0"}, {"sdpMid", "0"}, {"sdpMLineIndex", 0}};
    EXPECT_EQ(registry_.Relay(t1.get(), candidate), RoomRegistry::RelayError::MISSING_TARGET);

    candidate.target_participant_id = "p2";
    // Targets in another room are not reachable.
    EXPECT_EQ(registry_.Relay(t1.get(), candidate), RoomRegistry::RelayError::TARGET_NOT_FOUND);
    EXPECT_EQ(registry_.Relay(stranger.get(), candidate), RoomRegistry::RelayError::PARTICIPANT_NOT_FOUND);
    EXPECT_TRUE(t2->MessagesOf<signaling::IceCandidate>().empty());

    EXPECT_EQ(ToString(RoomRegistry::RelayError::TARGET_NOT_FOUND), "Target participant not found");
    EXPECT_EQ(ToString(RoomRegistry::RelayError::PARTICIPANT_NOT_FOUND), "Participant not found");
}

MY_TEST_F(RoomRegistryTest, SweepRemovesIdleEmptyRooms) {
    auto t1 = Connect();
    auto t2 = Connect();
    registry_.Join("R1", "p1", std::nullopt, t1);
    registry_.Join("R2", "p2", std::nullopt, t2);
    registry_.Leave(t1.get());

    clock_.AdvanceTimeMs(30 * kMinuteMs);
    EXPECT_EQ(registry_.Sweep(), 0u);
    EXPECT_TRUE(registry_.HasRoom("R1"));

    clock_.AdvanceTimeMs(1);
    EXPECT_EQ(registry_.Sweep(), 1u);
    EXPECT_FALSE(registry_.HasRoom("R1"));
    // A room with participants is never removed, however idle.
    EXPECT_TRUE(registry_.HasRoom("R2"));
    clock_.AdvanceTimeMs(24 * 60 * kMinuteMs);
    EXPECT_EQ(registry_.Sweep(), 0u);
    EXPECT_TRUE(registry_.HasRoom("R2"));
}

MY_TEST_F(RoomRegistryTest, IdleTimeCountsFromLastMembershipChange) {
    auto t1 = Connect();
    registry_.Join("R1", "p1", std::nullopt, t1);
    clock_.AdvanceTimeMs(60 * kMinuteMs);
    registry_.Leave(t1.get());

    clock_.AdvanceTimeMs(10 * kMinuteMs);
    EXPECT_EQ(registry_.Sweep(), 0u);
    EXPECT_TRUE(registry_.HasRoom("R1"));

    clock_.AdvanceTimeMs(21 * kMinuteMs);
    EXPECT_EQ(registry_.Sweep(), 1u);
}

MY_TEST_F(RoomRegistryTest, ConcurrentJoinAndLeave) {
    const int kThreads = 8;
    const int kRounds = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t](){
            for (int i = 0; i < kRounds; ++i) {
                auto transport = std::make_shared<FakeSignalingTransport>();
                const std::string room_id = "R" + std::to_string(i % 3);
                registry_.Join(room_id, "p" + std::to_string(t) + "_" + std::to_string(i), std::nullopt, transport);
                if (i % 2 == 0) {
                    registry_.Leave(transport.get());
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    size_t total = 0;
    for (int i = 0; i < 3; ++i) {
        total += registry_.participant_count("R" + std::to_string(i));
    }
    EXPECT_EQ(total, static_cast<size_t>(kThreads * kRounds / 2));
}

} // namespace test
} // namespace meshrtc
