#include "client/remote_stream_table.hpp"
#include "testing/fake_media.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "../testing/unittest_defines.hpp"

namespace meshrtc {
namespace test {
namespace {

std::shared_ptr<MediaTrack> Track(std::string id, MediaTrack::Kind kind = MediaTrack::Kind::VIDEO) {
    return std::make_shared<FakeMediaTrack>(std::move(id), kind);
}

} // namespace

MY_TEST(RemoteStreamTableTest, FirstTrackCreatesEntry) {
    RemoteStreamTable table;
    EXPECT_TRUE(table.AddTrack("p2", Track("a", MediaTrack::Kind::AUDIO)));
    EXPECT_TRUE(table.AddTrack("p2", Track("v")));
    EXPECT_FALSE(table.AddTrack("p2", Track("v")));

    auto entry = table.Find("p2");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->participant_id, "p2");
    EXPECT_EQ(entry->stream->id(), "p2");
    EXPECT_EQ(entry->stream->tracks().size(), 2u);
    EXPECT_FALSE(entry->name);
    EXPECT_EQ(table.size(), 1u);
}

MY_TEST(RemoteStreamTableTest, NameArrivesBeforeMedia) {
    RemoteStreamTable table;
    Roster roster = {{"p2", "Bob"}};
    EXPECT_FALSE(table.ReconcileNames(roster));

    table.AddTrack("p2", Track("v"));
    EXPECT_TRUE(table.ReconcileNames(roster));
    EXPECT_EQ(table.Find("p2")->name, std::optional<std::string>("Bob"));
    EXPECT_FALSE(table.ReconcileNames(roster));
}

MY_TEST(RemoteStreamTableTest, MediaArrivesBeforeName) {
    RemoteStreamTable table;
    table.AddTrack("p2", Track("v"));
    Roster roster = {{"p2", std::nullopt}};
    EXPECT_FALSE(table.ReconcileNames(roster));
    EXPECT_FALSE(table.Find("p2")->name);

    roster["p2"] = "Bob";
    EXPECT_TRUE(table.ReconcileNames(roster));
    EXPECT_EQ(table.Find("p2")->name, std::optional<std::string>("Bob"));
}

MY_TEST(RemoteStreamTableTest, RemoveAndClear) {
    RemoteStreamTable table;
    table.AddTrack("p3", Track("v3"));
    table.AddTrack("p2", Track("v2"));
    auto entries = table.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].participant_id, "p2");
    EXPECT_EQ(entries[1].participant_id, "p3");

    EXPECT_TRUE(table.Remove("p2"));
    EXPECT_FALSE(table.Remove("p2"));
    EXPECT_FALSE(table.Contains("p2"));
    EXPECT_TRUE(table.Contains("p3"));

    table.Clear();
    EXPECT_TRUE(table.empty());
}

} // namespace test
} // namespace meshrtc
