#include "client/websocket.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "../testing/unittest_defines.hpp"

namespace meshrtc {
namespace test {

MY_TEST(URLPartsTest, ParseHostAndPort) {
    URLParts parts;
    ASSERT_TRUE(URLParts::Parse("ws://localhost:8080", parts));
    EXPECT_EQ(parts.scheme, "ws");
    EXPECT_EQ(parts.host, "localhost");
    EXPECT_EQ(parts.port, "8080");
    EXPECT_EQ(parts.path_query_fragment, "/");
    EXPECT_EQ(parts.GetPort(), "8080");
}

MY_TEST(URLPartsTest, DefaultPorts) {
    URLParts parts;
    ASSERT_TRUE(URLParts::Parse("WS://example.com/signal?room=ABC", parts));
    EXPECT_EQ(parts.scheme, "ws");
    EXPECT_TRUE(parts.port.empty());
    EXPECT_EQ(parts.GetPort(), "80");
    EXPECT_EQ(parts.path_query_fragment, "/signal?room=ABC");

    ASSERT_TRUE(URLParts::Parse("wss://example.com", parts));
    EXPECT_EQ(parts.GetPort(), "443");
}

MY_TEST(URLPartsTest, QueryWithoutPath) {
    URLParts parts;
    ASSERT_TRUE(URLParts::Parse("ws://example.com?x=1#top", parts));
    EXPECT_EQ(parts.host, "example.com");
    EXPECT_EQ(parts.path_query_fragment, "/?x=1#top");
}

MY_TEST(URLPartsTest, IPv6AndUserInfo) {
    URLParts parts;
    ASSERT_TRUE(URLParts::Parse("ws://user:secret@[::1]:9000/ws", parts));
    EXPECT_EQ(parts.host, "::1");
    EXPECT_EQ(parts.port, "9000");
    EXPECT_EQ(parts.path_query_fragment, "/ws");

    ASSERT_TRUE(URLParts::Parse("ws://[fe80::1]", parts));
    EXPECT_EQ(parts.host, "fe80::1");
    EXPECT_TRUE(parts.port.empty());
}

MY_TEST(URLPartsTest, RejectsInvalidUrls) {
    URLParts parts;
    parts.host = "untouched";
    EXPECT_FALSE(URLParts::Parse("localhost:8080", parts));
    EXPECT_FALSE(URLParts::Parse("://localhost", parts));
    EXPECT_FALSE(URLParts::Parse("ws://", parts));
    EXPECT_FALSE(URLParts::Parse("ws://:8080", parts));
    EXPECT_FALSE(URLParts::Parse("ws://host:99999", parts));
    EXPECT_FALSE(URLParts::Parse("ws://host:80a", parts));
    EXPECT_FALSE(URLParts::Parse("ws://[::1", parts));
    EXPECT_FALSE(URLParts::Parse("ws://[::1]x", parts));
    EXPECT_EQ(parts.host, "untouched");
}

} // namespace test
} // namespace meshrtc
