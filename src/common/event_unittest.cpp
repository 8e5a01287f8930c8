#include "common/event.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#define ENABLE_UNIT_TESTS 1
#include "../testing/unittest_defines.hpp"

namespace meshrtc {
namespace test {

MY_TEST(EventTest, InitiallySignaled) {
    Event event(false, true);
    ASSERT_TRUE(event.Wait(0));
}

MY_TEST(EventTest, ManualReset) {
    Event event(true, false);
    ASSERT_FALSE(event.Wait(0));

    event.Set();
    ASSERT_TRUE(event.Wait(0));
    ASSERT_TRUE(event.Wait(0));

    event.Reset();
    ASSERT_FALSE(event.Wait(0));
}

MY_TEST(EventTest, AutoReset) {
    Event event;
    ASSERT_FALSE(event.Wait(0));

    event.Set();
    ASSERT_TRUE(event.Wait(0));
    ASSERT_FALSE(event.Wait(0));
}

MY_TEST(EventTest, SignaledFromAnotherThread) {
    Event event;
    std::thread thread([&event](){
        event.Set();
    });
    EXPECT_TRUE(event.Wait(5000));
    thread.join();
}

MY_TEST(EventTest, GivesUpAfterTimeout) {
    Event event;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(event.Wait(20));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));
}

MY_TEST(EventTest, ManualResetReleasesEveryWaiter) {
    Event event(true, false);
    std::atomic<int> released = 0;
    std::vector<std::thread> waiters;
    for (int i = 0; i < 3; ++i) {
        waiters.emplace_back([&](){
            if (event.Wait(5000)) {
                ++released;
            }
        });
    }
    event.Set();
    for (auto& waiter : waiters) {
        waiter.join();
    }
    EXPECT_EQ(released, 3);
}
    
} // namespace test
} // namespace meshrtc
