#include "common/task_queue.hpp"
#include "common/event.hpp"
#include "common/utils_time.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <vector>

#define ENABLE_UNIT_TESTS 1
#include "../testing/unittest_defines.hpp"

using namespace testing;

namespace meshrtc {
namespace test {

void CheckCurrent(Event* signal, TaskQueue* queue) {
    EXPECT_TRUE(queue->IsCurrent());
    if (signal) {
        signal->Set();
    }
}

MY_TEST(TaskQueueTest, PostRunsOnQueue) {
    TaskQueue task_queue("TaskQueueTest");
    Event event;
    EXPECT_FALSE(task_queue.IsCurrent());
    task_queue.Post([&task_queue, &event](){
        CheckCurrent(&event, &task_queue);
    });
    EXPECT_TRUE(event.Wait(1000));
}

MY_TEST(TaskQueueTest, PostedTasksRunInOrder) {
    TaskQueue task_queue("TaskQueueTest");
    std::vector<int> order;
    Event event;
    for (int i = 0; i < 10; ++i) {
        task_queue.Post([&order, i](){
            order.push_back(i);
        });
    }
    task_queue.Post([&event](){ event.Set(); });
    ASSERT_TRUE(event.Wait(1000));
    ASSERT_EQ(order.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(order[i], i);
    }
}

MY_TEST(TaskQueueTest, PostDelayed) {
    TaskQueue task_queue("TaskQueueTest");
    Event event;
    int64_t start = utils::time::TimeInMillis();
    task_queue.PostDelayed(100, [&task_queue, &event](){
        CheckCurrent(&event, &task_queue);
    });
    EXPECT_TRUE(event.Wait(Event::kForever));
    int64_t end = utils::time::TimeInMillis();
    EXPECT_GE(end - start, 100);
}

MY_TEST(TaskQueueTest, Invoke) {
    TaskQueue task_queue("TaskQueueTest");
    int ret = task_queue.Invoke<int>([&task_queue]() {
        EXPECT_TRUE(task_queue.IsCurrent());
        return 100;
    });
    EXPECT_EQ(ret, 100);
}

MY_TEST(TaskQueueTest, PendingDelayedTaskDroppedOnDestruction) {
    std::atomic<bool> ran(false);
    {
        TaskQueue task_queue("TaskQueueTest");
        task_queue.PostDelayed(60 * 1000, [&ran](){
            ran = true;
        });
    }
    EXPECT_FALSE(ran.load());
}

} // namespace test
} // namespace meshrtc
