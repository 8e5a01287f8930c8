#include "common/repeating_task.hpp"
#include "common/task_queue.hpp"
#include "testing/simulated_time_controller.hpp"

#include <gtest/gtest.h>

#include <atomic>

#define ENABLE_UNIT_TESTS 1
#include "../testing/unittest_defines.hpp"

namespace meshrtc {
namespace test {
namespace {

constexpr int64_t kStartTimeMs = 1000 * 1000;
    
} // namespace

MY_TEST(RepeatingTaskTest, TaskIsStoppedOnStop) {
    const TimeInterval kShortInterval = 5;
    const TimeInterval kLongInterval = 20;
    const int kShortIntervalCount = 4;
    const int kMargin = 1;

    SimulatedTimeController time_controller(kStartTimeMs);
    auto task_queue = time_controller.CreateTaskQueue();
    std::atomic_int counter(0);
    auto repeating_task = RepeatingTask::Start(time_controller.clock(), task_queue->Get(), [&](){
        if (++counter >= kShortIntervalCount) {
            return kLongInterval;
        }
        return kShortInterval;
    });

    // Sleep long enough to go through the initial phase.
    time_controller.AdvanceTime(kShortInterval * (kShortIntervalCount + kMargin));
    EXPECT_EQ(counter.load(), kShortIntervalCount);

    repeating_task->Stop();
    EXPECT_FALSE(repeating_task->Running());

    // Sleep long enough that the task would run at least once more if not stopped.
    time_controller.AdvanceTime(kLongInterval * 2);
    EXPECT_EQ(counter.load(), kShortIntervalCount);
}

MY_TEST(RepeatingTaskTest, TaskCanStopItself) {
    SimulatedTimeController time_controller(kStartTimeMs);
    auto task_queue = time_controller.CreateTaskQueue();
    std::atomic_int counter(0);
    std::unique_ptr<RepeatingTask> repeating_task;
    repeating_task = RepeatingTask::Start(time_controller.clock(), task_queue->Get(), [&](){
        ++counter;
        repeating_task->Stop();
        return TimeInterval(2);
    });
    time_controller.AdvanceTime(10);
    EXPECT_EQ(counter.load(), 1);
}

MY_TEST(RepeatingTaskTest, TaskStoppedByReturningNonPositiveInterval) {
    SimulatedTimeController time_controller(kStartTimeMs);
    auto task_queue = time_controller.CreateTaskQueue();
    int counter = 0;
    auto repeating_task = RepeatingTask::DelayedStart(time_controller.clock(), task_queue->Get(), 1000, [&](){
        if (counter == 5) {
            return TimeInterval(0);
        }
        ++counter;
        return TimeInterval(1000);
    });
    time_controller.AdvanceTime(999);
    EXPECT_EQ(counter, 0);
    time_controller.AdvanceTime(10 * 1000);
    EXPECT_EQ(counter, 5);
    EXPECT_FALSE(repeating_task->Running());
}

MY_TEST(RepeatingTaskTest, DestructionStopsTask) {
    SimulatedTimeController time_controller(kStartTimeMs);
    auto task_queue = time_controller.CreateTaskQueue();
    int counter = 0;
    auto repeating_task = RepeatingTask::Start(time_controller.clock(), task_queue->Get(), [&](){
        ++counter;
        return TimeInterval(100);
    });
    time_controller.AdvanceTime(0);
    EXPECT_EQ(counter, 1);
    repeating_task.reset();
    time_controller.AdvanceTime(1000);
    EXPECT_EQ(counter, 1);
}
    
} // namespace test
} // namespace meshrtc
