#ifndef _COMMON_REPEATING_TASK_H_
#define _COMMON_REPEATING_TASK_H_

#include "base/defines.hpp"
#include "common/clock.hpp"
#include "common/task_queue_impl.hpp"
#include "common/pending_task_safety_flag.hpp"

#include <memory>
#include <functional>

namespace meshrtc {

// Runs a closure on a task queue repeatedly, the closure returns the 
// delay in milliseconds until the next run, a non-positive value stops
// the task.
class MESHRTC_EXPORT RepeatingTask final {
public:
    using Closure = std::function<TimeInterval(void)>;
    static std::unique_ptr<RepeatingTask> DelayedStart(Clock* clock,
                                                       TaskQueueImpl* task_queue,
                                                       TimeInterval delay_ms,
                                                       Closure closure);
    static std::unique_ptr<RepeatingTask> Start(Clock* clock,
                                                TaskQueueImpl* task_queue,
                                                Closure closure) {
        return RepeatingTask::DelayedStart(clock, task_queue, 0, std::move(closure));
    }
public:
    ~RepeatingTask();

    // No invocation will start after calling this function, an invocation
    // already running on another thread is allowed to finish.
    void Stop();

    // Returns true until Stop() was called or the closure stopped itself.
    bool Running() const;
    
private:
    struct State;
    explicit RepeatingTask(std::shared_ptr<State> state);

    static void ScheduleTaskAfter(std::shared_ptr<State> state, TimeInterval delay_ms);
    static void MaybeExecuteTask(std::shared_ptr<State> state, int64_t execution_time_ms);
    static void ExecuteTask(std::shared_ptr<State> state);

private:
    std::shared_ptr<State> state_;
};
    
} // namespace meshrtc

#endif
