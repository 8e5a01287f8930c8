#include "common/repeating_task.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace meshrtc {

struct RepeatingTask::State {
    Clock* const clock;
    TaskQueueImpl* const task_queue;
    const Closure closure;
    std::shared_ptr<PendingTaskSafetyFlag> safety_flag = PendingTaskSafetyFlag::Create();

    State(Clock* clock, TaskQueueImpl* task_queue, Closure closure) 
        : clock(clock), 
          task_queue(task_queue), 
          closure(std::move(closure)) {}
};

std::unique_ptr<RepeatingTask> RepeatingTask::DelayedStart(Clock* clock,
                                                           TaskQueueImpl* task_queue,
                                                           TimeInterval delay_ms, 
                                                           Closure closure) {
    if (!clock || !task_queue || !closure) {
        throw std::invalid_argument("RepeatingTask requires a clock, a task queue and a closure.");
    }
    auto state = std::make_shared<State>(clock, task_queue, std::move(closure));
    task_queue->Post(ToSafeTask(state->safety_flag, [state, delay_ms](){
        if (delay_ms <= 0) {
            ExecuteTask(state);
        } else {
            ScheduleTaskAfter(state, delay_ms);
        }
    }));
    return std::unique_ptr<RepeatingTask>(new RepeatingTask(std::move(state)));
}

RepeatingTask::RepeatingTask(std::shared_ptr<State> state) 
    : state_(std::move(state)) {}

RepeatingTask::~RepeatingTask() {
    Stop();
}

void RepeatingTask::Stop() {
    state_->safety_flag->SetNotAlive();
}

bool RepeatingTask::Running() const {
    return state_->safety_flag->alive();
}

// Private methods
void RepeatingTask::ScheduleTaskAfter(std::shared_ptr<State> state, TimeInterval delay_ms) {
    RTC_RUN_ON(state->task_queue);
    int64_t execution_time_ms = state->clock->CurrentTimeMs() + delay_ms;
    auto task_queue = state->task_queue;
    auto safety_flag = state->safety_flag;
    task_queue->PostDelayed(delay_ms, ToSafeTask(safety_flag, [state=std::move(state), execution_time_ms](){
        MaybeExecuteTask(state, execution_time_ms);
    }));
}

void RepeatingTask::MaybeExecuteTask(std::shared_ptr<State> state, int64_t execution_time_ms) {
    RTC_RUN_ON(state->task_queue);
    int64_t now_ms = state->clock->CurrentTimeMs();
    if (now_ms >= execution_time_ms) {
        ExecuteTask(std::move(state));
        return;
    }
    PLOG_WARNING << "RepeatingTask: scheduled delayed called too early.";
    auto task_queue = state->task_queue;
    auto safety_flag = state->safety_flag;
    task_queue->PostDelayed(execution_time_ms - now_ms, ToSafeTask(safety_flag, [state=std::move(state), execution_time_ms](){
        MaybeExecuteTask(state, execution_time_ms);
    }));
}

void RepeatingTask::ExecuteTask(std::shared_ptr<State> state) {
    RTC_RUN_ON(state->task_queue);
    TimeInterval interval_ms = state->closure();
    // The closure may have stopped the task itself.
    if (!state->safety_flag->alive()) {
        return;
    }
    if (interval_ms > 0) {
        ScheduleTaskAfter(std::move(state), interval_ms);
    } else {
        // Stop internally if the interval is not a positive number.
        state->safety_flag->SetNotAlive();
    }
}
    
} // namespace meshrtc
