#include "testing/simulated_time_controller.hpp"

#include <algorithm>

namespace meshrtc {
namespace {
// Helper funciton to remove from a std container by value
template <class C>
bool RemoveByValue(C* container, typename C::value_type val) {
    auto it = std::find(container->begin(), container->end(), val);
    if (it == container->end()) {
        return false;
    }
    container->erase(it);
    return true;
}
    
} // namespace

SimulatedTimeController::SimulatedTimeController(int64_t start_time_ms) 
    : current_time_ms_(start_time_ms),
      sim_clock_(std::make_unique<SimulatedClock>(start_time_ms)) {}

SimulatedTimeController::~SimulatedTimeController() = default;

std::unique_ptr<TaskQueue> SimulatedTimeController::CreateTaskQueue() {
    return std::make_unique<TaskQueue>(std::unique_ptr<TaskQueueImpl, TaskQueueImpl::Deleter>(new SimulatedTaskQueue(this)));
}

Clock* SimulatedTimeController::clock() const {
    return sim_clock_.get();
}

int64_t SimulatedTimeController::CurrentTimeMs() const {
    std::lock_guard lock(time_lock_);
    return current_time_ms_;
}

void SimulatedTimeController::AdvanceTime(TimeInterval duration_ms) {
    int64_t curr_time_ms = CurrentTimeMs();
    const int64_t target_time_ms = curr_time_ms + duration_ms;
    while (curr_time_ms < target_time_ms) {
        RunReadyRunners();
        int64_t next_time_ms = std::min(NextRunTimeMs(), target_time_ms);
        {
            std::lock_guard lock(time_lock_);
            current_time_ms_ = next_time_ms;
        }
        sim_clock_->AdvanceTimeMs(next_time_ms - curr_time_ms);
        curr_time_ms = next_time_ms;
    }
    // Runs tasks meant to be executed at `target_time_ms`.
    RunReadyRunners();
}

void SimulatedTimeController::SendTask(TaskQueue* task_queue, QueuedTask task) {
    task_queue->Post(std::move(task));
    AdvanceTime(0);
}

void SimulatedTimeController::Register(SimulatedSequenceRunner* runner) {
    std::lock_guard lock(lock_);
    runners_.push_back(runner);
}

void SimulatedTimeController::Deregister(SimulatedSequenceRunner* runner) {
    std::lock_guard lock(lock_);
    bool removed = RemoveByValue(&runners_, runner);
    if (removed) {
        RemoveByValue(&ready_runners_, runner);
    }
}

// Private methods
int64_t SimulatedTimeController::NextRunTimeMs() const {
    int64_t curr_time_ms = CurrentTimeMs();
    int64_t next_time_ms = std::numeric_limits<int64_t>::max();
    std::lock_guard lock(lock_);
    for (auto* runner : runners_) {
        int64_t next_run_time_ms = runner->GetNextRunTimeMs();
        if (next_run_time_ms <= curr_time_ms) {
            return curr_time_ms;
        }
        next_time_ms = std::min(next_time_ms, next_run_time_ms);
    }
    return next_time_ms;
}

void SimulatedTimeController::RunReadyRunners() {
    std::unique_lock lock(lock_);
    int64_t curr_time_ms = CurrentTimeMs();
    ready_runners_.clear();

    while (true) {
        for (auto* runner : runners_) {
            if (runner->GetNextRunTimeMs() <= curr_time_ms) {
                ready_runners_.push_back(runner);
            }
        }
        if (ready_runners_.empty()) {
            break;
        }
        while (!ready_runners_.empty()) {
            auto* runner = ready_runners_.front();
            ready_runners_.pop_front();
            // `RunReady()` might indirectly call `Deregister()`,
            // which grabs `lock_` again.
            lock.unlock();
            runner->RunReady(curr_time_ms);
            lock.lock();
        }
    }
}
    
} // namespace meshrtc
