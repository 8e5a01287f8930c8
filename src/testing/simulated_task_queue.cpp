#include "testing/simulated_task_queue.hpp"
#include "testing/simulated_time_controller.hpp"

#include <algorithm>

namespace meshrtc {
 
SimulatedTaskQueue::SimulatedTaskQueue(SimulatedTimeController* time_controller) 
    : time_controller_(time_controller) {
    time_controller_->Register(this);
}

SimulatedTaskQueue::~SimulatedTaskQueue() {
    time_controller_->Deregister(this);
}

int64_t SimulatedTaskQueue::GetNextRunTimeMs() const {
    std::lock_guard lock(lock_);
    return next_run_time_ms_;
}

void SimulatedTaskQueue::RunReady(int64_t at_time_ms) {
    std::unique_lock lock(lock_);
    for (auto it = delayed_tasks_.begin(); 
         it != delayed_tasks_.end() && it->first <= at_time_ms;
         it = delayed_tasks_.erase(it)) {
        for (auto& task : it->second) {
            ready_tasks_.push_back(std::move(task));
        }
    }
    CurrentTaskQueueSetter set_current(this);
    while (!ready_tasks_.empty()) {
        auto ready = std::move(ready_tasks_.front());
        ready_tasks_.pop_front();
        // The task might post to this queue again, which grabs `lock_`.
        lock.unlock();
        ready();
        lock.lock();
    }
    if (!delayed_tasks_.empty()) {
        next_run_time_ms_ = delayed_tasks_.begin()->first;
    } else {
        next_run_time_ms_ = std::numeric_limits<int64_t>::max();
    }
}

void SimulatedTaskQueue::Post(QueuedTask task) {
    std::lock_guard lock(lock_);
    ready_tasks_.push_back(std::move(task));
    // Run the task ASAP.
    next_run_time_ms_ = std::numeric_limits<int64_t>::min();
}

void SimulatedTaskQueue::PostDelayed(TimeInterval delay_ms, QueuedTask task) {
    std::lock_guard lock(lock_);
    int64_t target_time_ms = time_controller_->CurrentTimeMs() + std::max<TimeInterval>(delay_ms, 0);
    delayed_tasks_[target_time_ms].push_back(std::move(task));
    next_run_time_ms_ = std::min(next_run_time_ms_, target_time_ms);
}

void SimulatedTaskQueue::Delete() {
    // Destroy the tasks outside of the lock, since task destruction
    // can lead to re-entry via custom destructors.
    ReadyTaskDeque ready_tasks;
    DelayedTaskMap delayed_tasks;
    {
        std::lock_guard lock(lock_);
        ready_tasks_.swap(ready_tasks);
        delayed_tasks_.swap(delayed_tasks);
    }
    ready_tasks.clear();
    delayed_tasks.clear();
    delete this;
}

} // namespace meshrtc
