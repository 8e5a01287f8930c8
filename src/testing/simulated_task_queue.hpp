#ifndef _TESTING_SIMULATED_TASK_QUEUE_H_
#define _TESTING_SIMULATED_TASK_QUEUE_H_

#include "base/defines.hpp"
#include "common/task_queue_impl.hpp"
#include "testing/simulated_sequence_runner.hpp"

#include <deque>
#include <limits>
#include <map>
#include <mutex>
#include <vector>

namespace meshrtc {

class SimulatedTimeController;

// Task queue driven by SimulatedTimeController::AdvanceTime on the test thread.
class SimulatedTaskQueue : public TaskQueueImpl, 
                           public SimulatedSequenceRunner {
public:
    explicit SimulatedTaskQueue(SimulatedTimeController* time_controller);

    // SimulatedSequenceRunner interface
    int64_t GetNextRunTimeMs() const override;
    void RunReady(int64_t at_time_ms) override;

    // TaskQueueImpl interface
    void Delete() override;
    void Post(QueuedTask task) override;
    void PostDelayed(TimeInterval delay_ms, QueuedTask task) override;

private:
    ~SimulatedTaskQueue() override;

private:
    SimulatedTimeController* const time_controller_;

    mutable std::mutex lock_;

    using ReadyTaskDeque = std::deque<QueuedTask>;
    ReadyTaskDeque ready_tasks_;
    using DelayedTaskMap = std::map<int64_t, std::vector<QueuedTask>>;
    DelayedTaskMap delayed_tasks_;

    int64_t next_run_time_ms_ = std::numeric_limits<int64_t>::max();
};

} // namespace meshrtc

#endif
