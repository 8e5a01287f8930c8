#ifndef _TESTING_SIMULATED_TIME_CONTROLLER_H_
#define _TESTING_SIMULATED_TIME_CONTROLLER_H_

#include "base/defines.hpp"
#include "common/task_queue.hpp"
#include "testing/simulated_clock.hpp"
#include "testing/simulated_task_queue.hpp"

#include <limits>
#include <list>
#include <mutex>
#include <vector>

namespace meshrtc {

// Runs simulated task queues on the calling thread while advancing
// a simulated clock.
class SimulatedTimeController {
public:
    explicit SimulatedTimeController(int64_t start_time_ms);
    ~SimulatedTimeController();

    std::unique_ptr<TaskQueue> CreateTaskQueue();
    Clock* clock() const;

    int64_t CurrentTimeMs() const;

    // Runs every task due up to now + `duration_ms`, zero runs the ready tasks only.
    void AdvanceTime(TimeInterval duration_ms);

    // Runs `task` on `task_queue` and waits for it, along with anything it posts.
    void SendTask(TaskQueue* task_queue, QueuedTask task);

    void Register(SimulatedSequenceRunner* runner);
    void Deregister(SimulatedSequenceRunner* runner);

private:
    int64_t NextRunTimeMs() const;
    void RunReadyRunners();

private:
    mutable std::mutex time_lock_;
    mutable std::mutex lock_;

    int64_t current_time_ms_;
    std::unique_ptr<SimulatedClock> sim_clock_;

    std::vector<SimulatedSequenceRunner*> runners_;
    std::list<SimulatedSequenceRunner*> ready_runners_;
};
    
} // namespace meshrtc

#endif
