#ifndef _TESTING_SIMULATED_CLOCK_H_
#define _TESTING_SIMULATED_CLOCK_H_

#include "base/defines.hpp"
#include "common/clock.hpp"

#include <atomic>

namespace meshrtc {

class SimulatedClock : public Clock {
public:
    explicit SimulatedClock(int64_t initial_time_ms);
    ~SimulatedClock() override;

    int64_t CurrentTimeMs() override;

    void AdvanceTimeMs(int64_t time_ms);

private:
    std::atomic<int64_t> time_ms_;
};

} // namespace meshrtc

#endif
