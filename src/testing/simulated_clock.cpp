#include "testing/simulated_clock.hpp"

namespace meshrtc {

SimulatedClock::SimulatedClock(int64_t initial_time_ms)
    : time_ms_(initial_time_ms) {}

SimulatedClock::~SimulatedClock() {}

int64_t SimulatedClock::CurrentTimeMs() {
    return time_ms_.load(std::memory_order_relaxed);
}

void SimulatedClock::AdvanceTimeMs(int64_t time_ms) {
    time_ms_.fetch_add(time_ms, std::memory_order_relaxed);
}

} // namespace meshrtc
