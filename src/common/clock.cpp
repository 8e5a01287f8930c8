#include "common/clock.hpp"
#include "common/utils_time.hpp"

namespace meshrtc {

std::shared_ptr<Clock> Clock::GetRealTimeClock() {
    static std::shared_ptr<Clock> clock = std::make_shared<RealTimeClock>();
    return clock;
}

int64_t RealTimeClock::CurrentTimeMs() {
    return utils::time::TimeInMillis();
}
    
} // namespace meshrtc
