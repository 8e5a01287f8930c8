#ifndef _COMMON_CLOCK_H_
#define _COMMON_CLOCK_H_

#include "base/defines.hpp"

namespace meshrtc {

// A clock interface that allows reading of relative timestamps.
class MESHRTC_EXPORT Clock {
public:
    virtual ~Clock() = default;

    // Returns a timestamp in milliseconds relative to an unspecified epoch.
    virtual int64_t CurrentTimeMs() = 0;

    // Returns an instance of the real-time system clock implementation.
    static std::shared_ptr<Clock> GetRealTimeClock();
};

class MESHRTC_EXPORT RealTimeClock : public Clock {
public:
    RealTimeClock() = default;
    ~RealTimeClock() override = default;

    int64_t CurrentTimeMs() override;
};
    
} // namespace meshrtc

#endif
