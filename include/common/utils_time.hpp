#ifndef _COMMON_UTILS_TIME_H_
#define _COMMON_UTILS_TIME_H_

#include "base/defines.hpp"

#include <stdint.h>

namespace meshrtc {

static constexpr int64_t kNumMillisecsPerSec = INT64_C(1000);
static constexpr int64_t kNumMicrosecsPerSec = INT64_C(1000000);
static constexpr int64_t kNumNanosecsPerSec = INT64_C(1000000000);

static constexpr int64_t kNumMicrosecsPerMillisec = kNumMicrosecsPerSec / kNumMillisecsPerSec;
static constexpr int64_t kNumNanosecsPerMillisec = kNumNanosecsPerSec / kNumMillisecsPerSec;

namespace utils {
namespace time {

// Monotonic time
// Returns the current monotonic time in nanoseconds in 64 bits.
MESHRTC_EXPORT int64_t TimeInNanos();

// Returns the current monotonic time in milliseconds in 64 bits.
MESHRTC_EXPORT int64_t TimeInMillis();

// UTC time
// Returns the number of milliseconds since January 1, 1970, UTC.
// Not guaranteed to be monotonic, always use TimeInMillis() for 
// measuring time intervals and timeouts.
MESHRTC_EXPORT int64_t TimeUTCInMillis();
    
} // namespace time
} // namespace utils
} // namespace meshrtc

#endif
