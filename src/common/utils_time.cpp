#include "common/utils_time.hpp"

#if defined(MESHRTC_POSIX)
#include <sys/time.h>
#include <time.h>
#else
#error "Unsupported platform"
#endif

namespace meshrtc {
namespace utils {
namespace time {

int64_t TimeInNanos() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return kNumNanosecsPerSec * static_cast<int64_t>(ts.tv_sec) +
           static_cast<int64_t>(ts.tv_nsec);
}

int64_t TimeInMillis() {
    return TimeInNanos() / kNumNanosecsPerMillisec;
}

int64_t TimeUTCInMillis() {
    // Using gettimeofday instead of clock_gettime
    struct timeval time;
    gettimeofday(&time, nullptr);
    return static_cast<int64_t>(time.tv_sec) * kNumMillisecsPerSec + time.tv_usec / kNumMicrosecsPerMillisec; 
}
    
} // namespace time
} // namespace utils
} // namespace meshrtc
