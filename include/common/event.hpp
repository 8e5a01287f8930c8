#ifndef _COMMON_EVENT_H_
#define _COMMON_EVENT_H_

#include "base/defines.hpp"

#include <optional>

#if defined(MESHRTC_POSIX)
#include <pthread.h>
#include <time.h>
#else
#error "Must define MESHRTC_POSIX."
#endif

namespace meshrtc {

class MESHRTC_EXPORT Event {
public:
    static const int kForever = -1;
public:
    Event();
    Event(bool manual_reset, bool initially_signaled);
    ~Event();

    void Set();
    void Reset();

    // Waits for the event to become signaled, logs a warning if it takes more
    // than `warn_after_ms` milliseconds, and gives up if it takes more
    // than `give_up_after_ms` milliseconds. Either may be `kForever`.
    //
    // Returns true if the event was signaled, false if there was a timeout or
    // some other error.
    bool Wait(int give_up_after_ms, int warn_after_ms);

    // Waits with the given timeout and a reasonable default warning timeout.
    bool Wait(int give_up_after_ms) {
        return Wait(give_up_after_ms, give_up_after_ms == kForever ? 3000 : kForever);
    }

    bool WaitForever() {
        return Wait(kForever);
    }

private:
    // Called with `event_mutex_` held, returns 0 once signaled.
    int WaitUntil(const std::optional<timespec>& deadline);

private:
    pthread_mutex_t event_mutex_;
    pthread_cond_t event_cond_;
    const bool is_manual_reset_;
    bool signaled_;

    DISALLOW_COPY_AND_ASSIGN(Event);
};
    
} // namespace meshrtc

#endif
