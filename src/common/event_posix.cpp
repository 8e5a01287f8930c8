#include "common/event.hpp"

#include <plog/Log.h>

#include <optional>

#include <errno.h>
#include <sys/time.h>
#include <time.h>

namespace meshrtc {
namespace {

constexpr long kNanosecondsPerSecond = 1000 * 1000 * 1000;

// Absolute CLOCK_MONOTONIC deadline `delay_ms` from now.
timespec DeadlineAfter(int delay_ms) {
    timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    ts.tv_sec += delay_ms / 1000;
    ts.tv_nsec += static_cast<long>(delay_ms % 1000) * 1000 * 1000;
    if (ts.tv_nsec >= kNanosecondsPerSecond) {
        ts.tv_sec += 1;
        ts.tv_nsec -= kNanosecondsPerSecond;
    }
    return ts;
}

class MutexLock {
public:
    explicit MutexLock(pthread_mutex_t* mutex) : mutex_(mutex) {
        pthread_mutex_lock(mutex_);
    }
    ~MutexLock() {
        pthread_mutex_unlock(mutex_);
    }
private:
    pthread_mutex_t* const mutex_;
};

} // namespace

Event::Event() : Event(false, false) {}

Event::Event(bool manual_reset, bool initially_signaled)
    : is_manual_reset_(manual_reset), 
      signaled_(initially_signaled) {
    pthread_mutex_init(&event_mutex_, nullptr);
    // Deadlines are monotonic, the wall clock may jump.
    pthread_condattr_t cond_attr;
    pthread_condattr_init(&cond_attr);
    pthread_condattr_setclock(&cond_attr, CLOCK_MONOTONIC);
    pthread_cond_init(&event_cond_, &cond_attr);
    pthread_condattr_destroy(&cond_attr);
}

Event::~Event() {
    pthread_cond_destroy(&event_cond_);
    pthread_mutex_destroy(&event_mutex_);
}

void Event::Set() {
    MutexLock lock(&event_mutex_);
    signaled_ = true;
    pthread_cond_broadcast(&event_cond_);
}

void Event::Reset() {
    MutexLock lock(&event_mutex_);
    signaled_ = false;
}

bool Event::Wait(const int give_up_after_ms, const int warn_after_ms) {
    const bool gives_up = give_up_after_ms != kForever;
    const bool warns = warn_after_ms != kForever && 
                       (!gives_up || warn_after_ms <= give_up_after_ms);
    const std::optional<timespec> give_up_at = gives_up ? std::make_optional(DeadlineAfter(give_up_after_ms)) 
                                                        : std::nullopt;

    MutexLock lock(&event_mutex_);
    int error = 0;
    if (warns) {
        error = WaitUntil(DeadlineAfter(warn_after_ms));
        if (error == ETIMEDOUT) {
            PLOG_WARNING << "Still waiting for the event after " << warn_after_ms << " ms, probable deadlock.";
            error = WaitUntil(give_up_at);
        }
    } else {
        error = WaitUntil(give_up_at);
    }

    if (error != 0) {
        return false;
    }
    // Only one waiter consumes an auto-reset event.
    if (!is_manual_reset_) {
        signaled_ = false;
    }
    return true;
}

int Event::WaitUntil(const std::optional<timespec>& deadline) {
    int error = 0;
    while (!signaled_ && error == 0) {
        error = deadline ? pthread_cond_timedwait(&event_cond_, &event_mutex_, &*deadline)
                         : pthread_cond_wait(&event_cond_, &event_mutex_);
    }
    return error;
}

} // namespace meshrtc
