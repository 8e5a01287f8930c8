#ifndef _COMMON_PENDING_TASK_SAFETY_FLAG_H_
#define _COMMON_PENDING_TASK_SAFETY_FLAG_H_

#include "base/defines.hpp"

#include <atomic>
#include <memory>

namespace meshrtc {

// The PendingTaskSafetyFlag and the ScopedTaskSafety address the issue 
// where a task executed later holds references, but the referenced object
// is not guaranteed to be alive when the task runs.
// Tasks can be posted from any thread, the flag must be cleared on the 
// sequence the guarded tasks run on.
class MESHRTC_EXPORT PendingTaskSafetyFlag final {
public:
    static std::shared_ptr<PendingTaskSafetyFlag> Create();
public:
    ~PendingTaskSafetyFlag() = default;

    bool alive() const;
    void SetAlive();
    void SetNotAlive();
    
private:
    explicit PendingTaskSafetyFlag(bool alive) 
        : alive_(alive) {}

private:
    std::atomic<bool> alive_;
};

// This should be used by the class that wants tasks dropped after destruction.
class MESHRTC_EXPORT ScopedTaskSafety final {
public:
    ScopedTaskSafety() = default;
    ~ScopedTaskSafety() { flag_->SetNotAlive(); }

    // Returns a new reference to the safety flag.
    std::shared_ptr<PendingTaskSafetyFlag> flag() const { return flag_; }

private:
    std::shared_ptr<PendingTaskSafetyFlag> flag_ = PendingTaskSafetyFlag::Create();
};

// Wraps `closure` so that it's dropped if `safety_flag` is not alive when it runs.
template<typename Closure>
std::function<void()> ToSafeTask(std::shared_ptr<PendingTaskSafetyFlag> safety_flag, Closure&& closure) {
    return [safety_flag=std::move(safety_flag), closure=std::forward<Closure>(closure)]() mutable {
        if (safety_flag->alive()) {
            closure();
        }
    };
}

} // namespace meshrtc

#endif
