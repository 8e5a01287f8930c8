#ifndef _COMMON_TASK_QUEUE_H_
#define _COMMON_TASK_QUEUE_H_

#include "base/defines.hpp"
#include "common/task_queue_impl.hpp"

#include <memory>
#include <string>

namespace meshrtc {

class MESHRTC_EXPORT TaskQueue {
public:
    enum class Kind {
        BOOST
    };
public:
    explicit TaskQueue(std::string name, Kind kind = Kind::BOOST);
    explicit TaskQueue(std::unique_ptr<TaskQueueImpl, TaskQueueImpl::Deleter> task_queue_impl);
    ~TaskQueue();

    void Post(QueuedTask task);
    void PostDelayed(TimeInterval delay_ms, QueuedTask task);

    template<typename ReturnT,
             typename = typename std::enable_if<std::is_void<ReturnT>::value>::type>
    void Invoke(std::function<void()>&& handler) {
        impl_->Invoke<void>(std::move(handler));
    }
    template<typename ReturnT,
             typename = typename std::enable_if<!std::is_void<ReturnT>::value>::type>
    ReturnT Invoke(std::function<ReturnT()>&& handler) {
        return impl_->Invoke<ReturnT>(std::move(handler));
    }

    bool IsCurrent() const;

    // Returns non-owning pointer to the task queue implementation.
    TaskQueueImpl* Get() { return impl_; }

private:
    TaskQueueImpl* const impl_;

    DISALLOW_COPY_AND_ASSIGN(TaskQueue);
};

} // namespace meshrtc

#endif
