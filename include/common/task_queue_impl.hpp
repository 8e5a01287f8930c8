#ifndef _COMMON_TASK_QUEUE_IMPL_H_
#define _COMMON_TASK_QUEUE_IMPL_H_

#include "base/defines.hpp"
#include "common/event.hpp"

#include <functional>
#include <type_traits>

namespace meshrtc {

using QueuedTask = std::function<void()>;

class MESHRTC_EXPORT TaskQueueImpl {
public:
    struct Deleter {
        void operator()(TaskQueueImpl* task_queue) const { task_queue->Delete(); }
    };
public:
    // Starts destruction of the task queue.
    // On return ensures no task are running and no new tasks are 
    // able to start on the task queue.
    virtual void Delete() = 0;

    // Schedules a task to execute. Tasks are executed in FIFO order.
    virtual void Post(QueuedTask task) = 0;
    // Schedules a task to execute a specified delay from when the call is made.
    virtual void PostDelayed(TimeInterval delay_ms, QueuedTask task) = 0;

    // Convenience method to invoke a functor on the task queue, which
    // blocks the current thread until execution is complete.
    template<typename ReturnT,
             typename = typename std::enable_if<std::is_void<ReturnT>::value>::type>
    void Invoke(std::function<void()>&& handler) {
        if (IsCurrent()) {
            handler();
        } else {
            Event done;
            Post([&done, handler=std::move(handler)]() {
                handler();
                done.Set();
            });
            done.WaitForever();
        }
    }
    template<typename ReturnT,
             typename = typename std::enable_if<!std::is_void<ReturnT>::value>::type>
    ReturnT Invoke(std::function<ReturnT()>&& handler) {
        ReturnT ret;
        if (IsCurrent()) {
            ret = handler();
        } else {
            Event done;
            Post([&done, &ret, handler=std::move(handler)]() {
                ret = handler();
                done.Set();
            });
            done.WaitForever();
        }
        return ret;
    }

    // Returns the task queue that is running the current thread.
    // Returns nullptr if this thread is not associated with any task queue.
    static TaskQueueImpl* Current();

    // Returns true if this task queue is running the current thread.
    bool IsCurrent() const { return Current() == this; }

protected:
    class CurrentTaskQueueSetter {
    public:
        explicit CurrentTaskQueueSetter(TaskQueueImpl* task_queue);
        ~CurrentTaskQueueSetter();
    private:
        TaskQueueImpl* const previous_;

        DISALLOW_COPY_AND_ASSIGN(CurrentTaskQueueSetter);
    };

    // Users of the TaskQueue should call Delete instead of 
    // directly deleting this instance.
    virtual ~TaskQueueImpl() = default;
};

#define RTC_RUN_ON(x)   \
    assert((x)->IsCurrent() && "TaskQueue doesn't match.")
    
} // namespace meshrtc

#endif
