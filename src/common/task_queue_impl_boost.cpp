#include "common/task_queue_impl_boost.hpp"

#include <boost/asio.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/io_context_strand.hpp>
#include <boost/thread/thread.hpp>

#include <plog/Log.h>

#include <list>

namespace meshrtc {
namespace {

class TaskQueueBoost final : public TaskQueueImpl {
public:
    explicit TaskQueueBoost(std::string name);

    void Delete() override;
    void Post(QueuedTask task) override;
    void PostDelayed(TimeInterval delay_ms, QueuedTask task) override;

private:
    ~TaskQueueBoost() override;

    void ScheduleTaskAfter(TimeInterval delay_ms, QueuedTask task);

private:
    const std::string name_;
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    boost::asio::io_context::strand strand_;
    std::unique_ptr<boost::thread> ioc_thread_;

    std::list<std::unique_ptr<boost::asio::deadline_timer>> pending_timers_;
    bool deleting_ = false;
};

TaskQueueBoost::TaskQueueBoost(std::string name) 
    : name_(std::move(name)),
      work_guard_(boost::asio::make_work_guard(ioc_)),
      strand_(ioc_) {
    // The thread will start immediately after created
    ioc_thread_.reset(new boost::thread([this](){
        // Set the current task queue of the thread.
        CurrentTaskQueueSetter set_current(this);
        // Run and block the thread.
        ioc_.run();
        PLOG_VERBOSE << "Task queue [" << name_ << "] exited.";
    }));
}

TaskQueueBoost::~TaskQueueBoost() = default;

void TaskQueueBoost::Delete() {
    assert(IsCurrent() == false);
    // Cancel the pending timers, their tasks will never run.
    boost::asio::post(strand_, [this](){
        deleting_ = true;
        for (auto& timer : pending_timers_) {
            boost::system::error_code ec;
            timer->cancel(ec);
        }
    });
    // Indicate that the work is no longer working, ioc will exit 
    // after all queued handlers are done.
    work_guard_.reset();
    if (ioc_thread_->joinable()) {
        // The calling thread will block until the thread of execution has completed.
        ioc_thread_->join();
    }
    ioc_thread_.reset();
    pending_timers_.clear();
    // Delete itself after the associated thread exited.
    delete this;
}

void TaskQueueBoost::Post(QueuedTask task) {
    boost::asio::post(strand_, std::move(task));
}

void TaskQueueBoost::PostDelayed(TimeInterval delay_ms, QueuedTask task) {
    if (delay_ms <= 0) {
        Post(std::move(task));
        return;
    }
    if (IsCurrent()) {
        ScheduleTaskAfter(delay_ms, std::move(task));
    } else {
        boost::asio::post(strand_, [this, delay_ms, task=std::move(task)]() mutable {
            ScheduleTaskAfter(delay_ms, std::move(task));
        });
    }
}

// Private methods
void TaskQueueBoost::ScheduleTaskAfter(TimeInterval delay_ms, QueuedTask task) {
    assert(IsCurrent());
    if (deleting_) {
        PLOG_VERBOSE << "Task queue [" << name_ << "] is deleting, drop the delayed task.";
        return;
    }
    pending_timers_.push_back(std::make_unique<boost::asio::deadline_timer>(ioc_, boost::posix_time::milliseconds(delay_ms)));
    auto timer_it = std::prev(pending_timers_.end());
    // Start an asynchronous wait
    (*timer_it)->async_wait(boost::asio::bind_executor(strand_, [this, timer_it, task=std::move(task)](const boost::system::error_code& error) mutable {
        pending_timers_.erase(timer_it);
        if (error == boost::asio::error::operation_aborted) {
            return;
        }
        task();
    }));
}

} // namespace

std::unique_ptr<TaskQueueImpl, TaskQueueImpl::Deleter> CreateTaskQueueBoost(std::string name) {
    return std::unique_ptr<TaskQueueImpl, TaskQueueImpl::Deleter>(new TaskQueueBoost(std::move(name)));
}
    
} // namespace meshrtc
