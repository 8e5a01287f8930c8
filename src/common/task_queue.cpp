#include "common/task_queue.hpp"
#include "common/task_queue_impl_boost.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace meshrtc {
namespace {

std::unique_ptr<TaskQueueImpl, TaskQueueImpl::Deleter> CreateTaskQueue(std::string name, TaskQueue::Kind kind) {
    switch (kind) {
    case TaskQueue::Kind::BOOST:
        return CreateTaskQueueBoost(std::move(name));
    }
    throw std::invalid_argument("Unsupported task queue kind.");
}

} // namespace

TaskQueue::TaskQueue(std::string name, Kind kind) 
    : TaskQueue(CreateTaskQueue(std::move(name), kind)) {}

TaskQueue::TaskQueue(std::unique_ptr<TaskQueueImpl, TaskQueueImpl::Deleter> task_queue_impl) 
    : impl_(task_queue_impl.release()) {
    if (!impl_) {
        throw std::invalid_argument("Task queue implementation is null.");
    }
}

TaskQueue::~TaskQueue() {
    // Do NOT invalidate `impl_` until Delete returns to 
    // make sure all remained tasks will be executed with a 
    // valid pointer.
    impl_->Delete();
}

void TaskQueue::Post(QueuedTask task) {
    impl_->Post(std::move(task));
}

void TaskQueue::PostDelayed(TimeInterval delay_ms, QueuedTask task) {
    impl_->PostDelayed(delay_ms, std::move(task));
}

bool TaskQueue::IsCurrent() const {
    return impl_->IsCurrent();
}

} // namespace meshrtc
