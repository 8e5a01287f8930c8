#include "common/task_queue_impl.hpp"

namespace meshrtc {
namespace {

thread_local TaskQueueImpl* current_task_queue = nullptr;

} // namespace

TaskQueueImpl* TaskQueueImpl::Current() {
    return current_task_queue;
}

TaskQueueImpl::CurrentTaskQueueSetter::CurrentTaskQueueSetter(TaskQueueImpl* task_queue) 
    : previous_(current_task_queue) {
    current_task_queue = task_queue;
}

TaskQueueImpl::CurrentTaskQueueSetter::~CurrentTaskQueueSetter() {
    current_task_queue = previous_;
}

} // namespace meshrtc
