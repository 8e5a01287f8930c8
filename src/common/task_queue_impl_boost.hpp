#ifndef _COMMON_TASK_QUEUE_IMPL_BOOST_H_
#define _COMMON_TASK_QUEUE_IMPL_BOOST_H_

#include "base/defines.hpp"
#include "common/task_queue_impl.hpp"

#include <string>

namespace meshrtc {

std::unique_ptr<TaskQueueImpl, TaskQueueImpl::Deleter> CreateTaskQueueBoost(std::string name);
    
} // namespace meshrtc

#endif
