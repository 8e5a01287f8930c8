#include "common/pending_task_safety_flag.hpp"

namespace meshrtc {

std::shared_ptr<PendingTaskSafetyFlag> PendingTaskSafetyFlag::Create() {
    return std::shared_ptr<PendingTaskSafetyFlag>(new PendingTaskSafetyFlag(true));
}

bool PendingTaskSafetyFlag::alive() const {
    return alive_.load(std::memory_order_acquire);
}

void PendingTaskSafetyFlag::SetAlive() {
    alive_.store(true, std::memory_order_release);
}

void PendingTaskSafetyFlag::SetNotAlive() {
    alive_.store(false, std::memory_order_release);
}

} // namespace meshrtc
