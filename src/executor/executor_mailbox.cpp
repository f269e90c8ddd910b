/**
 * @file executor_mailbox.cpp
 * @brief ExecutorMailbox implementation.
 */

#include "executor/job_executor.hpp"

namespace tco_scheduler {

ExecutorMailbox::ExecutorMailbox(size_t capacity)
    : capacity_(capacity == 0 ? DEFAULT_CAPACITY : capacity) {}

bool ExecutorMailbox::post(ExecutorMessage message) {
    std::lock_guard lock(mutex_);
    if (queue_.size() >= capacity_) {
        ++dropped_;
        return false;
    }
    queue_.push_back(std::move(message));
    return true;
}

std::vector<ExecutorMessage> ExecutorMailbox::drain() {
    std::lock_guard lock(mutex_);
    std::vector<ExecutorMessage> out(std::make_move_iterator(queue_.begin()),
                                     std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
}

size_t ExecutorMailbox::size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

size_t ExecutorMailbox::dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
}

}  // namespace tco_scheduler
