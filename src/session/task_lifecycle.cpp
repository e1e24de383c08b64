#include "session/task_lifecycle.hpp"

#include "core/config/id_gen.hpp"
#include "core/logging/logger.hpp"

namespace forge::session {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using protocol::TaskState;

bool TaskLifecycle::is_allowed(const TaskState from, const TaskState to) {
    switch (from) {
        case TaskState::Idle:
            return to == TaskState::Running;
        case TaskState::Running:
            return to == TaskState::Idle || to == TaskState::WaitingApproval ||
                   to == TaskState::Paused || to == TaskState::Completed ||
                   to == TaskState::Failed || to == TaskState::Cancelled;
        case TaskState::WaitingApproval:
            return to == TaskState::Running || to == TaskState::Cancelled;
        case TaskState::Paused:
            return to == TaskState::Running || to == TaskState::Cancelled;
        case TaskState::Completed:
        case TaskState::Failed:
        case TaskState::Cancelled:
            return to == TaskState::Running;
        default:
            return false;
    }
}

core::errors::Result<TaskState> TaskLifecycle::begin_task() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != TaskState::Idle && !protocol::is_terminal(state_)) {
        return ForgeError{ErrorCategory::Validation,
                          "A task is already " + protocol::to_string(state_),
                          "invalid_state_transition",
                          "Wait for the current task to settle or cancel it."};
    }
    if (task_id_.empty() || protocol::is_terminal(state_)) {
        task_id_ = core::config::generate_task_id();
        core::logging::Logger::get().set_task_id(task_id_);
    }
    failure_reason_.reset();
    return transition_locked(TaskState::Running, std::nullopt);
}

core::errors::Result<TaskState> TaskLifecycle::transition(
    const TaskState next, const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    return transition_locked(next, failure_reason);
}

core::errors::Result<TaskState> TaskLifecycle::transition_locked(
    const TaskState next, const std::optional<std::string>& failure_reason) {
    if (!is_allowed(state_, next)) {
        return ForgeError{ErrorCategory::Internal,
                          "Illegal task transition " + protocol::to_string(state_) + " -> " +
                              protocol::to_string(next),
                          "invalid_state_transition"};
    }
    const std::string prev = protocol::to_string(state_);
    state_ = next;
    if (next == TaskState::Failed) {
        failure_reason_ = failure_reason;
    }
    FORGE_LOG_INFO("TaskLifecycle: task " + task_id_ + " transition " + prev + " -> " +
                   protocol::to_string(next));
    return state_;
}

TaskState TaskLifecycle::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string TaskLifecycle::task_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return task_id_;
}

std::optional<std::string> TaskLifecycle::failure_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_reason_;
}

}  // namespace forge::session
