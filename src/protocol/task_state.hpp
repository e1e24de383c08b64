#pragma once

#include <string>

namespace forge::protocol {

enum class TaskState {
    Idle,
    Running,
    WaitingApproval,
    Paused,
    Completed,
    Failed,
    Cancelled
};

inline std::string to_string(const TaskState state) {
    switch (state) {
        case TaskState::Idle:
            return "idle";
        case TaskState::Running:
            return "running";
        case TaskState::WaitingApproval:
            return "waiting_approval";
        case TaskState::Paused:
            return "paused";
        case TaskState::Completed:
            return "completed";
        case TaskState::Failed:
            return "failed";
        case TaskState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

inline bool is_terminal(const TaskState state) {
    return state == TaskState::Completed || state == TaskState::Failed ||
           state == TaskState::Cancelled;
}

}  // namespace forge::protocol
