#pragma once

#include <mutex>
#include <optional>
#include <string>
#include "core/errors/forge_errors.hpp"
#include "protocol/task_state.hpp"

namespace forge::session {

// Owns the TaskState of the single active task and validates every move.
class TaskLifecycle {
public:
    // Idle or terminal -> Running. A terminal state gets a fresh task id.
    core::errors::Result<protocol::TaskState> begin_task();

    core::errors::Result<protocol::TaskState> transition(
        protocol::TaskState next, const std::optional<std::string>& failure_reason = std::nullopt);

    protocol::TaskState state() const;
    std::string task_id() const;
    std::optional<std::string> failure_reason() const;

    static bool is_allowed(protocol::TaskState from, protocol::TaskState to);

private:
    core::errors::Result<protocol::TaskState> transition_locked(
        protocol::TaskState next, const std::optional<std::string>& failure_reason);

    mutable std::mutex mutex_;
    protocol::TaskState state_ = protocol::TaskState::Idle;
    std::string task_id_;
    std::optional<std::string> failure_reason_;
};

}  // namespace forge::session
