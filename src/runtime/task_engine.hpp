#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/concurrency/cancel_token.hpp"
#include "core/concurrency/channel.hpp"
#include "core/errors/forge_errors.hpp"
#include "policy/permission_gate.hpp"
#include "protocol/event_contract.hpp"
#include "providers/model_client.hpp"
#include "session/conversation.hpp"
#include "session/session_store.hpp"
#include "session/task_lifecycle.hpp"
#include "tools/dispatcher.hpp"
#include "tools/tool_registry.hpp"

namespace forge::process {
class ProcessSupervisor;
}

namespace forge::runtime {

// model, registry and dispatcher are required; processes and
// session_store may be null.
struct EngineDependencies {
    std::shared_ptr<providers::ModelClient> model;
    const tools::ToolRegistry* registry = nullptr;
    tools::Dispatcher* dispatcher = nullptr;
    process::ProcessSupervisor* processes = nullptr;
    std::shared_ptr<session::SessionStore> session_store;
};

struct EngineOptions {
    protocol::PermissionMode permission_mode = protocol::PermissionMode::ManualApproval;
    std::uint32_t max_turns = 50;
};

// Drives one task: model turn -> authorization -> dispatch -> results,
// until a terminal signal tool fires, the model stops calling tools, or
// the operator intervenes.
//
// Everything except cancel() runs on the engine thread, either directly or
// through run(). cancel() may be called from any thread: it fires the
// task's cancel token, and whichever thread owns the engine at that moment
// finishes the cancellation.
class TaskEngine {
public:
    TaskEngine(EngineDependencies deps, EngineOptions options = {});
    ~TaskEngine();

    TaskEngine(const TaskEngine&) = delete;
    TaskEngine& operator=(const TaskEngine&) = delete;

    core::errors::Status start_task(const std::string& instruction);

    // One model turn plus its tool calls. Stops early at WaitingApproval.
    core::errors::Status step();
    core::errors::Status run_until_settled();

    core::errors::Status approve(const std::string& call_id);
    core::errors::Status reject(const std::string& call_id, const std::string& reason);
    core::errors::Status pause();
    core::errors::Status resume();
    core::errors::Status cancel();

    // Task loop: serves control events and steps a running task. Shutdown
    // (or a closed channel) lets a running task settle first; a task left
    // waiting for approval or paused is cancelled. Closes events() on return.
    void run(core::concurrency::Channel<protocol::ControlEvent>& control);

    protocol::TaskState state() const { return lifecycle_.state(); }
    std::string task_id() const { return lifecycle_.task_id(); }
    std::optional<std::string> failure_reason() const { return lifecycle_.failure_reason(); }
    std::optional<protocol::ToolCall> pending_approval() const { return gate_.pending(); }
    const session::Conversation& conversation() const { return conversation_; }
    core::concurrency::Channel<protocol::EngineEvent>& events() { return *events_; }

private:
    struct PendingCall {
        protocol::ToolCall call;
        bool terminal_signal = false;
        std::optional<std::future<protocol::ToolResult>> running;
        std::optional<protocol::ToolResult> result;
    };

    // Tool calls of the current model turn, in authorization order.
    struct ActiveTurn {
        std::vector<PendingCall> calls;
        std::size_t next = 0;  // first call not yet authorized
    };

    bool handle_control(const protocol::ControlEvent& event);

    core::errors::Status stream_turn_locked();
    core::errors::Status continue_turn_locked();
    core::errors::Status finish_turn_locked();
    void launch_locked(PendingCall& pending);
    void settle_cancellation_locked();
    void fail_step_locked(const std::string& partial_text, const core::errors::ForgeError& error);

    core::errors::Status move_to(protocol::TaskState next,
                                 const std::string& detail = "",
                                 const std::optional<std::string>& failure_reason = std::nullopt);
    core::errors::Status append_turn(protocol::Turn turn);
    void persist();
    void emit(protocol::EngineEvent event);

    core::concurrency::CancelToken current_token() const;
    bool cancel_requested() const;

    EngineDependencies deps_;
    EngineOptions options_;

    policy::PermissionGate gate_;
    session::Conversation conversation_;
    session::TaskLifecycle lifecycle_;
    // Shared with output callbacks, which can outlive the engine.
    std::shared_ptr<core::concurrency::Channel<protocol::EngineEvent>> events_;

    // Held by every engine-thread operation.
    std::recursive_mutex engine_mutex_;

    mutable std::mutex token_mutex_;
    core::concurrency::CancelToken cancel_token_;

    std::optional<ActiveTurn> turn_;
    std::uint32_t turns_taken_ = 0;
};

}  // namespace forge::runtime
