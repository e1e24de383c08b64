#include "runtime/task_engine.hpp"

#include <chrono>
#include <type_traits>
#include <utility>
#include <variant>
#include "core/config/id_gen.hpp"
#include "core/logging/logger.hpp"
#include "process/process_supervisor.hpp"
#include "runtime/stream_accumulator.hpp"

namespace forge::runtime {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using protocol::TaskState;
using protocol::ToolResult;

namespace {

constexpr const char* kCancelledText = "Cancelled by operator";
constexpr auto kControlPoll = std::chrono::milliseconds(50);

bool is_active(const TaskState state) {
    return state == TaskState::Running || state == TaskState::WaitingApproval ||
           state == TaskState::Paused;
}

std::string summarize(const ToolResult& result) {
    std::string text = result.text_content();
    constexpr std::size_t kSummaryChars = 200;
    if (text.size() > kSummaryChars) {
        text = text.substr(0, kSummaryChars) + "...";
    }
    return text;
}

}  // namespace

TaskEngine::TaskEngine(EngineDependencies deps, EngineOptions options)
    : deps_(std::move(deps)),
      options_(options),
      gate_(options.permission_mode),
      events_(std::make_shared<core::concurrency::Channel<protocol::EngineEvent>>()),
      cancel_token_(core::concurrency::make_cancel_token()) {}

TaskEngine::~TaskEngine() {
    if (is_active(lifecycle_.state())) {
        auto status = cancel();
        if (core::errors::is_error(status)) {
            FORGE_LOG_WARN(core::errors::describe(core::errors::get_error(status)));
        }
    }
    // Commands left running by a completed task die with the engine.
    if (deps_.processes != nullptr) {
        deps_.processes->kill_all();
        deps_.processes->release_finished();
    }
    events_->close();
}

core::errors::Status TaskEngine::start_task(const std::string& instruction) {
    std::lock_guard<std::recursive_mutex> lock(engine_mutex_);
    if (instruction.find_first_not_of(" \t\r\n") == std::string::npos) {
        return ForgeError{ErrorCategory::Validation, "Instruction is empty", "empty_instruction"};
    }
    const TaskState current = lifecycle_.state();
    if (current != TaskState::Idle && !protocol::is_terminal(current)) {
        return ForgeError{ErrorCategory::Validation,
                          "Cannot start a task while " + protocol::to_string(current),
                          "invalid_state_transition",
                          "Wait for the current task to settle or cancel it."};
    }

    {
        std::lock_guard<std::mutex> token_lock(token_mutex_);
        cancel_token_ = core::concurrency::make_cancel_token();
    }
    turns_taken_ = 0;
    turn_.reset();

    auto status = append_turn(protocol::UserMessage{instruction});
    if (core::errors::is_error(status)) {
        return status;
    }
    auto begun = lifecycle_.begin_task();
    if (core::errors::is_error(begun)) {
        return core::errors::get_error(begun);
    }
    emit(protocol::TaskStateChangedEvent{TaskState::Running, "new instruction"});
    return core::errors::ok();
}

core::errors::Status TaskEngine::step() {
    std::lock_guard<std::recursive_mutex> lock(engine_mutex_);
    if (lifecycle_.state() != TaskState::Running) {
        return ForgeError{ErrorCategory::Validation,
                          "Task is " + protocol::to_string(lifecycle_.state()) + ", not running",
                          "task_not_running"};
    }
    if (cancel_requested()) {
        settle_cancellation_locked();
        return core::errors::ok();
    }
    if (turn_) {
        // An approved or rejected call left the rest of its turn to run.
        return continue_turn_locked();
    }
    if (turns_taken_ >= options_.max_turns) {
        FORGE_LOG_WARN("Turn budget of " + std::to_string(options_.max_turns) + " exhausted");
        auto status = append_turn(protocol::Notice{ErrorCategory::Execution,
                                                   "turn budget exhausted"});
        if (core::errors::is_error(status)) {
            return status;
        }
        status = move_to(TaskState::Failed, "turn budget exhausted", "turn budget exhausted");
        persist();
        return status;
    }
    ++turns_taken_;
    return stream_turn_locked();
}

core::errors::Status TaskEngine::run_until_settled() {
    while (lifecycle_.state() == TaskState::Running) {
        auto status = step();
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    return core::errors::ok();
}

core::errors::Status TaskEngine::stream_turn_locked() {
    protocol::ModelRequest request;
    request.history = conversation_.snapshot();
    request.tools = deps_.registry->specs();

    const auto token = current_token();
    StreamAccumulator accumulator;
    std::optional<ForgeError> stream_fault;

    auto streamed = deps_.model->stream(
        request,
        [&](const protocol::ModelChunk& chunk) {
            if (stream_fault) {
                return;
            }
            auto fed = accumulator.feed(chunk);
            if (core::errors::is_error(fed)) {
                stream_fault = core::errors::get_error(fed);
                return;
            }
            const auto& outcome = core::errors::get_value(fed);
            if (outcome.text_delta) {
                emit(protocol::TextDeltaEvent{*outcome.text_delta});
            }
        },
        token);

    if (cancel_requested()) {
        if (!accumulator.text().empty()) {
            auto status = append_turn(protocol::AssistantMessage{accumulator.text(), {}});
            if (core::errors::is_error(status)) {
                FORGE_LOG_ERROR(core::errors::describe(core::errors::get_error(status)));
            }
        }
        settle_cancellation_locked();
        return core::errors::ok();
    }
    if (core::errors::is_error(streamed)) {
        fail_step_locked(accumulator.text(), core::errors::get_error(streamed));
        return core::errors::ok();
    }
    if (stream_fault) {
        fail_step_locked(accumulator.text(), *stream_fault);
        return core::errors::ok();
    }
    accumulator.finish();

    protocol::AssistantMessage message;
    message.text = accumulator.text();
    message.tool_calls = accumulator.calls();
    for (std::size_t i = 0; i < message.tool_calls.size(); ++i) {
        auto& call = message.tool_calls[i];
        bool clash = call.id.empty() || conversation_.has_call(call.id);
        for (std::size_t j = 0; j < i && !clash; ++j) {
            clash = message.tool_calls[j].id == call.id;
        }
        if (clash) {
            const std::string fresh = core::config::generate_id("call");
            FORGE_LOG_DEBUG("Tool call id '" + call.id + "' reassigned to " + fresh);
            call.id = fresh;
        }
    }

    ActiveTurn turn;
    for (const auto& call : message.tool_calls) {
        PendingCall pending;
        pending.call = call;
        const auto* descriptor = deps_.registry->find(call.name);
        pending.terminal_signal = descriptor != nullptr && descriptor->terminal_signal;
        turn.calls.push_back(std::move(pending));
    }

    auto status = append_turn(std::move(message));
    if (core::errors::is_error(status)) {
        const auto error = core::errors::get_error(status);
        auto moved = move_to(TaskState::Failed, error.message, error.message);
        persist();
        return moved;
    }

    if (turn.calls.empty()) {
        status = move_to(TaskState::Idle, "model turn without tool calls");
        persist();
        return status;
    }
    turn_ = std::move(turn);
    return continue_turn_locked();
}

core::errors::Status TaskEngine::continue_turn_locked() {
    while (turn_->next < turn_->calls.size()) {
        if (cancel_requested()) {
            settle_cancellation_locked();
            return core::errors::ok();
        }
        PendingCall& pending = turn_->calls[turn_->next];
        const auto& call = pending.call;
        const auto* descriptor = deps_.registry->find(call.name);

        if (descriptor == nullptr) {
            pending.result = tools::error_result(
                call.id, ForgeError{ErrorCategory::Validation, "Unknown tool: " + call.name,
                                    "unknown_tool"});
        } else if (call.argument_error) {
            pending.result = tools::error_result(
                call.id, ForgeError{ErrorCategory::Validation,
                                    *call.argument_error + ": " + call.raw_arguments,
                                    "malformed_arguments"});
        } else {
            const auto risk = tools::effective_risk(*descriptor, call.arguments);
            const auto decision = gate_.authorize(risk);
            FORGE_LOG_DEBUG("Authorize " + call.name + " (" + protocol::to_string(risk) + ")");
            if (decision.kind == protocol::DecisionKind::Allow) {
                launch_locked(pending);
            } else if (decision.kind == protocol::DecisionKind::Deny) {
                pending.result = tools::error_result(
                    call.id, ForgeError{ErrorCategory::Permission, decision.reason,
                                        "permission_denied"});
            } else {
                auto begun = gate_.begin_approval(call);
                if (core::errors::is_error(begun)) {
                    return begun;
                }
                auto status = move_to(TaskState::WaitingApproval, call.name);
                if (core::errors::is_error(status)) {
                    return status;
                }
                emit(protocol::ApprovalRequestedEvent{call, risk});
                return core::errors::ok();
            }
        }
        ++turn_->next;
    }
    return finish_turn_locked();
}

void TaskEngine::launch_locked(PendingCall& pending) {
    const std::string call_id = pending.call.id;
    tools::DispatchOptions options;
    options.cancel = current_token();
    options.on_output = [events = events_, call_id](std::uint64_t process_id,
                                                    protocol::OutputStream stream,
                                                    const std::string& text) {
        events->send(protocol::ToolOutputEvent{call_id, process_id, stream, text});
    };
    emit(protocol::ToolStartedEvent{call_id, pending.call.name});
    pending.running = deps_.dispatcher->launch(pending.call, options);
}

core::errors::Status TaskEngine::finish_turn_locked() {
    bool terminal = false;
    for (auto& pending : turn_->calls) {
        if (pending.running) {
            pending.result = pending.running->get();
            pending.running.reset();
        }
        if (!pending.result) {
            pending.result = ToolResult::text(pending.call.id, kCancelledText, true);
        }
        emit(protocol::ToolFinishedEvent{pending.call.id, pending.result->is_error,
                                         summarize(*pending.result)});
        auto status = append_turn(*pending.result);
        if (core::errors::is_error(status)) {
            return status;
        }
        if (pending.terminal_signal && !pending.result->is_error) {
            terminal = true;
        }
    }
    turn_.reset();

    if (cancel_requested()) {
        settle_cancellation_locked();
        return core::errors::ok();
    }
    if (terminal) {
        auto status = move_to(TaskState::Completed, "terminal signal tool");
        persist();
        return status;
    }
    return core::errors::ok();
}

core::errors::Status TaskEngine::approve(const std::string& call_id) {
    std::lock_guard<std::recursive_mutex> lock(engine_mutex_);
    if (lifecycle_.state() != TaskState::WaitingApproval || !turn_) {
        return ForgeError{ErrorCategory::Validation, "No tool call is waiting for approval",
                          "no_pending_approval"};
    }
    auto approved = gate_.approve(call_id);
    if (core::errors::is_error(approved)) {
        return core::errors::get_error(approved);
    }
    auto status = move_to(TaskState::Running, "approved " + call_id);
    if (core::errors::is_error(status)) {
        return status;
    }
    launch_locked(turn_->calls[turn_->next]);
    ++turn_->next;
    return continue_turn_locked();
}

core::errors::Status TaskEngine::reject(const std::string& call_id, const std::string& reason) {
    std::lock_guard<std::recursive_mutex> lock(engine_mutex_);
    if (lifecycle_.state() != TaskState::WaitingApproval || !turn_) {
        return ForgeError{ErrorCategory::Validation, "No tool call is waiting for approval",
                          "no_pending_approval"};
    }
    auto rejected = gate_.reject(call_id);
    if (core::errors::is_error(rejected)) {
        return core::errors::get_error(rejected);
    }
    auto status = move_to(TaskState::Running, "rejected " + call_id);
    if (core::errors::is_error(status)) {
        return status;
    }
    FORGE_LOG_INFO("Operator rejected " + call_id);
    turn_->calls[turn_->next].result =
        ToolResult::text(call_id, reason.empty() ? "Rejected by operator" : reason, true);
    ++turn_->next;
    return continue_turn_locked();
}

core::errors::Status TaskEngine::pause() {
    std::lock_guard<std::recursive_mutex> lock(engine_mutex_);
    auto status = move_to(TaskState::Paused, "operator pause");
    if (core::errors::is_error(status)) {
        return status;
    }
    persist();
    return core::errors::ok();
}

core::errors::Status TaskEngine::resume() {
    std::lock_guard<std::recursive_mutex> lock(engine_mutex_);
    const TaskState current = lifecycle_.state();
    if (current != TaskState::Paused && current != TaskState::Idle) {
        return ForgeError{ErrorCategory::Validation,
                          "Cannot resume while " + protocol::to_string(current),
                          "invalid_state_transition"};
    }
    if (current == TaskState::Idle) {
        auto begun = lifecycle_.begin_task();
        if (core::errors::is_error(begun)) {
            return core::errors::get_error(begun);
        }
        emit(protocol::TaskStateChangedEvent{TaskState::Running, "operator resume"});
        return core::errors::ok();
    }
    return move_to(TaskState::Running, "operator resume");
}

core::errors::Status TaskEngine::cancel() {
    if (!is_active(lifecycle_.state())) {
        return ForgeError{ErrorCategory::Validation, "No active task to cancel", "no_active_task"};
    }
    current_token()->store(true);
    FORGE_LOG_INFO("Cancellation requested");

    // A thread inside step() sees the token and settles on its own.
    std::unique_lock<std::recursive_mutex> lock(engine_mutex_, std::try_to_lock);
    if (lock.owns_lock() && is_active(lifecycle_.state())) {
        settle_cancellation_locked();
    }
    return core::errors::ok();
}

void TaskEngine::settle_cancellation_locked() {
    if (deps_.processes != nullptr) {
        deps_.processes->kill_all();
    }

    if (turn_) {
        for (auto& pending : turn_->calls) {
            if (pending.running) {
                pending.result = pending.running->get();
                pending.running.reset();
            }
            if (!pending.result) {
                pending.result = ToolResult::text(pending.call.id, kCancelledText, true);
            }
            emit(protocol::ToolFinishedEvent{pending.call.id, pending.result->is_error,
                                             summarize(*pending.result)});
            auto status = append_turn(*pending.result);
            if (core::errors::is_error(status)) {
                FORGE_LOG_ERROR(core::errors::describe(core::errors::get_error(status)));
            }
        }
        turn_.reset();
    }
    if (deps_.processes != nullptr) {
        deps_.processes->release_finished();
    }
    for (const auto& call_id : conversation_.unresolved_calls()) {
        auto status = append_turn(ToolResult::text(call_id, kCancelledText, true));
        if (core::errors::is_error(status)) {
            FORGE_LOG_ERROR(core::errors::describe(core::errors::get_error(status)));
        }
    }
    gate_.clear();

    if (is_active(lifecycle_.state())) {
        auto status = move_to(TaskState::Cancelled, "operator cancel");
        if (core::errors::is_error(status)) {
            FORGE_LOG_ERROR(core::errors::describe(core::errors::get_error(status)));
        }
    }
    persist();
}

void TaskEngine::fail_step_locked(const std::string& partial_text,
                                  const ForgeError& error) {
    FORGE_LOG_WARN("Model step failed: " + core::errors::describe(error));
    if (!partial_text.empty()) {
        auto status = append_turn(protocol::AssistantMessage{partial_text, {}});
        if (core::errors::is_error(status)) {
            FORGE_LOG_ERROR(core::errors::describe(core::errors::get_error(status)));
        }
    }
    auto status = append_turn(protocol::Notice{error.category, core::errors::describe(error)});
    if (core::errors::is_error(status)) {
        FORGE_LOG_ERROR(core::errors::describe(core::errors::get_error(status)));
    }
    emit(protocol::ErrorEvent{core::errors::describe(error)});
    auto moved = move_to(TaskState::Idle, "step failed");
    if (core::errors::is_error(moved)) {
        FORGE_LOG_ERROR(core::errors::describe(core::errors::get_error(moved)));
    }
    persist();
}

void TaskEngine::run(core::concurrency::Channel<protocol::ControlEvent>& control) {
    FORGE_LOG_INFO("Task loop started");
    bool shutdown_requested = false;
    while (true) {
        if (cancel_requested() && is_active(lifecycle_.state())) {
            std::lock_guard<std::recursive_mutex> lock(engine_mutex_);
            settle_cancellation_locked();
        }

        const TaskState current = lifecycle_.state();
        if (shutdown_requested && current != TaskState::Running) {
            break;
        }

        if (current == TaskState::Running) {
            while (auto event = control.try_recv()) {
                if (!handle_control(*event)) {
                    shutdown_requested = true;
                }
            }
            if (lifecycle_.state() == TaskState::Running) {
                auto status = step();
                // task_not_running: a cancel from the operator thread won the race.
                if (core::errors::is_error(status) &&
                    core::errors::get_error(status).code != "task_not_running") {
                    emit(protocol::ErrorEvent{
                        core::errors::describe(core::errors::get_error(status))});
                }
            }
            continue;
        }

        auto event = control.recv_for(kControlPoll);
        if (!event) {
            if (control.is_closed()) {
                shutdown_requested = true;
            }
            continue;
        }
        if (!handle_control(*event)) {
            shutdown_requested = true;
        }
    }

    if (is_active(lifecycle_.state())) {
        FORGE_LOG_WARN("Shutting down with an unsettled task; cancelling it");
        auto status = cancel();
        if (core::errors::is_error(status)) {
            FORGE_LOG_WARN(core::errors::describe(core::errors::get_error(status)));
        }
    }
    FORGE_LOG_INFO("Task loop stopped");
    events_->close();
}

bool TaskEngine::handle_control(const protocol::ControlEvent& event) {
    core::errors::Status status = core::errors::ok();
    bool keep_running = true;
    std::visit(
        [&](const auto& command) {
            using Command = std::decay_t<decltype(command)>;
            if constexpr (std::is_same_v<Command, protocol::SendMessageCommand>) {
                status = start_task(command.text);
            } else if constexpr (std::is_same_v<Command, protocol::ApproveCommand>) {
                status = approve(command.call_id);
            } else if constexpr (std::is_same_v<Command, protocol::RejectCommand>) {
                status = reject(command.call_id, command.reason);
            } else if constexpr (std::is_same_v<Command, protocol::PauseCommand>) {
                status = pause();
            } else if constexpr (std::is_same_v<Command, protocol::ResumeCommand>) {
                status = resume();
            } else if constexpr (std::is_same_v<Command, protocol::CancelCommand>) {
                status = cancel();
            } else if constexpr (std::is_same_v<Command, protocol::ShutdownCommand>) {
                keep_running = false;
            }
        },
        event);
    if (core::errors::is_error(status)) {
        const auto& error = core::errors::get_error(status);
        FORGE_LOG_WARN(core::errors::describe(error));
        emit(protocol::ErrorEvent{core::errors::describe(error)});
    }
    return keep_running;
}

core::errors::Status TaskEngine::move_to(const TaskState next, const std::string& detail,
                                         const std::optional<std::string>& failure_reason) {
    auto moved = lifecycle_.transition(next, failure_reason);
    if (core::errors::is_error(moved)) {
        return core::errors::get_error(moved);
    }
    emit(protocol::TaskStateChangedEvent{next, detail});
    return core::errors::ok();
}

core::errors::Status TaskEngine::append_turn(protocol::Turn turn) {
    auto status = conversation_.append(std::move(turn));
    if (core::errors::is_error(status)) {
        FORGE_LOG_ERROR(core::errors::describe(core::errors::get_error(status)));
    }
    return status;
}

void TaskEngine::persist() {
    if (!deps_.session_store) {
        return;
    }
    auto status = deps_.session_store->save(lifecycle_.task_id(), conversation_.snapshot(),
                                            lifecycle_.state());
    if (core::errors::is_error(status)) {
        FORGE_LOG_WARN("Session save failed: " +
                       core::errors::describe(core::errors::get_error(status)));
    }
}

void TaskEngine::emit(protocol::EngineEvent event) {
    // Dropped silently once the operator side has gone.
    events_->send(std::move(event));
}

core::concurrency::CancelToken TaskEngine::current_token() const {
    std::lock_guard<std::mutex> lock(token_mutex_);
    return cancel_token_;
}

bool TaskEngine::cancel_requested() const {
    return core::concurrency::is_cancelled(current_token());
}

}  // namespace forge::runtime
