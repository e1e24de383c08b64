#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include "task_state.hpp"
#include "tool_contract.hpp"

namespace forge::protocol {

    enum class OutputStream {
        Stdout,
        Stderr
    };

    inline std::string to_string(const OutputStream stream) {
        return stream == OutputStream::Stdout ? "stdout" : "stderr";
    }

    // Engine -> operator lifecycle events
    struct TaskStateChangedEvent { TaskState state; std::string detail; };
    struct TextDeltaEvent { std::string delta_text; };
    struct ToolStartedEvent { std::string call_id; std::string tool_name; };
    struct ToolOutputEvent {
        std::string call_id;
        std::uint64_t process_id = 0;
        OutputStream stream = OutputStream::Stdout;
        std::string text;
    };
    struct ToolFinishedEvent { std::string call_id; bool is_error; std::string summary; };
    struct ApprovalRequestedEvent { ToolCall call; RiskClass risk; };
    struct ErrorEvent { std::string message; };

    // std::variant means "EngineEvent" is exactly ONE of the types listed below.
    using EngineEvent = std::variant<
        TaskStateChangedEvent,
        TextDeltaEvent,
        ToolStartedEvent,
        ToolOutputEvent,
        ToolFinishedEvent,
        ApprovalRequestedEvent,
        ErrorEvent
    >;

    // Operator -> engine control events
    struct SendMessageCommand { std::string text; };
    struct ApproveCommand { std::string call_id; };
    struct RejectCommand { std::string call_id; std::string reason; };
    struct PauseCommand {};
    struct ResumeCommand {};
    struct CancelCommand {};
    struct ShutdownCommand {};

    using ControlEvent = std::variant<
        SendMessageCommand,
        ApproveCommand,
        RejectCommand,
        PauseCommand,
        ResumeCommand,
        CancelCommand,
        ShutdownCommand
    >;

} // namespace forge::protocol
