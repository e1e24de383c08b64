#include "app/console_operator.hpp"

#include <istream>
#include <ostream>
#include <type_traits>
#include <variant>
#include "core/logging/logger.hpp"
#include "runtime/task_engine.hpp"

namespace forge::app {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

}  // namespace

ConsoleOperator::ConsoleOperator(runtime::TaskEngine& engine,
                                 core::concurrency::Channel<protocol::ControlEvent>& control,
                                 std::istream& in, std::ostream& out)
    : engine_(engine), control_(control), in_(in), out_(out) {}

core::errors::Result<protocol::ControlEvent> ConsoleOperator::parse_command(
    const std::string& line, const std::optional<std::string>& pending_call_id) {
    const std::string text = trim(line);
    if (text.empty()) {
        return ForgeError{ErrorCategory::Input, "Empty input", "empty_input"};
    }
    if (text[0] != '/') {
        return protocol::ControlEvent{protocol::SendMessageCommand{text}};
    }

    const auto space = text.find(' ');
    const std::string verb = text.substr(0, space);
    const std::string rest = space == std::string::npos ? "" : trim(text.substr(space + 1));

    if (verb == "/approve" || verb == "/reject") {
        if (!pending_call_id) {
            return ForgeError{ErrorCategory::Input, "Nothing is waiting for approval",
                              "no_pending_approval"};
        }
        if (verb == "/approve") {
            return protocol::ControlEvent{protocol::ApproveCommand{*pending_call_id}};
        }
        return protocol::ControlEvent{
            protocol::RejectCommand{*pending_call_id, rest.empty() ? "Rejected by operator" : rest}};
    }
    if (verb == "/pause") return protocol::ControlEvent{protocol::PauseCommand{}};
    if (verb == "/resume") return protocol::ControlEvent{protocol::ResumeCommand{}};
    if (verb == "/cancel") return protocol::ControlEvent{protocol::CancelCommand{}};
    if (verb == "/quit") return protocol::ControlEvent{protocol::ShutdownCommand{}};

    return ForgeError{ErrorCategory::Input, "Unknown command: " + verb, "unknown_command",
                      "Commands: /approve, /reject [reason], /pause, /resume, /cancel, /quit"};
}

std::string ConsoleOperator::render(const protocol::EngineEvent& event) {
    return std::visit(
        [](const auto& e) -> std::string {
            using Event = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<Event, protocol::TextDeltaEvent>) {
                return e.delta_text;
            } else if constexpr (std::is_same_v<Event, protocol::TaskStateChangedEvent>) {
                return "\n[state] " + protocol::to_string(e.state) +
                       (e.detail.empty() ? "" : " (" + e.detail + ")") + "\n";
            } else if constexpr (std::is_same_v<Event, protocol::ToolStartedEvent>) {
                return "\n[tool] " + e.tool_name + " started (" + e.call_id + ")\n";
            } else if constexpr (std::is_same_v<Event, protocol::ToolOutputEvent>) {
                return e.text;
            } else if constexpr (std::is_same_v<Event, protocol::ToolFinishedEvent>) {
                return "[tool] " + e.call_id + (e.is_error ? " failed: " : " done: ") +
                       e.summary + "\n";
            } else if constexpr (std::is_same_v<Event, protocol::ApprovalRequestedEvent>) {
                return "\n[approval] " + e.call.name + " (" + protocol::to_string(e.risk) +
                       ") " + e.call.arguments.dump() +
                       "\n           /approve or /reject [reason]\n";
            } else if constexpr (std::is_same_v<Event, protocol::ErrorEvent>) {
                return "\n[error] " + e.message + "\n";
            } else {
                return "";
            }
        },
        event);
}

void ConsoleOperator::render_events() {
    while (auto event = engine_.events().recv()) {
        if (const auto* approval = std::get_if<protocol::ApprovalRequestedEvent>(&*event)) {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_call_id_ = approval->call.id;
        } else if (const auto* changed = std::get_if<protocol::TaskStateChangedEvent>(&*event)) {
            if (changed->state != protocol::TaskState::WaitingApproval) {
                std::lock_guard<std::mutex> lock(mutex_);
                pending_call_id_.reset();
            }
        }
        out_ << render(*event) << std::flush;
    }
}

void ConsoleOperator::read_commands() {
    std::string line;
    while (std::getline(in_, line)) {
        if (trim(line).empty()) {
            continue;
        }
        std::optional<std::string> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending = pending_call_id_;
        }
        auto parsed = parse_command(line, pending);
        if (core::errors::is_error(parsed)) {
            const auto& error = core::errors::get_error(parsed);
            out_ << "[error] " << error.message
                 << (error.hint.empty() ? "" : "\n        " + error.hint) << "\n" << std::flush;
            continue;
        }
        const auto& event = core::errors::get_value(parsed);
        if (std::holds_alternative<protocol::CancelCommand>(event)) {
            // Must reach a step that is blocked on the model or a tool.
            auto status = engine_.cancel();
            if (core::errors::is_error(status)) {
                out_ << "[error] " << core::errors::get_error(status).message << "\n" << std::flush;
            }
            continue;
        }
        if (std::holds_alternative<protocol::ShutdownCommand>(event)) {
            auto status = engine_.cancel();
            if (core::errors::is_error(status)) {
                FORGE_LOG_DEBUG(core::errors::describe(core::errors::get_error(status)));
            }
            break;
        }
        control_.send(event);
    }
    FORGE_LOG_DEBUG("Operator input closed");
    control_.send(protocol::ShutdownCommand{});
}

}  // namespace forge::app
