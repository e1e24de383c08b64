#include "tools/command_tools.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/tool_registry.hpp"

namespace forge::tools {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using nlohmann::json;
using process::ProcessId;
using process::ProcessSnapshot;
using protocol::ToolResult;

namespace {

// Follow-up calls give a just-fed process a moment to answer.
constexpr auto kInputSettle = std::chrono::milliseconds(300);

core::errors::Result<process::ProcessSupervisor*> supervisor_of(const ToolContext& context) {
    if (context.processes == nullptr) {
        return ForgeError{ErrorCategory::Internal, "No process supervisor attached.",
                          "no_supervisor"};
    }
    return context.processes;
}

ToolResult snapshot_result(const std::string& call_id, const ProcessSnapshot& snapshot) {
    return ToolResult::text(call_id, command_result_json(snapshot).dump(2));
}

void release_quietly(process::ProcessSupervisor& supervisor, const ProcessId id) {
    auto released = supervisor.release(id);
    if (core::errors::is_error(released)) {
        FORGE_LOG_WARN(core::errors::describe(core::errors::get_error(released)));
    }
}

// A terminal snapshot is the last thing anyone learns about the process.
ToolResult report_and_release(process::ProcessSupervisor& supervisor, const std::string& call_id,
                              const ProcessSnapshot& snapshot) {
    if (process::is_terminal(snapshot.state)) {
        release_quietly(supervisor, snapshot.id);
    }
    return snapshot_result(call_id, snapshot);
}

json process_id_schema() {
    return {{"type", "integer"},
            {"minimum", 1},
            {"description", "managed_process_id from execute_command"}};
}

core::errors::Result<ProcessId> process_id_argument(const json& arguments) {
    const ForgeError invalid{ErrorCategory::Validation,
                             "process_id must be a positive integer", "invalid_arguments"};
    if (!arguments.contains("process_id")) {
        return invalid;
    }
    const auto& value = arguments.at("process_id");
    if (value.is_number_unsigned()) {
        return value.get<ProcessId>();
    }
    if (value.is_number_integer()) {
        const auto signed_id = value.get<std::int64_t>();
        if (signed_id < 0) {
            return invalid;
        }
        return static_cast<ProcessId>(signed_id);
    }
    if (value.is_number_float()) {
        // Integral doubles pass schema validation; only exact ones map to an id.
        constexpr double kExactLimit = 9007199254740992.0;
        const double number = value.get<double>();
        if (!std::isfinite(number) || number < 0.0 || number >= kExactLimit ||
            std::floor(number) != number) {
            return invalid;
        }
        return static_cast<ProcessId>(number);
    }
    return invalid;
}

}  // namespace

json command_result_json(const ProcessSnapshot& snapshot) {
    json out;
    if (process::is_terminal(snapshot.state) && snapshot.exit_code) {
        out["exit_code"] = *snapshot.exit_code;
    } else {
        out["exit_code"] = nullptr;
    }
    out["stdout_tail"] = snapshot.stdout_tail;
    out["stderr_tail"] = snapshot.stderr_tail;
    out["managed_process_id"] = snapshot.id;
    out["state"] = process::to_string(snapshot.state);
    return out;
}

core::errors::Result<std::optional<std::chrono::milliseconds>> duration_argument(
    const json& arguments, const std::string& key, const std::chrono::milliseconds limit) {
    if (!arguments.contains(key)) {
        return std::optional<std::chrono::milliseconds>();
    }
    const auto& value = arguments.at(key);
    const double requested = value.is_number() ? value.get<double>() : -1.0;
    if (!std::isfinite(requested) || requested < 0.0) {
        return ForgeError{ErrorCategory::Validation,
                          key + " must be a non-negative number of milliseconds",
                          "invalid_duration"};
    }
    if (requested >= static_cast<double>(limit.count())) {
        return std::optional<std::chrono::milliseconds>(limit);
    }
    return std::optional<std::chrono::milliseconds>(
        std::chrono::milliseconds(static_cast<std::int64_t>(requested)));
}

ExecuteCommandTool::ExecuteCommandTool(CommandToolOptions options) : options_(options) {}

core::errors::Result<ToolResult> ExecuteCommandTool::invoke(const ToolContext& context,
                                                            const json& arguments) {
    auto supervisor_result = supervisor_of(context);
    if (core::errors::is_error(supervisor_result)) {
        return core::errors::get_error(supervisor_result);
    }
    process::ProcessSupervisor& supervisor = *core::errors::get_value(supervisor_result);

    auto command = guard_.validate_command(arguments.value("command", ""));
    if (core::errors::is_error(command)) {
        return core::errors::get_error(command);
    }
    if (core::concurrency::is_cancelled(context.cancel)) {
        return ForgeError{ErrorCategory::Execution, "Command cancelled before start.",
                          "cancelled"};
    }

    process::SpawnRequest request;
    request.program = "/bin/sh";
    request.args = {"-c", core::errors::get_value(command)};
    request.cwd = context.workspace_root;
    request.interactive = arguments.value("interactive", false);
    const auto on_output = context.on_output;
    if (on_output) {
        request.sink = [on_output](const process::OutputChunk& chunk) {
            on_output(chunk.process_id, chunk.stream, chunk.text);
        };
    }

    auto timeout = duration_argument(arguments, "timeout_ms", options_.max_duration);
    if (core::errors::is_error(timeout)) {
        return core::errors::get_error(timeout);
    }
    const auto timeout_ms = core::errors::get_value(timeout);

    auto spawned = supervisor.spawn(std::move(request));
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    const ProcessId id = core::errors::get_value(spawned);

    if (timeout_ms && timeout_ms->count() > 0) {
        auto armed = supervisor.timeout(id, *timeout_ms);
        if (core::errors::is_error(armed)) {
            return core::errors::get_error(armed);
        }
    }

    auto waited = supervisor.wait_for(id, options_.long_running_threshold, context.cancel);
    if (core::errors::is_error(waited)) {
        return core::errors::get_error(waited);
    }
    ProcessSnapshot snapshot = core::errors::take_value(std::move(waited));

    if (core::concurrency::is_cancelled(context.cancel) && !process::is_terminal(snapshot.state)) {
        auto killed = supervisor.kill(id);
        if (core::errors::is_error(killed)) {
            FORGE_LOG_WARN("Kill after cancel failed: " +
                           core::errors::describe(core::errors::get_error(killed)));
        } else {
            release_quietly(supervisor, id);
        }
        return ForgeError{ErrorCategory::Execution,
                          "Command cancelled; process " + std::to_string(id) + " killed.",
                          "cancelled"};
    }

    if (!process::is_terminal(snapshot.state)) {
        FORGE_LOG_INFO("Command still running after threshold; process " + std::to_string(id) +
                       " keeps streaming");
        return snapshot_result(context.call_id, snapshot);
    }

    // Finished within the threshold: nothing will ask about it again.
    release_quietly(supervisor, id);
    ToolResult result = snapshot_result(context.call_id, snapshot);
    result.is_error = snapshot.state != process::ProcessState::Completed;
    return result;
}

GetCommandResultTool::GetCommandResultTool(CommandToolOptions options) : options_(options) {}

core::errors::Result<ToolResult> GetCommandResultTool::invoke(const ToolContext& context,
                                                              const json& arguments) {
    auto supervisor_result = supervisor_of(context);
    if (core::errors::is_error(supervisor_result)) {
        return core::errors::get_error(supervisor_result);
    }
    process::ProcessSupervisor& supervisor = *core::errors::get_value(supervisor_result);

    auto parsed_id = process_id_argument(arguments);
    if (core::errors::is_error(parsed_id)) {
        return core::errors::get_error(parsed_id);
    }
    const ProcessId id = core::errors::get_value(parsed_id);
    auto wait = duration_argument(arguments, "wait_ms", options_.max_duration);
    if (core::errors::is_error(wait)) {
        return core::errors::get_error(wait);
    }
    const auto wait_ms = core::errors::get_value(wait).value_or(std::chrono::milliseconds(0));
    auto snapshot = supervisor.wait_for(id, wait_ms, context.cancel);
    if (core::errors::is_error(snapshot)) {
        return core::errors::get_error(snapshot);
    }
    return report_and_release(supervisor, context.call_id, core::errors::get_value(snapshot));
}

core::errors::Result<ToolResult> SendCommandInputTool::invoke(const ToolContext& context,
                                                              const json& arguments) {
    auto supervisor_result = supervisor_of(context);
    if (core::errors::is_error(supervisor_result)) {
        return core::errors::get_error(supervisor_result);
    }
    process::ProcessSupervisor& supervisor = *core::errors::get_value(supervisor_result);

    auto parsed_id = process_id_argument(arguments);
    if (core::errors::is_error(parsed_id)) {
        return core::errors::get_error(parsed_id);
    }
    const ProcessId id = core::errors::get_value(parsed_id);
    std::string input = arguments.value("input", "");
    if (arguments.value("append_newline", true)) {
        input += "\n";
    }
    auto sent = supervisor.send_input(id, input);
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }
    auto snapshot = supervisor.wait_for(id, kInputSettle, context.cancel);
    if (core::errors::is_error(snapshot)) {
        return core::errors::get_error(snapshot);
    }
    return report_and_release(supervisor, context.call_id, core::errors::get_value(snapshot));
}

core::errors::Result<ToolResult> TerminateCommandTool::invoke(const ToolContext& context,
                                                              const json& arguments) {
    auto supervisor_result = supervisor_of(context);
    if (core::errors::is_error(supervisor_result)) {
        return core::errors::get_error(supervisor_result);
    }
    process::ProcessSupervisor& supervisor = *core::errors::get_value(supervisor_result);

    auto parsed_id = process_id_argument(arguments);
    if (core::errors::is_error(parsed_id)) {
        return core::errors::get_error(parsed_id);
    }
    const ProcessId id = core::errors::get_value(parsed_id);
    auto killed = supervisor.kill(id);
    if (core::errors::is_error(killed)) {
        return core::errors::get_error(killed);
    }
    auto snapshot = supervisor.snapshot(id);
    if (core::errors::is_error(snapshot)) {
        return core::errors::get_error(snapshot);
    }
    return report_and_release(supervisor, context.call_id, core::errors::get_value(snapshot));
}

core::errors::Status register_command_tools(ToolRegistry& registry,
                                            const CommandToolOptions options) {
    auto guard = std::make_shared<policy::PolicyGuard>();

    ToolDescriptor execute;
    execute.name = "execute_command";
    execute.description =
        "Run a shell command in the workspace root. Commands that outlive the long-running "
        "threshold keep running; their output streams and the result carries "
        "managed_process_id with exit_code null.";
    execute.input_schema = {
        {"type", "object"},
        {"properties",
         {{"command", {{"type", "string"}, {"description", "Shell command line"}}},
          {"interactive",
           {{"type", "boolean"}, {"description", "Keep stdin open for send_command_input"}}},
          {"timeout_ms",
           {{"type", "integer"},
            {"minimum", 0},
            {"description", "Kill the command after this many ms (capped)"}}}}},
        {"required", json::array({"command"})},
        {"additionalProperties", false}};
    execute.risk_class = protocol::RiskClass::Mutating;
    execute.classifier = [guard](const json& arguments) {
        return guard->classify_command(arguments.value("command", ""));
    };
    execute.handler = std::make_shared<ExecuteCommandTool>(options);
    execute.lock_mode = LockMode::Workspace;

    ToolDescriptor get_result;
    get_result.name = "get_command_result";
    get_result.description = "Poll a managed process for its state and output tails.";
    get_result.input_schema = {
        {"type", "object"},
        {"properties",
         {{"process_id", process_id_schema()},
          {"wait_ms",
           {{"type", "integer"},
            {"minimum", 0},
            {"description", "Wait up to this many ms for exit (capped)"}}}}},
        {"required", json::array({"process_id"})},
        {"additionalProperties", false}};
    get_result.risk_class = protocol::RiskClass::Safe;
    get_result.handler = std::make_shared<GetCommandResultTool>(options);

    ToolDescriptor send_input;
    send_input.name = "send_command_input";
    send_input.description = "Write a line to the stdin of an interactive managed process.";
    send_input.input_schema = {
        {"type", "object"},
        {"properties",
         {{"process_id", process_id_schema()},
          {"input", {{"type", "string"}}},
          {"append_newline", {{"type", "boolean"}}}}},
        {"required", json::array({"process_id", "input"})},
        {"additionalProperties", false}};
    send_input.risk_class = protocol::RiskClass::Mutating;
    send_input.handler = std::make_shared<SendCommandInputTool>();

    ToolDescriptor terminate;
    terminate.name = "terminate_command";
    terminate.description = "Stop a managed process (SIGTERM, then SIGKILL after the grace period).";
    terminate.input_schema = {{"type", "object"},
                              {"properties", {{"process_id", process_id_schema()}}},
                              {"required", json::array({"process_id"})},
                              {"additionalProperties", false}};
    terminate.risk_class = protocol::RiskClass::Mutating;
    terminate.handler = std::make_shared<TerminateCommandTool>();

    for (auto* descriptor : {&execute, &get_result, &send_input, &terminate}) {
        auto status = registry.register_tool(std::move(*descriptor));
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    return core::errors::ok();
}

}  // namespace forge::tools
