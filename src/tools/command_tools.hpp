#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "core/errors/forge_errors.hpp"
#include "policy/policy_guard.hpp"
#include "process/process_supervisor.hpp"
#include "tools/tool_handler.hpp"

namespace forge::tools {

class ToolRegistry;

struct CommandToolOptions {
    std::chrono::milliseconds long_running_threshold{10000};
    // Upper bound for model-supplied timeout_ms and wait_ms.
    std::chrono::milliseconds max_duration{3600000};
};

// {exit_code | null, stdout_tail, stderr_tail, managed_process_id, state}
nlohmann::json command_result_json(const process::ProcessSnapshot& snapshot);

// Reads a non-negative millisecond count, capped at limit. Absent -> nullopt.
core::errors::Result<std::optional<std::chrono::milliseconds>> duration_argument(
    const nlohmann::json& arguments, const std::string& key, std::chrono::milliseconds limit);

// Runs a shell command through the supervisor. A command still running
// after the long-running threshold is left streaming and reported with a
// null exit code; the managed id lets later calls poll, feed or kill it.
class ExecuteCommandTool : public ToolHandler {
public:
    explicit ExecuteCommandTool(CommandToolOptions options = {});

    core::errors::Result<protocol::ToolResult> invoke(const ToolContext& context,
                                                      const nlohmann::json& arguments) override;

private:
    CommandToolOptions options_;
    policy::PolicyGuard guard_;
};

class GetCommandResultTool : public ToolHandler {
public:
    explicit GetCommandResultTool(CommandToolOptions options = {});

    core::errors::Result<protocol::ToolResult> invoke(const ToolContext& context,
                                                      const nlohmann::json& arguments) override;

private:
    CommandToolOptions options_;
};

class SendCommandInputTool : public ToolHandler {
public:
    core::errors::Result<protocol::ToolResult> invoke(const ToolContext& context,
                                                      const nlohmann::json& arguments) override;
};

class TerminateCommandTool : public ToolHandler {
public:
    core::errors::Result<protocol::ToolResult> invoke(const ToolContext& context,
                                                      const nlohmann::json& arguments) override;
};

core::errors::Status register_command_tools(ToolRegistry& registry,
                                            CommandToolOptions options = {});

}  // namespace forge::tools
