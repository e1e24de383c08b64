#pragma once

#include <filesystem>
#include <future>
#include "core/concurrency/cancel_token.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_handler.hpp"
#include "tools/tool_registry.hpp"
#include "tools/workspace_locks.hpp"

namespace forge::process {
class ProcessSupervisor;
}

namespace forge::tools {

struct DispatchOptions {
    core::concurrency::CancelToken cancel;
    OutputCallback on_output;
};

// Turns an authorized ToolCall into a ToolResult: resolves the descriptor,
// validates arguments, holds the call's workspace lock and runs the handler.
// Every failure is folded into an error ToolResult; nothing escapes.
class Dispatcher {
public:
    Dispatcher(const ToolRegistry& registry, WorkspaceLocks& locks,
               process::ProcessSupervisor* processes, std::filesystem::path workspace_root);

    protocol::ToolResult dispatch(const protocol::ToolCall& call, const DispatchOptions& options);

    // Reserves the lock before returning so reservations follow call order;
    // the handler itself runs on its own thread.
    std::future<protocol::ToolResult> launch(const protocol::ToolCall& call,
                                             const DispatchOptions& options);

    LockScope lock_scope_for(const ToolDescriptor& descriptor,
                             const nlohmann::json& arguments) const;

private:
    const ToolRegistry& registry_;
    WorkspaceLocks& locks_;
    process::ProcessSupervisor* processes_;
    std::filesystem::path workspace_root_;
};

// Error ToolResult carrying the category and code of a ForgeError.
protocol::ToolResult error_result(const std::string& call_id,
                                  const core::errors::ForgeError& error);

}  // namespace forge::tools
