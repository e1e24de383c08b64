#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/concurrency/cancel_token.hpp"
#include "core/errors/forge_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace forge::process {
class ProcessSupervisor;
}

namespace forge::tools {

// Partial output of a running call, e.g. a command's streamed stdout.
using OutputCallback =
    std::function<void(std::uint64_t process_id, protocol::OutputStream stream,
                       const std::string& text)>;

struct ToolContext {
    std::filesystem::path workspace_root;
    core::concurrency::CancelToken cancel;
    std::string call_id;
    OutputCallback on_output;
    process::ProcessSupervisor* processes = nullptr;
};

// Uniform (context, arguments) -> result contract every tool implements.
// Arguments have already passed schema validation when invoke runs.
class ToolHandler {
public:
    virtual ~ToolHandler() = default;

    virtual core::errors::Result<protocol::ToolResult> invoke(
        const ToolContext& context, const nlohmann::json& arguments) = 0;
};

}  // namespace forge::tools
