#pragma once

#include "core/errors/forge_errors.hpp"
#include "tools/tool_handler.hpp"

namespace forge::tools {

class ToolRegistry;

// attempt_completion: the model reports the task finished.
class AttemptCompletionTool : public ToolHandler {
public:
    core::errors::Result<protocol::ToolResult> invoke(const ToolContext& context,
                                                      const nlohmann::json& arguments) override;
};

// ask_question: the model hands control back to the operator.
class AskQuestionTool : public ToolHandler {
public:
    core::errors::Result<protocol::ToolResult> invoke(const ToolContext& context,
                                                      const nlohmann::json& arguments) override;
};

core::errors::Status register_signal_tools(ToolRegistry& registry);

}  // namespace forge::tools
