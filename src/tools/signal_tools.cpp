#include "tools/signal_tools.hpp"

#include <utility>
#include "tools/tool_registry.hpp"

namespace forge::tools {

using nlohmann::json;
using protocol::ToolResult;

core::errors::Result<ToolResult> AttemptCompletionTool::invoke(const ToolContext& context,
                                                               const json& arguments) {
    std::string text = arguments.value("result", "");
    const std::string command = arguments.value("command", "");
    if (!command.empty()) {
        text += "\n\nTo see the result: " + command;
    }
    return ToolResult::text(context.call_id, text);
}

core::errors::Result<ToolResult> AskQuestionTool::invoke(const ToolContext& context,
                                                         const json& arguments) {
    std::string text = arguments.value("question", "");
    if (arguments.contains("options")) {
        for (const auto& option : arguments.at("options")) {
            text += "\n- " + option.get<std::string>();
        }
    }
    return ToolResult::text(context.call_id, text);
}

core::errors::Status register_signal_tools(ToolRegistry& registry) {
    ToolDescriptor completion;
    completion.name = "attempt_completion";
    completion.description =
        "Present the final result once the task is done. Ends the task.";
    completion.input_schema = {
        {"type", "object"},
        {"properties",
         {{"result", {{"type", "string"}}},
          {"command",
           {{"type", "string"}, {"description", "Optional command that demonstrates the result"}}}}},
        {"required", json::array({"result"})},
        {"additionalProperties", false}};
    completion.risk_class = protocol::RiskClass::Safe;
    completion.handler = std::make_shared<AttemptCompletionTool>();
    completion.terminal_signal = true;

    ToolDescriptor question;
    question.name = "ask_question";
    question.description =
        "Ask the operator a question when information is missing. Ends the turn until they reply.";
    question.input_schema = {
        {"type", "object"},
        {"properties",
         {{"question", {{"type", "string"}}},
          {"options", {{"type", "array"}, {"items", {{"type", "string"}}}}}}},
        {"required", json::array({"question"})},
        {"additionalProperties", false}};
    question.risk_class = protocol::RiskClass::Safe;
    question.handler = std::make_shared<AskQuestionTool>();
    question.terminal_signal = true;

    auto status = registry.register_tool(std::move(completion));
    if (core::errors::is_error(status)) {
        return status;
    }
    return registry.register_tool(std::move(question));
}

}  // namespace forge::tools
