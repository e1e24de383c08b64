#pragma once
#include <string>
#include <variant>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "tool_contract.hpp"

namespace forge::protocol {

    struct UserMessage {
        std::string text;
    };

    // If the model decides to use tools, it populates tool_calls.
    // A vector means it can request 1 or 10 tools in the same turn.
    struct AssistantMessage {
        std::string text;
        std::vector<ToolCall> tool_calls;
    };

    // Engine-authored record of a failed step, e.g. a transport error.
    struct Notice {
        core::errors::ErrorCategory category = core::errors::ErrorCategory::Internal;
        std::string message;
    };

    using Turn = std::variant<UserMessage, AssistantMessage, ToolResult, Notice>;

    inline std::string turn_kind(const Turn& turn) {
        switch (turn.index()) {
            case 0: return "user";
            case 1: return "assistant";
            case 2: return "tool_result";
            case 3: return "notice";
            default: return "unknown";
        }
    }

    inline nlohmann::json turn_to_json(const Turn& turn) {
        nlohmann::json payload;
        payload["kind"] = turn_kind(turn);
        if (const auto* user = std::get_if<UserMessage>(&turn)) {
            payload["text"] = user->text;
        } else if (const auto* assistant = std::get_if<AssistantMessage>(&turn)) {
            payload["text"] = assistant->text;
            payload["tool_calls"] = nlohmann::json::array();
            for (const auto& call : assistant->tool_calls) {
                payload["tool_calls"].push_back(
                    {{"id", call.id}, {"name", call.name}, {"arguments", call.arguments}});
            }
        } else if (const auto* result = std::get_if<ToolResult>(&turn)) {
            payload["call_id"] = result->call_id;
            payload["is_error"] = result->is_error;
            payload["content"] = content_to_json(result->content);
        } else if (const auto* notice = std::get_if<Notice>(&turn)) {
            payload["category"] = core::errors::to_string(notice->category);
            payload["message"] = notice->message;
        }
        return payload;
    }

} // namespace forge::protocol
