#include "session/conversation.hpp"

#include <utility>

namespace forge::session {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

core::errors::Status Conversation::append(protocol::Turn turn) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (const auto* assistant = std::get_if<protocol::AssistantMessage>(&turn)) {
        std::set<std::string> seen;
        for (const auto& call : assistant->tool_calls) {
            if (call.id.empty()) {
                return ForgeError{ErrorCategory::Internal, "Tool call without an id",
                                  "conversation_invariant"};
            }
            if (issued_call_ids_.count(call.id) != 0 || !seen.insert(call.id).second) {
                return ForgeError{ErrorCategory::Internal,
                                  "Tool call id reused: " + call.id, "conversation_invariant"};
            }
        }
        for (const auto& call : assistant->tool_calls) {
            issued_call_ids_.insert(call.id);
            call_order_.push_back(call.id);
        }
    } else if (const auto* result = std::get_if<protocol::ToolResult>(&turn)) {
        if (issued_call_ids_.count(result->call_id) == 0) {
            return ForgeError{ErrorCategory::Internal,
                              "Tool result for unknown call: " + result->call_id,
                              "conversation_invariant"};
        }
        if (!resolved_call_ids_.insert(result->call_id).second) {
            return ForgeError{ErrorCategory::Internal,
                              "Tool call already answered: " + result->call_id,
                              "conversation_invariant"};
        }
    }

    turns_.push_back(std::move(turn));
    return core::errors::ok();
}

std::vector<protocol::Turn> Conversation::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_;
}

std::size_t Conversation::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.size();
}

std::vector<std::string> Conversation::unresolved_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> pending;
    for (const auto& id : call_order_) {
        if (resolved_call_ids_.count(id) == 0) {
            pending.push_back(id);
        }
    }
    return pending;
}

bool Conversation::is_settled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolved_call_ids_.size() == issued_call_ids_.size();
}

bool Conversation::has_call(const std::string& call_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return issued_call_ids_.count(call_id) != 0;
}

}  // namespace forge::session
