#pragma once

#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "protocol/message_contract.hpp"

namespace forge::session {

// Append-only turn log. Every ToolResult must answer exactly one earlier
// tool call, and each call is answered at most once.
class Conversation {
public:
    core::errors::Status append(protocol::Turn turn);

    std::vector<protocol::Turn> snapshot() const;
    std::size_t size() const;

    // Call ids from assistant turns that have no result yet, in call order.
    std::vector<std::string> unresolved_calls() const;
    bool is_settled() const;
    bool has_call(const std::string& call_id) const;

private:
    mutable std::mutex mutex_;
    std::vector<protocol::Turn> turns_;
    std::set<std::string> issued_call_ids_;
    std::set<std::string> resolved_call_ids_;
    std::vector<std::string> call_order_;
};

}  // namespace forge::session
