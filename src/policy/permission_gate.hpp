#pragma once

#include <mutex>
#include <optional>
#include <string>
#include "core/errors/forge_errors.hpp"
#include "protocol/permission_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace forge::policy {

// Decides per call whether it runs, is refused, or needs the operator, and
// tracks the single outstanding approval of a task.
class PermissionGate {
public:
    explicit PermissionGate(protocol::PermissionMode mode);

    protocol::PermissionMode mode() const { return mode_; }

    // Pure over (mode, risk).
    protocol::PermissionDecision authorize(protocol::RiskClass risk) const;

    core::errors::Status begin_approval(const protocol::ToolCall& call);

    // Both resolve the pending call and hand it back.
    core::errors::Result<protocol::ToolCall> approve(const std::string& call_id);
    core::errors::Result<protocol::ToolCall> reject(const std::string& call_id);

    std::optional<protocol::ToolCall> pending() const;
    void clear();

private:
    core::errors::Result<protocol::ToolCall> resolve(const std::string& call_id,
                                                     const char* verb);

    const protocol::PermissionMode mode_;
    mutable std::mutex mutex_;
    std::optional<protocol::ToolCall> pending_;
};

}  // namespace forge::policy
