#include "policy/permission_gate.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace forge::policy {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using protocol::PermissionDecision;
using protocol::PermissionMode;
using protocol::RiskClass;

PermissionGate::PermissionGate(const PermissionMode mode) : mode_(mode) {}

PermissionDecision PermissionGate::authorize(const RiskClass risk) const {
    switch (mode_) {
        case PermissionMode::FullAutonomous:
            return PermissionDecision::allow();
        case PermissionMode::DenyAll:
            if (risk == RiskClass::Safe) {
                return PermissionDecision::allow();
            }
            return PermissionDecision::deny("Permission mode deny_all refuses " +
                                            protocol::to_string(risk) + " tools.");
        case PermissionMode::ManualApproval:
            if (risk == RiskClass::Safe) {
                return PermissionDecision::allow();
            }
            return PermissionDecision::ask_operator();
        default:
            return PermissionDecision::deny("Unknown permission mode.");
    }
}

core::errors::Status PermissionGate::begin_approval(const protocol::ToolCall& call) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_) {
        return ForgeError{ErrorCategory::Internal,
                          "Call " + pending_->id + " is already awaiting approval.",
                          "approval_pending"};
    }
    pending_ = call;
    FORGE_LOG_INFO("Awaiting operator approval for " + call.name + " (" + call.id + ")");
    return core::errors::ok();
}

core::errors::Result<protocol::ToolCall> PermissionGate::approve(const std::string& call_id) {
    return resolve(call_id, "approved");
}

core::errors::Result<protocol::ToolCall> PermissionGate::reject(const std::string& call_id) {
    return resolve(call_id, "rejected");
}

core::errors::Result<protocol::ToolCall> PermissionGate::resolve(const std::string& call_id,
                                                                 const char* verb) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_ || pending_->id != call_id) {
        return ForgeError{ErrorCategory::Input,
                          "No pending approval for call " + call_id,
                          "unknown_approval"};
    }
    protocol::ToolCall call = std::move(*pending_);
    pending_.reset();
    FORGE_LOG_INFO("Operator " + std::string(verb) + " " + call.name + " (" + call.id + ")");
    return call;
}

std::optional<protocol::ToolCall> PermissionGate::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

void PermissionGate::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.reset();
}

}  // namespace forge::policy
