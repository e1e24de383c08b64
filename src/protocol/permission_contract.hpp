#pragma once

#include <optional>
#include <string>
#include <utility>

namespace forge::protocol {

enum class PermissionMode {
    FullAutonomous,
    ManualApproval,
    DenyAll
};

inline std::string to_string(const PermissionMode mode) {
    switch (mode) {
        case PermissionMode::FullAutonomous:
            return "full_autonomous";
        case PermissionMode::ManualApproval:
            return "manual_approval";
        case PermissionMode::DenyAll:
            return "deny_all";
        default:
            return "unknown";
    }
}

inline std::optional<PermissionMode> parse_permission_mode(const std::string& text) {
    if (text == "full_autonomous") return PermissionMode::FullAutonomous;
    if (text == "manual_approval") return PermissionMode::ManualApproval;
    if (text == "deny_all") return PermissionMode::DenyAll;
    return std::nullopt;
}

enum class DecisionKind {
    Allow,
    Deny,
    AskOperator
};

struct PermissionDecision {
    DecisionKind kind = DecisionKind::Deny;
    std::string reason;  // Deny only

    static PermissionDecision allow() { return {DecisionKind::Allow, ""}; }
    static PermissionDecision deny(std::string why) { return {DecisionKind::Deny, std::move(why)}; }
    static PermissionDecision ask_operator() { return {DecisionKind::AskOperator, ""}; }
};

}  // namespace forge::protocol
