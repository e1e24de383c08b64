#include "policy/policy_guard.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace forge::policy {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

PolicyGuard::PolicyGuard(CommandPolicy command_policy)
    : command_policy_(std::move(command_policy)) {}

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        // A trailing separator shows up as an empty element.
        if (root_it->empty()) {
            continue;
        }
        if (*root_it != *child_it) {
            return false;
        }
    }
    for (; root_it != root.end(); ++root_it) {
        if (!root_it->empty()) {
            return false;
        }
    }
    return true;
}

std::string PolicyGuard::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

bool PolicyGuard::contains_any(const std::string& lowered,
                               const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (lowered.find(lowercase(needle)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::exists(workspace_root, ec) || ec) {
        return ForgeError{ErrorCategory::Input,
                          "Workspace root does not exist: " + workspace_root.string(),
                          "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return ForgeError{ErrorCategory::Input,
                          "Workspace root is not a directory: " + workspace_root.string(),
                          "invalid_workspace_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Input,
                          "Unable to resolve workspace root: " + workspace_root.string(),
                          "invalid_workspace_root"};
    }

    if (target_path.empty()) {
        return ForgeError{ErrorCategory::Validation, "Path cannot be empty.", "invalid_path"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    // weakly_canonical follows symlinks for the existing prefix and folds `..`
    // lexically for the rest, so both escapes are caught below.
    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Validation,
                          "Unable to resolve target path: " + target_path.string(),
                          "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return ForgeError{ErrorCategory::Sandbox,
                          "Path escapes workspace root: " + target_path.string(),
                          "path_outside_workspace",
                          "Use a path relative to the workspace root."};
    }

    return canonical_candidate;
}

core::errors::Result<std::string> PolicyGuard::validate_command(
    const std::string& command) const {
    const auto first = command.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return ForgeError{ErrorCategory::Validation, "Command cannot be empty.",
                          "empty_command"};
    }
    if (command.find('\0') != std::string::npos) {
        return ForgeError{ErrorCategory::Validation, "Command contains a NUL byte.",
                          "invalid_command"};
    }
    return command;
}

protocol::RiskClass PolicyGuard::classify_command(const std::string& command) const {
    const std::string lowered = lowercase(command) + " ";
    if (contains_any(lowered, command_policy_.destructive_substrings)) {
        return protocol::RiskClass::Destructive;
    }
    if (contains_any(lowered, command_policy_.network_substrings)) {
        return protocol::RiskClass::Network;
    }
    return protocol::RiskClass::Mutating;
}

}  // namespace forge::policy
