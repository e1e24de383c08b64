#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace forge::policy {

// Case-insensitive substrings that raise a shell command's risk class.
struct CommandPolicy {
    std::vector<std::string> destructive_substrings = {
        "sudo",
        "rm -rf",
        "rm -fr",
        "shutdown",
        "reboot",
        "mkfs",
        "dd if=",
        ":(){ :|:& };:",
        "chmod -r",
        "chown -r",
        "git push --force",
        "git push -f",
        "git reset --hard",
        "git clean -f"};
    std::vector<std::string> network_substrings = {
        "curl ",
        "wget ",
        "npm install",
        "npm i ",
        "yarn add",
        "pnpm add",
        "pip install",
        "pip3 install",
        "cargo install",
        "git clone",
        "git fetch",
        "git pull",
        "git push",
        "ssh ",
        "scp "};
};

class PolicyGuard {
public:
    explicit PolicyGuard(CommandPolicy command_policy = {});

    // Resolves target_path against the root and rejects anything that lands
    // outside it once `..` and symlinks are resolved.
    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    core::errors::Result<std::string> validate_command(const std::string& command) const;

    // Safe is never returned; an unremarkable command is Mutating.
    protocol::RiskClass classify_command(const std::string& command) const;

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static std::string lowercase(std::string value);
    static bool contains_any(const std::string& lowered,
                             const std::vector<std::string>& needles);

    CommandPolicy command_policy_;
};

}  // namespace forge::policy
