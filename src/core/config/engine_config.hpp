#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "protocol/permission_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace forge::core::config {

struct RetryPolicy {
    std::uint32_t max_attempts = 3;
    std::uint32_t initial_backoff_ms = 500;
    std::uint32_t max_backoff_ms = 8000;
};

// Externally-hosted tool server reached over stdio.
struct RemoteToolServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    protocol::RiskClass risk_class = protocol::RiskClass::Network;
};

struct EngineConfig {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    protocol::PermissionMode permission_mode = protocol::PermissionMode::ManualApproval;
    std::uint32_t long_running_threshold_ms = 10000;
    std::uint32_t kill_grace_ms = 2000;
    std::uint32_t max_command_timeout_ms = 3600000;  // caps timeout_ms and wait_ms
    std::uint32_t output_tail_bytes = 16384;
    std::uint32_t max_turns = 50;
    RetryPolicy model_retry;
    std::vector<RemoteToolServerConfig> remote_tools;
    std::string log_level = "info";
};

// Reads a JSON config file; absent keys keep their defaults.
errors::Result<EngineConfig> load_config(const std::filesystem::path& path);

// Parses an already-loaded JSON document on top of base.
errors::Result<EngineConfig> parse_config(const std::string& text, EngineConfig base = {});

// Canonicalizes the workspace root and checks every bound.
errors::Result<EngineConfig> validate_config(EngineConfig config);

}  // namespace forge::core::config
