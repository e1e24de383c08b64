#include "core/config/engine_config.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace forge::core::config {

using errors::ErrorCategory;
using errors::ForgeError;
using nlohmann::json;

namespace {

ForgeError config_error(const std::string& message, const std::string& code = "invalid_config") {
    return ForgeError{ErrorCategory::Input, message, code};
}

// Reads an unsigned field if present; false means wrong type.
bool read_u32(const json& doc, const char* key, std::uint32_t& out) {
    if (!doc.contains(key)) {
        return true;
    }
    const auto& value = doc.at(key);
    if (!value.is_number_unsigned()) {
        return false;
    }
    out = value.get<std::uint32_t>();
    return true;
}

bool read_string(const json& doc, const char* key, std::string& out) {
    if (!doc.contains(key)) {
        return true;
    }
    const auto& value = doc.at(key);
    if (!value.is_string()) {
        return false;
    }
    out = value.get<std::string>();
    return true;
}

errors::Result<RemoteToolServerConfig> parse_remote_server(const json& entry) {
    if (!entry.is_object()) {
        return config_error("remote_tools entries must be objects");
    }
    RemoteToolServerConfig server;
    if (!read_string(entry, "name", server.name) || server.name.empty()) {
        return config_error("remote_tools entry requires a non-empty 'name'");
    }
    if (!read_string(entry, "command", server.command) || server.command.empty()) {
        return config_error("remote_tools '" + server.name + "' requires a 'command'");
    }
    if (entry.contains("args")) {
        const auto& args = entry.at("args");
        if (!args.is_array()) {
            return config_error("remote_tools '" + server.name + "' args must be an array");
        }
        for (const auto& arg : args) {
            if (!arg.is_string()) {
                return config_error("remote_tools '" + server.name + "' args must be strings");
            }
            server.args.push_back(arg.get<std::string>());
        }
    }
    std::string risk_text;
    if (!read_string(entry, "risk_class", risk_text)) {
        return config_error("remote_tools '" + server.name + "' risk_class must be a string");
    }
    if (!risk_text.empty()) {
        const auto risk = protocol::parse_risk_class(risk_text);
        if (!risk) {
            return config_error("Unknown risk_class: " + risk_text, "invalid_risk_class");
        }
        server.risk_class = *risk;
    }
    return server;
}

}  // namespace

errors::Result<EngineConfig> load_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return ForgeError{ErrorCategory::Input, "Unable to open config file: " + path.string(),
                          "config_not_found"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    FORGE_LOG_DEBUG("Loaded config file " + path.string());
    return parse_config(buffer.str());
}

errors::Result<EngineConfig> parse_config(const std::string& text, EngineConfig base) {
    const json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return config_error("Config must be a JSON object");
    }

    EngineConfig config = std::move(base);

    std::string workspace;
    if (!read_string(doc, "workspace", workspace)) {
        return config_error("'workspace' must be a string");
    }
    if (!workspace.empty()) {
        config.workspace_root = workspace;
    }

    std::string mode_text;
    if (!read_string(doc, "permission_mode", mode_text)) {
        return config_error("'permission_mode' must be a string");
    }
    if (!mode_text.empty()) {
        const auto mode = protocol::parse_permission_mode(mode_text);
        if (!mode) {
            return config_error("Unknown permission mode: " + mode_text, "invalid_permission_mode");
        }
        config.permission_mode = *mode;
    }

    if (!read_u32(doc, "long_running_threshold_ms", config.long_running_threshold_ms) ||
        !read_u32(doc, "kill_grace_ms", config.kill_grace_ms) ||
        !read_u32(doc, "max_command_timeout_ms", config.max_command_timeout_ms) ||
        !read_u32(doc, "output_tail_bytes", config.output_tail_bytes) ||
        !read_u32(doc, "max_turns", config.max_turns)) {
        return config_error("Numeric settings must be non-negative integers");
    }

    if (doc.contains("model_retry")) {
        const auto& retry = doc.at("model_retry");
        if (!retry.is_object() ||
            !read_u32(retry, "max_attempts", config.model_retry.max_attempts) ||
            !read_u32(retry, "initial_backoff_ms", config.model_retry.initial_backoff_ms) ||
            !read_u32(retry, "max_backoff_ms", config.model_retry.max_backoff_ms)) {
            return config_error("'model_retry' must hold non-negative integers");
        }
    }

    if (doc.contains("remote_tools")) {
        const auto& servers = doc.at("remote_tools");
        if (!servers.is_array()) {
            return config_error("'remote_tools' must be an array");
        }
        config.remote_tools.clear();
        for (const auto& entry : servers) {
            auto server = parse_remote_server(entry);
            if (errors::is_error(server)) {
                return errors::get_error(server);
            }
            config.remote_tools.push_back(errors::take_value(std::move(server)));
        }
    }

    if (!read_string(doc, "log_level", config.log_level)) {
        return config_error("'log_level' must be a string");
    }

    return config;
}

errors::Result<EngineConfig> validate_config(EngineConfig config) {
    std::error_code ec;
    const bool is_dir = std::filesystem::is_directory(config.workspace_root, ec);
    if (ec || !is_dir) {
        return ForgeError{ErrorCategory::Input,
                          "Workspace root does not exist or is not a directory: " +
                              config.workspace_root.string(),
                          "invalid_workspace_root"};
    }
    auto canonical_root = std::filesystem::canonical(config.workspace_root, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Input,
                          "Failed to canonicalize workspace root: " +
                              config.workspace_root.string(),
                          "invalid_workspace_root"};
    }
    config.workspace_root = std::move(canonical_root);

    if (config.max_turns == 0 || config.max_turns > 1000) {
        return ForgeError{ErrorCategory::Input, "max_turns out of bounds", "bounds_error",
                          "Must be between 1 and 1000."};
    }
    if (config.model_retry.max_attempts == 0) {
        return ForgeError{ErrorCategory::Input, "model_retry.max_attempts must be at least 1",
                          "bounds_error"};
    }
    if (config.model_retry.initial_backoff_ms > config.model_retry.max_backoff_ms) {
        return ForgeError{ErrorCategory::Input,
                          "model_retry.initial_backoff_ms exceeds max_backoff_ms",
                          "bounds_error"};
    }
    if (config.max_command_timeout_ms == 0) {
        return ForgeError{ErrorCategory::Input, "max_command_timeout_ms must be positive",
                          "bounds_error"};
    }
    if (config.output_tail_bytes == 0) {
        return ForgeError{ErrorCategory::Input, "output_tail_bytes must be positive",
                          "bounds_error"};
    }
    logging::LogLevel level;
    if (!logging::Logger::parse_level(config.log_level, level)) {
        return ForgeError{ErrorCategory::Input, "Unknown log level: " + config.log_level,
                          "invalid_log_level", "Use debug, info, warn or error."};
    }
    return config;
}

}  // namespace forge::core::config
