#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/config/engine_config.hpp"
#include "core/errors/forge_errors.hpp"
#include "protocol/permission_contract.hpp"

namespace forge::app::cli {

    // Validated `forge run` flags. Unset options fall back to the config file.
    struct CliOptions {
        std::filesystem::path script;
        std::optional<std::string> task;
        std::optional<std::filesystem::path> workspace;
        std::optional<std::filesystem::path> config_file;
        std::optional<protocol::PermissionMode> permission_mode;
        std::optional<std::uint32_t> max_turns;
        bool verbose = false;
    };

    forge::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);

    // Config file (if any) overlaid with the flags, then validated.
    forge::core::errors::Result<forge::core::config::EngineConfig> resolve_config(
        const CliOptions& options);

}  // namespace forge::app::cli
