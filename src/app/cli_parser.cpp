#include "cli_parser.hpp"
#include <charconv>
#include <system_error>
#include <utility>
#include <vector>

namespace forge::app::cli {

    using namespace forge::core::errors;
    using forge::core::config::EngineConfig;

    namespace {

    constexpr const char* kUsage =
        "Usage: forge run --script FILE [--task \"...\"] [--workspace DIR] [--config FILE] "
        "[--permission-mode full_autonomous|manual_approval|deny_all] [--max-turns N] [--verbose]";

    }  // namespace

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> task;
        std::optional<std::string> script;
        std::optional<std::string> workspace;
        std::optional<std::string> config_file;
        std::optional<std::string> permission_mode;
        std::optional<std::string> max_turns;
        bool verbose = false;
    };

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ForgeError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        std::string command = argv[1];
        if (command != "run") {
            return ForgeError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'run' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        auto read_value = [&](std::size_t& i, std::optional<std::string>& slot) -> Status {
            if (i + 1 >= args.size()) {
                return ForgeError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
            }
            slot = args[++i];
            return ok();
        };

        for (std::size_t i = 0; i < args.size(); ++i) {
            Status status = ok();
            if (args[i] == "--task") {
                status = read_value(i, raw.task);
            } else if (args[i] == "--script") {
                status = read_value(i, raw.script);
            } else if (args[i] == "--workspace") {
                status = read_value(i, raw.workspace);
            } else if (args[i] == "--config") {
                status = read_value(i, raw.config_file);
            } else if (args[i] == "--permission-mode") {
                status = read_value(i, raw.permission_mode);
            } else if (args[i] == "--max-turns") {
                status = read_value(i, raw.max_turns);
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return ForgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }
            if (is_error(status)) {
                return get_error(status);
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliOptions options;
        options.verbose = raw.verbose;

        if (!raw.script.has_value()) {
            return ForgeError{ErrorCategory::Input, "Must provide --script", "missing_required_flag", kUsage};
        }
        options.script = raw.script.value();

        if (raw.task) {
            if (raw.task->find_first_not_of(" \t\r\n") == std::string::npos) {
                return ForgeError{ErrorCategory::Input, "--task cannot be empty", "invalid_task"};
            }
            options.task = raw.task.value();
        }

        if (raw.permission_mode) {
            const auto mode = protocol::parse_permission_mode(raw.permission_mode.value());
            if (!mode) {
                return ForgeError{ErrorCategory::Input, "Unknown permission mode: " + raw.permission_mode.value(), "invalid_permission_mode", "Use full_autonomous, manual_approval or deny_all."};
            }
            options.permission_mode = *mode;
        }

        // Exception-free integer parsing
        if (raw.max_turns) {
            std::uint32_t turns = 0;
            const char* begin = raw.max_turns->data();
            const char* end = raw.max_turns->data() + raw.max_turns->size();
            auto [ptr, ec] = std::from_chars(begin, end, turns);
            if (ec != std::errc() || ptr != end) {
                return ForgeError{ErrorCategory::Input, "Invalid number for --max-turns", "invalid_integer", "Provide a positive integer."};
            }
            if (turns == 0 || turns > 1000) {
                return ForgeError{ErrorCategory::Input, "--max-turns out of bounds", "bounds_error", "Must be between 1 and 1000."};
            }
            options.max_turns = turns;
        }

        // Path validation
        if (raw.workspace) {
            std::filesystem::path p(raw.workspace.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return ForgeError{ErrorCategory::Input, "Workspace does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return ForgeError{ErrorCategory::Input, "Failed to canonicalize workspace", "invalid_path"};
            }
            options.workspace = std::move(canonical_path);
        }

        if (raw.config_file) {
            options.config_file = std::filesystem::path(raw.config_file.value());
        }

        return options;
    }

    Result<EngineConfig> resolve_config(const CliOptions& options) {
        EngineConfig config;
        if (options.config_file) {
            auto loaded = core::config::load_config(options.config_file.value());
            if (is_error(loaded)) {
                return get_error(loaded);
            }
            config = take_value(std::move(loaded));
        }

        if (options.workspace) config.workspace_root = options.workspace.value();
        if (options.permission_mode) config.permission_mode = options.permission_mode.value();
        if (options.max_turns) config.max_turns = options.max_turns.value();
        if (options.verbose) config.log_level = "debug";

        return core::config::validate_config(std::move(config));
    }

}  // namespace forge::app::cli
