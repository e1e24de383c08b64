#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "app/cli_parser.hpp"
#include "app/console_operator.hpp"
#include "core/concurrency/channel.hpp"
#include "core/errors/forge_errors.hpp"
#include "core/logging/logger.hpp"
#include "process/process_supervisor.hpp"
#include "providers/replay_model_client.hpp"
#include "providers/retrying_model_client.hpp"
#include "runtime/task_engine.hpp"
#include "session/transcript_writer.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/dispatcher.hpp"
#include "tools/remote_tool_proxy.hpp"
#include "tools/stdio_remote_tool_host.hpp"
#include "tools/tool_registry.hpp"
#include "tools/workspace_locks.hpp"

namespace {

void report(const forge::core::errors::ForgeError& err, const std::string& what) {
    FORGE_LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        FORGE_LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = forge::core::errors;
    auto& logger = forge::core::logging::Logger::get();
    logger.set_output(std::cerr);

    // 1. Parse CLI input and return normalized input errors
    FORGE_LOG_DEBUG("forge: bootstrapping...");
    auto parsed = forge::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        report(errors::get_error(parsed), "Input error");
        return 2;
    }
    const auto& options = errors::get_value(parsed);

    auto resolved = forge::app::cli::resolve_config(options);
    if (errors::is_error(resolved)) {
        report(errors::get_error(resolved), "Configuration error");
        return 2;
    }
    const auto config = errors::take_value(std::move(resolved));

    forge::core::logging::LogLevel level = forge::core::logging::LogLevel::INFO;
    forge::core::logging::Logger::parse_level(config.log_level, level);
    logger.set_min_level(level);
    FORGE_LOG_INFO("Workspace: " + config.workspace_root.string() + ", permission mode: " +
                   forge::protocol::to_string(config.permission_mode));

    auto script = forge::providers::ReplayModelClient::load(options.script);
    if (errors::is_error(script)) {
        report(errors::get_error(script), "Input error");
        return 2;
    }

    // 2. Process supervision: task commands and remote tool hosts are kept apart
    // so cancelling a task never takes the hosts down with it.
    forge::process::SupervisorOptions supervisor_options;
    supervisor_options.tail_bytes = config.output_tail_bytes;
    supervisor_options.kill_grace = std::chrono::milliseconds(config.kill_grace_ms);
    forge::process::ProcessSupervisor task_processes(supervisor_options);
    forge::process::ProcessSupervisor host_processes(supervisor_options);

    // 3. Tool registry
    forge::tools::ToolRegistry registry;
    forge::tools::BuiltinToolOptions builtin;
    builtin.commands.long_running_threshold =
        std::chrono::milliseconds(config.long_running_threshold_ms);
    builtin.commands.max_duration = std::chrono::milliseconds(config.max_command_timeout_ms);
    auto registered = forge::tools::register_builtin_tools(registry, builtin);
    if (errors::is_error(registered)) {
        report(errors::get_error(registered), "Startup error");
        return 3;
    }

    std::vector<std::shared_ptr<forge::tools::StdioRemoteToolHost>> hosts;
    auto resources = std::make_shared<forge::tools::RemoteResourceReader>();
    for (const auto& server : config.remote_tools) {
        forge::tools::StdioHostOptions host_options;
        host_options.name = server.name;
        host_options.command = server.command;
        host_options.args = server.args;
        host_options.cwd = config.workspace_root;
        auto host = std::make_shared<forge::tools::StdioRemoteToolHost>(host_options, host_processes);

        auto advertised = host->initialize();
        if (errors::is_error(advertised)) {
            report(errors::get_error(advertised), "Remote tool host " + server.name + " unavailable");
            host->shutdown();
            continue;
        }
        auto merged = registry.merge_remote(host, errors::get_value(advertised), server.risk_class);
        if (errors::is_error(merged)) {
            report(errors::get_error(merged), "Startup error");
            return 3;
        }
        resources->add_host(host, server.risk_class);
        hosts.push_back(std::move(host));
    }
    if (!resources->empty()) {
        auto added = forge::tools::register_resource_tool(registry, resources);
        if (errors::is_error(added)) {
            report(errors::get_error(added), "Startup error");
            return 3;
        }
    }
    FORGE_LOG_INFO("Registered " + std::to_string(registry.size()) + " tools");

    // 4. Engine wiring
    forge::tools::WorkspaceLocks locks;
    forge::tools::Dispatcher dispatcher(registry, locks, &task_processes, config.workspace_root);

    forge::runtime::EngineDependencies deps;
    deps.model = std::make_shared<forge::providers::RetryingModelClient>(
        errors::get_value(script), config.model_retry);
    deps.registry = &registry;
    deps.dispatcher = &dispatcher;
    deps.processes = &task_processes;
    deps.session_store = std::make_shared<forge::session::TranscriptWriter>(config.workspace_root);

    forge::runtime::EngineOptions engine_options;
    engine_options.permission_mode = config.permission_mode;
    engine_options.max_turns = config.max_turns;

    int exit_code = 0;
    {
        forge::runtime::TaskEngine engine(deps, engine_options);
        if (options.task) {
            auto started = engine.start_task(options.task.value());
            if (errors::is_error(started)) {
                report(errors::get_error(started), "Input error");
                return 2;
            }
        }

        // 5. Task loop and operator console
        forge::core::concurrency::Channel<forge::protocol::ControlEvent> control;
        forge::app::ConsoleOperator console(engine, control, std::cin, std::cout);
        std::thread engine_thread([&engine, &control]() { engine.run(control); });
        std::thread render_thread([&console]() { console.render_events(); });
        console.read_commands();
        engine_thread.join();
        render_thread.join();

        const auto final_state = engine.state();
        FORGE_LOG_INFO("Final task state: " + forge::protocol::to_string(final_state));
        if (final_state == forge::protocol::TaskState::Failed) {
            const auto reason = engine.failure_reason();
            FORGE_LOG_ERROR("Task failed: " + reason.value_or("unknown reason"));
            exit_code = 1;
        }
    }

    // 6. Teardown
    for (const auto& host : hosts) {
        host->shutdown();
    }
    task_processes.shutdown();
    host_processes.shutdown();
    return exit_code;
}
