#include "tools/dispatcher.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/schema_validator.hpp"

namespace forge::tools {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using protocol::ToolCall;
using protocol::ToolResult;

namespace {

std::future<ToolResult> ready(ToolResult result) {
    std::promise<ToolResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

}  // namespace

ToolResult error_result(const std::string& call_id, const ForgeError& error) {
    std::string body = core::errors::describe(error);
    if (!error.hint.empty()) {
        body += "\nHint: " + error.hint;
    }
    return ToolResult::text(call_id, body, true);
}

Dispatcher::Dispatcher(const ToolRegistry& registry, WorkspaceLocks& locks,
                       process::ProcessSupervisor* processes,
                       std::filesystem::path workspace_root)
    : registry_(registry),
      locks_(locks),
      processes_(processes),
      workspace_root_(std::move(workspace_root)) {}

ToolResult Dispatcher::dispatch(const ToolCall& call, const DispatchOptions& options) {
    return launch(call, options).get();
}

LockScope Dispatcher::lock_scope_for(const ToolDescriptor& descriptor,
                                     const nlohmann::json& arguments) const {
    LockScope scope;
    scope.mode = descriptor.lock_mode;
    if (scope.mode != LockMode::Read && scope.mode != LockMode::Write) {
        return scope;
    }
    std::filesystem::path target = workspace_root_;
    if (descriptor.path_argument && arguments.contains(*descriptor.path_argument) &&
        arguments.at(*descriptor.path_argument).is_string()) {
        const std::filesystem::path requested =
            arguments.at(*descriptor.path_argument).get<std::string>();
        target = requested.is_absolute() ? requested : workspace_root_ / requested;
    }
    // Lexical only: the handler does the real sandbox resolution.
    scope.path = target.lexically_normal();
    return scope;
}

std::future<ToolResult> Dispatcher::launch(const ToolCall& call, const DispatchOptions& options) {
    const ToolDescriptor* descriptor = registry_.find(call.name);
    if (descriptor == nullptr) {
        return ready(error_result(call.id, ForgeError{ErrorCategory::Validation,
                                                      "Unknown tool: " + call.name,
                                                      "unknown_tool"}));
    }
    if (call.argument_error) {
        return ready(error_result(call.id, ForgeError{ErrorCategory::Validation,
                                                      *call.argument_error,
                                                      "malformed_arguments"}));
    }
    auto valid = validate_against_schema(descriptor->input_schema, call.arguments);
    if (core::errors::is_error(valid)) {
        return ready(error_result(call.id, core::errors::get_error(valid)));
    }

    auto lease = locks_.reserve(lock_scope_for(*descriptor, call.arguments));
    auto handler = descriptor->handler;

    ToolContext context;
    context.workspace_root = workspace_root_;
    context.cancel = options.cancel;
    context.call_id = call.id;
    context.on_output = options.on_output;
    context.processes = processes_;

    FORGE_LOG_DEBUG("Launching " + call.name + " (" + call.id + ")");
    return std::async(
        std::launch::async,
        [handler, context, call, lease = std::move(lease)]() mutable -> ToolResult {
            auto locked = lease.wait(context.cancel);
            if (core::errors::is_error(locked)) {
                return error_result(call.id, core::errors::get_error(locked));
            }
            core::errors::Result<ToolResult> outcome = ForgeError{
                ErrorCategory::Internal, "Handler did not run.", "handler_not_run"};
            try {
                outcome = handler->invoke(context, call.arguments);
            } catch (const std::exception& ex) {
                FORGE_LOG_ERROR("Tool " + call.name + " threw: " + ex.what());
                outcome = ForgeError{ErrorCategory::Internal,
                                     "Tool " + call.name + " failed: " + ex.what(),
                                     "handler_exception"};
            }
            lease.release();

            if (core::errors::is_error(outcome)) {
                const auto& error = core::errors::get_error(outcome);
                FORGE_LOG_WARN("Tool " + call.name + " failed: " + core::errors::describe(error));
                return error_result(call.id, error);
            }
            ToolResult result = core::errors::take_value(std::move(outcome));
            result.call_id = call.id;
            return result;
        });
}

}  // namespace forge::tools
