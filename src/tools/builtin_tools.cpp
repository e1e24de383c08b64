#include "tools/builtin_tools.hpp"

#include "core/logging/logger.hpp"
#include "tools/file_tools.hpp"
#include "tools/signal_tools.hpp"
#include "tools/tool_registry.hpp"

namespace forge::tools {

core::errors::Status register_builtin_tools(ToolRegistry& registry,
                                            const BuiltinToolOptions& options) {
    auto status = register_file_tools(registry);
    if (core::errors::is_error(status)) {
        return status;
    }
    status = register_command_tools(registry, options.commands);
    if (core::errors::is_error(status)) {
        return status;
    }
    if (options.web) {
        status = register_web_tools(registry, options.web);
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    if (options.memory) {
        status = register_memory_tools(registry, options.memory);
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    status = register_signal_tools(registry);
    if (core::errors::is_error(status)) {
        return status;
    }
    FORGE_LOG_DEBUG("Registered " + std::to_string(registry.size()) + " builtin tools");
    return core::errors::ok();
}

}  // namespace forge::tools
