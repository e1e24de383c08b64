#pragma once

#include <memory>
#include "core/errors/forge_errors.hpp"
#include "tools/command_tools.hpp"
#include "tools/memory_tools.hpp"
#include "tools/web_tools.hpp"

namespace forge::tools {

class ToolRegistry;

// Web and memory tools are registered only when a provider is supplied.
struct BuiltinToolOptions {
    CommandToolOptions commands;
    std::shared_ptr<WebProvider> web;
    std::shared_ptr<MemoryStore> memory;
};

core::errors::Status register_builtin_tools(ToolRegistry& registry,
                                            const BuiltinToolOptions& options = {});

}  // namespace forge::tools
