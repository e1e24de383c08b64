#pragma once

#include <memory>
#include <string>
#include "core/errors/forge_errors.hpp"
#include "tools/tool_handler.hpp"

namespace forge::tools {

class ToolRegistry;

// Long-term knowledge graph collaborator (entities, relations,
// observations). apply() receives the tool name and its validated
// arguments and returns the text shown to the model.
class MemoryStore {
public:
    virtual ~MemoryStore() = default;

    virtual core::errors::Result<std::string> apply(const std::string& operation,
                                                    const nlohmann::json& arguments) = 0;
};

class MemoryTool : public ToolHandler {
public:
    MemoryTool(std::shared_ptr<MemoryStore> store, std::string operation);

    core::errors::Result<protocol::ToolResult> invoke(const ToolContext& context,
                                                      const nlohmann::json& arguments) override;

private:
    std::shared_ptr<MemoryStore> store_;
    std::string operation_;
};

core::errors::Status register_memory_tools(ToolRegistry& registry,
                                           const std::shared_ptr<MemoryStore>& store);

}  // namespace forge::tools
