#include "tools/memory_tools.hpp"

#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "tools/tool_registry.hpp"

namespace forge::tools {

using nlohmann::json;
using protocol::RiskClass;
using protocol::ToolResult;

namespace {

json string_array() {
    return {{"type", "array"}, {"items", {{"type", "string"}}}};
}

json entity_schema() {
    return {{"type", "object"},
            {"properties",
             {{"name", {{"type", "string"}}},
              {"entityType", {{"type", "string"}}},
              {"observations", string_array()}}},
            {"required", json::array({"name", "entityType", "observations"})}};
}

json relation_schema() {
    return {{"type", "object"},
            {"properties",
             {{"from", {{"type", "string"}}},
              {"to", {{"type", "string"}}},
              {"relationType", {{"type", "string"}}}}},
            {"required", json::array({"from", "to", "relationType"})}};
}

json observation_schema(const char* list_key) {
    return {{"type", "object"},
            {"properties", {{"entityName", {{"type", "string"}}}, {list_key, string_array()}}},
            {"required", json::array({"entityName", list_key})}};
}

json object_with(const char* key, const json& property) {
    return {{"type", "object"},
            {"properties", {{key, property}}},
            {"required", json::array({key})},
            {"additionalProperties", false}};
}

struct MemoryToolSpec {
    const char* name;
    const char* description;
    json schema;
    RiskClass risk;
};

}  // namespace

MemoryTool::MemoryTool(std::shared_ptr<MemoryStore> store, std::string operation)
    : store_(std::move(store)), operation_(std::move(operation)) {}

core::errors::Result<ToolResult> MemoryTool::invoke(const ToolContext& context,
                                                    const json& arguments) {
    FORGE_LOG_DEBUG("memory " + operation_);
    auto text = store_->apply(operation_, arguments);
    if (core::errors::is_error(text)) {
        return core::errors::get_error(text);
    }
    return ToolResult::text(context.call_id, core::errors::get_value(text));
}

core::errors::Status register_memory_tools(ToolRegistry& registry,
                                           const std::shared_ptr<MemoryStore>& store) {
    const json empty_object = {{"type", "object"},
                               {"properties", json::object()},
                               {"additionalProperties", false}};
    const std::vector<MemoryToolSpec> specs = {
        {"create_entities", "Create new entities in the knowledge graph.",
         object_with("entities", {{"type", "array"}, {"items", entity_schema()}}),
         RiskClass::Mutating},
        {"create_relations", "Create relations (active voice) between entities.",
         object_with("relations", {{"type", "array"}, {"items", relation_schema()}}),
         RiskClass::Mutating},
        {"add_observations", "Add observations to existing entities.",
         object_with("observations",
                     {{"type", "array"}, {"items", observation_schema("contents")}}),
         RiskClass::Mutating},
        {"delete_entities", "Delete entities and their relations.",
         object_with("entityNames", string_array()), RiskClass::Mutating},
        {"delete_observations", "Delete specific observations from entities.",
         object_with("deletions",
                     {{"type", "array"}, {"items", observation_schema("observations")}}),
         RiskClass::Mutating},
        {"delete_relations", "Delete relations from the knowledge graph.",
         object_with("relations", {{"type", "array"}, {"items", relation_schema()}}),
         RiskClass::Mutating},
        {"read_graph", "Read the entire knowledge graph.", empty_object, RiskClass::Safe},
        {"search_nodes", "Search nodes by names, types and observation text.",
         object_with("query", {{"type", "string"}}), RiskClass::Safe},
        {"open_nodes", "Open specific nodes by name.", object_with("names", string_array()),
         RiskClass::Safe},
    };

    for (const auto& spec : specs) {
        ToolDescriptor descriptor;
        descriptor.name = spec.name;
        descriptor.description = spec.description;
        descriptor.input_schema = spec.schema;
        descriptor.risk_class = spec.risk;
        descriptor.handler = std::make_shared<MemoryTool>(store, spec.name);
        auto status = registry.register_tool(std::move(descriptor));
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    return core::errors::ok();
}

}  // namespace forge::tools
