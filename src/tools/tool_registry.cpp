#include "tools/tool_registry.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "tools/remote_tool_proxy.hpp"

namespace forge::tools {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

core::errors::Status ToolRegistry::register_tool(ToolDescriptor descriptor) {
    if (descriptor.name.empty()) {
        return ForgeError{ErrorCategory::Fatal, "Tool name cannot be empty.", "invalid_tool"};
    }
    if (!descriptor.handler) {
        return ForgeError{ErrorCategory::Fatal, "Tool " + descriptor.name + " has no handler.",
                          "invalid_tool"};
    }
    if (index_.find(descriptor.name) != index_.end()) {
        const auto& existing = descriptors_[index_.at(descriptor.name)];
        return ForgeError{ErrorCategory::Fatal,
                          "Tool " + descriptor.name + " from " + descriptor.origin +
                              " is already registered by " + existing.origin,
                          "duplicate_tool"};
    }
    FORGE_LOG_DEBUG("Registered tool " + descriptor.name + " (" +
                    protocol::to_string(descriptor.risk_class) + ", " + descriptor.origin + ")");
    index_.emplace(descriptor.name, descriptors_.size());
    descriptors_.push_back(std::move(descriptor));
    return core::errors::ok();
}

core::errors::Status ToolRegistry::merge_remote(
    const std::shared_ptr<protocol::RemoteToolHost>& host,
    const std::vector<protocol::RemoteToolDescriptor>& tools,
    const protocol::RiskClass risk_class) {
    for (const auto& remote : tools) {
        ToolDescriptor descriptor;
        descriptor.name = remote.name;
        descriptor.description = remote.description;
        descriptor.input_schema = remote.input_schema;
        descriptor.usage_hint = remote.usage_hint;
        descriptor.risk_class = risk_class;
        descriptor.handler = std::make_shared<RemoteToolProxy>(host, remote.name);
        descriptor.origin = host->host_name();
        auto status = register_tool(std::move(descriptor));
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    FORGE_LOG_INFO("Merged " + std::to_string(tools.size()) + " tool(s) from " +
                   host->host_name());
    return core::errors::ok();
}

const ToolDescriptor* ToolRegistry::find(const std::string& name) const {
    const auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &descriptors_[it->second];
}

std::vector<protocol::ToolSpec> ToolRegistry::specs() const {
    std::vector<protocol::ToolSpec> out;
    out.reserve(descriptors_.size());
    for (const auto& descriptor : descriptors_) {
        std::string description = descriptor.description;
        if (!descriptor.usage_hint.empty()) {
            description += "\n" + descriptor.usage_hint;
        }
        out.push_back(protocol::ToolSpec{descriptor.name, description, descriptor.input_schema});
    }
    return out;
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(descriptors_.size());
    for (const auto& descriptor : descriptors_) {
        out.push_back(descriptor.name);
    }
    return out;
}

protocol::RiskClass effective_risk(const ToolDescriptor& descriptor,
                                   const nlohmann::json& arguments) {
    if (!descriptor.classifier) {
        return descriptor.risk_class;
    }
    return protocol::max_risk(descriptor.risk_class, descriptor.classifier(arguments));
}

}  // namespace forge::tools
