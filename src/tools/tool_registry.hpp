#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/forge_errors.hpp"
#include "protocol/model_contract.hpp"
#include "protocol/remote_tool_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_handler.hpp"
#include "tools/workspace_locks.hpp"

namespace forge::tools {

// Raises a call's risk above the descriptor's static class based on its arguments.
using RiskClassifier = std::function<protocol::RiskClass(const nlohmann::json& arguments)>;

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
    protocol::RiskClass risk_class = protocol::RiskClass::Safe;
    std::shared_ptr<ToolHandler> handler;
    std::string usage_hint;
    LockMode lock_mode = LockMode::None;
    std::optional<std::string> path_argument;  // scopes Read/Write locks
    bool terminal_signal = false;
    std::string origin = "builtin";
    RiskClassifier classifier;
};

// Name-keyed table of every tool the engine can dispatch. Populated at
// startup and read-only afterwards.
class ToolRegistry {
public:
    core::errors::Status register_tool(ToolDescriptor descriptor);

    // Registers one proxy per tool a remote host advertised during initialize().
    core::errors::Status merge_remote(const std::shared_ptr<protocol::RemoteToolHost>& host,
                                      const std::vector<protocol::RemoteToolDescriptor>& tools,
                                      protocol::RiskClass risk_class);

    const ToolDescriptor* find(const std::string& name) const;

    // Registration order.
    std::vector<protocol::ToolSpec> specs() const;
    std::vector<std::string> names() const;
    std::size_t size() const { return descriptors_.size(); }

private:
    std::vector<ToolDescriptor> descriptors_;
    std::unordered_map<std::string, std::size_t> index_;
};

// Static risk raised by the descriptor's classifier, never lowered.
protocol::RiskClass effective_risk(const ToolDescriptor& descriptor,
                                   const nlohmann::json& arguments);

}  // namespace forge::tools
