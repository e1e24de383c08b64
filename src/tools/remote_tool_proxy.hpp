#pragma once

#include <map>
#include <memory>
#include <string>
#include "core/errors/forge_errors.hpp"
#include "protocol/remote_tool_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_handler.hpp"

namespace forge::tools {

// Forwards one registered tool to the remote host that advertised it.
class RemoteToolProxy : public ToolHandler {
public:
    RemoteToolProxy(std::shared_ptr<protocol::RemoteToolHost> host, std::string tool_name);

    core::errors::Result<protocol::ToolResult> invoke(const ToolContext& context,
                                                      const nlohmann::json& arguments) override;

private:
    std::shared_ptr<protocol::RemoteToolHost> host_;
    std::string tool_name_;
};

// access_mcp_resource: reads a resource from the host named by server_name.
// Hosts are added at startup; the table is read-only once tasks run.
class RemoteResourceReader : public ToolHandler {
public:
    void add_host(std::shared_ptr<protocol::RemoteToolHost> host, protocol::RiskClass risk_class);

    // Risk configured for the named host; Safe for unknown names.
    protocol::RiskClass risk_for(const std::string& server_name) const;

    bool empty() const { return hosts_.empty(); }

    core::errors::Result<protocol::ToolResult> invoke(const ToolContext& context,
                                                      const nlohmann::json& arguments) override;

private:
    struct HostEntry {
        std::shared_ptr<protocol::RemoteToolHost> host;
        protocol::RiskClass risk_class = protocol::RiskClass::Network;
    };
    std::map<std::string, HostEntry> hosts_;
};

class ToolRegistry;

core::errors::Status register_resource_tool(ToolRegistry& registry,
                                            std::shared_ptr<RemoteResourceReader> reader);

// {contents: [{uri, mimeType, text | blob}]} to content blocks. Image blobs
// stay images; other blobs are summarized.
protocol::ToolResult resource_result_to_tool_result(const std::string& call_id,
                                                    const nlohmann::json& result);

// Maps a host's result payload onto content blocks. Understands the
// {content: [{type: text|image, ...}], isError} shape and falls back to
// the JSON text of anything else.
protocol::ToolResult remote_result_to_tool_result(const std::string& call_id,
                                                  const nlohmann::json& result);

}  // namespace forge::tools
