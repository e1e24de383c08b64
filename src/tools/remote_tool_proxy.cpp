#include "tools/remote_tool_proxy.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "tools/tool_registry.hpp"

namespace forge::tools {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using protocol::ContentBlock;
using protocol::ContentKind;
using protocol::RiskClass;
using protocol::ToolResult;

namespace {

ToolResult remote_error_result(const std::string& call_id, const std::string& host_name,
                               const protocol::RemoteError& error) {
    return ToolResult::text(call_id,
                            host_name + " error " + std::to_string(error.code) + ": " +
                                error.message,
                            true);
}

}  // namespace

RemoteToolProxy::RemoteToolProxy(std::shared_ptr<protocol::RemoteToolHost> host,
                                 std::string tool_name)
    : host_(std::move(host)), tool_name_(std::move(tool_name)) {}

core::errors::Result<ToolResult> RemoteToolProxy::invoke(const ToolContext& context,
                                                         const nlohmann::json& arguments) {
    FORGE_LOG_DEBUG("Forwarding " + tool_name_ + " to " + host_->host_name());
    auto response = host_->call(protocol::RemoteRequest{tool_name_, arguments}, context.cancel);
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    const auto& reply = core::errors::get_value(response);
    if (reply.error) {
        return remote_error_result(context.call_id, host_->host_name(), *reply.error);
    }
    if (!reply.result) {
        return ToolResult::text(context.call_id, "", false);
    }
    return remote_result_to_tool_result(context.call_id, *reply.result);
}

void RemoteResourceReader::add_host(std::shared_ptr<protocol::RemoteToolHost> host,
                                    const RiskClass risk_class) {
    const std::string name = host->host_name();
    hosts_[name] = HostEntry{std::move(host), risk_class};
}

RiskClass RemoteResourceReader::risk_for(const std::string& server_name) const {
    const auto it = hosts_.find(server_name);
    return it == hosts_.end() ? RiskClass::Safe : it->second.risk_class;
}

core::errors::Result<ToolResult> RemoteResourceReader::invoke(const ToolContext& context,
                                                              const nlohmann::json& arguments) {
    const std::string server_name = arguments.value("server_name", "");
    const std::string uri = arguments.value("uri", "");
    if (uri.empty()) {
        return ForgeError{ErrorCategory::Validation, "uri must not be empty", "invalid_arguments"};
    }
    const auto it = hosts_.find(server_name);
    if (it == hosts_.end()) {
        std::string known;
        for (const auto& item : hosts_) {
            known += (known.empty() ? "" : ", ") + item.first;
        }
        return ForgeError{ErrorCategory::Validation, "Unknown server: " + server_name,
                          "unknown_server", "Connected servers: " + known};
    }

    const auto& host = it->second.host;
    FORGE_LOG_DEBUG("Reading " + uri + " from " + server_name);
    auto response = host->read_resource(uri, context.cancel);
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    const auto& reply = core::errors::get_value(response);
    if (reply.error) {
        return remote_error_result(context.call_id, server_name, *reply.error);
    }
    if (!reply.result) {
        return ToolResult::text(context.call_id, "", false);
    }
    return resource_result_to_tool_result(context.call_id, *reply.result);
}

core::errors::Status register_resource_tool(ToolRegistry& registry,
                                            std::shared_ptr<RemoteResourceReader> reader) {
    ToolDescriptor descriptor;
    descriptor.name = "access_mcp_resource";
    descriptor.description =
        "Read a resource served by a connected tool server, such as a file, an API "
        "response or system information, identified by its URI.";
    descriptor.input_schema = {
        {"type", "object"},
        {"properties",
         {{"server_name",
           {{"type", "string"}, {"description", "Name of the server providing the resource"}}},
          {"uri", {{"type", "string"}, {"description", "URI of the resource to read"}}}}},
        {"required", nlohmann::json::array({"server_name", "uri"})},
        {"additionalProperties", false}};
    descriptor.risk_class = RiskClass::Safe;
    descriptor.classifier = [reader](const nlohmann::json& arguments) {
        return reader->risk_for(arguments.value("server_name", ""));
    };
    descriptor.handler = std::move(reader);
    descriptor.origin = "remote";
    return registry.register_tool(std::move(descriptor));
}

ToolResult resource_result_to_tool_result(const std::string& call_id,
                                          const nlohmann::json& result) {
    if (!result.is_object() || !result.contains("contents") ||
        !result.at("contents").is_array()) {
        return remote_result_to_tool_result(call_id, result);
    }
    ToolResult out;
    out.call_id = call_id;
    for (const auto& item : result.at("contents")) {
        if (!item.is_object()) {
            out.content.push_back(ContentBlock{ContentKind::Text, item.dump(), "", ""});
            continue;
        }
        const std::string mime = item.value("mimeType", "");
        if (item.contains("text") && item.at("text").is_string()) {
            out.content.push_back(
                ContentBlock{ContentKind::Text, item.at("text").get<std::string>(), "", ""});
        } else if (item.contains("blob") && item.at("blob").is_string()) {
            const auto blob = item.at("blob").get<std::string>();
            if (mime.rfind("image/", 0) == 0) {
                out.content.push_back(ContentBlock{ContentKind::Image, "", mime, blob});
            } else {
                out.content.push_back(ContentBlock{
                    ContentKind::Text,
                    "[binary resource " + item.value("uri", "") + " (" +
                        (mime.empty() ? "unknown type" : mime) + "), " +
                        std::to_string(blob.size()) + " base64 chars]",
                    "", ""});
            }
        } else {
            out.content.push_back(ContentBlock{ContentKind::Text, item.dump(), "", ""});
        }
    }
    return out;
}

ToolResult remote_result_to_tool_result(const std::string& call_id,
                                        const nlohmann::json& result) {
    ToolResult out;
    out.call_id = call_id;
    if (!result.is_object() || !result.contains("content") || !result.at("content").is_array()) {
        out.content.push_back(ContentBlock{ContentKind::Text,
                                           result.is_string() ? result.get<std::string>()
                                                              : result.dump(),
                                           "", ""});
        return out;
    }
    for (const auto& block : result.at("content")) {
        const std::string type = block.is_object() ? block.value("type", "") : "";
        if (type == "text") {
            out.content.push_back(ContentBlock{ContentKind::Text, block.value("text", ""), "", ""});
        } else if (type == "image") {
            out.content.push_back(ContentBlock{ContentKind::Image, "",
                                               block.value("mimeType", "image/png"),
                                               block.value("data", "")});
        } else {
            out.content.push_back(ContentBlock{ContentKind::Text, block.dump(), "", ""});
        }
    }
    out.is_error = result.value("isError", false);
    return out;
}

}  // namespace forge::tools
