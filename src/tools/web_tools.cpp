#include "tools/web_tools.hpp"

#include <algorithm>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/tool_registry.hpp"

namespace forge::tools {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using nlohmann::json;
using protocol::ToolResult;

std::string window_fetched_text(const WebPage& page, const std::size_t start_index,
                                const std::size_t max_length) {
    std::string text = page.text;
    if (page.content_type.rfind("application/json", 0) == 0) {
        const json doc = json::parse(text, nullptr, false);
        if (!doc.is_discarded()) {
            text = "```json\n" + doc.dump(2) + "\n```";
        }
    }
    const std::size_t limit = max_length == 0 ? kDefaultFetchLength : max_length;
    if (start_index >= text.size()) {
        return start_index == 0 ? text : "";
    }
    return text.substr(start_index, limit);
}

WebFetchTool::WebFetchTool(std::shared_ptr<WebProvider> provider)
    : provider_(std::move(provider)) {}

core::errors::Result<ToolResult> WebFetchTool::invoke(const ToolContext& context,
                                                      const json& arguments) {
    const std::string url = arguments.value("url", "");
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
        return ForgeError{ErrorCategory::Validation, "Only http(s) URLs can be fetched: " + url,
                          "invalid_url"};
    }
    const auto max_length = arguments.value("max_length", static_cast<std::size_t>(0));
    const auto start_index = arguments.value("start_index", static_cast<std::size_t>(0));
    FORGE_LOG_INFO("web_fetch " + url);
    auto page = provider_->fetch(url, arguments.value("raw", false), context.cancel);
    if (core::errors::is_error(page)) {
        return core::errors::get_error(page);
    }
    const auto& fetched = core::errors::get_value(page);
    std::string text = window_fetched_text(fetched, start_index, max_length);
    const std::size_t shown_end = start_index + text.size();
    if (shown_end < fetched.text.size()) {
        text += "\n\n(truncated; continue with start_index " + std::to_string(shown_end) + ")";
    }
    return ToolResult::text(context.call_id, text);
}

WebSearchTool::WebSearchTool(std::shared_ptr<WebProvider> provider)
    : provider_(std::move(provider)) {}

core::errors::Result<ToolResult> WebSearchTool::invoke(const ToolContext& context,
                                                       const json& arguments) {
    const std::string query = arguments.value("query", "");
    if (query.empty()) {
        return ForgeError{ErrorCategory::Validation, "Search query cannot be empty.",
                          "empty_query"};
    }
    const auto count = std::clamp<std::size_t>(
        arguments.value("count", static_cast<std::size_t>(10)), 1, 20);
    const auto offset = arguments.value("offset", static_cast<std::size_t>(0));
    FORGE_LOG_INFO("web_search '" + query + "'");
    auto hits = provider_->search(query, count, offset, context.cancel);
    if (core::errors::is_error(hits)) {
        return core::errors::get_error(hits);
    }
    std::ostringstream out;
    bool first = true;
    for (const auto& hit : core::errors::get_value(hits)) {
        out << (first ? "" : "\n\n") << "Title: " << hit.title
            << "\nDescription: " << hit.description << "\nURL: " << hit.url;
        first = false;
    }
    const std::string text = out.str();
    return ToolResult::text(context.call_id, text.empty() ? "No results found" : text);
}

core::errors::Status register_web_tools(ToolRegistry& registry,
                                        const std::shared_ptr<WebProvider>& provider) {
    ToolDescriptor fetch;
    fetch.name = "web_fetch";
    fetch.description = "Fetch a URL and return its content as text.";
    fetch.input_schema = {
        {"type", "object"},
        {"properties",
         {{"url", {{"type", "string"}}},
          {"max_length",
           {{"type", "integer"},
            {"description", "Maximum output length (default " +
                                std::to_string(kDefaultFetchLength) + ")"}}},
          {"start_index", {{"type", "integer"}, {"description", "Output offset (default 0)"}}},
          {"raw", {{"type", "boolean"}, {"description", "Return the page unsimplified"}}}}},
        {"required", json::array({"url"})},
        {"additionalProperties", false}};
    fetch.risk_class = protocol::RiskClass::Network;
    fetch.handler = std::make_shared<WebFetchTool>(provider);

    ToolDescriptor search;
    search.name = "web_search";
    search.description = "Search the web. At most 20 results per request; use offset to page.";
    search.input_schema = {
        {"type", "object"},
        {"properties",
         {{"query", {{"type", "string"}}},
          {"count", {{"type", "integer"}, {"description", "Number of results (1-20, default 10)"}}},
          {"offset", {{"type", "integer"}, {"description", "Pagination offset"}}}}},
        {"required", json::array({"query"})},
        {"additionalProperties", false}};
    search.risk_class = protocol::RiskClass::Network;
    search.handler = std::make_shared<WebSearchTool>(provider);

    auto status = registry.register_tool(std::move(fetch));
    if (core::errors::is_error(status)) {
        return status;
    }
    return registry.register_tool(std::move(search));
}

}  // namespace forge::tools
