#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "core/concurrency/cancel_token.hpp"
#include "core/errors/forge_errors.hpp"
#include "tools/tool_handler.hpp"

namespace forge::tools {

class ToolRegistry;

struct WebPage {
    std::string content_type = "text/html";
    std::string text;  // already simplified by the provider unless raw was asked for
};

struct SearchHit {
    std::string title;
    std::string description;
    std::string url;
};

// Network collaborator behind web_fetch and web_search; failures come back
// as Execution or Transport errors.
class WebProvider {
public:
    virtual ~WebProvider() = default;

    virtual core::errors::Result<WebPage> fetch(const std::string& url, bool raw,
                                                const core::concurrency::CancelToken& cancel) = 0;

    virtual core::errors::Result<std::vector<SearchHit>> search(
        const std::string& query, std::size_t count, std::size_t offset,
        const core::concurrency::CancelToken& cancel) = 0;
};

constexpr std::size_t kDefaultFetchLength = 10000;

// Window of text starting at start_index, at most max_length bytes long
// (0 means the default). Pretty-prints JSON bodies.
std::string window_fetched_text(const WebPage& page, std::size_t start_index,
                                std::size_t max_length);

class WebFetchTool : public ToolHandler {
public:
    explicit WebFetchTool(std::shared_ptr<WebProvider> provider);

    core::errors::Result<protocol::ToolResult> invoke(const ToolContext& context,
                                                      const nlohmann::json& arguments) override;

private:
    std::shared_ptr<WebProvider> provider_;
};

class WebSearchTool : public ToolHandler {
public:
    explicit WebSearchTool(std::shared_ptr<WebProvider> provider);

    core::errors::Result<protocol::ToolResult> invoke(const ToolContext& context,
                                                      const nlohmann::json& arguments) override;

private:
    std::shared_ptr<WebProvider> provider_;
};

core::errors::Status register_web_tools(ToolRegistry& registry,
                                        const std::shared_ptr<WebProvider>& provider);

}  // namespace forge::tools
