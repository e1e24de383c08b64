#pragma once

#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "policy/policy_guard.hpp"
#include "tools/tool_handler.hpp"

namespace forge::tools {

class ToolRegistry;

class ReadFileTool : public ToolHandler {
public:
    core::errors::Result<protocol::ToolResult> invoke(const ToolContext& context,
                                                      const nlohmann::json& arguments) override;

private:
    policy::PolicyGuard guard_;
};

// Lists entries up to max_depth (default 1), skipping node_modules and .git.
class ListFilesTool : public ToolHandler {
public:
    core::errors::Result<protocol::ToolResult> invoke(const ToolContext& context,
                                                      const nlohmann::json& arguments) override;

private:
    policy::PolicyGuard guard_;
};

// ECMAScript regex over every text file below a path, optionally filtered
// by a glob on the file name. Output lines are "path:line:text".
class SearchFilesTool : public ToolHandler {
public:
    core::errors::Result<protocol::ToolResult> invoke(const ToolContext& context,
                                                      const nlohmann::json& arguments) override;

private:
    policy::PolicyGuard guard_;
};

class WriteToFileTool : public ToolHandler {
public:
    core::errors::Result<protocol::ToolResult> invoke(const ToolContext& context,
                                                      const nlohmann::json& arguments) override;

private:
    policy::PolicyGuard guard_;
};

class ReplaceInFileTool : public ToolHandler {
public:
    core::errors::Result<protocol::ToolResult> invoke(const ToolContext& context,
                                                      const nlohmann::json& arguments) override;

private:
    policy::PolicyGuard guard_;
};

struct ReplaceBlock {
    std::string search;
    std::string replace;
};

// Parses <<<<<<< SEARCH / ======= / >>>>>>> REPLACE blocks; every line of a
// section keeps its trailing newline.
core::errors::Result<std::vector<ReplaceBlock>> parse_replace_blocks(const std::string& diff);

// Replaces the first occurrence of each block, in order.
core::errors::Result<std::string> apply_replace_blocks(std::string content,
                                                       const std::vector<ReplaceBlock>& blocks);

core::errors::Status register_file_tools(ToolRegistry& registry);

}  // namespace forge::tools
