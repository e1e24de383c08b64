#include "tools/file_tools.hpp"

#include <algorithm>
#include <cctype>
#include <fnmatch.h>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <re2/re2.h>
#include "core/logging/logger.hpp"
#include "tools/tool_registry.hpp"

namespace forge::tools {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using nlohmann::json;
using protocol::ContentBlock;
using protocol::ContentKind;
using protocol::ToolResult;

namespace {

constexpr std::uintmax_t kMaxReadBytes = 2 * 1024 * 1024;
constexpr std::uintmax_t kMaxSearchFileBytes = 1024 * 1024;
constexpr std::size_t kMaxSearchMatches = 300;
constexpr std::size_t kMaxListEntries = 2000;

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kSniffSize = 1024;
    char buffer[kSniffSize];
    in.read(buffer, static_cast<std::streamsize>(kSniffSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

std::string trim_line(const std::string& line) {
    constexpr std::size_t kMaxLineLength = 240;
    if (line.size() <= kMaxLineLength) {
        return line;
    }
    return line.substr(0, kMaxLineLength) + "...";
}

bool is_skipped_directory(const std::filesystem::path& name) {
    return name == "node_modules" || name == ".git";
}

std::string image_mime_type(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif") return "image/gif";
    if (ext == ".webp") return "image/webp";
    return "";
}

std::string base64_encode(const std::string& bytes) {
    static const char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);
    std::size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        const auto n = (static_cast<unsigned char>(bytes[i]) << 16) |
                       (static_cast<unsigned char>(bytes[i + 1]) << 8) |
                       static_cast<unsigned char>(bytes[i + 2]);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back(kAlphabet[n & 0x3F]);
    }
    const std::size_t rest = bytes.size() - i;
    if (rest > 0) {
        auto n = static_cast<unsigned char>(bytes[i]) << 16;
        if (rest == 2) {
            n |= static_cast<unsigned char>(bytes[i + 1]) << 8;
        }
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(rest == 2 ? kAlphabet[(n >> 6) & 0x3F] : '=');
        out.push_back('=');
    }
    return out;
}

core::errors::Result<std::string> read_whole_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return ForgeError{ErrorCategory::Execution, "Failed to open file: " + path.string(),
                          "io_error"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return ForgeError{ErrorCategory::Execution,
                          "I/O error while reading file: " + path.string(), "io_error"};
    }
    return buffer.str();
}

core::errors::Status write_whole_file(const std::filesystem::path& path,
                                      const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return ForgeError{ErrorCategory::Execution, "Failed to open file for writing: " +
                                                        path.string(),
                          "io_error"};
    }
    out << content;
    out.flush();
    if (!out.good()) {
        return ForgeError{ErrorCategory::Execution,
                          "I/O error while writing file: " + path.string(), "io_error"};
    }
    return core::errors::ok();
}

// Path as shown to the model: relative to the workspace root.
std::string display_path(const std::filesystem::path& root, const std::filesystem::path& path) {
    std::error_code ec;
    const auto canonical_root = std::filesystem::weakly_canonical(root, ec);
    const auto relative = path.lexically_relative(ec ? root : canonical_root);
    if (relative.empty()) {
        return path.generic_string();
    }
    return relative.generic_string();
}

json path_schema(const std::string& what) {
    return {{"type", "string"},
            {"description", what + " (relative to the workspace root)"}};
}

}  // namespace

core::errors::Result<ToolResult> ReadFileTool::invoke(const ToolContext& context,
                                                      const json& arguments) {
    const std::string requested = arguments.value("path", "");
    auto resolved = guard_.validate_path_in_workspace(context.workspace_root, requested);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return ForgeError{ErrorCategory::Execution, "File does not exist: " + requested,
                          "file_not_found"};
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return ForgeError{ErrorCategory::Execution, "Path is not a regular file: " + requested,
                          "not_a_file"};
    }
    const auto size = std::filesystem::file_size(file_path, ec);
    if (ec || size > kMaxReadBytes) {
        return ForgeError{ErrorCategory::Execution, "File is too large to read: " + requested,
                          "file_too_large"};
    }

    const std::string mime = image_mime_type(file_path);
    if (!mime.empty()) {
        auto bytes = read_whole_file(file_path);
        if (core::errors::is_error(bytes)) {
            return core::errors::get_error(bytes);
        }
        ToolResult result;
        result.call_id = context.call_id;
        result.content.push_back(
            ContentBlock{ContentKind::Image, "", mime, base64_encode(core::errors::get_value(bytes))});
        return result;
    }
    if (is_probably_binary(file_path)) {
        return ForgeError{ErrorCategory::Execution, "Refusing to read binary file: " + requested,
                          "binary_file"};
    }

    auto text = read_whole_file(file_path);
    if (core::errors::is_error(text)) {
        return core::errors::get_error(text);
    }
    FORGE_LOG_DEBUG("read_file " + file_path.string());
    return ToolResult::text(context.call_id, core::errors::take_value(std::move(text)));
}

core::errors::Result<ToolResult> ListFilesTool::invoke(const ToolContext& context,
                                                       const json& arguments) {
    const std::string requested = arguments.value("path", ".");
    const int max_depth = std::max(1, arguments.value("max_depth", 1));
    auto resolved = guard_.validate_path_in_workspace(context.workspace_root, requested);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path dir = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec) || ec) {
        return ForgeError{ErrorCategory::Execution, "Not a directory: " + requested,
                          "not_a_directory"};
    }

    std::vector<std::string> entries;
    bool truncated = false;
    const auto options = std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::recursive_directory_iterator it(dir, options, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Execution, "Unable to list directory: " + requested,
                          "io_error"};
    }
    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        if (core::concurrency::is_cancelled(context.cancel)) {
            return ForgeError{ErrorCategory::Execution, "Cancelled.", "cancelled"};
        }
        const auto& entry = *it;
        const bool is_dir = entry.is_directory(ec);
        if (is_dir && is_skipped_directory(entry.path().filename())) {
            it.disable_recursion_pending();
            continue;
        }
        if (is_dir && it.depth() + 1 >= max_depth) {
            it.disable_recursion_pending();
        }
        if (entries.size() >= kMaxListEntries) {
            truncated = true;
            break;
        }
        std::string name = entry.path().lexically_relative(dir).generic_string();
        if (is_dir) {
            name += "/";
        }
        entries.push_back(std::move(name));
    }

    if (entries.empty()) {
        return ToolResult::text(context.call_id, "No results found");
    }
    std::sort(entries.begin(), entries.end());
    std::ostringstream out;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        out << (i == 0 ? "" : "\n") << entries[i];
    }
    if (truncated) {
        out << "\n(listing truncated at " << kMaxListEntries << " entries)";
    }
    return ToolResult::text(context.call_id, out.str());
}

core::errors::Result<ToolResult> SearchFilesTool::invoke(const ToolContext& context,
                                                         const json& arguments) {
    const std::string requested = arguments.value("path", ".");
    const std::string pattern = arguments.value("regex", "");
    const std::string file_pattern = arguments.value("file_pattern", "");
    if (pattern.empty()) {
        return ForgeError{ErrorCategory::Validation, "Search regex cannot be empty.",
                          "empty_search_pattern"};
    }

    const RE2 matcher(pattern, RE2::Quiet);
    if (!matcher.ok()) {
        return ForgeError{ErrorCategory::Validation,
                          "Invalid regex '" + pattern + "': " + matcher.error(), "invalid_regex"};
    }

    auto resolved = guard_.validate_path_in_workspace(context.workspace_root, requested);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path scope_path = core::errors::get_value(resolved);

    std::error_code ec;
    std::vector<std::filesystem::path> files;
    if (std::filesystem::is_regular_file(scope_path, ec) && !ec) {
        files.push_back(scope_path);
    } else if (std::filesystem::is_directory(scope_path, ec) && !ec) {
        const auto options = std::filesystem::directory_options::skip_permission_denied;
        std::filesystem::recursive_directory_iterator it(scope_path, options, ec);
        for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_directory(ec) && is_skipped_directory(it->path().filename())) {
                it.disable_recursion_pending();
                continue;
            }
            if (!it->is_regular_file(ec) || ec) {
                continue;
            }
            if (!file_pattern.empty() &&
                fnmatch(file_pattern.c_str(), it->path().filename().c_str(), 0) != 0) {
                continue;
            }
            // A symlink may point outside the workspace.
            auto inside = guard_.validate_path_in_workspace(context.workspace_root, it->path());
            if (core::errors::is_error(inside)) {
                FORGE_LOG_DEBUG("search_files skips " + it->path().string() + ": " +
                                core::errors::get_error(inside).message);
                continue;
            }
            files.push_back(it->path());
        }
    } else {
        return ForgeError{ErrorCategory::Execution, "Scope does not exist: " + requested,
                          "file_not_found"};
    }
    std::sort(files.begin(), files.end());

    std::ostringstream out;
    std::size_t matches = 0;
    for (const auto& file : files) {
        if (matches >= kMaxSearchMatches) {
            break;
        }
        if (core::concurrency::is_cancelled(context.cancel)) {
            return ForgeError{ErrorCategory::Execution, "Cancelled.", "cancelled"};
        }
        const auto size = std::filesystem::file_size(file, ec);
        if (ec || size > kMaxSearchFileBytes || is_probably_binary(file)) {
            continue;
        }
        std::ifstream in(file);
        if (!in.is_open()) {
            continue;
        }
        const std::string shown = display_path(context.workspace_root, file);
        std::string line;
        std::size_t line_no = 0;
        while (std::getline(in, line)) {
            ++line_no;
            if (core::concurrency::is_cancelled(context.cancel)) {
                return ForgeError{ErrorCategory::Execution, "Cancelled.", "cancelled"};
            }
            if (!RE2::PartialMatch(line, matcher)) {
                continue;
            }
            out << shown << ":" << line_no << ":" << trim_line(line) << "\n";
            if (++matches >= kMaxSearchMatches) {
                break;
            }
        }
    }

    const std::string text = out.str();
    return ToolResult::text(context.call_id, text.empty() ? "No results found" : text);
}

core::errors::Result<ToolResult> WriteToFileTool::invoke(const ToolContext& context,
                                                         const json& arguments) {
    const std::string requested = arguments.value("path", "");
    const std::string content = arguments.value("content", "");
    auto resolved = guard_.validate_path_in_workspace(context.workspace_root, requested);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec)) {
        return ForgeError{ErrorCategory::Execution, "Path is a directory: " + requested,
                          "not_a_file"};
    }
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
        return ForgeError{ErrorCategory::Execution,
                          "Unable to create parent directories for " + requested + ": " +
                              ec.message(),
                          "io_error"};
    }
    auto written = write_whole_file(file_path, content);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    FORGE_LOG_INFO("write_to_file " + file_path.string());
    return ToolResult::text(context.call_id, "Wrote " + std::to_string(content.size()) +
                                                 " bytes to " + requested);
}

core::errors::Result<std::vector<ReplaceBlock>> parse_replace_blocks(const std::string& diff) {
    std::vector<ReplaceBlock> blocks;
    ReplaceBlock current;
    enum class Section { Outside, Search, Replace } section = Section::Outside;

    std::istringstream in(diff);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line == "<<<<<<< SEARCH") {
            current = ReplaceBlock{};
            section = Section::Search;
        } else if (section == Section::Search && line == "=======") {
            section = Section::Replace;
        } else if (line == ">>>>>>> REPLACE") {
            if (section != Section::Replace) {
                return ForgeError{ErrorCategory::Validation,
                                  "REPLACE marker without a preceding ======= separator.",
                                  "invalid_diff"};
            }
            blocks.push_back(std::move(current));
            current = ReplaceBlock{};
            section = Section::Outside;
        } else if (section == Section::Search) {
            current.search += line + "\n";
        } else if (section == Section::Replace) {
            current.replace += line + "\n";
        }
    }
    if (section != Section::Outside) {
        return ForgeError{ErrorCategory::Validation, "Unterminated SEARCH/REPLACE block.",
                          "invalid_diff"};
    }
    if (blocks.empty()) {
        return ForgeError{ErrorCategory::Validation, "No SEARCH/REPLACE blocks found.",
                          "invalid_diff"};
    }
    return blocks;
}

core::errors::Result<std::string> apply_replace_blocks(std::string content,
                                                       const std::vector<ReplaceBlock>& blocks) {
    for (const auto& block : blocks) {
        if (block.search.empty()) {
            return ForgeError{ErrorCategory::Validation, "SEARCH section cannot be empty.",
                              "invalid_diff"};
        }
        const auto pos = content.find(block.search);
        if (pos == std::string::npos) {
            return ForgeError{ErrorCategory::Execution,
                              "Search text not found:\n" + block.search, "search_not_found"};
        }
        content.replace(pos, block.search.size(), block.replace);
    }
    return content;
}

core::errors::Result<ToolResult> ReplaceInFileTool::invoke(const ToolContext& context,
                                                           const json& arguments) {
    const std::string requested = arguments.value("path", "");
    auto blocks = parse_replace_blocks(arguments.value("diff", ""));
    if (core::errors::is_error(blocks)) {
        return core::errors::get_error(blocks);
    }
    auto resolved = guard_.validate_path_in_workspace(context.workspace_root, requested);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return ForgeError{ErrorCategory::Execution, "File does not exist: " + requested,
                          "file_not_found"};
    }
    auto original = read_whole_file(file_path);
    if (core::errors::is_error(original)) {
        return core::errors::get_error(original);
    }
    const auto& block_list = core::errors::get_value(blocks);
    auto modified = apply_replace_blocks(core::errors::get_value(original), block_list);
    if (core::errors::is_error(modified)) {
        return core::errors::get_error(modified);
    }
    auto written = write_whole_file(file_path, core::errors::get_value(modified));
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    FORGE_LOG_INFO("replace_in_file " + file_path.string());
    return ToolResult::text(context.call_id, "Applied " + std::to_string(block_list.size()) +
                                                 " replacement(s) to " + requested);
}

core::errors::Status register_file_tools(ToolRegistry& registry) {
    std::vector<ToolDescriptor> tools;

    ToolDescriptor read;
    read.name = "read_file";
    read.description = "Read the contents of a file. Images come back as image blocks.";
    read.input_schema = {{"type", "object"},
                         {"properties", {{"path", path_schema("File to read")}}},
                         {"required", json::array({"path"})},
                         {"additionalProperties", false}};
    read.risk_class = protocol::RiskClass::Safe;
    read.handler = std::make_shared<ReadFileTool>();
    read.lock_mode = LockMode::Read;
    read.path_argument = "path";
    tools.push_back(std::move(read));

    ToolDescriptor list;
    list.name = "list_files";
    list.description =
        "List files and directories. max_depth 1 (default) lists only the top level.";
    list.input_schema = {
        {"type", "object"},
        {"properties",
         {{"path", path_schema("Directory to list")},
          {"max_depth", {{"type", "integer"}, {"description", "Max depth (default: 1)"}}}}},
        {"required", json::array({"path"})},
        {"additionalProperties", false}};
    list.risk_class = protocol::RiskClass::Safe;
    list.handler = std::make_shared<ListFilesTool>();
    list.lock_mode = LockMode::Read;
    list.path_argument = "path";
    tools.push_back(std::move(list));

    ToolDescriptor search;
    search.name = "search_files";
    search.description = "Regex search across files below a directory.";
    search.input_schema = {
        {"type", "object"},
        {"properties",
         {{"path", path_schema("Directory to search recursively")},
          {"regex", {{"type", "string"}, {"description", "Regular expression (RE2 syntax, matched per line)"}}},
          {"file_pattern",
           {{"type", "string"}, {"description", "Glob on file names, e.g. '*.cpp'"}}}}},
        {"required", json::array({"path", "regex"})},
        {"additionalProperties", false}};
    search.risk_class = protocol::RiskClass::Safe;
    search.handler = std::make_shared<SearchFilesTool>();
    search.lock_mode = LockMode::Read;
    search.path_argument = "path";
    tools.push_back(std::move(search));

    ToolDescriptor write;
    write.name = "write_to_file";
    write.description =
        "Write complete content to a file, creating it and any parent directories.";
    write.input_schema = {
        {"type", "object"},
        {"properties",
         {{"path", path_schema("File to write")},
          {"content", {{"type", "string"}, {"description", "Complete file content"}}}}},
        {"required", json::array({"path", "content"})},
        {"additionalProperties", false}};
    write.risk_class = protocol::RiskClass::Mutating;
    write.handler = std::make_shared<WriteToFileTool>();
    write.lock_mode = LockMode::Write;
    write.path_argument = "path";
    tools.push_back(std::move(write));

    ToolDescriptor replace;
    replace.name = "replace_in_file";
    replace.description =
        "Edit a file with SEARCH/REPLACE blocks; each block replaces its first match.";
    replace.input_schema = {
        {"type", "object"},
        {"properties",
         {{"path", path_schema("File to modify")},
          {"diff",
           {{"type", "string"},
            {"description",
             "One or more blocks:\n<<<<<<< SEARCH\n[exact text]\n=======\n[new text]\n>>>>>>> "
             "REPLACE"}}}}},
        {"required", json::array({"path", "diff"})},
        {"additionalProperties", false}};
    replace.risk_class = protocol::RiskClass::Mutating;
    replace.handler = std::make_shared<ReplaceInFileTool>();
    replace.lock_mode = LockMode::Write;
    replace.path_argument = "path";
    tools.push_back(std::move(replace));

    for (auto& tool : tools) {
        auto status = registry.register_tool(std::move(tool));
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    return core::errors::ok();
}

}  // namespace forge::tools
