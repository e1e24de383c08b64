#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/id_gen.hpp"
#include "core/errors/forge_errors.hpp"
#include "tools/file_tools.hpp"
#include "tools/tool_registry.hpp"

namespace {

using forge::core::errors::ErrorCategory;
using forge::core::errors::get_error;
using forge::core::errors::get_value;
using forge::core::errors::is_error;
using forge::protocol::ContentKind;
using forge::protocol::RiskClass;
using forge::tools::ListFilesTool;
using forge::tools::ReadFileTool;
using forge::tools::ReplaceInFileTool;
using forge::tools::SearchFilesTool;
using forge::tools::ToolContext;
using forge::tools::ToolRegistry;
using forge::tools::WriteToFileTool;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_file_tools_" + forge::core::config::generate_id("ws"));
        std::filesystem::create_directories(root_);
        root_ = std::filesystem::canonical(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

    ToolContext context() const {
        ToolContext context;
        context.workspace_root = root_;
        context.call_id = "call-1";
        return context;
    }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

TEST(FileToolsTest, ReadFileReturnsContent) {
    TempWorkspace workspace;
    write_file(workspace.root() / "notes.txt", "hello forge");

    ReadFileTool tool;
    auto result = tool.invoke(workspace.context(), {{"path", "notes.txt"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).text_content(), "hello forge");
    EXPECT_EQ(get_value(result).call_id, "call-1");
}

TEST(FileToolsTest, ReadFileRejectsTraversal) {
    TempWorkspace workspace;
    ReadFileTool tool;
    auto result = tool.invoke(workspace.context(), {{"path", "../outside.txt"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Sandbox);
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");

    auto absolute = tool.invoke(workspace.context(), {{"path", "/etc/passwd"}});
    ASSERT_TRUE(is_error(absolute));
    EXPECT_EQ(get_error(absolute).code, "path_outside_workspace");
}

TEST(FileToolsTest, ReadFileReportsMissingAndBinary) {
    TempWorkspace workspace;
    ReadFileTool tool;
    EXPECT_EQ(get_error(tool.invoke(workspace.context(), {{"path", "nope.txt"}})).code,
              "file_not_found");

    write_file(workspace.root() / "blob.bin", std::string("ab\0cd", 5));
    EXPECT_EQ(get_error(tool.invoke(workspace.context(), {{"path", "blob.bin"}})).code,
              "binary_file");
}

TEST(FileToolsTest, ReadFileReturnsImagesAsBase64) {
    TempWorkspace workspace;
    write_file(workspace.root() / "pixel.png", "abc");
    ReadFileTool tool;
    auto result = tool.invoke(workspace.context(), {{"path", "pixel.png"}});
    ASSERT_FALSE(is_error(result));
    const auto& content = get_value(result).content;
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0].kind, ContentKind::Image);
    EXPECT_EQ(content[0].mime_type, "image/png");
    EXPECT_EQ(content[0].data, "YWJj");
}

TEST(FileToolsTest, ListFilesHonorsDepthAndSkipsVcs) {
    TempWorkspace workspace;
    write_file(workspace.root() / "a.txt", "a");
    write_file(workspace.root() / "src" / "main.cpp", "int main() {}");
    write_file(workspace.root() / ".git" / "HEAD", "ref");

    ListFilesTool tool;
    auto shallow = tool.invoke(workspace.context(), {{"path", "."}});
    ASSERT_FALSE(is_error(shallow));
    EXPECT_EQ(get_value(shallow).text_content(), "a.txt\nsrc/");

    auto deep = tool.invoke(workspace.context(), {{"path", "."}, {"max_depth", 2}});
    ASSERT_FALSE(is_error(deep));
    EXPECT_EQ(get_value(deep).text_content(), "a.txt\nsrc/\nsrc/main.cpp");

    std::filesystem::create_directories(workspace.root() / "empty");
    auto empty = tool.invoke(workspace.context(), {{"path", "empty"}});
    ASSERT_FALSE(is_error(empty));
    EXPECT_EQ(get_value(empty).text_content(), "No results found");
}

TEST(FileToolsTest, SearchFilesReportsPathAndLine) {
    TempWorkspace workspace;
    write_file(workspace.root() / "src" / "main.cpp", "int main() {\n  // TODO tidy\n}\n");
    write_file(workspace.root() / "README.md", "TODO docs\n");

    SearchFilesTool tool;
    auto filtered = tool.invoke(workspace.context(),
                                {{"path", "."}, {"regex", "TODO"}, {"file_pattern", "*.cpp"}});
    ASSERT_FALSE(is_error(filtered));
    const auto text = get_value(filtered).text_content();
    EXPECT_NE(text.find("src/main.cpp:2:"), std::string::npos);
    EXPECT_EQ(text.find("README.md"), std::string::npos);

    auto none = tool.invoke(workspace.context(), {{"path", "."}, {"regex", "FIXME"}});
    ASSERT_FALSE(is_error(none));
    EXPECT_EQ(get_value(none).text_content(), "No results found");

    EXPECT_EQ(get_error(tool.invoke(workspace.context(), {{"path", "."}, {"regex", "("}})).code,
              "invalid_regex");
}

TEST(FileToolsTest, SearchFilesSkipsSymlinksLeavingWorkspace) {
    TempWorkspace workspace;
    const auto outside = workspace.root().parent_path() /
                         (".tmp_outside_" + forge::core::config::generate_id("secret") + ".txt");
    write_file(outside, "TOP_SECRET_TOKEN=42\n");
    write_file(workspace.root() / "notes.txt", "SECRET plans are public\n");
    std::filesystem::create_symlink(outside, workspace.root() / "link.txt");

    SearchFilesTool tool;
    auto result = tool.invoke(workspace.context(), {{"path", "."}, {"regex", "SECRET"}});
    ReadFileTool read;
    auto direct = read.invoke(workspace.context(), {{"path", "link.txt"}});
    std::error_code ec;
    std::filesystem::remove(outside, ec);

    ASSERT_FALSE(is_error(result));
    const auto text = get_value(result).text_content();
    EXPECT_NE(text.find("notes.txt:1:"), std::string::npos);
    EXPECT_EQ(text.find("link.txt"), std::string::npos);
    EXPECT_EQ(text.find("TOP_SECRET_TOKEN"), std::string::npos);
    ASSERT_TRUE(is_error(direct));
    EXPECT_EQ(get_error(direct).code, "path_outside_workspace");
}

TEST(FileToolsTest, SearchFilesHandlesVeryLongLines) {
    TempWorkspace workspace;
    write_file(workspace.root() / "bundle.min.js", std::string(200000, 'a') + "\nneedle c\n");

    SearchFilesTool tool;
    auto result = tool.invoke(workspace.context(), {{"path", "."}, {"regex", "(a|b)*c"}});
    ASSERT_FALSE(is_error(result));
    const auto text = get_value(result).text_content();
    EXPECT_NE(text.find("bundle.min.js:2:needle c"), std::string::npos);
    EXPECT_EQ(text.find("bundle.min.js:1:"), std::string::npos);

    auto nested = tool.invoke(workspace.context(), {{"path", "."}, {"regex", "(a*)*b"}});
    ASSERT_FALSE(is_error(nested));
    EXPECT_EQ(get_value(nested).text_content(), "No results found");
}

TEST(FileToolsTest, WriteToFileCreatesParents) {
    TempWorkspace workspace;
    WriteToFileTool tool;
    auto result = tool.invoke(workspace.context(),
                              {{"path", "docs/guide.md"}, {"content", "# Guide\n"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(read_file(workspace.root() / "docs" / "guide.md"), "# Guide\n");

    auto escaped = tool.invoke(workspace.context(), {{"path", "../evil.txt"}, {"content", "x"}});
    ASSERT_TRUE(is_error(escaped));
    EXPECT_EQ(get_error(escaped).code, "path_outside_workspace");
    EXPECT_FALSE(std::filesystem::exists(workspace.root().parent_path() / "evil.txt"));
}

TEST(FileToolsTest, ReplaceInFileAppliesBlocksInOrder) {
    TempWorkspace workspace;
    write_file(workspace.root() / "app.cpp", "int a = 1;\nint b = 2;\n");

    const std::string diff =
        "<<<<<<< SEARCH\nint a = 1;\n=======\nint a = 10;\n>>>>>>> REPLACE\n"
        "<<<<<<< SEARCH\nint b = 2;\n=======\nint b = 20;\n>>>>>>> REPLACE\n";
    ReplaceInFileTool tool;
    auto result = tool.invoke(workspace.context(), {{"path", "app.cpp"}, {"diff", diff}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(read_file(workspace.root() / "app.cpp"), "int a = 10;\nint b = 20;\n");

    const std::string missing = "<<<<<<< SEARCH\nint c = 3;\n=======\nint c = 4;\n>>>>>>> REPLACE\n";
    auto failed = tool.invoke(workspace.context(), {{"path", "app.cpp"}, {"diff", missing}});
    ASSERT_TRUE(is_error(failed));
    EXPECT_EQ(get_error(failed).code, "search_not_found");
    EXPECT_EQ(read_file(workspace.root() / "app.cpp"), "int a = 10;\nint b = 20;\n");
}

TEST(FileToolsTest, ParseReplaceBlocksRejectsBrokenMarkers) {
    EXPECT_EQ(get_error(forge::tools::parse_replace_blocks("no markers")).code, "invalid_diff");
    EXPECT_EQ(get_error(forge::tools::parse_replace_blocks("<<<<<<< SEARCH\nx\n")).code,
              "invalid_diff");
    EXPECT_EQ(get_error(forge::tools::parse_replace_blocks("<<<<<<< SEARCH\nx\n>>>>>>> REPLACE\n"))
                  .code,
              "invalid_diff");
}

TEST(FileToolsTest, RegistersWithExpectedRiskClasses) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(forge::tools::register_file_tools(registry)));
    ASSERT_NE(registry.find("read_file"), nullptr);
    EXPECT_EQ(registry.find("read_file")->risk_class, RiskClass::Safe);
    EXPECT_EQ(registry.find("list_files")->risk_class, RiskClass::Safe);
    EXPECT_EQ(registry.find("search_files")->risk_class, RiskClass::Safe);
    EXPECT_EQ(registry.find("write_to_file")->risk_class, RiskClass::Mutating);
    EXPECT_EQ(registry.find("replace_in_file")->risk_class, RiskClass::Mutating);
}

}  // namespace
