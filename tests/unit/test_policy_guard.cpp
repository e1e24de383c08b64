#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/id_gen.hpp"
#include "core/errors/forge_errors.hpp"
#include "policy/policy_guard.hpp"

namespace {

using forge::core::errors::ErrorCategory;
using forge::core::errors::get_error;
using forge::core::errors::get_value;
using forge::core::errors::is_error;
using forge::policy::PolicyGuard;
using forge::protocol::RiskClass;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_policy_guard_" + forge::core::config::generate_id("ws"));
        std::filesystem::create_directories(root_ / "sub");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

TEST(PolicyGuardTest, AllowsPathInsideWorkspace) {
    TempWorkspace workspace;
    write_file(workspace.root() / "sub/sample.txt", "ok");

    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), "sub/sample.txt");
    ASSERT_FALSE(is_error(result));

    const auto resolved = get_value(result);
    EXPECT_TRUE(resolved.is_absolute());
    EXPECT_EQ(resolved.filename().string(), "sample.txt");
}

TEST(PolicyGuardTest, AllowsNotYetExistingPathInsideWorkspace) {
    TempWorkspace workspace;
    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), "new/dir/file.txt");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).filename().string(), "file.txt");
}

TEST(PolicyGuardTest, AllowsWorkspaceRootItself) {
    TempWorkspace workspace;
    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), ".");
    ASSERT_FALSE(is_error(result));
}

TEST(PolicyGuardTest, RejectsPathOutsideWorkspace) {
    TempWorkspace workspace;
    const auto outside = workspace.root().parent_path() /
                         ("outside_" + forge::core::config::generate_id("f") + ".txt");
    write_file(outside, "outside");

    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), outside);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");
    EXPECT_EQ(get_error(result).category, ErrorCategory::Sandbox);

    std::error_code ec;
    std::filesystem::remove(outside, ec);
}

TEST(PolicyGuardTest, RejectsTraversalInEverySyntax) {
    TempWorkspace workspace;
    PolicyGuard guard;
    for (const std::string path : {"../../etc/passwd", "sub/../../../etc/passwd",
                                   "./sub/./../..//etc/passwd", "/etc/passwd", "..",
                                   "sub/../.."}) {
        auto result = guard.validate_path_in_workspace(workspace.root(), path);
        ASSERT_TRUE(is_error(result)) << path;
        EXPECT_EQ(get_error(result).category, ErrorCategory::Sandbox) << path;
    }
}

TEST(PolicyGuardTest, RejectsSiblingDirectorySharingPrefix) {
    TempWorkspace workspace;
    const auto sibling = std::filesystem::path(workspace.root().string() + "_evil");
    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), sibling / "x.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");
}

TEST(PolicyGuardTest, RejectsSymlinkPointingOutside) {
    TempWorkspace workspace;
    std::error_code ec;
    std::filesystem::create_directory_symlink(workspace.root().parent_path(),
                                              workspace.root() / "escape", ec);
    ASSERT_FALSE(ec);

    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), "escape/anything.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");
}

TEST(PolicyGuardTest, RejectsInvalidWorkspaceRoot) {
    PolicyGuard guard;
    const auto missing_root = std::filesystem::current_path() /
                              ("__missing_workspace_root__" +
                               forge::core::config::generate_id("ws"));
    std::error_code ec;
    std::filesystem::remove_all(missing_root, ec);
    auto result = guard.validate_path_in_workspace(missing_root, "a.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_workspace_root");
}

TEST(PolicyGuardTest, RejectsEmptyCommand) {
    PolicyGuard guard;
    auto result = guard.validate_command("   ");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_command");
}

TEST(PolicyGuardTest, AcceptsOrdinaryCommand) {
    PolicyGuard guard;
    auto result = guard.validate_command("rg TaskEngine src");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "rg TaskEngine src");
}

TEST(PolicyGuardTest, ClassifiesDestructiveCommands) {
    PolicyGuard guard;
    EXPECT_EQ(guard.classify_command("rm -rf ."), RiskClass::Destructive);
    EXPECT_EQ(guard.classify_command("sudo apt update"), RiskClass::Destructive);
    EXPECT_EQ(guard.classify_command("ReBoOt now"), RiskClass::Destructive);
    EXPECT_EQ(guard.classify_command("git push --force origin main"), RiskClass::Destructive);
}

TEST(PolicyGuardTest, ClassifiesNetworkCommands) {
    PolicyGuard guard;
    EXPECT_EQ(guard.classify_command("curl https://example.com"), RiskClass::Network);
    EXPECT_EQ(guard.classify_command("npm install"), RiskClass::Network);
    EXPECT_EQ(guard.classify_command("git clone repo"), RiskClass::Network);
}

TEST(PolicyGuardTest, ClassifiesOrdinaryCommandsAsMutating) {
    PolicyGuard guard;
    EXPECT_EQ(guard.classify_command("ls -la"), RiskClass::Mutating);
    EXPECT_EQ(guard.classify_command("npm run dev"), RiskClass::Mutating);
}

}  // namespace
