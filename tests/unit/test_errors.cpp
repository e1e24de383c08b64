#include <string>
#include <gtest/gtest.h>
#include "core/errors/forge_errors.hpp"

using namespace forge::core::errors;

// A dummy function to simulate a tool failing
Result<std::string> simulate_read_file(bool should_fail) {
    if (should_fail) {
        return ForgeError{ErrorCategory::Execution, "File not found", "file_not_found"};
    }
    return std::string("file contents here");
}

Status simulate_write(bool should_fail) {
    if (should_fail) {
        return ForgeError{ErrorCategory::Sandbox, "Path escapes workspace root: /etc",
                          "path_outside_workspace", "Use a path inside the workspace."};
    }
    return ok();
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_read_file(false);

    // Check that it is NOT an error
    EXPECT_FALSE(is_error(result));
    // Check that the value is correct
    EXPECT_EQ(get_value(result), "file contents here");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_read_file(true);

    // Check that it IS an error
    EXPECT_TRUE(is_error(result));

    // Check the error details
    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Execution);
    EXPECT_EQ(error.message, "File not found");
    EXPECT_EQ(error.code, "file_not_found");
}

TEST(ErrorModelTest, StatusCarriesHint) {
    EXPECT_FALSE(is_error(simulate_write(false)));

    auto status = simulate_write(true);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).hint, "Use a path inside the workspace.");
}

TEST(ErrorModelTest, TakeValueMovesPayloadOut) {
    Result<std::string> result = std::string("payload");
    EXPECT_EQ(take_value(std::move(result)), "payload");
}

TEST(ErrorModelTest, DescribeNamesCategoryAndCode) {
    auto status = simulate_write(true);
    EXPECT_EQ(describe(get_error(status)),
              "sandbox_violation [path_outside_workspace]: Path escapes workspace root: /etc");
    EXPECT_EQ(to_string(ErrorCategory::Transport), "transport_error");
    EXPECT_EQ(to_string(ErrorCategory::Permission), "permission_denied");
}
