#include <string>
#include <gtest/gtest.h>
#include "core/errors/relay_errors.hpp"

using namespace relay::core::errors;

// A dummy lookup standing in for a registry query
Result<std::string> simulate_lookup(bool should_fail) {
    if (should_fail) {
        return RelayError{ErrorCategory::Config, "Server 'ghost' not found in config",
                          "server_not_found"};
    }
    return std::string("readability");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_lookup(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "readability");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_lookup(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Config);
    EXPECT_EQ(error.code, "server_not_found");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, DefaultsCodeWhenUnset) {
    RelayError error{ErrorCategory::Internal, "boom"};
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, StatusOkCarriesNoError) {
    Status status = ok();
    EXPECT_FALSE(is_error(status));

    Status failed = RelayError{ErrorCategory::Setup, "clone failed", "fetch_failed"};
    EXPECT_TRUE(is_error(failed));
    EXPECT_EQ(get_error(failed).category, ErrorCategory::Setup);
}

TEST(ErrorModelTest, DescribeFormatsCodeAndMessage) {
    RelayError error{ErrorCategory::Protocol, "MCP server timeout", "timeout"};
    EXPECT_EQ(describe(error), "[timeout] MCP server timeout");
}

TEST(ErrorModelTest, CategoryNames) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::Config), "config");
    EXPECT_EQ(to_string(ErrorCategory::Setup), "setup");
    EXPECT_EQ(to_string(ErrorCategory::Launch), "launch");
    EXPECT_EQ(to_string(ErrorCategory::Protocol), "protocol");
    EXPECT_EQ(to_string(ErrorCategory::Internal), "internal");
}
