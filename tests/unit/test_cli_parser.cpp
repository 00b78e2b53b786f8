#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/settings.hpp"
#include "core/errors/relay_errors.hpp"

namespace {

using relay::app::cli::apply_overrides;
using relay::app::cli::CliAction;
using relay::core::config::Settings;
using relay::core::errors::ErrorCategory;
using relay::core::errors::get_error;
using relay::core::errors::get_value;
using relay::core::errors::is_error;

relay::core::errors::Result<CliAction> parse_tokens(const std::vector<std::string>& tokens,
                                                    Settings& settings) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("relay_gateway");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return apply_overrides(static_cast<int>(argv.size()), argv.data(), settings);
}

TEST(CliParserTest, NoArgumentsKeepsSettings) {
    Settings settings;
    auto result = parse_tokens({}, settings);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), CliAction::Serve);
    EXPECT_EQ(settings.gateway.port, 3000);
    EXPECT_EQ(settings.gateway.server_name, "readability");
}

TEST(CliParserTest, AppliesAllOverrides) {
    Settings settings;
    auto result = parse_tokens({"--config", "servers.json", "--server", "fetcher", "--host",
                                "127.0.0.1", "--port", "8081"},
                               settings);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), CliAction::Serve);
    EXPECT_EQ(settings.gateway.config_file.string(), "servers.json");
    EXPECT_EQ(settings.gateway.server_name, "fetcher");
    EXPECT_EQ(settings.gateway.host, "127.0.0.1");
    EXPECT_EQ(settings.gateway.port, 8081);
}

TEST(CliParserTest, HelpWinsOverOtherFlags) {
    Settings settings;
    auto result = parse_tokens({"--port", "9000", "--help"}, settings);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), CliAction::ShowHelp);
    EXPECT_EQ(settings.gateway.port, 3000);
}

TEST(CliParserTest, FailsWhenArgumentUnknown) {
    Settings settings;
    auto result = parse_tokens({"--verbose"}, settings);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenValueMissing) {
    Settings settings;
    auto result = parse_tokens({"--server"}, settings);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsWhenPortNotNumeric) {
    Settings settings;
    auto result = parse_tokens({"--port", "80a"}, settings);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenPortOutOfBounds) {
    Settings settings;
    auto zero = parse_tokens({"--port", "0"}, settings);
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).code, "bounds_error");

    auto high = parse_tokens({"--port", "65536"}, settings);
    ASSERT_TRUE(is_error(high));
    EXPECT_EQ(get_error(high).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenServerEmpty) {
    Settings settings;
    auto result = parse_tokens({"--server", ""}, settings);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_value");
}

TEST(CliParserTest, FailureLeavesSettingsUntouched) {
    Settings settings;
    auto result = parse_tokens({"--host", "10.0.0.1", "--port", "abc"}, settings);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(settings.gateway.host, "0.0.0.0");
}

}  // namespace
