#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/gatehouse_errors.hpp"

namespace {

using gatehouse::app::cli::CliOptions;
using gatehouse::app::cli::Command;
using gatehouse::app::cli::parse_and_validate;
using gatehouse::core::errors::ErrorCategory;
using gatehouse::core::errors::get_error;
using gatehouse::core::errors::get_value;
using gatehouse::core::errors::is_error;

gatehouse::core::errors::Result<CliOptions> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("gatehouse");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsOnUnknownCommand) {
    auto result = parse_tokens({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(CliParserTest, ParsesServeWithOverrides) {
    auto result = parse_tokens({"serve", "--allowed-dir", "/tmp,/srv", "--allowed-command",
                                "ls,git status", "--base-path", "/opt/gh", "--config",
                                "/etc/gh.json", "--debug"});
    ASSERT_FALSE(is_error(result));
    const auto& options = get_value(result);
    EXPECT_EQ(options.command, Command::Serve);
    EXPECT_EQ(options.allowed_dir.value(), "/tmp,/srv");
    EXPECT_EQ(options.allowed_command.value(), "ls,git status");
    EXPECT_EQ(options.base_path.value(), "/opt/gh");
    EXPECT_EQ(options.config_file.value(), "/etc/gh.json");
    EXPECT_TRUE(options.debug);
    EXPECT_FALSE(options.init);
}

TEST(CliParserTest, EmptyAllowedCommandFlagIsKeptForConfigCheck) {
    auto result = parse_tokens({"serve", "--allowed-command", ""});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).allowed_command.value(), "");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"serve", "--allowed-dir"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownFlag) {
    auto result = parse_tokens({"serve", "--yolo"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, CheckCommandTakesExactlyOneOperand) {
    auto ok = parse_tokens({"check-command", "ls -la | grep x"});
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok).command, Command::CheckCommand);
    EXPECT_EQ(get_value(ok).target, "ls -la | grep x");

    auto none = parse_tokens({"check-command"});
    ASSERT_TRUE(is_error(none));
    EXPECT_EQ(get_error(none).code, "missing_required_argument");

    auto two = parse_tokens({"check-path", "/a", "/b"});
    ASSERT_TRUE(is_error(two));
    EXPECT_EQ(get_error(two).code, "missing_required_argument");
}

TEST(CliParserTest, DoubleDashAllowsOperandStartingWithDashes) {
    auto result = parse_tokens({"check-path", "--allowed-dir", "/tmp", "--", "--weird"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).target, "--weird");
    EXPECT_EQ(get_value(result).allowed_dir.value(), "/tmp");
}

TEST(CliParserTest, InitOnlyWithConfig) {
    auto config = parse_tokens({"config", "--init"});
    ASSERT_FALSE(is_error(config));
    EXPECT_TRUE(get_value(config).init);

    auto serve = parse_tokens({"serve", "--init"});
    ASSERT_TRUE(is_error(serve));
    EXPECT_EQ(get_error(serve).code, "conflicting_flags");
}

TEST(CliParserTest, ServeRejectsStrayOperand) {
    auto result = parse_tokens({"serve", "extra"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, EmptyPathFlagIsRejected) {
    auto result = parse_tokens({"config", "--base-path", ""});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

}  // namespace
