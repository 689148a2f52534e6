#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/cortex_errors.hpp"

namespace {

using cortex::app::cli::parse_and_validate;
using cortex::core::errors::ErrorCategory;
using cortex::core::errors::get_error;
using cortex::core::errors::get_value;
using cortex::core::errors::is_error;
using cortex::protocol::CliCommand;
using cortex::protocol::RunRequest;

cortex::core::errors::Result<RunRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("cortex");
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

TEST(CliParserTest, BarePromptOrchestrates) {
    auto result = parse_tokens({"Explain", "monads"});
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CliCommand::Orchestrate);
    EXPECT_EQ(req.prompt, "Explain monads");
}

TEST(CliParserTest, OrchestrateWithGlobalFlags) {
    auto result = parse_tokens({"--primary", "gemini", "orchestrate", "Build it", "--verbose",
                                "--config", "/tmp/c.json", "--log-file", "/tmp/d.log"});
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CliCommand::Orchestrate);
    EXPECT_EQ(req.prompt, "Build it");
    EXPECT_EQ(req.primary_override.value_or(""), "gemini");
    EXPECT_TRUE(req.verbose);
    ASSERT_TRUE(req.config_path.has_value());
    EXPECT_EQ(req.config_path->string(), "/tmp/c.json");
    ASSERT_TRUE(req.log_file.has_value());
    EXPECT_EQ(req.log_file->string(), "/tmp/d.log");
}

TEST(CliParserTest, RunParsesAgentPromptAndStream) {
    auto result = parse_tokens({"run", "codex", "Write", "a", "test", "--stream"});
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CliCommand::Run);
    EXPECT_EQ(req.agent.value_or(""), "codex");
    EXPECT_EQ(req.prompt, "Write a test");
    EXPECT_TRUE(req.stream);
}

TEST(CliParserTest, RunWithoutPromptFails) {
    auto result = parse_tokens({"run", "codex"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_argument");
}

TEST(CliParserTest, CompareParsesAgentList) {
    auto result = parse_tokens({"compare", "What is Rust?", "--agents", "claude, gemini,"});
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CliCommand::Compare);
    ASSERT_TRUE(req.agents.has_value());
    EXPECT_EQ(*req.agents, (std::vector<std::string>{"claude", "gemini"}));
}

TEST(CliParserTest, EmptyAgentListFails) {
    auto result = parse_tokens({"compare", "x", "--agents", " , "});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_value");
}

TEST(CliParserTest, StreamOutsideRunConflicts) {
    auto result = parse_tokens({"compare", "x", "--stream"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST(CliParserTest, StatusAndConfigCommands) {
    auto status = parse_tokens({"status"});
    ASSERT_FALSE(is_error(status));
    EXPECT_EQ(get_value(status).command, CliCommand::Status);

    auto show = parse_tokens({"config"});
    ASSERT_FALSE(is_error(show));
    EXPECT_EQ(get_value(show).command, CliCommand::ConfigShow);

    auto set = parse_tokens({"config", "set", "agents.codex.timeout", "120"});
    ASSERT_FALSE(is_error(set));
    EXPECT_EQ(get_value(set).command, CliCommand::ConfigSet);
    EXPECT_EQ(get_value(set).config_key.value_or(""), "agents.codex.timeout");
    EXPECT_EQ(get_value(set).config_value.value_or(""), "120");
}

TEST(CliParserTest, ConfigSetNeedsKeyAndValue) {
    auto result = parse_tokens({"config", "set", "primary"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_argument");
}

TEST(CliParserTest, RejectsUnknownFlag) {
    auto result = parse_tokens({"--frobnicate", "hello"});
    ASSERT_TRUE(is_error(result));
    const auto& err = get_error(result);
    EXPECT_EQ(err.category, ErrorCategory::Input);
    EXPECT_EQ(err.code, "unknown_argument");
}

TEST(CliParserTest, DoubleDashAllowsDashPrompt) {
    auto result = parse_tokens({"--", "-v", "means", "verbose?"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).prompt, "-v means verbose?");
    EXPECT_FALSE(get_value(result).verbose);
}

TEST(CliParserTest, MissingFlagValue) {
    auto result = parse_tokens({"hello", "--primary"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, NoArgumentsFails) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, BlankPromptFails) {
    auto result = parse_tokens({"orchestrate", "   "});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_prompt");
}

}  // namespace
