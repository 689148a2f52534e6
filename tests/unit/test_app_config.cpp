#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/app_config.hpp"
#include "support/temp_path.hpp"

namespace {

using cortex::core::config::AppConfig;
using cortex::core::config::apply_setting;
using cortex::core::config::load_config;
using cortex::core::config::render_config;
using cortex::core::config::save_config;
using cortex::core::errors::get_error;
using cortex::core::errors::get_value;
using cortex::core::errors::is_error;

class TempConfigDir {
public:
    TempConfigDir() {
        root_ = cortex::testing::unique_temp_path("cortex_config_");
    }

    ~TempConfigDir() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path file() const { return root_ / "config.json"; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

TEST(AppConfigTest, DefaultsMatchExpectedValues) {
    const AppConfig config;
    EXPECT_EQ(config.primary, "claude");
    EXPECT_EQ(config.parallel_timeout, 600U);
    EXPECT_EQ(config.max_retries, 3);
    EXPECT_DOUBLE_EQ(config.retry_base_delay, 5.0);
    EXPECT_DOUBLE_EQ(config.retry_max_delay, 60.0);
    ASSERT_TRUE(config.get_agent_config("claude").max_turns.has_value());
    EXPECT_EQ(*config.get_agent_config("claude").max_turns, 15U);
    EXPECT_EQ(config.get_agent_config("codex").extra_args,
              (std::vector<std::string>{"--skip-git-repo-check"}));
    EXPECT_EQ(config.get_agent_config("unknown").timeout, 300U);
}

TEST(AppConfigTest, MissingFileWritesDefaults) {
    TempConfigDir dir;
    auto loaded = load_config(dir.file());
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).primary, "claude");
    EXPECT_TRUE(std::filesystem::exists(dir.file()));
}

TEST(AppConfigTest, PartialFileKeepsDefaults) {
    TempConfigDir dir;
    write_file(dir.file(), R"({"primary": "gemini", "agents": {"gemini": {"timeout": 90}}})");

    auto loaded = load_config(dir.file());
    ASSERT_FALSE(is_error(loaded));
    const auto& config = get_value(loaded);
    EXPECT_EQ(config.primary, "gemini");
    EXPECT_EQ(config.max_retries, 3);
    EXPECT_EQ(config.get_agent_config("gemini").timeout, 90U);
    EXPECT_TRUE(config.get_agent_config("gemini").auto_approve);
}

TEST(AppConfigTest, MalformedFileIsParseError) {
    TempConfigDir dir;
    write_file(dir.file(), "{ primary = claude");
    auto loaded = load_config(dir.file());
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "config_parse_failed");
}

TEST(AppConfigTest, SaveThenLoadPreservesSettings) {
    TempConfigDir dir;
    AppConfig config;
    config.primary = "codex";
    config.agents["gemini"].default_model = "gemini-2.5-pro";
    ASSERT_FALSE(is_error(save_config(config, dir.file())));

    auto loaded = load_config(dir.file());
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).primary, "codex");
    EXPECT_EQ(get_value(loaded).get_agent_config("gemini").default_model.value_or(""),
              "gemini-2.5-pro");
}

TEST(AppConfigTest, ApplySettingUpdatesTopLevelAndAgentKeys) {
    auto updated = apply_setting(AppConfig{}, "max_retries", "5");
    ASSERT_FALSE(is_error(updated));
    EXPECT_EQ(get_value(updated).max_retries, 5);

    updated = apply_setting(get_value(updated), "agents.codex.timeout", "120");
    ASSERT_FALSE(is_error(updated));
    EXPECT_EQ(get_value(updated).get_agent_config("codex").timeout, 120U);
    EXPECT_EQ(get_value(updated).get_agent_config("codex").extra_args.size(), 1U);

    updated = apply_setting(get_value(updated), "agents.gemini.auto_approve", "false");
    ASSERT_FALSE(is_error(updated));
    EXPECT_FALSE(get_value(updated).get_agent_config("gemini").auto_approve);
}

TEST(AppConfigTest, ApplySettingRejectsBadInput) {
    auto bad_number = apply_setting(AppConfig{}, "parallel_timeout", "soon");
    ASSERT_TRUE(is_error(bad_number));
    EXPECT_EQ(get_error(bad_number).code, "invalid_integer");

    auto bad_delay = apply_setting(AppConfig{}, "retry_base_delay", "-1");
    ASSERT_TRUE(is_error(bad_delay));
    EXPECT_EQ(get_error(bad_delay).code, "invalid_number");

    auto unknown = apply_setting(AppConfig{}, "colour", "blue");
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "unknown_config_key");

    auto unknown_field = apply_setting(AppConfig{}, "agents.codex.colour", "blue");
    ASSERT_TRUE(is_error(unknown_field));
    EXPECT_EQ(get_error(unknown_field).code, "unknown_config_key");
}

TEST(AppConfigTest, ApplySettingRejectsOutOfRangeTimeout) {
    auto zero = apply_setting(AppConfig{}, "agents.gemini.timeout", "0");
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).code, "invalid_timeout");

    auto huge = apply_setting(AppConfig{}, "agents.gemini.timeout", "4294968");
    ASSERT_TRUE(is_error(huge));
    EXPECT_EQ(get_error(huge).code, "invalid_timeout");

    auto one_day = apply_setting(AppConfig{}, "agents.gemini.timeout", "86400");
    ASSERT_FALSE(is_error(one_day));
    EXPECT_EQ(get_value(one_day).get_agent_config("gemini").timeout, 86400U);
}

TEST(AppConfigTest, FileWithZeroTimeoutIsParseError) {
    TempConfigDir dir;
    write_file(dir.file(), R"({"agents": {"codex": {"timeout": 0}}})");
    auto loaded = load_config(dir.file());
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "config_parse_failed");
    EXPECT_NE(get_error(loaded).message.find("agents.codex.timeout"), std::string::npos);
}

TEST(AppConfigTest, RenderMarksPrimary) {
    const auto text = render_config(AppConfig{});
    EXPECT_NE(text.find("claude (primary):"), std::string::npos);
    EXPECT_NE(text.find("max_turns: 15"), std::string::npos);
}

}  // namespace
