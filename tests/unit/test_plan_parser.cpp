#include <string>
#include <gtest/gtest.h>
#include "runtime/plan_parser.hpp"

namespace {

using cortex::core::errors::get_error;
using cortex::core::errors::get_value;
using cortex::core::errors::is_error;
using cortex::protocol::SubtaskPriority;
using cortex::runtime::extract_json_block;
using cortex::runtime::parse_delegation_plan;
using cortex::runtime::parse_plan_json;
using cortex::runtime::repair_json;

TEST(PlanParserTest, PrefersFencedBlock) {
    const std::string text =
        "Here is my plan {not this}\n```json\n{\"delegate\": true}\n```\nThanks {or this}";
    EXPECT_EQ(extract_json_block(text), "{\"delegate\": true}");
}

TEST(PlanParserTest, FallsBackToOutermostBraces) {
    const std::string text = "Sure! {\"delegate\": false, \"x\": {\"y\": 1}} Hope that helps.";
    EXPECT_EQ(extract_json_block(text), "{\"delegate\": false, \"x\": {\"y\": 1}}");
}

TEST(PlanParserTest, PlainFenceWithoutLanguageTag) {
    const std::string text = "```\n{\"delegate\": true}\n```";
    EXPECT_EQ(extract_json_block(text), "{\"delegate\": true}");
}

TEST(PlanParserTest, RepairsTrailingCommasAndPythonLiterals) {
    const std::string broken = "{'delegate': True, 'self_task': None, 'subtasks': [1, 2,],}";
    auto parsed = parse_plan_json(broken);
    ASSERT_FALSE(is_error(parsed));
    const auto& json = get_value(parsed);
    EXPECT_TRUE(json["delegate"].get<bool>());
    EXPECT_TRUE(json["self_task"].is_null());
    EXPECT_EQ(json["subtasks"].size(), 2U);
}

TEST(PlanParserTest, RepairsUnquotedKeysAndComments) {
    const std::string broken =
        "{\n  // the decision\n  delegate: false, /* why */ reasoning: \"simple\"\n}";
    auto parsed = parse_plan_json(broken);
    ASSERT_FALSE(is_error(parsed));
    EXPECT_FALSE(get_value(parsed)["delegate"].get<bool>());
    EXPECT_EQ(get_value(parsed)["reasoning"], "simple");
}

TEST(PlanParserTest, RepairsTruncatedOutput) {
    const std::string truncated = "{\"delegate\": true, \"subtasks\": [{\"agent\": \"codex\", \"prompt\": \"Write";
    const std::string repaired = repair_json(truncated);
    EXPECT_EQ(repaired,
              "{\"delegate\": true, \"subtasks\": [{\"agent\": \"codex\", \"prompt\": \"Write\"}]}");
}

TEST(PlanParserTest, EscapesRawNewlinesInsideStrings) {
    const std::string broken = "{\"delegate\": true, \"reasoning\": \"line one\nline two\"}";
    auto parsed = parse_plan_json(broken);
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed)["reasoning"], "line one\nline two");
}

TEST(PlanParserTest, NonJsonTextFails) {
    auto plan = parse_delegation_plan("Not valid JSON at all!!!");
    ASSERT_TRUE(is_error(plan));
    EXPECT_EQ(get_error(plan).code, "plan_parse_failed");
}

TEST(PlanParserTest, NonObjectFails) {
    auto plan = parse_delegation_plan("[1, 2, 3]");
    ASSERT_TRUE(is_error(plan));
    EXPECT_EQ(get_error(plan).code, "plan_not_object");
}

TEST(PlanParserTest, MissingDelegateFails) {
    auto plan = parse_delegation_plan("{\"reasoning\": \"forgot\"}");
    ASSERT_TRUE(is_error(plan));
    EXPECT_EQ(get_error(plan).code, "plan_missing_delegate");
}

TEST(PlanParserTest, ParsesFullPlan) {
    const std::string text = R"(```json
{
  "delegate": true,
  "reasoning": "Research then code",
  "subtasks": [
    {"agent": "gemini", "prompt": "Find the API docs", "priority": "high"},
    {"agent": "codex", "prompt": "Write the client", "priority": "LOW"},
    {"agent": "codex", "prompt": "Review it"},
    "garbage"
  ],
  "self_task": "Summarize"
}
```)";
    auto parsed = parse_delegation_plan(text);
    ASSERT_FALSE(is_error(parsed));
    const auto& plan = get_value(parsed);
    EXPECT_TRUE(plan.delegate);
    EXPECT_EQ(plan.reasoning, "Research then code");
    ASSERT_EQ(plan.subtasks.size(), 3U);
    EXPECT_EQ(plan.subtasks[0].agent, "gemini");
    EXPECT_EQ(plan.subtasks[0].priority, SubtaskPriority::High);
    EXPECT_EQ(plan.subtasks[1].priority, SubtaskPriority::Low);
    EXPECT_EQ(plan.subtasks[2].priority, SubtaskPriority::Medium);
    ASSERT_TRUE(plan.self_task.has_value());
    EXPECT_EQ(*plan.self_task, "Summarize");
}

TEST(PlanParserTest, DelegateTruthiness) {
    auto as_string = parse_delegation_plan("{\"delegate\": \"yes\"}");
    ASSERT_FALSE(is_error(as_string));
    EXPECT_TRUE(get_value(as_string).delegate);

    auto as_number = parse_delegation_plan("{\"delegate\": 0}");
    ASSERT_FALSE(is_error(as_number));
    EXPECT_FALSE(get_value(as_number).delegate);

    auto as_null = parse_delegation_plan("{\"delegate\": null}");
    ASSERT_FALSE(is_error(as_null));
    EXPECT_FALSE(get_value(as_null).delegate);
}

TEST(PlanParserTest, NullOrBlankSelfTaskIsAbsent) {
    auto with_null = parse_delegation_plan("{\"delegate\": true, \"self_task\": null}");
    ASSERT_FALSE(is_error(with_null));
    EXPECT_FALSE(get_value(with_null).self_task.has_value());

    auto with_blank = parse_delegation_plan("{\"delegate\": true, \"self_task\": \"  \"}");
    ASSERT_FALSE(is_error(with_blank));
    EXPECT_FALSE(get_value(with_blank).self_task.has_value());
}

}  // namespace
