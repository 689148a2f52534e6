#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/cortex_errors.hpp"
#include "protocol/delegation_plan.hpp"

namespace cortex::runtime {

// Locates the JSON object in free text: a fenced code block wins, otherwise
// the span from the first '{' to the last '}'.
std::string extract_json_block(const std::string& text);

// Best-effort structural repair of model-written JSON: comments, single
// quotes, unquoted keys, Python literals, raw control characters inside
// strings, trailing commas and unbalanced brackets.
std::string repair_json(const std::string& text);

// Strict parse first, repaired parse second.
core::errors::Result<nlohmann::json> parse_plan_json(const std::string& text);

// Fails with plan_parse_failed, plan_not_object or plan_missing_delegate.
core::errors::Result<protocol::DelegationPlan> parse_delegation_plan(const std::string& text);

}  // namespace cortex::runtime
