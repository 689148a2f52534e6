#include "runtime/plan_parser.hpp"

#include <algorithm>
#include <cctype>
#include <vector>
#include "adapters/output_analysis.hpp"
#include "core/logging/logger.hpp"

namespace cortex::runtime {

using core::errors::CortexError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::DelegationPlan;
using protocol::Subtask;

namespace {

bool is_identifier_start(const char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$';
}

bool is_identifier_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$';
}

void strip_trailing_comma(std::string& out) {
    auto pos = out.find_last_not_of(" \t\r\n");
    if (pos != std::string::npos && out[pos] == ',') {
        out.erase(pos, 1);
    }
}

std::string fenced_block(const std::string& text) {
    const auto open = text.find("```");
    if (open == std::string::npos) {
        return "";
    }
    std::size_t start = open + 3;
    if (adapters::lowercase(text.substr(start, 4)) == "json") {
        start += 4;
    }
    const auto close = text.find("```", start);
    if (close == std::string::npos) {
        return "";
    }
    return adapters::trim(text.substr(start, close - start));
}

bool truthy(const json& value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number()) {
        return value.get<double>() != 0.0;
    }
    if (value.is_string()) {
        const std::string lowered = adapters::lowercase(adapters::trim(value.get<std::string>()));
        return lowered == "true" || lowered == "yes" || lowered == "1";
    }
    return false;
}

std::string string_field(const json& object, const char* key) {
    if (object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

}  // namespace

std::string extract_json_block(const std::string& text) {
    const std::string fenced = fenced_block(text);
    if (!fenced.empty()) {
        return fenced;
    }

    const auto first = text.find('{');
    if (first == std::string::npos) {
        return adapters::trim(text);
    }
    const auto last = text.rfind('}');
    if (last == std::string::npos || last < first) {
        return text.substr(first);
    }
    return text.substr(first, last - first + 1);
}

std::string repair_json(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 16);
    std::vector<char> closers;
    bool in_string = false;
    bool escaped = false;
    char quote = '"';

    std::size_t i = 0;
    const std::size_t n = text.size();
    while (i < n) {
        const char c = text[i];

        if (in_string) {
            if (escaped) {
                out.push_back(c);
                escaped = false;
            } else if (c == '\\') {
                if (quote == '\'' && i + 1 < n && text[i + 1] == '\'') {
                    out.push_back('\'');
                    ++i;
                } else {
                    out.push_back(c);
                    escaped = true;
                }
            } else if (c == quote) {
                out.push_back('"');
                in_string = false;
            } else if (c == '"') {
                out += "\\\"";
            } else if (c == '\n') {
                out += "\\n";
            } else if (c == '\r') {
                out += "\\r";
            } else if (c == '\t') {
                out += "\\t";
            } else {
                out.push_back(c);
            }
            ++i;
            continue;
        }

        if (c == '"' || c == '\'') {
            in_string = true;
            quote = c;
            out.push_back('"');
            ++i;
            continue;
        }

        if (c == '/' && i + 1 < n && text[i + 1] == '/') {
            while (i < n && text[i] != '\n') {
                ++i;
            }
            continue;
        }
        if (c == '/' && i + 1 < n && text[i + 1] == '*') {
            const auto end = text.find("*/", i + 2);
            i = end == std::string::npos ? n : end + 2;
            continue;
        }

        if (c == '{' || c == '[') {
            closers.push_back(c == '{' ? '}' : ']');
            out.push_back(c);
            ++i;
            continue;
        }

        if (c == '}' || c == ']') {
            if (std::find(closers.begin(), closers.end(), c) == closers.end()) {
                // Stray closer with nothing open to match.
                ++i;
                continue;
            }
            while (closers.back() != c) {
                strip_trailing_comma(out);
                out.push_back(closers.back());
                closers.pop_back();
            }
            strip_trailing_comma(out);
            out.push_back(c);
            closers.pop_back();
            ++i;
            continue;
        }

        if (is_identifier_start(c)) {
            std::size_t end = i;
            while (end < n && is_identifier_char(text[end])) {
                ++end;
            }
            const std::string word = text.substr(i, end - i);
            std::size_t next = end;
            while (next < n && std::isspace(static_cast<unsigned char>(text[next])) != 0) {
                ++next;
            }
            if (next < n && text[next] == ':') {
                out += "\"" + word + "\"";
            } else if (word == "True") {
                out += "true";
            } else if (word == "False") {
                out += "false";
            } else if (word == "None") {
                out += "null";
            } else {
                out += word;
            }
            i = end;
            continue;
        }

        out.push_back(c);
        ++i;
    }

    if (in_string) {
        if (escaped) {
            out.pop_back();
        }
        out.push_back('"');
    }
    while (!closers.empty()) {
        strip_trailing_comma(out);
        out.push_back(closers.back());
        closers.pop_back();
    }
    return out;
}

core::errors::Result<json> parse_plan_json(const std::string& text) {
    const std::string block = extract_json_block(text);

    json parsed = json::parse(block, nullptr, false);
    if (!parsed.is_discarded()) {
        return parsed;
    }

    const std::string repaired = repair_json(block);
    LOG_DEBUG("Strict plan parse failed, trying repaired JSON: " + repaired);
    parsed = json::parse(repaired, nullptr, false);
    if (!parsed.is_discarded()) {
        return parsed;
    }

    return CortexError{ErrorCategory::Provider,
                       "Primary agent did not return parseable JSON.", "plan_parse_failed"};
}

core::errors::Result<DelegationPlan> parse_delegation_plan(const std::string& text) {
    auto parsed = parse_plan_json(text);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const json& root = core::errors::get_value(parsed);
    if (!root.is_object()) {
        return CortexError{ErrorCategory::Provider,
                           "Delegation plan must be a JSON object.", "plan_not_object"};
    }
    if (!root.contains("delegate")) {
        return CortexError{ErrorCategory::Provider,
                           "Delegation plan is missing the 'delegate' key.",
                           "plan_missing_delegate"};
    }

    DelegationPlan plan;
    plan.delegate = truthy(root["delegate"]);
    plan.reasoning = string_field(root, "reasoning");

    if (root.contains("subtasks") && root["subtasks"].is_array()) {
        for (const auto& entry : root["subtasks"]) {
            if (!entry.is_object()) {
                continue;
            }
            Subtask subtask;
            subtask.agent = string_field(entry, "agent");
            subtask.prompt = string_field(entry, "prompt");
            subtask.priority = protocol::priority_from_string(
                adapters::lowercase(string_field(entry, "priority")));
            plan.subtasks.push_back(subtask);
        }
    }

    if (root.contains("self_task") && root["self_task"].is_string()) {
        const std::string self_task = root["self_task"].get<std::string>();
        if (!adapters::trim(self_task).empty()) {
            plan.self_task = self_task;
        }
    }
    return plan;
}

}  // namespace cortex::runtime
