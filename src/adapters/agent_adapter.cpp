#include "adapters/agent_adapter.hpp"

#include <utility>
#include "adapters/output_analysis.hpp"

namespace cortex::adapters {

using protocol::AgentResult;
using protocol::InvocationOptions;

AgentAdapter::AgentAdapter(AdapterSettings settings) : settings_(std::move(settings)) {}

std::string AgentAdapter::filter_stderr(const std::string& stderr_text) const {
    return stderr_text;
}

AgentResult AgentAdapter::parse_output(const std::string& stdout_bytes,
                                       const std::string& stderr_bytes,
                                       const int returncode) const {
    AgentResult result;
    result.agent_name = name();
    result.output = trim(decode_lossy(stdout_bytes));
    result.error_text = filter_stderr(trim(decode_lossy(stderr_bytes)));
    result.returncode = returncode;
    result.rate_limited = is_rate_limited(result.output, result.error_text);
    result.success = returncode == 0 && !result.rate_limited;
    return result;
}

std::optional<std::string> AgentAdapter::effective_model(
    const InvocationOptions& options) const {
    if (options.model.has_value() && !options.model->empty()) {
        return options.model;
    }
    if (settings_.default_model.has_value() && !settings_.default_model->empty()) {
        return settings_.default_model;
    }
    return std::nullopt;
}

bool AgentAdapter::effective_auto_approve(const InvocationOptions& options) const {
    return options.auto_approve.value_or(settings_.auto_approve);
}

std::optional<std::uint32_t> AgentAdapter::effective_max_turns(
    const InvocationOptions& options) const {
    if (options.max_turns.has_value() && *options.max_turns > 0) {
        return options.max_turns;
    }
    if (settings_.default_max_turns.has_value() && *settings_.default_max_turns > 0) {
        return settings_.default_max_turns;
    }
    return std::nullopt;
}

}  // namespace cortex::adapters
