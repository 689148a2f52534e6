#include "protocol/agent_result.hpp"

#include "adapters/output_analysis.hpp"

namespace cortex::protocol {

AgentResult AgentResult::from_error(const std::string& agent_name,
                                    const std::string& message) {
    AgentResult result;
    result.agent_name = agent_name;
    result.success = false;
    result.returncode = -1;
    result.error_text = message;
    return result;
}

std::string AgentResult::status_label() const {
    if (rate_limited) {
        return "RATE_LIMITED";
    }
    if (success) {
        if (retries > 0) {
            return "SUCCESS (retried " + std::to_string(retries) + "x)";
        }
        return "SUCCESS";
    }
    const std::string lowered = adapters::lowercase(error_text);
    if (lowered.find("timed out") != std::string::npos ||
        lowered.find("timeout") != std::string::npos) {
        return "TIMEOUT";
    }
    return "FAILED";
}

std::string AgentResult::truncated_output(const std::size_t limit) const {
    if (output.size() <= limit) {
        return output;
    }
    return output.substr(0, limit) + "...";
}

}  // namespace cortex::protocol
