#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace cortex::protocol {

// Outcome of one agent invocation, including every rate-limit retry it took.
struct AgentResult {
    std::string agent_name;
    std::string output;
    bool success = false;       // exit code 0 and not rate limited
    int returncode = 0;
    std::string error_text;     // filtered stderr or failure reason
    double duration_seconds = 0.0;
    bool rate_limited = false;
    int retries = 0;
    nlohmann::json metadata = nlohmann::json::object();

    static AgentResult from_error(const std::string& agent_name,
                                  const std::string& message);

    // SUCCESS, SUCCESS (retried Nx), RATE_LIMITED, TIMEOUT or FAILED.
    std::string status_label() const;

    std::string truncated_output(std::size_t limit = 500) const;
};

}  // namespace cortex::protocol
