#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "adapters/adapter_registry.hpp"
#include "core/config/app_config.hpp"
#include "core/errors/cortex_errors.hpp"
#include "protocol/agent_result.hpp"
#include "protocol/delegation_plan.hpp"
#include "protocol/invocation_options.hpp"
#include "runtime/process_runner.hpp"

namespace cortex::runtime {

struct RetryPolicy {
    int max_retries = 3;
    double base_delay_seconds = 5.0;
    double max_delay_seconds = 60.0;

    static RetryPolicy from_config(const core::config::AppConfig& config);
};

// Runs agent invocations as subprocesses. Failures of any kind come back as
// failed AgentResults; nothing is thrown past this class.
class AgentExecutor {
public:
    AgentExecutor(adapters::AdapterMap adapters,
                  std::shared_ptr<const ProcessRunner> runner,
                  RetryPolicy retry_policy = {});
    virtual ~AgentExecutor() = default;

    // One invocation with the rate-limit retry loop applied.
    virtual protocol::AgentResult run_single(
        const std::string& agent_name, const std::string& prompt,
        const protocol::InvocationOptions& options = {}) const;

    // All tasks run concurrently; results come back in task order.
    virtual std::vector<protocol::AgentResult> run_parallel(
        const std::vector<protocol::AgentTask>& tasks,
        const protocol::InvocationOptions& options = {}) const;

    // Forwards stdout line by line; returns the exit code. Never retried.
    core::errors::Result<int> stream(const std::string& agent_name,
                                     const std::string& prompt,
                                     const protocol::InvocationOptions& options,
                                     const LineCallback& on_line) const;

    // Delay before retry `attempt` (1-based).
    double compute_delay(int attempt, std::optional<double> retry_after) const;

    bool has_agent(const std::string& agent_name) const;
    std::vector<std::string> agent_names() const;

    const adapters::AdapterMap& adapters() const { return adapters_; }
    const RetryPolicy& retry_policy() const { return retry_policy_; }

private:
    struct Attempt {
        protocol::AgentResult result;
        std::optional<double> retry_after;
    };

    Attempt execute_once(const adapters::AgentAdapter& adapter, const std::string& prompt,
                         const protocol::InvocationOptions& options) const;

    adapters::AdapterMap adapters_;
    std::shared_ptr<const ProcessRunner> runner_;
    RetryPolicy retry_policy_;
};

}  // namespace cortex::runtime
