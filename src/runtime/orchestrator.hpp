#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/cortex_errors.hpp"
#include "policy/coordinator_policy.hpp"
#include "protocol/agent_result.hpp"
#include "protocol/delegation_plan.hpp"
#include "runtime/agent_executor.hpp"

namespace cortex::runtime {

enum class OrchestrationPath {
    Direct,
    Delegated,
    WorkerFallback
};

struct OrchestrationOutcome {
    std::string text;
    OrchestrationPath path = OrchestrationPath::Direct;
    std::optional<protocol::DelegationPlan> plan;
    std::vector<protocol::AgentResult> worker_results;  // includes the self-task result
    protocol::AgentResult final_result;                 // direct run or synthesis
};

std::string to_string(OrchestrationPath path);

// analyze -> (direct | delegate) -> [self task] -> synthesize, one level deep.
class Orchestrator {
public:
    Orchestrator(std::shared_ptr<const AgentExecutor> executor, std::string primary,
                 policy::CoordinatorPolicy coordinator_policy = policy::CoordinatorPolicy{},
                 bool json_output = true);

    core::errors::Result<std::string> run(const std::string& prompt) const;

    // Fails only with no_worker_agents (coordinator-only primary with nobody
    // to delegate to) or primary_unavailable.
    core::errors::Result<OrchestrationOutcome> run_detailed(const std::string& prompt) const;

    // analysis_failed when the primary invocation fails, otherwise the plan
    // parser's error.
    core::errors::Result<protocol::DelegationPlan> analyze(const std::string& prompt) const;

    std::string build_analysis_prompt(const std::string& prompt) const;

    static std::string build_synthesis_prompt(
        const std::string& prompt, const std::vector<protocol::AgentResult>& results);

    const std::string& primary() const { return primary_; }

private:
    core::errors::Result<OrchestrationOutcome> run_direct(
        const std::string& prompt, std::optional<protocol::DelegationPlan> plan) const;

    core::errors::Result<OrchestrationOutcome> run_worker_fallback(
        const std::string& prompt, std::optional<protocol::DelegationPlan> plan,
        const std::string& reason) const;

    // Direct run, or worker fallback when the primary is coordinator-only.
    core::errors::Result<OrchestrationOutcome> fall_back(
        const std::string& prompt, std::optional<protocol::DelegationPlan> plan,
        const std::string& reason) const;

    OrchestrationOutcome dispatch(const std::string& prompt,
                                  const std::vector<protocol::AgentTask>& tasks,
                                  const std::optional<std::string>& self_task,
                                  OrchestrationPath path) const;

    std::shared_ptr<const AgentExecutor> executor_;
    std::string primary_;
    policy::CoordinatorPolicy policy_;
    bool json_output_;
};

}  // namespace cortex::runtime
