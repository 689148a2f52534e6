#pragma once

#include <string>
#include <vector>
#include "protocol/delegation_plan.hpp"

namespace cortex::policy {

struct RolePolicy {
    // Fixed by identity; not exposed through the config file.
    std::string coordinator_only_agent = "claude";
};

class CoordinatorPolicy {
public:
    explicit CoordinatorPolicy(RolePolicy role_policy = {});

    bool is_coordinator_only(const std::string& agent_name) const;

    // Plan subtasks that survive filtering: blank prompts, unavailable agents
    // and (for a coordinator-only primary) the primary itself are dropped.
    std::vector<protocol::AgentTask> select_subtasks(
        const protocol::DelegationPlan& plan, const std::string& primary,
        const std::vector<std::string>& available_agents) const;

    // The unmodified prompt for every available agent other than the primary.
    std::vector<protocol::AgentTask> worker_fallback(
        const std::string& prompt, const std::string& primary,
        const std::vector<std::string>& available_agents) const;

    // Extra instructions embedded in the analysis prompt; empty when the
    // primary may do work itself.
    std::string analysis_instructions(const std::string& primary) const;

private:
    static bool is_blank(const std::string& text);

    RolePolicy role_policy_;
};

}  // namespace cortex::policy
