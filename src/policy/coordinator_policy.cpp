#include "policy/coordinator_policy.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include "core/logging/logger.hpp"

namespace cortex::policy {

using protocol::AgentTask;
using protocol::DelegationPlan;

CoordinatorPolicy::CoordinatorPolicy(RolePolicy role_policy)
    : role_policy_(std::move(role_policy)) {}

bool CoordinatorPolicy::is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](const unsigned char c) {
        return std::isspace(c) != 0;
    });
}

bool CoordinatorPolicy::is_coordinator_only(const std::string& agent_name) const {
    return agent_name == role_policy_.coordinator_only_agent;
}

std::vector<AgentTask> CoordinatorPolicy::select_subtasks(
    const DelegationPlan& plan, const std::string& primary,
    const std::vector<std::string>& available_agents) const {
    const bool coordinator_only = is_coordinator_only(primary);

    std::vector<AgentTask> tasks;
    for (const auto& subtask : plan.subtasks) {
        if (is_blank(subtask.prompt)) {
            LOG_WARN("Dropping subtask for '" + subtask.agent + "' with an empty prompt");
            continue;
        }
        if (std::find(available_agents.begin(), available_agents.end(), subtask.agent) ==
            available_agents.end()) {
            LOG_WARN("Dropping subtask for unavailable agent '" + subtask.agent + "'");
            continue;
        }
        if (coordinator_only && subtask.agent == primary) {
            LOG_WARN("Dropping subtask assigned to coordinator-only primary '" + primary +
                     "'");
            continue;
        }
        tasks.push_back(AgentTask{subtask.agent, subtask.prompt});
    }
    return tasks;
}

std::vector<AgentTask> CoordinatorPolicy::worker_fallback(
    const std::string& prompt, const std::string& primary,
    const std::vector<std::string>& available_agents) const {
    std::vector<AgentTask> tasks;
    for (const auto& agent : available_agents) {
        if (agent != primary) {
            tasks.push_back(AgentTask{agent, prompt});
        }
    }
    return tasks;
}

std::string CoordinatorPolicy::analysis_instructions(const std::string& primary) const {
    if (!is_coordinator_only(primary)) {
        return "";
    }
    return "COORDINATOR POLICY:\n"
           "The primary agent (" +
           primary +
           ") is coordinator-only.\n"
           "- Always set \"delegate\": true.\n"
           "- Do not assign any subtask to " +
           primary +
           ".\n"
           "- Always set \"self_task\": null.\n";
}

}  // namespace cortex::policy
