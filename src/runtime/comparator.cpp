#include "runtime/comparator.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace cortex::runtime {

using protocol::AgentResult;
using protocol::AgentTask;

Comparator::Comparator(std::shared_ptr<const AgentExecutor> executor)
    : executor_(std::move(executor)) {}

std::vector<AgentResult> Comparator::compare(
    const std::string& prompt,
    const std::optional<std::vector<std::string>>& agent_names) const {
    const std::vector<std::string> requested =
        agent_names.has_value() && !agent_names->empty() ? *agent_names
                                                         : executor_->agent_names();

    std::vector<AgentTask> tasks;
    for (const auto& name : requested) {
        if (!executor_->has_agent(name)) {
            LOG_WARN("Skipping unavailable agent: " + name);
            continue;
        }
        tasks.push_back(AgentTask{name, prompt});
    }

    if (tasks.empty()) {
        LOG_WARN("No agents available for comparison");
        return {};
    }

    LOG_INFO("Comparing " + std::to_string(tasks.size()) + " agents");
    return executor_->run_parallel(tasks);
}

}  // namespace cortex::runtime
