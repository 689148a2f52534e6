#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "protocol/agent_result.hpp"
#include "runtime/agent_executor.hpp"

namespace cortex::runtime {

// Same prompt to several agents at once, no planning or synthesis.
class Comparator {
public:
    explicit Comparator(std::shared_ptr<const AgentExecutor> executor);

    // Absent or empty list means every available agent. Names that are not available are
    // skipped; nothing left to run yields an empty list.
    std::vector<protocol::AgentResult> compare(
        const std::string& prompt,
        const std::optional<std::vector<std::string>>& agent_names = std::nullopt) const;

private:
    std::shared_ptr<const AgentExecutor> executor_;
};

}  // namespace cortex::runtime
