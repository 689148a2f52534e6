#pragma once

#include <optional>
#include <string>
#include <vector>

namespace cortex::protocol {

enum class SubtaskPriority {
    High,
    Medium,
    Low
};

struct Subtask {
    std::string agent;
    std::string prompt;
    SubtaskPriority priority = SubtaskPriority::Medium;
};

// Parsed answer of the primary agent to the analysis prompt.
struct DelegationPlan {
    bool delegate = false;
    std::string reasoning;
    std::vector<Subtask> subtasks;
    std::optional<std::string> self_task;
};

// One unit of work for the executor.
struct AgentTask {
    std::string agent_name;
    std::string prompt;

    bool operator==(const AgentTask& other) const {
        return agent_name == other.agent_name && prompt == other.prompt;
    }
};

inline std::string to_string(const SubtaskPriority priority) {
    switch (priority) {
        case SubtaskPriority::High:
            return "high";
        case SubtaskPriority::Medium:
            return "medium";
        case SubtaskPriority::Low:
            return "low";
        default:
            return "unknown";
    }
}

inline SubtaskPriority priority_from_string(const std::string& value) {
    if (value == "high") {
        return SubtaskPriority::High;
    }
    if (value == "low") {
        return SubtaskPriority::Low;
    }
    return SubtaskPriority::Medium;
}

}  // namespace cortex::protocol
