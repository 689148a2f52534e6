#pragma once

#include "adapters/agent_adapter.hpp"

namespace cortex::adapters {

// Claude Code: prompt is the value of -p.
class ClaudeAdapter : public AgentAdapter {
public:
    using AgentAdapter::AgentAdapter;

    std::string name() const override { return "claude"; }
    std::string display_name() const override { return "Claude Code"; }
    std::string provider() const override { return "Anthropic"; }

    std::vector<std::string> build_command(
        const std::string& prompt,
        const protocol::InvocationOptions& options) const override;
};

}  // namespace cortex::adapters
