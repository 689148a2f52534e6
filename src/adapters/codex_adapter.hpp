#pragma once

#include "adapters/agent_adapter.hpp"

namespace cortex::adapters {

// Codex CLI: `codex exec [flags] <prompt>`.
class CodexAdapter : public AgentAdapter {
public:
    using AgentAdapter::AgentAdapter;

    std::string name() const override { return "codex"; }
    std::string display_name() const override { return "Codex CLI"; }
    std::string provider() const override { return "OpenAI"; }

    std::vector<std::string> build_command(
        const std::string& prompt,
        const protocol::InvocationOptions& options) const override;
};

}  // namespace cortex::adapters
