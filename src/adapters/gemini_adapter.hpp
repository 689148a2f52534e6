#pragma once

#include "adapters/agent_adapter.hpp"

namespace cortex::adapters {

// Gemini CLI: positional prompt last; stderr carries Node deprecation noise.
class GeminiAdapter : public AgentAdapter {
public:
    using AgentAdapter::AgentAdapter;

    std::string name() const override { return "gemini"; }
    std::string display_name() const override { return "Gemini CLI"; }
    std::string provider() const override { return "Google"; }

    std::vector<std::string> build_command(
        const std::string& prompt,
        const protocol::InvocationOptions& options) const override;

    std::string filter_stderr(const std::string& stderr_text) const override;
};

}  // namespace cortex::adapters
