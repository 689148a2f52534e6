#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "protocol/agent_result.hpp"
#include "protocol/invocation_options.hpp"

namespace cortex::adapters {

struct AdapterSettings {
    std::string binary_path;
    std::uint32_t timeout_seconds = 300;
    bool auto_approve = true;
    std::optional<std::string> default_model;
    std::optional<std::uint32_t> default_max_turns;
    std::vector<std::string> extra_args;
};

// Translates (prompt, options) into an argument vector for one agent CLI and
// turns its raw output back into an AgentResult. Stateless across invocations.
class AgentAdapter {
public:
    explicit AgentAdapter(AdapterSettings settings);
    virtual ~AgentAdapter() = default;

    virtual std::string name() const = 0;
    virtual std::string display_name() const = 0;
    virtual std::string provider() const = 0;

    virtual std::vector<std::string> build_command(
        const std::string& prompt, const protocol::InvocationOptions& options) const = 0;

    // Identity unless the agent prints known benign warnings on stderr.
    virtual std::string filter_stderr(const std::string& stderr_text) const;

    protocol::AgentResult parse_output(const std::string& stdout_bytes,
                                       const std::string& stderr_bytes,
                                       int returncode) const;

    const AdapterSettings& settings() const { return settings_; }
    std::uint32_t timeout_seconds() const { return settings_.timeout_seconds; }

protected:
    std::optional<std::string> effective_model(
        const protocol::InvocationOptions& options) const;
    bool effective_auto_approve(const protocol::InvocationOptions& options) const;
    std::optional<std::uint32_t> effective_max_turns(
        const protocol::InvocationOptions& options) const;

private:
    AdapterSettings settings_;
};

}  // namespace cortex::adapters
