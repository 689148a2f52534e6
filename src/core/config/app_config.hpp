#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/cortex_errors.hpp"

namespace cortex::core::config {

// Per-invocation agent timeouts must fall within [1, kMaxAgentTimeoutSeconds].
constexpr std::uint32_t kMaxAgentTimeoutSeconds = 24 * 60 * 60;

struct AgentConfig {
    std::optional<std::string> binary_path;  // Detected on PATH when absent
    std::optional<std::string> default_model;
    bool auto_approve = true;
    std::uint32_t timeout = 300;  // seconds
    std::optional<std::uint32_t> max_turns;
    std::vector<std::string> extra_args;
};

struct AppConfig {
    std::string primary = "claude";
    std::uint32_t parallel_timeout = 600;
    bool json_output = true;
    int max_retries = 3;
    double retry_base_delay = 5.0;
    double retry_max_delay = 60.0;
    std::map<std::string, AgentConfig> agents = default_agents();

    AgentConfig get_agent_config(const std::string& name) const;

    static std::map<std::string, AgentConfig> default_agents();
};

std::filesystem::path default_config_dir();
std::filesystem::path default_config_path();

// Missing file: defaults are returned and written back to `path`.
// Missing keys keep their defaults.
errors::Result<AppConfig> load_config(const std::filesystem::path& path);

errors::Result<std::filesystem::path> save_config(const AppConfig& config,
                                          const std::filesystem::path& path);

// Applies one `config set` assignment, e.g. ("agents.codex.timeout", "120").
errors::Result<AppConfig> apply_setting(AppConfig config, const std::string& key,
                                const std::string& value);

std::string render_config(const AppConfig& config);

}  // namespace cortex::core::config
