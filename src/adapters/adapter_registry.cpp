#include "adapters/adapter_registry.hpp"

#include <utility>
#include "adapters/claude_adapter.hpp"
#include "adapters/codex_adapter.hpp"
#include "adapters/gemini_adapter.hpp"
#include "core/logging/logger.hpp"

namespace cortex::adapters {

namespace {

template <typename Adapter>
AdapterFactory factory_for() {
    return [](AdapterSettings settings) -> std::unique_ptr<AgentAdapter> {
        return std::make_unique<Adapter>(std::move(settings));
    };
}

}  // namespace

const std::map<std::string, AdapterFactory>& adapter_factories() {
    static const std::map<std::string, AdapterFactory> factories = {
        {"claude", factory_for<ClaudeAdapter>()},
        {"gemini", factory_for<GeminiAdapter>()},
        {"codex", factory_for<CodexAdapter>()},
    };
    return factories;
}

bool is_known_agent(const std::string& name) {
    return adapter_factories().count(name) > 0;
}

std::unique_ptr<AgentAdapter> make_adapter(const std::string& name,
                                           AdapterSettings settings) {
    const auto& factories = adapter_factories();
    const auto it = factories.find(name);
    if (it == factories.end()) {
        return nullptr;
    }
    return it->second(std::move(settings));
}

AdapterSettings settings_for(const std::string& detected_binary_path,
                             const core::config::AgentConfig& agent_config) {
    AdapterSettings settings;
    settings.binary_path = agent_config.binary_path.value_or(detected_binary_path);
    settings.timeout_seconds = agent_config.timeout;
    settings.auto_approve = agent_config.auto_approve;
    settings.default_model = agent_config.default_model;
    settings.default_max_turns = agent_config.max_turns;
    settings.extra_args = agent_config.extra_args;
    return settings;
}

AdapterMap build_adapters(const std::map<std::string, DetectedAgent>& detected,
                          const core::config::AppConfig& config) {
    AdapterMap adapters;
    for (const auto& [name, agent] : detected) {
        if (!agent.available) {
            continue;
        }
        auto adapter =
            make_adapter(name, settings_for(agent.binary_path, config.get_agent_config(name)));
        if (!adapter) {
            LOG_DEBUG("No adapter variant for detected agent: " + name);
            continue;
        }
        adapters.emplace(name, std::move(adapter));
    }
    return adapters;
}

}  // namespace cortex::adapters
