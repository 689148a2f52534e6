#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include "adapters/agent_adapter.hpp"
#include "adapters/agent_detector.hpp"
#include "core/config/app_config.hpp"

namespace cortex::adapters {

using AdapterMap = std::map<std::string, std::shared_ptr<const AgentAdapter>>;
using AdapterFactory = std::function<std::unique_ptr<AgentAdapter>(AdapterSettings)>;

// Closed set of supported agent kinds, keyed by agent name.
const std::map<std::string, AdapterFactory>& adapter_factories();

bool is_known_agent(const std::string& name);

// nullptr for names without an adapter variant.
std::unique_ptr<AgentAdapter> make_adapter(const std::string& name,
                                           AdapterSettings settings);

AdapterSettings settings_for(const std::string& detected_binary_path,
                             const core::config::AgentConfig& agent_config);

// One adapter per detected agent that has a known variant.
AdapterMap build_adapters(const std::map<std::string, DetectedAgent>& detected,
                          const core::config::AppConfig& config);

}  // namespace cortex::adapters
