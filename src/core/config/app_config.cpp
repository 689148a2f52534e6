#include "core/config/app_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <nlohmann/json.hpp>
#include "adapters/output_analysis.hpp"
#include "core/logging/logger.hpp"

namespace cortex::core::config {

using errors::CortexError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentConfig agent_from_json(const json& j) {
    AgentConfig cfg;
    if (j.contains("binary_path") && !j["binary_path"].is_null()) {
        cfg.binary_path = j["binary_path"].get<std::string>();
    }
    if (j.contains("default_model") && !j["default_model"].is_null()) {
        cfg.default_model = j["default_model"].get<std::string>();
    }
    if (j.contains("auto_approve")) cfg.auto_approve = j["auto_approve"].get<bool>();
    if (j.contains("timeout")) cfg.timeout = j["timeout"].get<std::uint32_t>();
    if (j.contains("max_turns") && !j["max_turns"].is_null()) {
        cfg.max_turns = j["max_turns"].get<std::uint32_t>();
    }
    if (j.contains("extra_args")) {
        cfg.extra_args = j["extra_args"].get<std::vector<std::string>>();
    }
    return cfg;
}

json agent_to_json(const AgentConfig& cfg) {
    json j;
    if (cfg.binary_path) j["binary_path"] = *cfg.binary_path;
    if (cfg.default_model) j["default_model"] = *cfg.default_model;
    j["auto_approve"] = cfg.auto_approve;
    j["timeout"] = cfg.timeout;
    if (cfg.max_turns) j["max_turns"] = *cfg.max_turns;
    if (!cfg.extra_args.empty()) j["extra_args"] = cfg.extra_args;
    return j;
}

AppConfig config_from_json(const json& j) {
    AppConfig cfg;
    if (j.contains("primary")) cfg.primary = j["primary"].get<std::string>();
    if (j.contains("parallel_timeout")) {
        cfg.parallel_timeout = j["parallel_timeout"].get<std::uint32_t>();
    }
    if (j.contains("json_output")) cfg.json_output = j["json_output"].get<bool>();
    if (j.contains("max_retries")) cfg.max_retries = j["max_retries"].get<int>();
    if (j.contains("retry_base_delay")) {
        cfg.retry_base_delay = j["retry_base_delay"].get<double>();
    }
    if (j.contains("retry_max_delay")) {
        cfg.retry_max_delay = j["retry_max_delay"].get<double>();
    }

    if (j.contains("agents") && j["agents"].is_object() && !j["agents"].empty()) {
        cfg.agents.clear();
        for (const auto& [name, agent_json] : j["agents"].items()) {
            cfg.agents[name] = agent_from_json(agent_json);
        }
    }
    return cfg;
}

json config_to_json(const AppConfig& cfg) {
    json j;
    j["primary"] = cfg.primary;
    j["parallel_timeout"] = cfg.parallel_timeout;
    j["json_output"] = cfg.json_output;
    j["max_retries"] = cfg.max_retries;
    j["retry_base_delay"] = cfg.retry_base_delay;
    j["retry_max_delay"] = cfg.retry_max_delay;
    j["agents"] = json::object();
    for (const auto& [name, agent] : cfg.agents) {
        j["agents"][name] = agent_to_json(agent);
    }
    return j;
}

bool parse_bool(const std::string& value) {
    const std::string lowered = adapters::lowercase(value);
    return lowered == "true" || lowered == "1" || lowered == "yes";
}

errors::Result<std::uint32_t> parse_uint(const std::string& key,
                                         const std::string& value) {
    std::uint32_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc() || ptr != end || value.empty()) {
        return CortexError{ErrorCategory::Input,
                           "Invalid number for " + key + ": " + value,
                           "invalid_integer", "Provide a non-negative integer."};
    }
    return parsed;
}

errors::Result<std::uint32_t> check_timeout(const std::string& key,
                                            const std::uint32_t seconds) {
    if (seconds == 0 || seconds > kMaxAgentTimeoutSeconds) {
        return CortexError{ErrorCategory::Input,
                           "Timeout out of range for " + key + ": " + std::to_string(seconds),
                           "invalid_timeout",
                           "Use between 1 and " + std::to_string(kMaxAgentTimeoutSeconds) +
                               " seconds."};
    }
    return seconds;
}

errors::Result<double> parse_seconds(const std::string& key,
                                     const std::string& value) {
    char* end = nullptr;
    const double parsed = std::strtod(value.c_str(), &end);
    if (value.empty() || end != value.c_str() + value.size() || parsed < 0.0) {
        return CortexError{ErrorCategory::Input,
                           "Invalid delay for " + key + ": " + value,
                           "invalid_number", "Provide a non-negative number of seconds."};
    }
    return parsed;
}

}  // namespace

std::map<std::string, AgentConfig> AppConfig::default_agents() {
    std::map<std::string, AgentConfig> agents;

    AgentConfig claude;
    claude.max_turns = 15;
    agents["claude"] = claude;

    agents["gemini"] = AgentConfig{};

    AgentConfig codex;
    codex.extra_args = {"--skip-git-repo-check"};
    agents["codex"] = codex;
    return agents;
}

AgentConfig AppConfig::get_agent_config(const std::string& name) const {
    const auto it = agents.find(name);
    if (it == agents.end()) {
        return AgentConfig{};
    }
    return it->second;
}

std::filesystem::path default_config_dir() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return std::filesystem::current_path() / ".cortex";
    }
    return std::filesystem::path(home) / ".cortex";
}

std::filesystem::path default_config_path() {
    return default_config_dir() / "config.json";
}

errors::Result<AppConfig> load_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        LOG_INFO("No config file found, creating default at " + path.string());
        AppConfig defaults;
        auto saved = save_config(defaults, path);
        if (errors::is_error(saved)) {
            LOG_WARN("Could not write default config: " + errors::get_error(saved).message);
        }
        return defaults;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return CortexError{ErrorCategory::Input,
                           "Unable to open config file: " + path.string(),
                           "config_open_failed"};
    }

    try {
        const json j = json::parse(in);
        if (!j.is_object()) {
            return CortexError{ErrorCategory::Input,
                               "Config root must be a JSON object: " + path.string(),
                               "config_parse_failed"};
        }
        LOG_DEBUG("Loaded config: " + j.dump());
        AppConfig loaded = config_from_json(j);
        for (const auto& [name, agent] : loaded.agents) {
            auto checked = check_timeout("agents." + name + ".timeout", agent.timeout);
            if (errors::is_error(checked)) {
                CortexError err = errors::with_context(errors::get_error(checked),
                                                       "Invalid config " + path.string());
                err.code = "config_parse_failed";
                return err;
            }
        }
        return loaded;
    } catch (const json::exception& e) {
        return CortexError{ErrorCategory::Input,
                           "Failed to parse config " + path.string() + ": " + e.what(),
                           "config_parse_failed",
                           "Fix or delete the file to regenerate defaults."};
    }
}

errors::Result<std::filesystem::path> save_config(const AppConfig& config,
                                                  const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return CortexError{ErrorCategory::Internal,
                               "Unable to create config directory: " +
                                   path.parent_path().string(),
                               "config_write_failed"};
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return CortexError{ErrorCategory::Internal,
                           "Unable to open config file for writing: " + path.string(),
                           "config_write_failed"};
    }
    out << config_to_json(config).dump(2) << "\n";
    if (!out.good()) {
        return CortexError{ErrorCategory::Internal,
                           "Unable to write config file: " + path.string(),
                           "config_write_failed"};
    }
    LOG_INFO("Saved config to " + path.string());
    return path;
}

errors::Result<AppConfig> apply_setting(AppConfig config, const std::string& key,
                                        const std::string& value) {
    if (key == "primary") {
        config.primary = value;
        return config;
    }
    if (key == "json_output") {
        config.json_output = parse_bool(value);
        return config;
    }
    if (key == "parallel_timeout" || key == "max_retries") {
        auto parsed = parse_uint(key, value);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        if (key == "parallel_timeout") {
            config.parallel_timeout = errors::get_value(parsed);
        } else {
            config.max_retries = static_cast<int>(errors::get_value(parsed));
        }
        return config;
    }
    if (key == "retry_base_delay" || key == "retry_max_delay") {
        auto parsed = parse_seconds(key, value);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        if (key == "retry_base_delay") {
            config.retry_base_delay = errors::get_value(parsed);
        } else {
            config.retry_max_delay = errors::get_value(parsed);
        }
        return config;
    }

    // agents.<name>.<field>
    const auto first_dot = key.find('.');
    const auto last_dot = key.rfind('.');
    if (first_dot == std::string::npos || first_dot == last_dot ||
        key.substr(0, first_dot) != "agents") {
        return CortexError{ErrorCategory::Input, "Unknown key: " + key, "unknown_config_key"};
    }
    const std::string agent_name = key.substr(first_dot + 1, last_dot - first_dot - 1);
    const std::string field = key.substr(last_dot + 1);
    if (agent_name.empty()) {
        return CortexError{ErrorCategory::Input, "Unknown key: " + key, "unknown_config_key"};
    }

    AgentConfig agent = config.get_agent_config(agent_name);
    if (field == "auto_approve") {
        agent.auto_approve = parse_bool(value);
    } else if (field == "timeout" || field == "max_turns") {
        auto parsed = parse_uint(key, value);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        if (field == "timeout") {
            auto checked = check_timeout(key, errors::get_value(parsed));
            if (errors::is_error(checked)) {
                return errors::get_error(checked);
            }
            agent.timeout = errors::get_value(checked);
        } else {
            agent.max_turns = errors::get_value(parsed);
        }
    } else if (field == "default_model") {
        agent.default_model = value;
    } else if (field == "binary_path") {
        agent.binary_path = value;
    } else {
        return CortexError{ErrorCategory::Input, "Unknown field: " + field,
                           "unknown_config_key"};
    }
    config.agents[agent_name] = agent;
    return config;
}

std::string render_config(const AppConfig& config) {
    std::ostringstream out;
    out << "  primary: " << config.primary << "\n";
    out << "  parallel_timeout: " << config.parallel_timeout << "s\n";
    out << "  json_output: " << (config.json_output ? "true" : "false") << "\n";
    out << "  max_retries: " << config.max_retries << "\n";
    out << "  retry_base_delay: " << config.retry_base_delay << "s\n";
    out << "  retry_max_delay: " << config.retry_max_delay << "s\n\n";
    for (const auto& [name, agent] : config.agents) {
        out << "  " << name << (name == config.primary ? " (primary)" : "") << ":\n";
        out << "    auto_approve: " << (agent.auto_approve ? "true" : "false") << "\n";
        out << "    timeout: " << agent.timeout << "s\n";
        if (agent.binary_path) out << "    binary_path: " << *agent.binary_path << "\n";
        if (agent.default_model) out << "    model: " << *agent.default_model << "\n";
        if (agent.max_turns) out << "    max_turns: " << *agent.max_turns << "\n";
        if (!agent.extra_args.empty()) {
            out << "    extra_args:";
            for (const auto& arg : agent.extra_args) {
                out << " " << arg;
            }
            out << "\n";
        }
    }
    return out.str();
}

}  // namespace cortex::core::config
