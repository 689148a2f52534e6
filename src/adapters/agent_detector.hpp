#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "runtime/process_runner.hpp"

namespace cortex::adapters {

struct DetectedAgent {
    std::string name;
    std::string binary_path;
    std::string version;
    std::string display_name;
    std::string provider;
    bool available = true;
};

struct KnownAgent {
    std::string name;
    std::string binary;
    std::string display_name;
    std::string provider;
};

class AgentDetector {
public:
    explicit AgentDetector(std::shared_ptr<const runtime::ProcessRunner> runner,
                           std::vector<KnownAgent> known_agents = default_known_agents(),
                           std::optional<std::string> search_path = std::nullopt);

    // Probes PATH for every known agent; absent ones are simply left out.
    std::map<std::string, DetectedAgent> detect_all() const;

    std::optional<std::filesystem::path> find_in_path(const std::string& binary) const;

    static std::vector<KnownAgent> default_known_agents();

private:
    std::string probe_version(const std::string& binary_path) const;

    std::shared_ptr<const runtime::ProcessRunner> runner_;
    std::vector<KnownAgent> known_agents_;
    std::string search_path_;
};

}  // namespace cortex::adapters
