#include "adapters/agent_detector.hpp"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <future>
#include <regex>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace cortex::adapters {

namespace {

constexpr std::uint32_t kVersionProbeTimeoutMs = 10000;

bool is_executable_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

}  // namespace

AgentDetector::AgentDetector(std::shared_ptr<const runtime::ProcessRunner> runner,
                             std::vector<KnownAgent> known_agents,
                             std::optional<std::string> search_path)
    : runner_(std::move(runner)), known_agents_(std::move(known_agents)) {
    if (search_path.has_value()) {
        search_path_ = *search_path;
    } else {
        const char* env_path = std::getenv("PATH");
        search_path_ = env_path != nullptr ? env_path : "";
    }
}

std::vector<KnownAgent> AgentDetector::default_known_agents() {
    return {
        {"claude", "claude", "Claude Code", "Anthropic"},
        {"gemini", "gemini", "Gemini CLI", "Google"},
        {"codex", "codex", "Codex CLI", "OpenAI"},
    };
}

std::optional<std::filesystem::path> AgentDetector::find_in_path(
    const std::string& binary) const {
    if (binary.find('/') != std::string::npos) {
        if (is_executable_file(binary)) {
            return std::filesystem::path(binary);
        }
        return std::nullopt;
    }

    std::istringstream dirs(search_path_);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        const auto candidate = std::filesystem::path(dir) / binary;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::string AgentDetector::probe_version(const std::string& binary_path) const {
    static const std::regex version_pattern(R"((\d+\.\d+\.\d+))");

    auto probed = runner_->run({binary_path, "--version"}, kVersionProbeTimeoutMs);
    if (core::errors::is_error(probed)) {
        LOG_WARN("Failed to get version of " + binary_path + ": " +
                 core::errors::get_error(probed).message);
        return "unknown";
    }
    const auto& capture = core::errors::get_value(probed);
    if (capture.timed_out) {
        LOG_WARN("Version probe timed out for " + binary_path);
        return "unknown";
    }

    const std::string& text =
        capture.stdout_text.empty() ? capture.stderr_text : capture.stdout_text;
    std::smatch match;
    if (std::regex_search(text, match, version_pattern)) {
        return match[1].str();
    }
    return "unknown";
}

std::map<std::string, DetectedAgent> AgentDetector::detect_all() const {
    std::vector<std::pair<KnownAgent, std::string>> found;
    for (const auto& known : known_agents_) {
        const auto path = find_in_path(known.binary);
        if (!path.has_value()) {
            LOG_DEBUG("Agent " + known.name + " not found on PATH");
            continue;
        }
        LOG_INFO("Found " + known.name + " at " + path->string());
        found.emplace_back(known, path->string());
    }

    std::vector<std::future<std::string>> probes;
    probes.reserve(found.size());
    for (const auto& [known, path] : found) {
        probes.push_back(std::async(std::launch::async, [this, path = path]() {
            return probe_version(path);
        }));
    }

    std::map<std::string, DetectedAgent> detected;
    for (std::size_t i = 0; i < found.size(); ++i) {
        const auto& [known, path] = found[i];
        std::string version = "unknown";
        try {
            version = probes[i].get();
        } catch (const std::exception& e) {
            LOG_WARN("Detection failed for " + known.name + ": " + e.what());
        }
        detected[known.name] =
            DetectedAgent{known.name, path, version, known.display_name, known.provider, true};
    }
    return detected;
}

}  // namespace cortex::adapters
