#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cortex::protocol {

    enum class CliCommand {
        Orchestrate,
        Run,
        Compare,
        Status,
        ConfigShow,
        ConfigSet
    };

    // Validated command-line input for one invocation of the tool
    struct RunRequest {
        CliCommand command = CliCommand::Orchestrate;
        std::string prompt;
        std::optional<std::string> agent;                  // run
        std::optional<std::vector<std::string>> agents;    // compare --agents
        std::optional<std::string> config_key;             // config set
        std::optional<std::string> config_value;           // config set
        std::optional<std::string> primary_override;       // --primary
        std::optional<std::filesystem::path> config_path;  // --config
        std::optional<std::filesystem::path> log_file;     // --log-file
        bool stream = false;
        bool verbose = false;
    };

    inline std::string to_string(const CliCommand command) {
        switch (command) {
            case CliCommand::Orchestrate: return "orchestrate";
            case CliCommand::Run: return "run";
            case CliCommand::Compare: return "compare";
            case CliCommand::Status: return "status";
            case CliCommand::ConfigShow: return "config show";
            case CliCommand::ConfigSet: return "config set";
            default: return "unknown";
        }
    }

} // namespace cortex::protocol
