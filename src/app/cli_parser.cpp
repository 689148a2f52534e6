#include "cli_parser.hpp"
#include <optional>
#include <sstream>
#include <vector>

namespace cortex::app::cli {

    using namespace cortex::core::errors;
    using cortex::protocol::CliCommand;
    using cortex::protocol::RunRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::vector<std::string> positionals;
        std::optional<std::string> config_path;
        std::optional<std::string> primary;
        std::optional<std::string> log_file;
        std::optional<std::string> agents;
        bool stream = false;
        bool verbose = false;
    };

    namespace {

        std::string join_words(const std::vector<std::string>& words, size_t from) {
            std::string joined;
            for (size_t i = from; i < words.size(); ++i) {
                if (!joined.empty()) joined += " ";
                joined += words[i];
            }
            return joined;
        }

        std::string trim_copy(const std::string& value) {
            const auto first = value.find_first_not_of(" \t");
            if (first == std::string::npos) return "";
            const auto last = value.find_last_not_of(" \t");
            return value.substr(first, last - first + 1);
        }

        std::vector<std::string> split_agents(const std::string& value) {
            std::vector<std::string> names;
            std::istringstream in(value);
            std::string item;
            while (std::getline(in, item, ',')) {
                item = trim_copy(item);
                if (!item.empty()) names.push_back(item);
            }
            return names;
        }

    } // namespace

    std::string usage() {
        return "Usage:\n"
               "  cortex [options] <prompt...>              orchestrate across agents\n"
               "  cortex [options] orchestrate <prompt...>\n"
               "  cortex [options] run <agent> <prompt...> [--stream]\n"
               "  cortex [options] compare <prompt...> [--agents a,b]\n"
               "  cortex [options] status\n"
               "  cortex [options] config show\n"
               "  cortex [options] config set <key> <value>\n"
               "\n"
               "Options:\n"
               "  --config <path>     config file (default ~/.cortex/config.json)\n"
               "  --primary <name>    primary agent for orchestration\n"
               "  --log-file <path>   debug log file (default ~/.cortex/debug.log)\n"
               "  -v, --verbose       debug logging on stderr\n";
    }

    Result<RunRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return CortexError{ErrorCategory::Input, "No command or prompt provided.", "missing_command", "Usage: cortex \"<prompt>\""};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        bool positional_only = false;
        for (size_t i = 0; i < args.size(); ++i) {
            if (positional_only) {
                raw.positionals.push_back(args[i]);
            } else if (args[i] == "--") {
                positional_only = true;
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config_path = args[++i];
                else return CortexError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--primary") {
                if (i + 1 < args.size()) raw.primary = args[++i];
                else return CortexError{ErrorCategory::Input, "Missing value for --primary", "missing_value"};
            } else if (args[i] == "--log-file") {
                if (i + 1 < args.size()) raw.log_file = args[++i];
                else return CortexError{ErrorCategory::Input, "Missing value for --log-file", "missing_value"};
            } else if (args[i] == "--agents") {
                if (i + 1 < args.size()) raw.agents = args[++i];
                else return CortexError{ErrorCategory::Input, "Missing value for --agents", "missing_value"};
            } else if (args[i] == "--stream") {
                raw.stream = true;
            } else if (args[i] == "--verbose" || args[i] == "-v") {
                raw.verbose = true;
            } else if (args[i].size() > 1 && args[i][0] == '-') {
                return CortexError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", "Use '--' before a prompt that starts with '-'."};
            } else {
                raw.positionals.push_back(args[i]);
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        RunRequest req;
        req.verbose = raw.verbose;
        req.stream = raw.stream;
        if (raw.config_path) req.config_path = std::filesystem::path(raw.config_path.value());
        if (raw.log_file) req.log_file = std::filesystem::path(raw.log_file.value());
        if (raw.primary) {
            if (trim_copy(raw.primary.value()).empty()) {
                return CortexError{ErrorCategory::Input, "--primary cannot be empty", "invalid_value"};
            }
            req.primary_override = trim_copy(raw.primary.value());
        }

        if (raw.positionals.empty()) {
            return CortexError{ErrorCategory::Input, "No command or prompt provided.", "missing_command", "Usage: cortex \"<prompt>\""};
        }

        const std::string& command = raw.positionals.front();
        if (command == "run") {
            req.command = CliCommand::Run;
            if (raw.positionals.size() < 3) {
                return CortexError{ErrorCategory::Input, "run needs an agent and a prompt", "missing_argument", "Usage: cortex run <agent> <prompt>"};
            }
            req.agent = raw.positionals[1];
            req.prompt = join_words(raw.positionals, 2);
        } else if (command == "compare") {
            req.command = CliCommand::Compare;
            req.prompt = join_words(raw.positionals, 1);
            if (raw.agents) {
                auto names = split_agents(raw.agents.value());
                if (names.empty()) {
                    return CortexError{ErrorCategory::Input, "--agents needs at least one agent name", "invalid_value", "Example: --agents claude,gemini"};
                }
                req.agents = std::move(names);
            }
        } else if (command == "status") {
            req.command = CliCommand::Status;
            if (raw.positionals.size() > 1) {
                return CortexError{ErrorCategory::Input, "status takes no arguments", "unexpected_argument"};
            }
        } else if (command == "config") {
            const std::string action = raw.positionals.size() > 1 ? raw.positionals[1] : "show";
            if (action == "show") {
                req.command = CliCommand::ConfigShow;
                if (raw.positionals.size() > 2) {
                    return CortexError{ErrorCategory::Input, "config show takes no arguments", "unexpected_argument"};
                }
            } else if (action == "set") {
                req.command = CliCommand::ConfigSet;
                if (raw.positionals.size() != 4) {
                    return CortexError{ErrorCategory::Input, "config set needs a key and a value", "missing_argument", "Usage: cortex config set <key> <value>"};
                }
                req.config_key = raw.positionals[2];
                req.config_value = raw.positionals[3];
            } else {
                return CortexError{ErrorCategory::Input, "Unknown config action: " + action, "unknown_command", "Use 'config show' or 'config set <key> <value>'."};
            }
        } else if (command == "orchestrate") {
            req.command = CliCommand::Orchestrate;
            req.prompt = join_words(raw.positionals, 1);
        } else {
            req.command = CliCommand::Orchestrate;
            req.prompt = join_words(raw.positionals, 0);
        }

        const bool needs_prompt = req.command == CliCommand::Orchestrate ||
                                  req.command == CliCommand::Run ||
                                  req.command == CliCommand::Compare;
        if (needs_prompt && trim_copy(req.prompt).empty()) {
            return CortexError{ErrorCategory::Input, "Prompt cannot be empty.", "missing_prompt"};
        }
        if (req.stream && req.command != CliCommand::Run) {
            return CortexError{ErrorCategory::Input, "--stream is only valid with 'run'", "conflicting_flags"};
        }
        if (raw.agents && req.command != CliCommand::Compare) {
            return CortexError{ErrorCategory::Input, "--agents is only valid with 'compare'", "conflicting_flags"};
        }

        return req;
    }

} // namespace cortex::app::cli
