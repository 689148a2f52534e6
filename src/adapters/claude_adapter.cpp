#include "adapters/claude_adapter.hpp"

namespace cortex::adapters {

std::vector<std::string> ClaudeAdapter::build_command(
    const std::string& prompt, const protocol::InvocationOptions& options) const {
    std::vector<std::string> cmd = {settings().binary_path, "-p", prompt};

    if (options.json_output) {
        cmd.insert(cmd.end(), {"--output-format", "json"});
    }
    if (const auto model = effective_model(options)) {
        cmd.insert(cmd.end(), {"--model", *model});
    }
    if (effective_auto_approve(options)) {
        cmd.insert(cmd.end(), {"--permission-mode", "dontAsk"});
    }
    if (options.system_prompt.has_value() && !options.system_prompt->empty()) {
        cmd.insert(cmd.end(), {"--append-system-prompt", *options.system_prompt});
    }
    if (const auto max_turns = effective_max_turns(options)) {
        cmd.insert(cmd.end(), {"--max-turns", std::to_string(*max_turns)});
    }

    cmd.insert(cmd.end(), settings().extra_args.begin(), settings().extra_args.end());
    return cmd;
}

}  // namespace cortex::adapters
