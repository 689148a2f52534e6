#include "adapters/codex_adapter.hpp"

namespace cortex::adapters {

std::vector<std::string> CodexAdapter::build_command(
    const std::string& prompt, const protocol::InvocationOptions& options) const {
    std::vector<std::string> cmd = {settings().binary_path, "exec"};

    if (const auto model = effective_model(options)) {
        cmd.insert(cmd.end(), {"-m", *model});
    }
    if (effective_auto_approve(options)) {
        cmd.push_back("--full-auto");
    }
    if (options.json_output) {
        cmd.push_back("--json");
    }

    // --skip-git-repo-check comes from the configured extra args only.
    cmd.insert(cmd.end(), settings().extra_args.begin(), settings().extra_args.end());

    // Prompt must be last
    cmd.push_back(prompt);
    return cmd;
}

}  // namespace cortex::adapters
