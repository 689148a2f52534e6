#include "adapters/gemini_adapter.hpp"

#include <sstream>
#include "adapters/output_analysis.hpp"

namespace cortex::adapters {

namespace {

bool is_benign_warning(const std::string& line) {
    return lowercase(line).find("punycode") != std::string::npos ||
           line.find("DeprecationWarning") != std::string::npos;
}

}  // namespace

std::vector<std::string> GeminiAdapter::build_command(
    const std::string& prompt, const protocol::InvocationOptions& options) const {
    std::vector<std::string> cmd = {settings().binary_path};

    if (options.json_output) {
        cmd.insert(cmd.end(), {"--output-format", "json"});
    }
    if (const auto model = effective_model(options)) {
        cmd.insert(cmd.end(), {"-m", *model});
    }
    if (effective_auto_approve(options)) {
        cmd.push_back("-y");
    }

    cmd.insert(cmd.end(), settings().extra_args.begin(), settings().extra_args.end());

    // Positional argument must come last
    cmd.push_back(prompt);
    return cmd;
}

std::string GeminiAdapter::filter_stderr(const std::string& stderr_text) const {
    std::istringstream in(stderr_text);
    std::string line;
    std::string kept;
    while (std::getline(in, line)) {
        if (is_benign_warning(line)) {
            continue;
        }
        if (!kept.empty()) {
            kept += "\n";
        }
        kept += line;
    }
    return trim(kept);
}

}  // namespace cortex::adapters
