#pragma once
#include <string>
#include <variant>

namespace cortex::core::errors {

// Drives both the log wording and the CLI exit code.
enum class ErrorCategory {
    Input,      // unknown agent, bad flag, bad config value
    Execution,  // agent binary could not be spawned or streamed
    Provider,   // primary answered with something unusable
    Policy,     // coordinator-only primary left without workers
    Internal
};

struct CortexError {
    ErrorCategory category;
    std::string message;
    std::string code = "unknown_error";
    std::string hint = "";
};

// Either the value or the reason it could not be produced.
template <typename T>
using Result = std::variant<T, CortexError>;

template <typename T>
bool is_error(const Result<T>& result) {
    return std::holds_alternative<CortexError>(result);
}

template <typename T>
const CortexError& get_error(const Result<T>& result) {
    return std::get<CortexError>(result);
}

template <typename T>
const T& get_value(const Result<T>& result) {
    return std::get<T>(result);
}

inline std::string to_string(const ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Input: return "input";
        case ErrorCategory::Execution: return "execution";
        case ErrorCategory::Provider: return "provider";
        case ErrorCategory::Policy: return "policy";
        case ErrorCategory::Internal: return "internal";
        default: return "unknown";
    }
}

// "policy/no_worker_agents: No worker agents available"
inline std::string describe(const CortexError& err) {
    return to_string(err.category) + "/" + err.code + ": " + err.message;
}

// Same error, message prefixed with where it happened.
inline CortexError with_context(CortexError err, const std::string& context) {
    err.message = context + ": " + err.message;
    return err;
}

}  // namespace cortex::core::errors
