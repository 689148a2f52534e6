#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "core/errors/cortex_errors.hpp"

namespace cortex::runtime {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

using LineCallback = std::function<void(const std::string& line)>;

// Spawn boundary of the executor. Implementations may throw; the executor
// converts both errors and exceptions into failed agent results.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Runs argv[0] with the given arguments, capturing stdout/stderr.
    // A timeout of 0 disables the limit. On expiry the process group is killed.
    virtual core::errors::Result<ProcessCapture> run(
        const std::vector<std::string>& argv, std::uint64_t timeout_ms) const = 0;

    // Delivers stdout line by line as it is produced; returns the exit code.
    virtual core::errors::Result<int> stream(const std::vector<std::string>& argv,
                                             const LineCallback& on_line) const = 0;
};

class PosixProcessRunner : public ProcessRunner {
public:
    core::errors::Result<ProcessCapture> run(const std::vector<std::string>& argv,
                                             std::uint64_t timeout_ms) const override;

    core::errors::Result<int> stream(const std::vector<std::string>& argv,
                                     const LineCallback& on_line) const override;
};

}  // namespace cortex::runtime
