#include "runtime/agent_executor.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <future>
#include <sstream>
#include <thread>
#include <utility>
#include "adapters/output_analysis.hpp"
#include "core/logging/logger.hpp"

namespace cortex::runtime {

using core::errors::CortexError;
using core::errors::ErrorCategory;
using protocol::AgentResult;
using protocol::AgentTask;
using protocol::InvocationOptions;

namespace {

std::string format_seconds(const double seconds) {
    std::ostringstream out;
    out.precision(2);
    out << std::fixed << seconds;
    return out.str();
}

AgentResult unknown_agent(const std::string& agent_name) {
    return AgentResult::from_error(agent_name, "Unknown agent: " + agent_name);
}

}  // namespace

RetryPolicy RetryPolicy::from_config(const core::config::AppConfig& config) {
    RetryPolicy policy;
    policy.max_retries = std::max(0, config.max_retries);
    policy.base_delay_seconds = config.retry_base_delay;
    policy.max_delay_seconds = config.retry_max_delay;
    return policy;
}

AgentExecutor::AgentExecutor(adapters::AdapterMap adapters,
                             std::shared_ptr<const ProcessRunner> runner,
                             RetryPolicy retry_policy)
    : adapters_(std::move(adapters)),
      runner_(std::move(runner)),
      retry_policy_(retry_policy) {}

bool AgentExecutor::has_agent(const std::string& agent_name) const {
    return adapters_.count(agent_name) > 0;
}

std::vector<std::string> AgentExecutor::agent_names() const {
    std::vector<std::string> names;
    names.reserve(adapters_.size());
    for (const auto& [name, adapter] : adapters_) {
        names.push_back(name);
    }
    return names;
}

double AgentExecutor::compute_delay(const int attempt,
                                    const std::optional<double> retry_after) const {
    if (retry_after.has_value()) {
        return std::min(*retry_after, retry_policy_.max_delay_seconds);
    }
    const double backoff =
        retry_policy_.base_delay_seconds * std::pow(2.0, std::max(0, attempt - 1));
    return std::min(backoff, retry_policy_.max_delay_seconds);
}

AgentExecutor::Attempt AgentExecutor::execute_once(const adapters::AgentAdapter& adapter,
                                                   const std::string& prompt,
                                                   const InvocationOptions& options) const {
    try {
        const auto argv = adapter.build_command(prompt, options);
        LOG_DEBUG("Running " + adapter.name() + ": " + argv.front() + " (" +
                  std::to_string(argv.size()) + " args)");

        const std::uint32_t timeout_seconds = adapter.timeout_seconds();
        auto ran = runner_->run(argv, static_cast<std::uint64_t>(timeout_seconds) * 1000U);
        if (core::errors::is_error(ran)) {
            const auto& err = core::errors::get_error(ran);
            LOG_ERROR("Error running " + adapter.name() + " [" + err.code + "]: " +
                      err.message);
            return Attempt{AgentResult::from_error(adapter.name(), err.message),
                           std::nullopt};
        }

        const auto& capture = core::errors::get_value(ran);
        if (capture.timed_out) {
            LOG_WARN(adapter.name() + " timed out after " +
                     std::to_string(timeout_seconds) + "s");
            auto result = AgentResult::from_error(
                adapter.name(),
                "Agent timed out after " + std::to_string(timeout_seconds) + "s");
            result.metadata["timeout_seconds"] = timeout_seconds;
            return Attempt{result, std::nullopt};
        }

        auto result =
            adapter.parse_output(capture.stdout_text, capture.stderr_text, capture.exit_code);
        std::optional<double> retry_after;
        if (result.rate_limited) {
            retry_after = adapters::extract_retry_after(result.output, result.error_text);
        }
        return Attempt{result, retry_after};
    } catch (const std::exception& e) {
        LOG_ERROR("Error running " + adapter.name() + ": " + e.what());
        return Attempt{AgentResult::from_error(adapter.name(), e.what()), std::nullopt};
    }
}

AgentResult AgentExecutor::run_single(const std::string& agent_name,
                                      const std::string& prompt,
                                      const InvocationOptions& options) const {
    const auto it = adapters_.find(agent_name);
    if (it == adapters_.end()) {
        LOG_WARN("Unknown agent requested: " + agent_name);
        return unknown_agent(agent_name);
    }
    const auto& adapter = *it->second;

    const auto started = std::chrono::steady_clock::now();
    const int max_retries = std::max(0, retry_policy_.max_retries);
    Attempt last;
    int retries = 0;
    for (int attempt = 0; attempt <= max_retries; ++attempt) {
        if (attempt > 0) {
            const double delay = compute_delay(attempt, last.retry_after);
            LOG_WARN(agent_name + " rate limited (attempt " + std::to_string(attempt) + "/" +
                     std::to_string(max_retries) + "), retrying in " +
                     format_seconds(delay) + "s");
            std::this_thread::sleep_for(std::chrono::duration<double>(delay));
            retries = attempt;
        }

        last = execute_once(adapter, prompt, options);
        if (!last.result.rate_limited) {
            break;
        }
    }

    if (last.result.rate_limited) {
        LOG_ERROR(agent_name + " still rate limited after " + std::to_string(retries) +
                  " retries");
    }

    AgentResult result = std::move(last.result);
    result.retries = retries;
    result.duration_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    LOG_INFO(agent_name + " finished: " + result.status_label() + " in " +
             format_seconds(result.duration_seconds) + "s");
    return result;
}

std::vector<AgentResult> AgentExecutor::run_parallel(const std::vector<AgentTask>& tasks,
                                                     const InvocationOptions& options) const {
    struct Pending {
        std::future<AgentResult> future;
        std::string launch_error;
    };

    std::vector<Pending> pending;
    pending.reserve(tasks.size());
    for (const auto& task : tasks) {
        Pending entry;
        try {
            entry.future = std::async(std::launch::async, [this, task, options]() {
                return run_single(task.agent_name, task.prompt, options);
            });
        } catch (const std::exception& e) {
            entry.launch_error = e.what();
        }
        pending.push_back(std::move(entry));
    }

    std::vector<AgentResult> results;
    results.reserve(tasks.size());
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        if (!pending[i].future.valid()) {
            LOG_ERROR("Failed to launch task for " + tasks[i].agent_name + ": " +
                      pending[i].launch_error);
            results.push_back(
                AgentResult::from_error(tasks[i].agent_name, pending[i].launch_error));
            continue;
        }
        try {
            results.push_back(pending[i].future.get());
        } catch (const std::exception& e) {
            LOG_ERROR("Task for " + tasks[i].agent_name + " raised: " + e.what());
            results.push_back(AgentResult::from_error(tasks[i].agent_name, e.what()));
        }
    }
    return results;
}

core::errors::Result<int> AgentExecutor::stream(const std::string& agent_name,
                                                const std::string& prompt,
                                                const InvocationOptions& options,
                                                const LineCallback& on_line) const {
    const auto it = adapters_.find(agent_name);
    if (it == adapters_.end()) {
        return CortexError{ErrorCategory::Input, "Unknown agent: " + agent_name,
                           "unknown_agent", "Run 'cortex status' to list detected agents."};
    }
    const auto argv = it->second->build_command(prompt, options);
    LOG_DEBUG("Streaming " + agent_name);
    return runner_->stream(argv, on_line);
}

}  // namespace cortex::runtime
