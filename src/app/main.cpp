#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include "adapters/adapter_registry.hpp"
#include "adapters/agent_detector.hpp"
#include "app/cli_parser.hpp"
#include "app/report.hpp"
#include "core/config/app_config.hpp"
#include "core/errors/cortex_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/coordinator_policy.hpp"
#include "runtime/agent_executor.hpp"
#include "runtime/comparator.hpp"
#include "runtime/orchestrator.hpp"
#include "runtime/process_runner.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitAgentFailure = 1;
constexpr int kExitInputError = 2;
constexpr int kExitNoAgents = 3;
constexpr int kExitFatal = 4;

void report_error(const std::string& context, const cortex::core::errors::CortexError& err) {
    LOG_ERROR(context + " (" + cortex::core::errors::describe(err) + ")");
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

void configure_log_file(const cortex::protocol::RunRequest& req) {
    const std::filesystem::path log_path =
        req.log_file.value_or(cortex::core::config::default_config_dir() / "debug.log");
    std::error_code ec;
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }
    if (ec || !cortex::core::logging::Logger::get().open_file(log_path)) {
        LOG_WARN("Unable to open log file: " + log_path.string());
    }
}

int run_agent(const cortex::runtime::AgentExecutor& executor,
              const cortex::protocol::RunRequest& req) {
    const std::string& agent = req.agent.value();
    if (!executor.has_agent(agent)) {
        report_error("Cannot run agent",
                     {cortex::core::errors::ErrorCategory::Input, "Unknown agent: " + agent,
                      "unknown_agent", "Run 'cortex status' to list detected agents."});
        return kExitInputError;
    }

    if (req.stream) {
        auto streamed = executor.stream(agent, req.prompt, {}, [](const std::string& line) {
            std::cout << line << std::endl;
        });
        if (cortex::core::errors::is_error(streamed)) {
            report_error("Streaming failed", cortex::core::errors::get_error(streamed));
            return kExitAgentFailure;
        }
        return cortex::core::errors::get_value(streamed) == 0 ? kExitOk : kExitAgentFailure;
    }

    const auto result = executor.run_single(agent, req.prompt);
    std::cout << cortex::app::report::format_result(result);
    return result.success ? kExitOk : kExitAgentFailure;
}

int run_compare(const std::shared_ptr<const cortex::runtime::AgentExecutor>& executor,
                const cortex::protocol::RunRequest& req) {
    cortex::runtime::Comparator comparator(executor);
    const auto results = comparator.compare(req.prompt, req.agents);
    if (results.empty()) {
        LOG_ERROR("None of the requested agents are available.");
        return kExitInputError;
    }
    std::cout << cortex::app::report::format_comparison(results);
    for (const auto& result : results) {
        if (result.success) {
            return kExitOk;
        }
    }
    return kExitAgentFailure;
}

int run_orchestration(const std::shared_ptr<const cortex::runtime::AgentExecutor>& executor,
                      const cortex::core::config::AppConfig& config,
                      const cortex::protocol::RunRequest& req) {
    std::string primary = req.primary_override.value_or(config.primary);
    if (!executor->has_agent(primary)) {
        if (req.primary_override.has_value()) {
            report_error("Cannot orchestrate",
                         {cortex::core::errors::ErrorCategory::Input,
                          "Primary agent '" + primary + "' is not available.",
                          "primary_unavailable", "Run 'cortex status' to list detected agents."});
            return kExitInputError;
        }
        const std::string fallback = executor->agent_names().front();
        LOG_WARN("Configured primary '" + primary + "' is not available, using '" + fallback +
                 "'");
        primary = fallback;
    }

    cortex::runtime::Orchestrator orchestrator(executor, primary,
                                               cortex::policy::CoordinatorPolicy{},
                                               config.json_output);
    auto outcome = orchestrator.run_detailed(req.prompt);
    if (cortex::core::errors::is_error(outcome)) {
        const auto& err = cortex::core::errors::get_error(outcome);
        report_error("Orchestration failed", err);
        return err.category == cortex::core::errors::ErrorCategory::Policy ? kExitFatal
                                                                           : kExitInputError;
    }

    const auto& result = cortex::core::errors::get_value(outcome);
    std::clog << cortex::app::report::format_outcome_summary(result);
    if (!result.final_result.success) {
        report_error("Primary agent failed",
                     {cortex::core::errors::ErrorCategory::Execution,
                      result.final_result.status_label() + ": " + result.final_result.error_text,
                      "agent_failed"});
        return kExitAgentFailure;
    }
    std::cout << result.text << std::endl;
    return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag every log record of this invocation
    cortex::core::logging::Logger::get().begin_invocation();

    // 2. Parse CLI input and return normalized input errors
    auto parsed = cortex::app::cli::parse_and_validate(argc, argv);
    if (cortex::core::errors::is_error(parsed)) {
        report_error("Input error", cortex::core::errors::get_error(parsed));
        std::cerr << cortex::app::cli::usage();
        return kExitInputError;
    }
    const auto& req = cortex::core::errors::get_value(parsed);

    if (req.verbose) {
        cortex::core::logging::Logger::get().set_min_level(
            cortex::core::logging::LogLevel::DEBUG);
    }
    configure_log_file(req);
    LOG_DEBUG("Command: " + cortex::protocol::to_string(req.command));

    // 3. Load configuration, creating defaults on first use
    const std::filesystem::path config_path =
        req.config_path.value_or(cortex::core::config::default_config_path());
    cortex::core::config::AppConfig config;
    auto loaded = cortex::core::config::load_config(config_path);
    if (cortex::core::errors::is_error(loaded)) {
        const auto& err = cortex::core::errors::get_error(loaded);
        if (err.code != "config_parse_failed") {
            report_error("Config error", err);
            return kExitInputError;
        }
        LOG_WARN("Using default config: " + err.message);
    } else {
        config = cortex::core::errors::get_value(loaded);
    }

    if (req.command == cortex::protocol::CliCommand::ConfigShow) {
        std::cout << "Config: " << config_path.string() << "\n\n"
                  << cortex::core::config::render_config(config);
        return kExitOk;
    }
    if (req.command == cortex::protocol::CliCommand::ConfigSet) {
        auto updated = cortex::core::config::apply_setting(config, req.config_key.value(),
                                                           req.config_value.value());
        if (cortex::core::errors::is_error(updated)) {
            report_error("Config error", cortex::core::errors::get_error(updated));
            return kExitInputError;
        }
        auto saved =
            cortex::core::config::save_config(cortex::core::errors::get_value(updated), config_path);
        if (cortex::core::errors::is_error(saved)) {
            report_error("Config error", cortex::core::errors::get_error(saved));
            return kExitAgentFailure;
        }
        std::cout << "Set " << req.config_key.value() << " = " << req.config_value.value()
                  << "\n";
        return kExitOk;
    }

    // 4. Detect installed agents
    auto runner = std::make_shared<cortex::runtime::PosixProcessRunner>();
    cortex::adapters::AgentDetector detector(runner);
    const auto detected = detector.detect_all();

    if (req.command == cortex::protocol::CliCommand::Status) {
        std::cout << cortex::app::report::format_status(detected, config.primary);
        return detected.empty() ? kExitNoAgents : kExitOk;
    }

    auto adapters = cortex::adapters::build_adapters(detected, config);
    if (adapters.empty()) {
        report_error("Cannot start",
                     {cortex::core::errors::ErrorCategory::Input, "No agents detected.",
                      "no_agents_detected",
                      "Install claude, gemini or codex and make sure they are on PATH."});
        return kExitNoAgents;
    }

    // 5. Dispatch
    std::shared_ptr<const cortex::runtime::AgentExecutor> executor =
        std::make_shared<cortex::runtime::AgentExecutor>(
            std::move(adapters), runner, cortex::runtime::RetryPolicy::from_config(config));

    switch (req.command) {
        case cortex::protocol::CliCommand::Run:
            return run_agent(*executor, req);
        case cortex::protocol::CliCommand::Compare:
            return run_compare(executor, req);
        case cortex::protocol::CliCommand::Orchestrate:
            return run_orchestration(executor, config, req);
        default:
            LOG_ERROR("Unhandled command: " + cortex::protocol::to_string(req.command));
            return kExitFatal;
    }
}
