#include "runtime/orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include "core/logging/logger.hpp"
#include "runtime/plan_parser.hpp"

namespace cortex::runtime {

using core::errors::CortexError;
using core::errors::ErrorCategory;
using protocol::AgentResult;
using protocol::AgentTask;
using protocol::DelegationPlan;
using protocol::InvocationOptions;

namespace {

constexpr const char* kAnalysisInstructions =
    "You are Cortex, an orchestrator coordinating several AI development agents.\n"
    "\n"
    "AGENT ROLES:\n"
    "- claude: reasoning, planning, documentation, debugging, architecture\n"
    "- gemini: web search, research, quick factual questions, Google ecosystem\n"
    "- codex: code generation, code review, sandboxed execution, file operations\n"
    "\n"
    "Break the user's request into a delegation plan.\n"
    "\n"
    "RULES:\n"
    "1. If a single agent can handle the request, set \"delegate\": false.\n"
    "2. If several agents would help, write one subtask per agent.\n"
    "3. Every subtask prompt must stand alone; the receiving agent sees nothing else.\n"
    "4. You may keep part of the work for yourself in \"self_task\".\n"
    "\n"
    "Reply with this JSON object only, without markdown or commentary:\n"
    "{\n"
    "  \"delegate\": true or false,\n"
    "  \"reasoning\": \"short explanation of the decision\",\n"
    "  \"subtasks\": [\n"
    "    {\"agent\": \"claude|gemini|codex\", \"prompt\": \"self-contained prompt\", "
    "\"priority\": \"high|medium|low\"}\n"
    "  ],\n"
    "  \"self_task\": \"work you handle directly, or null\"\n"
    "}\n";

constexpr const char* kSynthesisInstructions =
    "Synthesize these results into a single, coherent response. Merge complementary "
    "information, resolve conflicts, and present the best unified answer.";

std::string uppercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::toupper(c));
                   });
    return value;
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string joined;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += items[i];
    }
    return joined;
}

}  // namespace

std::string to_string(const OrchestrationPath path) {
    switch (path) {
        case OrchestrationPath::Direct:
            return "direct";
        case OrchestrationPath::Delegated:
            return "delegated";
        case OrchestrationPath::WorkerFallback:
            return "worker-fallback";
        default:
            return "unknown";
    }
}

Orchestrator::Orchestrator(std::shared_ptr<const AgentExecutor> executor, std::string primary,
                           policy::CoordinatorPolicy coordinator_policy, const bool json_output)
    : executor_(std::move(executor)),
      primary_(std::move(primary)),
      policy_(std::move(coordinator_policy)),
      json_output_(json_output) {}

std::string Orchestrator::build_analysis_prompt(const std::string& prompt) const {
    std::string text = kAnalysisInstructions;
    const std::string policy_block = policy_.analysis_instructions(primary_);
    if (!policy_block.empty()) {
        text += "\n" + policy_block;
    }
    text += "\nAVAILABLE (installed) AGENTS: " + join(executor_->agent_names(), ", ") + "\n";
    text += "\nUSER REQUEST:\n" + prompt;
    return text;
}

std::string Orchestrator::build_synthesis_prompt(const std::string& prompt,
                                                 const std::vector<AgentResult>& results) {
    std::vector<std::string> blocks;
    blocks.reserve(results.size());
    for (const auto& result : results) {
        blocks.push_back("--- " + uppercase(result.agent_name) + " [" + result.status_label() +
                         "] ---\n" + result.output + "\n");
    }
    return "ORIGINAL TASK: " + prompt + "\n\nRESULTS FROM AGENTS:\n" + join(blocks, "\n") +
           "\n" + kSynthesisInstructions;
}

core::errors::Result<DelegationPlan> Orchestrator::analyze(const std::string& prompt) const {
    InvocationOptions options;
    options.json_output = json_output_;
    const AgentResult analysis =
        executor_->run_single(primary_, build_analysis_prompt(prompt), options);
    if (!analysis.success) {
        return CortexError{ErrorCategory::Provider,
                           "Primary analysis failed (" + analysis.status_label() +
                               "): " + analysis.error_text,
                           "analysis_failed"};
    }

    auto parsed = parse_delegation_plan(analysis.output);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }

    const auto& plan = core::errors::get_value(parsed);
    LOG_INFO("Plan: delegate=" + std::string(plan.delegate ? "true" : "false") + ", " +
             std::to_string(plan.subtasks.size()) + " subtasks. " + plan.reasoning);
    return plan;
}

core::errors::Result<std::string> Orchestrator::run(const std::string& prompt) const {
    auto outcome = run_detailed(prompt);
    if (core::errors::is_error(outcome)) {
        return core::errors::get_error(outcome);
    }
    return core::errors::get_value(outcome).text;
}

core::errors::Result<OrchestrationOutcome> Orchestrator::run_detailed(
    const std::string& prompt) const {
    if (!executor_->has_agent(primary_)) {
        return CortexError{ErrorCategory::Input,
                           "Primary agent '" + primary_ + "' is not available.",
                           "primary_unavailable",
                           "Install it or choose another primary with --primary."};
    }
    LOG_INFO("Orchestrating with primary " + primary_ + ": " + prompt.substr(0, 100));

    auto analyzed = analyze(prompt);
    if (core::errors::is_error(analyzed)) {
        const auto& err = core::errors::get_error(analyzed);
        LOG_WARN("Analysis failed [" + err.code + "]: " + err.message);
        return fall_back(prompt, std::nullopt, "analysis failed");
    }
    std::optional<DelegationPlan> plan = core::errors::get_value(analyzed);
    if (!plan->delegate) {
        return fall_back(prompt, plan, "plan chose not to delegate");
    }

    const auto tasks = policy_.select_subtasks(*plan, primary_, executor_->agent_names());
    if (tasks.empty()) {
        return fall_back(prompt, plan, "no usable subtasks in plan");
    }

    std::optional<std::string> self_task = plan->self_task;
    if (self_task.has_value() && policy_.is_coordinator_only(primary_)) {
        LOG_WARN("Ignoring self task for coordinator-only primary " + primary_ + ": " +
                 *self_task);
        self_task.reset();
    }

    OrchestrationOutcome outcome =
        dispatch(prompt, tasks, self_task, OrchestrationPath::Delegated);
    outcome.plan = std::move(plan);
    return outcome;
}

core::errors::Result<OrchestrationOutcome> Orchestrator::fall_back(
    const std::string& prompt, std::optional<DelegationPlan> plan,
    const std::string& reason) const {
    if (policy_.is_coordinator_only(primary_)) {
        return run_worker_fallback(prompt, std::move(plan), reason);
    }
    LOG_INFO("Running directly on " + primary_ + " (" + reason + ")");
    return run_direct(prompt, std::move(plan));
}

core::errors::Result<OrchestrationOutcome> Orchestrator::run_direct(
    const std::string& prompt, std::optional<DelegationPlan> plan) const {
    OrchestrationOutcome outcome;
    outcome.path = OrchestrationPath::Direct;
    outcome.plan = std::move(plan);
    outcome.final_result = executor_->run_single(primary_, prompt);
    outcome.text = outcome.final_result.output;
    return outcome;
}

core::errors::Result<OrchestrationOutcome> Orchestrator::run_worker_fallback(
    const std::string& prompt, std::optional<DelegationPlan> plan,
    const std::string& reason) const {
    const auto tasks = policy_.worker_fallback(prompt, primary_, executor_->agent_names());
    if (tasks.empty()) {
        LOG_ERROR("Coordinator-only primary " + primary_ + " has no worker agents (" +
                  reason + ")");
        return CortexError{ErrorCategory::Policy,
                           "Primary '" + primary_ +
                               "' is coordinator-only and no worker agents are available.",
                           "no_worker_agents",
                           "Install another agent or choose a different primary."};
    }
    LOG_WARN("Coordinator-only primary " + primary_ + ": broadcasting to " +
             std::to_string(tasks.size()) + " workers (" + reason + ")");

    OrchestrationOutcome outcome =
        dispatch(prompt, tasks, std::nullopt, OrchestrationPath::WorkerFallback);
    outcome.plan = std::move(plan);
    return outcome;
}

OrchestrationOutcome Orchestrator::dispatch(const std::string& prompt,
                                            const std::vector<AgentTask>& tasks,
                                            const std::optional<std::string>& self_task,
                                            const OrchestrationPath path) const {
    OrchestrationOutcome outcome;
    outcome.path = path;

    std::vector<std::string> names;
    for (const auto& task : tasks) {
        names.push_back(task.agent_name);
    }
    LOG_INFO("Dispatching to: " + join(names, ", "));
    outcome.worker_results = executor_->run_parallel(tasks);

    if (self_task.has_value()) {
        LOG_INFO("Running self task on " + primary_);
        outcome.worker_results.push_back(executor_->run_single(primary_, *self_task));
    }

    LOG_INFO("Synthesizing " + std::to_string(outcome.worker_results.size()) +
             " results on " + primary_);
    outcome.final_result =
        executor_->run_single(primary_, build_synthesis_prompt(prompt, outcome.worker_results));
    outcome.text = outcome.final_result.output;
    return outcome;
}

}  // namespace cortex::runtime
