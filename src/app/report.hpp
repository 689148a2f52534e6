#pragma once

#include <map>
#include <string>
#include <vector>
#include "adapters/agent_detector.hpp"
#include "protocol/agent_result.hpp"
#include "runtime/orchestrator.hpp"

namespace cortex::app::report {

// Plain-text tables for stdout; logging stays on stderr.
std::string format_comparison(const std::vector<protocol::AgentResult>& results);

std::string format_result(const protocol::AgentResult& result);

std::string format_status(const std::map<std::string, adapters::DetectedAgent>& detected,
                          const std::string& primary);

std::string format_outcome_summary(const runtime::OrchestrationOutcome& outcome);

}  // namespace cortex::app::report
