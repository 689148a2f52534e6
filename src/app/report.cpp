#include "app/report.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace cortex::app::report {

using protocol::AgentResult;

namespace {

constexpr std::size_t kOutputPreview = 500;
constexpr std::size_t kErrorPreview = 200;

std::string single_line(std::string text) {
    std::replace(text.begin(), text.end(), '\n', ' ');
    std::replace(text.begin(), text.end(), '\r', ' ');
    return text;
}

std::string seconds(const double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value << "s";
    return out.str();
}

std::string preview(const AgentResult& result) {
    if (!result.output.empty()) {
        return single_line(result.truncated_output(kOutputPreview));
    }
    return single_line(result.error_text.substr(0, kErrorPreview));
}

std::string render_table(const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows) {
    // The last column is left unpadded.
    std::vector<std::size_t> widths(headers.size(), 0);
    for (std::size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
        for (const auto& row : rows) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    std::ostringstream out;
    auto emit = [&out, &widths](const std::vector<std::string>& cells) {
        for (std::size_t c = 0; c < cells.size(); ++c) {
            if (c + 1 == cells.size()) {
                out << cells[c];
            } else {
                out << std::left << std::setw(static_cast<int>(widths[c] + 2)) << cells[c];
            }
        }
        out << "\n";
    };
    emit(headers);
    for (const auto& row : rows) {
        emit(row);
    }
    return out.str();
}

}  // namespace

std::string format_comparison(const std::vector<AgentResult>& results) {
    std::vector<std::vector<std::string>> rows;
    for (const auto& result : results) {
        rows.push_back({result.agent_name, result.status_label(),
                        result.retries > 0 ? std::to_string(result.retries) : "-",
                        seconds(result.duration_seconds), preview(result)});
    }
    return render_table({"AGENT", "STATUS", "RETRIES", "TIME", "OUTPUT"}, rows);
}

std::string format_result(const AgentResult& result) {
    std::ostringstream out;
    out << result.agent_name << " [" << result.status_label() << "] ("
        << seconds(result.duration_seconds);
    if (result.retries > 0) {
        out << ", " << result.retries << " retries";
    }
    out << ")\n";
    if (!result.output.empty()) {
        out << result.output << "\n";
    } else if (!result.error_text.empty()) {
        out << result.error_text << "\n";
    } else {
        out << "(no output)\n";
    }
    return out.str();
}

std::string format_status(const std::map<std::string, adapters::DetectedAgent>& detected,
                          const std::string& primary) {
    if (detected.empty()) {
        return "No agents detected. Install claude, gemini or codex and make sure they are on "
               "PATH.\n";
    }
    std::vector<std::vector<std::string>> rows;
    for (const auto& [name, agent] : detected) {
        rows.push_back({name + (name == primary ? " *" : ""), agent.display_name, agent.provider,
                        agent.version, agent.binary_path});
    }
    return render_table({"AGENT", "NAME", "PROVIDER", "VERSION", "PATH"}, rows) +
           "\n* primary\n";
}

std::string format_outcome_summary(const runtime::OrchestrationOutcome& outcome) {
    std::ostringstream out;
    out << "Path: " << runtime::to_string(outcome.path);
    if (outcome.plan.has_value() && !outcome.plan->reasoning.empty()) {
        out << " (" << single_line(outcome.plan->reasoning) << ")";
    }
    out << "\n";
    for (const auto& result : outcome.worker_results) {
        out << "  " << result.agent_name << ": " << result.status_label() << " in "
            << seconds(result.duration_seconds) << "\n";
    }
    return out.str();
}

}  // namespace cortex::app::report
