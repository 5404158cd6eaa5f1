#pragma once

#include <roadnet/cli/output_formatter.hpp>
#include <roadnet/workflow/graph_build_workflow.hpp>

#include <string>
#include <vector>

namespace roadnet {

// Rows for the step table: step, outcome, duration, detail.
[[nodiscard]] std::vector<std::vector<std::string>> StepRows(
    const std::vector<StepResult>& steps);

// Graph summary grouped as records / graph / metadata.
[[nodiscard]] std::vector<DetailSection> SummarySections(const GraphBuildResult& result);

// Full machine-readable report for --json.
[[nodiscard]] std::string BuildResultToJson(const GraphBuildResult& result);

// Step table (unless quiet) followed by the summary, or the JSON report.
void PrintBuildReport(const OutputFormatter& formatter, const GraphBuildResult& result,
                      bool quiet);

// Step table for a failed run (human-readable modes only).
void PrintFailedSteps(const OutputFormatter& formatter, const std::vector<StepResult>& steps);

} // namespace roadnet
