#include <roadnet/cli/build_report.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace roadnet {

namespace {

const std::vector<std::string> kStepHeaders = {"Step", "Outcome", "Duration", "Detail"};

std::string FormatDuration(std::chrono::milliseconds duration) {
    return std::to_string(duration.count()) + " ms";
}

// "3, 7, 12" for short lists, "3, 7, 12, ... (40 total)" otherwise.
std::string FormatIndices(const std::vector<std::size_t>& indices) {
    constexpr std::size_t kMaxShown = 5;
    if (indices.empty()) {
        return "none";
    }
    std::ostringstream oss;
    for (std::size_t i = 0; i < indices.size() && i < kMaxShown; ++i) {
        if (i > 0) oss << ", ";
        oss << indices[i];
    }
    if (indices.size() > kMaxShown) {
        oss << ", ... (" << indices.size() << " total)";
    }
    return oss.str();
}

} // anonymous namespace

std::vector<std::vector<std::string>> StepRows(const std::vector<StepResult>& steps) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(steps.size());
    for (const auto& step : steps) {
        rows.push_back({step.step_name, std::string(StepOutcomeName(step.outcome)),
                        step.outcome == StepOutcome::Skipped ? "-" : FormatDuration(step.duration),
                        step.message});
    }
    return rows;
}

std::vector<DetailSection> SummarySections(const GraphBuildResult& result) {
    std::vector<DetailSection> sections;

    DetailSection records{"Records", {}};
    records.entries.emplace_back("input", std::to_string(result.input_records));
    records.entries.emplace_back("normalized", std::to_string(result.normalized_records));
    records.entries.emplace_back("filtered", std::to_string(result.filtered_records));
    records.entries.emplace_back("defaulted speed", FormatIndices(result.defaulted_speed_records));
    records.entries.emplace_back("zero-filled", FormatIndices(result.zero_filled_records));
    sections.push_back(std::move(records));

    DetailSection graph{"Graph", {}};
    graph.entries.emplace_back("nodes", std::to_string(result.graph.NodeCount()));
    graph.entries.emplace_back("edges", std::to_string(result.graph.EdgeCount()));
    graph.entries.emplace_back("components", std::to_string(result.reduce.component_count));
    graph.entries.emplace_back("dropped nodes", std::to_string(result.reduce.dropped_nodes));
    graph.entries.emplace_back("dropped edges", std::to_string(result.reduce.dropped_edges));
    graph.entries.emplace_back("key collisions",
                               std::to_string(result.build.key_collisions.size()));
    sections.push_back(std::move(graph));

    if (result.graph.Metadata().has_value()) {
        const auto& meta = *result.graph.Metadata();
        DetailSection metadata{"Metadata", {}};
        metadata.entries.emplace_back("crs", meta.crs.Value());
        metadata.entries.emplace_back("distance", meta.distance_key);
        metadata.entries.emplace_back("travel time", meta.time_key);
        metadata.entries.emplace_back("geometry", meta.geometry_key);
        metadata.entries.emplace_back("road id", meta.road_id_key);
        sections.push_back(std::move(metadata));
    }
    return sections;
}

std::string BuildResultToJson(const GraphBuildResult& result) {
    nlohmann::json j;
    j["success"] = true;

    nlohmann::json graph;
    graph["nodes"] = result.graph.NodeCount();
    graph["edges"] = result.graph.EdgeCount();
    if (result.graph.Metadata().has_value()) {
        const auto& meta = *result.graph.Metadata();
        graph["metadata"] = {
            {"crs", meta.crs.Value()},
            {"distance", meta.distance_key},
            {"travel_time", meta.time_key},
            {"geometry", meta.geometry_key},
            {"road_id", meta.road_id_key},
        };
    }
    j["graph"] = std::move(graph);

    j["records"] = {
        {"input", result.input_records},
        {"normalized", result.normalized_records},
        {"filtered", result.filtered_records},
        {"defaulted_speed", result.defaulted_speed_records},
        {"zero_filled", result.zero_filled_records},
    };

    nlohmann::json collisions = nlohmann::json::array();
    for (const auto& id : result.build.key_collisions) {
        collisions.push_back(id.ToString());
    }
    j["build"] = {
        {"directed_edges", result.directed_edges},
        {"key_collisions", std::move(collisions)},
    };

    j["reduce"] = {
        {"components", result.reduce.component_count},
        {"dropped_nodes", result.reduce.dropped_nodes},
        {"dropped_edges", result.reduce.dropped_edges},
    };

    nlohmann::json steps = nlohmann::json::array();
    for (const auto& step : result.steps) {
        steps.push_back({
            {"step", step.step_name},
            {"outcome", std::string(StepOutcomeName(step.outcome))},
            {"message", step.message},
            {"duration_ms", step.duration.count()},
        });
    }
    j["steps"] = std::move(steps);
    j["total_duration_ms"] = result.total_duration.count();
    return j.dump();
}

void PrintBuildReport(const OutputFormatter& formatter, const GraphBuildResult& result,
                      bool quiet) {
    if (formatter.IsJsonMode()) {
        formatter.PrintJson(BuildResultToJson(result));
        return;
    }
    if (!quiet) {
        formatter.PrintTable(kStepHeaders, StepRows(result.steps));
        formatter.PrintDetail("Routable graph", SummarySections(result));
    }
    formatter.PrintSuccess("graph built: " + std::to_string(result.graph.NodeCount()) +
                           " nodes, " + std::to_string(result.graph.EdgeCount()) + " edges in " +
                           FormatDuration(result.total_duration));
}

void PrintFailedSteps(const OutputFormatter& formatter, const std::vector<StepResult>& steps) {
    if (formatter.IsJsonMode() || steps.empty()) {
        return;
    }
    formatter.PrintTable(kStepHeaders, StepRows(steps));
}

} // namespace roadnet
