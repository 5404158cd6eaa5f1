#include <roadnet/workflow/graph_build_workflow.hpp>

#include <roadnet/core/log.hpp>
#include <roadnet/graph/edge_expander.hpp>
#include <roadnet/graph/metadata_tagger.hpp>

#include <iterator>
#include <sstream>
#include <utility>

namespace roadnet {

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* kSteps[] = {"normalize", "expand", "build", "reduce", "tag", "verify"};

std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

std::string_view StepOutcomeName(StepOutcome outcome) noexcept {
    switch (outcome) {
        case StepOutcome::Completed: return "completed";
        case StepOutcome::Skipped:   return "skipped";
        case StepOutcome::Failed:    return "failed";
    }
    return "unknown";
}

GraphBuildWorkflow::GraphBuildWorkflow(const SchemaAdapterRegistry& registry,
                                       GraphBuildOptions options)
    : registry_(registry), options_(std::move(options)) {}

CrsCode GraphBuildWorkflow::ResolveCrs(const RawSegmentBatch& batch) const {
    if (options_.crs.has_value()) {
        return *options_.crs;
    }
    if (batch.crs.has_value()) {
        return *batch.crs;
    }
    return CrsCode::LatLon();
}

Result<GraphBuildResult, Error> GraphBuildWorkflow::Run(const RawSegmentBatch& batch) {
    using R = Result<GraphBuildResult, Error>;

    const auto total_start = Clock::now();
    steps_.clear();
    GraphBuildResult result;

    // Records the failing stage, marks the rest skipped and hands the error on.
    auto fail = [this](std::size_t stage, Clock::time_point start, Error error) -> R {
        steps_.push_back(StepResult{kSteps[stage], StepOutcome::Failed,
                                    error.ToString(), Elapsed(start)});
        for (std::size_t i = stage + 1; i < std::size(kSteps); ++i) {
            steps_.push_back(StepResult{kSteps[i], StepOutcome::Skipped, "", {}});
        }
        LogError("workflow", std::string(kSteps[stage]) + " failed: " + error.ToString());
        return R::Err(std::move(error));
    };

    // Step 1: Normalize.
    auto start = Clock::now();
    auto normalized = Normalize(registry_, batch.records, options_.vintage);
    if (normalized.IsErr()) {
        return fail(0, start, std::move(normalized).Error());
    }
    auto normalize_out = std::move(normalized).Value();
    result.input_records = normalize_out.input_count;
    result.normalized_records = normalize_out.records.size();
    result.filtered_records = normalize_out.filtered_count;
    result.defaulted_speed_records = normalize_out.defaulted_speed_records;
    result.zero_filled_records = normalize_out.zero_filled_records;
    {
        std::ostringstream oss;
        oss << result.normalized_records << " of " << result.input_records
            << " records (vintage " << options_.vintage << ")";
        if (result.filtered_records > 0) {
            oss << ", " << result.filtered_records << " filtered";
        }
        if (!result.defaulted_speed_records.empty()) {
            oss << ", " << result.defaulted_speed_records.size() << " defaulted speed";
        }
        if (!result.zero_filled_records.empty()) {
            oss << ", " << result.zero_filled_records.size() << " zero-filled";
        }
        steps_.push_back(StepResult{kSteps[0], StepOutcome::Completed, oss.str(), Elapsed(start)});
    }

    // Step 2: Expand.
    start = Clock::now();
    auto edges = ExpandAll(normalize_out.records);
    result.directed_edges = edges.size();
    steps_.push_back(StepResult{kSteps[1], StepOutcome::Completed,
                                std::to_string(edges.size()) + " directed edges",
                                Elapsed(start)});

    // Step 3: Build.
    start = Clock::now();
    BuildOptions build_options;
    build_options.on_key_collision = options_.on_key_collision;
    auto built = BuildGraph(edges, build_options);
    if (built.IsErr()) {
        return fail(2, start, std::move(built).Error());
    }
    auto build_out = std::move(built).Value();
    result.build = build_out.stats;
    {
        std::ostringstream oss;
        oss << build_out.stats.node_count << " nodes, " << build_out.stats.edge_count << " edges";
        if (!build_out.stats.key_collisions.empty()) {
            oss << ", " << build_out.stats.key_collisions.size() << " key collisions";
        }
        steps_.push_back(StepResult{kSteps[2], StepOutcome::Completed, oss.str(), Elapsed(start)});
    }

    // Step 4: Reduce.
    start = Clock::now();
    auto reduced = ReduceToLargestComponent(build_out.graph);
    if (reduced.IsErr()) {
        return fail(3, start, std::move(reduced).Error());
    }
    auto reduce_out = std::move(reduced).Value();
    result.reduce = reduce_out.stats;
    {
        std::ostringstream oss;
        oss << "kept " << reduce_out.stats.kept_nodes << " nodes of "
            << reduce_out.stats.component_count << " components, dropped "
            << reduce_out.stats.dropped_nodes << " nodes / "
            << reduce_out.stats.dropped_edges << " edges";
        steps_.push_back(StepResult{kSteps[3], StepOutcome::Completed, oss.str(), Elapsed(start)});
    }

    // Step 5: Tag.
    start = Clock::now();
    const auto crs = ResolveCrs(batch);
    auto tagged = TagGraph(std::move(reduce_out.graph), DefaultMetadata(crs));
    if (tagged.IsErr()) {
        return fail(4, start, std::move(tagged).Error());
    }
    result.graph = std::move(tagged).Value();
    steps_.push_back(StepResult{kSteps[4], StepOutcome::Completed, "crs " + crs.Value(),
                                Elapsed(start)});

    // Step 6: Verify the graph is routable between any two nodes.
    start = Clock::now();
    if (!IsStronglyConnected(result.graph)) {
        return fail(5, start, Error::Make(ErrorCategory::Internal, "GraphBuildWorkflow",
                                          "reduced graph is not strongly connected"));
    }
    steps_.push_back(StepResult{kSteps[5], StepOutcome::Completed, "strongly connected",
                                Elapsed(start)});

    result.steps = steps_;
    result.total_duration = Elapsed(total_start);
    LogInfo("workflow", "graph ready: " + std::to_string(result.graph.NodeCount()) +
                            " nodes, " + std::to_string(result.graph.EdgeCount()) + " edges");
    return R::Ok(std::move(result));
}

} // namespace roadnet
