#pragma once

#include <roadnet/core/result.hpp>
#include <roadnet/core/types.hpp>
#include <roadnet/graph/connectivity.hpp>
#include <roadnet/graph/graph.hpp>
#include <roadnet/graph/graph_builder.hpp>
#include <roadnet/model/raw_segment.hpp>
#include <roadnet/schema/schema_adapter.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace roadnet {

// ---------------------------------------------------------------------------
// StepOutcome — outcome for each stage of the pipeline.
// ---------------------------------------------------------------------------
enum class StepOutcome {
    Completed,
    Skipped,
    Failed,
};

[[nodiscard]] std::string_view StepOutcomeName(StepOutcome outcome) noexcept;

// ---------------------------------------------------------------------------
// StepResult — outcome + timing for a single stage.
// ---------------------------------------------------------------------------
struct StepResult {
    std::string step_name;
    StepOutcome outcome = StepOutcome::Failed;
    std::string message;
    std::chrono::milliseconds duration{0};
};

struct GraphBuildOptions {
    std::string vintage = "2021";
    std::optional<CrsCode> crs;  // overrides the batch CRS
    KeyCollisionPolicy on_key_collision = KeyCollisionPolicy::Overwrite;
};

// ---------------------------------------------------------------------------
// GraphBuildResult — tagged graph plus what each stage reported.
// ---------------------------------------------------------------------------
struct GraphBuildResult {
    Graph graph;
    std::vector<StepResult> steps;

    std::size_t input_records = 0;
    std::size_t normalized_records = 0;
    std::size_t filtered_records = 0;
    std::vector<std::size_t> defaulted_speed_records;
    std::vector<std::size_t> zero_filled_records;
    std::size_t directed_edges = 0;
    BuildStats build;
    ReduceStats reduce;

    std::chrono::milliseconds total_duration{0};
};

// ---------------------------------------------------------------------------
// GraphBuildWorkflow — normalize -> expand -> build -> reduce -> tag.
//
// The registry must outlive this object. Run() returns the first failing
// stage's error unchanged; Steps() still shows how far the last run got.
// ---------------------------------------------------------------------------
class GraphBuildWorkflow {
public:
    GraphBuildWorkflow(const SchemaAdapterRegistry& registry, GraphBuildOptions options);

    // Non-copyable, non-movable.
    GraphBuildWorkflow(const GraphBuildWorkflow&) = delete;
    GraphBuildWorkflow& operator=(const GraphBuildWorkflow&) = delete;
    GraphBuildWorkflow(GraphBuildWorkflow&&) = delete;
    GraphBuildWorkflow& operator=(GraphBuildWorkflow&&) = delete;

    [[nodiscard]] Result<GraphBuildResult, Error> Run(const RawSegmentBatch& batch);

    /// Steps recorded by the most recent Run(), including the failed one.
    [[nodiscard]] const std::vector<StepResult>& Steps() const noexcept { return steps_; }

    /// CRS the tagger will use for `batch`: option, then batch, then EPSG:4326.
    [[nodiscard]] CrsCode ResolveCrs(const RawSegmentBatch& batch) const;

private:
    const SchemaAdapterRegistry& registry_;
    GraphBuildOptions options_;
    std::vector<StepResult> steps_;
};

} // namespace roadnet
