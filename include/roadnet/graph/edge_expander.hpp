#pragma once

#include <roadnet/graph/directed_edge.hpp>
#include <roadnet/model/canonical_edge.hpp>

#include <vector>

namespace roadnet {

// ---------------------------------------------------------------------------
// Edge expansion — one canonical record becomes one or two directed edges.
//
//   Forward   from -> to,  forward_minutes,  geometry as digitized
//   Backward  to -> from,  backward_minutes, geometry reversed
//   Both      both of the above
//
// Forward edges carry EdgeKey{road_id, Forward}, synthesized reverse edges
// EdgeKey{road_id, Reverse}. The road_id attribute is the original id in
// both cases.
// ---------------------------------------------------------------------------

/// Expand a single record. Always returns 1 or 2 edges.
[[nodiscard]] std::vector<DirectedEdge> ExpandEdges(const CanonicalEdgeRecord& record);

/// Expand every record, preserving input order (forward before reverse).
[[nodiscard]] std::vector<DirectedEdge> ExpandAll(
    const std::vector<CanonicalEdgeRecord>& records);

} // namespace roadnet
