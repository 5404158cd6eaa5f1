#pragma once

#include <roadnet/core/result.hpp>
#include <roadnet/core/types.hpp>
#include <roadnet/graph/graph.hpp>

namespace roadnet {

/// Metadata for graphs built by this pipeline: kilometers, minutes, geom,
/// road_id, in `crs`.
[[nodiscard]] GraphMetadata DefaultMetadata(CrsCode crs);

/// Every key must name an edge attribute of the matching kind: distance and
/// travel time numeric, geometry a line, road_id an id.
[[nodiscard]] Result<void, Error> ValidateMetadata(const GraphMetadata& metadata);

/// Attach metadata. Topology and edge attributes are left untouched;
/// tagging a tagged graph replaces the previous metadata.
[[nodiscard]] Result<Graph, Error> TagGraph(Graph graph, const GraphMetadata& metadata);

} // namespace roadnet
