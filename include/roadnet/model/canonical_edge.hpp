#pragma once

#include <roadnet/core/types.hpp>
#include <roadnet/model/geometry.hpp>

#include <string_view>

namespace roadnet {

// ---------------------------------------------------------------------------
// Direction — permitted travel along a segment relative to its digitized
// (from -> to) orientation.
// ---------------------------------------------------------------------------
enum class Direction {
    Forward,   // from -> to only
    Backward,  // to -> from only
    Both,
};

[[nodiscard]] std::string_view DirectionName(Direction direction) noexcept;

// ---------------------------------------------------------------------------
// CanonicalEdgeRecord — vintage-independent road segment.
//
// Invariants (established by the schema adapters):
//   - geometry.Front() is at from_node_id, geometry.Back() at to_node_id
//   - geometry has at least two points
//   - distance_km, forward_minutes, backward_minutes are >= 0
// ---------------------------------------------------------------------------
struct CanonicalEdgeRecord {
    NodeId from_node_id = 0;
    NodeId to_node_id = 0;
    RoadId road_id;
    LineString geometry;
    double distance_km = 0.0;
    double forward_minutes = 0.0;
    double backward_minutes = 0.0;
    Direction direction = Direction::Both;
};

} // namespace roadnet
