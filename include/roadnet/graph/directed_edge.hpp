#pragma once

#include <roadnet/core/types.hpp>
#include <roadnet/model/geometry.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

namespace roadnet {

// Attribute names under which edge values are published in GraphMetadata.
constexpr const char* kKilometersAttribute = "kilometers";
constexpr const char* kMinutesAttribute = "minutes";
constexpr const char* kGeometryAttribute = "geom";
constexpr const char* kRoadIdAttribute = "road_id";

// ---------------------------------------------------------------------------
// EdgeKey — distinguishes parallel edges between one ordered node pair.
//
// A road contributes at most one Forward and one Reverse edge, so the key
// never depends on the numeric range of road ids (no negation trick).
// ---------------------------------------------------------------------------
enum class EdgeOrientation {
    Forward,  // digitized direction
    Reverse,  // synthesized backward copy
};

struct EdgeKey {
    RoadId road_id;
    EdgeOrientation orientation = EdgeOrientation::Forward;

    /// "<road_id>" for forward keys, "<road_id>:rev" for reverse keys.
    [[nodiscard]] std::string ToString() const;

    bool operator==(const EdgeKey& other) const {
        return road_id == other.road_id && orientation == other.orientation;
    }
    bool operator!=(const EdgeKey& other) const { return !(*this == other); }
    bool operator<(const EdgeKey& other) const {
        return std::tie(road_id, orientation) < std::tie(other.road_id, other.orientation);
    }
};

using AttributeValue = std::variant<double, LineString, RoadId>;

// ---------------------------------------------------------------------------
// EdgeAttributes — per-direction weights and oriented geometry.
// Invariants: distance_km >= 0, minutes >= 0, geometry runs from -> to.
// ---------------------------------------------------------------------------
struct EdgeAttributes {
    double distance_km = 0.0;
    double minutes = 0.0;
    LineString geometry;
    RoadId road_id;

    /// Generic access by attribute name (kKilometersAttribute, ...).
    /// nullopt for names that are not edge attributes.
    [[nodiscard]] std::optional<AttributeValue> Lookup(std::string_view name) const;

    /// All attribute names Lookup() understands.
    [[nodiscard]] static const std::vector<std::string>& Names();
};

// ---------------------------------------------------------------------------
// EdgeId — address of an edge in the multigraph.
// ---------------------------------------------------------------------------
struct EdgeId {
    NodeId from = 0;
    NodeId to = 0;
    EdgeKey key;

    [[nodiscard]] std::string ToString() const;

    bool operator==(const EdgeId& other) const {
        return from == other.from && to == other.to && key == other.key;
    }
    bool operator!=(const EdgeId& other) const { return !(*this == other); }
    bool operator<(const EdgeId& other) const {
        return std::tie(from, to, key) < std::tie(other.from, other.to, other.key);
    }
};

struct DirectedEdge {
    NodeId from = 0;
    NodeId to = 0;
    EdgeKey key;
    EdgeAttributes attributes;

    [[nodiscard]] EdgeId Id() const { return EdgeId{from, to, key}; }
};

} // namespace roadnet
