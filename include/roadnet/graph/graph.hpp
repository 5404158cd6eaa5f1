#pragma once

#include <roadnet/core/result.hpp>
#include <roadnet/core/types.hpp>
#include <roadnet/graph/directed_edge.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace roadnet {

// ---------------------------------------------------------------------------
// GraphMetadata — graph-level annotations telling consumers which edge
// attributes hold distance, travel time, geometry and the road id, and in
// which CRS coordinates are expressed.
// ---------------------------------------------------------------------------
struct GraphMetadata {
    CrsCode crs = CrsCode::LatLon();
    std::string distance_key = kKilometersAttribute;
    std::string time_key = kMinutesAttribute;
    std::string geometry_key = kGeometryAttribute;
    std::string road_id_key = kRoadIdAttribute;

    bool operator==(const GraphMetadata& other) const {
        return crs == other.crs && distance_key == other.distance_key &&
               time_key == other.time_key &&
               geometry_key == other.geometry_key && road_id_key == other.road_id_key;
    }
    bool operator!=(const GraphMetadata& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// Graph — directed multigraph of road junctions.
//
// Read-only once built: edges and nodes enter through GraphBuilder, and the
// reduce/tag stages return new graphs. Nodes and edges iterate in ascending
// order, so every traversal over a Graph is deterministic.
// ---------------------------------------------------------------------------
class Graph {
public:
    using EdgeMap = std::map<EdgeId, EdgeAttributes>;

    Graph() = default;

    [[nodiscard]] const std::set<NodeId>& Nodes() const noexcept { return nodes_; }
    [[nodiscard]] const EdgeMap& Edges() const noexcept { return edges_; }
    [[nodiscard]] std::size_t NodeCount() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::size_t EdgeCount() const noexcept { return edges_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return nodes_.empty(); }

    [[nodiscard]] bool HasNode(NodeId node) const { return nodes_.count(node) > 0; }
    [[nodiscard]] bool HasEdge(const EdgeId& id) const { return edges_.count(id) > 0; }

    /// nullptr when the edge does not exist.
    [[nodiscard]] const EdgeAttributes* FindEdge(const EdgeId& id) const;

    /// Distinct successor / predecessor nodes, ascending. Empty for unknown nodes.
    [[nodiscard]] const std::set<NodeId>& Successors(NodeId node) const;
    [[nodiscard]] const std::set<NodeId>& Predecessors(NodeId node) const;

    /// All parallel edges from -> to, ordered by key.
    [[nodiscard]] std::vector<EdgeId> EdgesBetween(NodeId from, NodeId to) const;

    /// All edges leaving `node`.
    [[nodiscard]] std::vector<EdgeId> OutEdges(NodeId node) const;

    /// Numeric weight of an edge under an attribute name (typically the
    /// metadata's distance_key or time_key). Fails when the edge is
    /// missing or the attribute is not numeric.
    [[nodiscard]] Result<double, Error> Weight(const EdgeId& id, std::string_view key) const;

    /// Subgraph on `keep`: those nodes plus every edge with both endpoints
    /// in `keep`. Metadata carries over.
    [[nodiscard]] Graph InducedSubgraph(const std::set<NodeId>& keep) const;

    [[nodiscard]] const std::optional<GraphMetadata>& Metadata() const noexcept {
        return metadata_;
    }
    [[nodiscard]] bool IsTagged() const noexcept { return metadata_.has_value(); }

    /// Copy of this graph with `metadata` attached. Topology is unchanged.
    [[nodiscard]] Graph WithMetadata(GraphMetadata metadata) const&;
    [[nodiscard]] Graph WithMetadata(GraphMetadata metadata) &&;

private:
    friend class GraphBuilder;

    void InsertNode(NodeId node);
    // Returns false when an edge with the same id already existed (replaced).
    bool InsertEdge(const EdgeId& id, EdgeAttributes attributes);

    std::set<NodeId> nodes_;
    EdgeMap edges_;
    std::map<NodeId, std::set<NodeId>> successors_;
    std::map<NodeId, std::set<NodeId>> predecessors_;
    std::optional<GraphMetadata> metadata_;
};

} // namespace roadnet
