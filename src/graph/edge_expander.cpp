#include <roadnet/graph/edge_expander.hpp>

namespace roadnet {

namespace {

DirectedEdge ForwardEdge(const CanonicalEdgeRecord& record) {
    DirectedEdge edge;
    edge.from = record.from_node_id;
    edge.to = record.to_node_id;
    edge.key = EdgeKey{record.road_id, EdgeOrientation::Forward};
    edge.attributes.distance_km = record.distance_km;
    edge.attributes.minutes = record.forward_minutes;
    edge.attributes.geometry = record.geometry;
    edge.attributes.road_id = record.road_id;
    return edge;
}

DirectedEdge ReverseEdge(const CanonicalEdgeRecord& record) {
    DirectedEdge edge;
    edge.from = record.to_node_id;
    edge.to = record.from_node_id;
    edge.key = EdgeKey{record.road_id, EdgeOrientation::Reverse};
    edge.attributes.distance_km = record.distance_km;
    edge.attributes.minutes = record.backward_minutes;
    edge.attributes.geometry = record.geometry.Reversed();
    edge.attributes.road_id = record.road_id;
    return edge;
}

} // anonymous namespace

std::vector<DirectedEdge> ExpandEdges(const CanonicalEdgeRecord& record) {
    std::vector<DirectedEdge> edges;
    switch (record.direction) {
        case Direction::Forward:
            edges.push_back(ForwardEdge(record));
            break;
        case Direction::Backward:
            edges.push_back(ReverseEdge(record));
            break;
        case Direction::Both:
            edges.push_back(ForwardEdge(record));
            edges.push_back(ReverseEdge(record));
            break;
    }
    return edges;
}

std::vector<DirectedEdge> ExpandAll(const std::vector<CanonicalEdgeRecord>& records) {
    std::vector<DirectedEdge> edges;
    edges.reserve(records.size() * 2);
    for (const auto& record : records) {
        auto expanded = ExpandEdges(record);
        for (auto& edge : expanded) {
            edges.push_back(std::move(edge));
        }
    }
    return edges;
}

} // namespace roadnet
