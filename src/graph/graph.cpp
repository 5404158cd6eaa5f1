#include <roadnet/graph/graph.hpp>

#include <limits>
#include <variant>

namespace roadnet {

namespace {

const std::set<NodeId>& EmptyNodeSet() {
    static const std::set<NodeId> empty;
    return empty;
}

// Smallest possible key: integer ids order before text ids.
EdgeKey LowestKey() {
    return EdgeKey{RoadId(std::numeric_limits<std::int64_t>::min()),
                   EdgeOrientation::Forward};
}

} // anonymous namespace

const EdgeAttributes* Graph::FindEdge(const EdgeId& id) const {
    auto it = edges_.find(id);
    if (it == edges_.end()) {
        return nullptr;
    }
    return &it->second;
}

const std::set<NodeId>& Graph::Successors(NodeId node) const {
    auto it = successors_.find(node);
    return it == successors_.end() ? EmptyNodeSet() : it->second;
}

const std::set<NodeId>& Graph::Predecessors(NodeId node) const {
    auto it = predecessors_.find(node);
    return it == predecessors_.end() ? EmptyNodeSet() : it->second;
}

std::vector<EdgeId> Graph::EdgesBetween(NodeId from, NodeId to) const {
    std::vector<EdgeId> ids;
    for (auto it = edges_.lower_bound(EdgeId{from, to, LowestKey()});
         it != edges_.end() && it->first.from == from && it->first.to == to; ++it) {
        ids.push_back(it->first);
    }
    return ids;
}

std::vector<EdgeId> Graph::OutEdges(NodeId node) const {
    std::vector<EdgeId> ids;
    const EdgeId lowest{node, std::numeric_limits<NodeId>::min(), LowestKey()};
    for (auto it = edges_.lower_bound(lowest);
         it != edges_.end() && it->first.from == node; ++it) {
        ids.push_back(it->first);
    }
    return ids;
}

Result<double, Error> Graph::Weight(const EdgeId& id, std::string_view key) const {
    const auto* attributes = FindEdge(id);
    if (attributes == nullptr) {
        return Result<double, Error>::Err(
            Error::Make(ErrorCategory::Internal, "Weight", "edge not in graph", id.ToString()));
    }
    auto value = attributes->Lookup(key);
    if (!value.has_value()) {
        return Result<double, Error>::Err(
            Error::Make(ErrorCategory::Internal, "Weight",
                        "unknown edge attribute '" + std::string(key) + "'", id.ToString()));
    }
    if (!std::holds_alternative<double>(*value)) {
        return Result<double, Error>::Err(
            Error::Make(ErrorCategory::Internal, "Weight",
                        "edge attribute '" + std::string(key) + "' is not numeric",
                        id.ToString()));
    }
    return Result<double, Error>::Ok(std::get<double>(*value));
}

Graph Graph::InducedSubgraph(const std::set<NodeId>& keep) const {
    Graph sub;
    for (NodeId node : nodes_) {
        if (keep.count(node) > 0) {
            sub.InsertNode(node);
        }
    }
    for (const auto& [id, attributes] : edges_) {
        if (keep.count(id.from) > 0 && keep.count(id.to) > 0) {
            sub.InsertEdge(id, attributes);
        }
    }
    sub.metadata_ = metadata_;
    return sub;
}

Graph Graph::WithMetadata(GraphMetadata metadata) const& {
    Graph copy(*this);
    copy.metadata_ = std::move(metadata);
    return copy;
}

Graph Graph::WithMetadata(GraphMetadata metadata) && {
    metadata_ = std::move(metadata);
    return std::move(*this);
}

void Graph::InsertNode(NodeId node) {
    nodes_.insert(node);
}

bool Graph::InsertEdge(const EdgeId& id, EdgeAttributes attributes) {
    InsertNode(id.from);
    InsertNode(id.to);
    successors_[id.from].insert(id.to);
    predecessors_[id.to].insert(id.from);
    return edges_.insert_or_assign(id, std::move(attributes)).second;
}

} // namespace roadnet
