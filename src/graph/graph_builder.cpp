#include <roadnet/graph/graph_builder.hpp>

#include <roadnet/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace roadnet {

std::string_view KeyCollisionPolicyName(KeyCollisionPolicy policy) noexcept {
    switch (policy) {
        case KeyCollisionPolicy::Overwrite: return "overwrite";
        case KeyCollisionPolicy::Reject:    return "reject";
    }
    return "unknown";
}

Result<KeyCollisionPolicy, std::string> ParseKeyCollisionPolicy(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "overwrite") {
        return Result<KeyCollisionPolicy, std::string>::Ok(KeyCollisionPolicy::Overwrite);
    }
    if (lower == "reject") {
        return Result<KeyCollisionPolicy, std::string>::Ok(KeyCollisionPolicy::Reject);
    }
    return Result<KeyCollisionPolicy, std::string>::Err(
        "unknown key collision policy '" + std::string(text) +
        "' (expected 'overwrite' or 'reject')");
}

GraphBuilder::GraphBuilder(BuildOptions options) : options_(options) {}

Result<void, Error> GraphBuilder::AddEdge(DirectedEdge edge) {
    const EdgeId id = edge.Id();
    ++stats_.edges_in;

    if (graph_.HasEdge(id)) {
        stats_.key_collisions.push_back(id);
        if (options_.on_key_collision == KeyCollisionPolicy::Reject) {
            auto error = Error::Make(ErrorCategory::KeyCollision, "BuildGraph",
                                     "duplicate edge key", id.ToString())
                             .WithHint("road ids must be unique per vintage; "
                                       "use on_key_collision: overwrite to keep the last edge");
            return Result<void, Error>::Err(std::move(error));
        }
        LogWarn("graph", "duplicate edge key " + id.ToString() + ", keeping the last edge");
    }

    graph_.InsertEdge(id, std::move(edge.attributes));
    stats_.node_count = graph_.NodeCount();
    stats_.edge_count = graph_.EdgeCount();
    return Result<void, Error>::Ok();
}

void GraphBuilder::AddNode(NodeId node) {
    graph_.InsertNode(node);
    stats_.node_count = graph_.NodeCount();
}

Graph GraphBuilder::Build() {
    Graph out = std::move(graph_);
    graph_ = Graph();
    stats_ = BuildStats{};
    return out;
}

Result<BuildOutput, Error> BuildGraph(const std::vector<DirectedEdge>& edges,
                                      const BuildOptions& options) {
    GraphBuilder builder(options);
    for (const auto& edge : edges) {
        auto added = builder.AddEdge(edge);
        if (added.IsErr()) {
            return Result<BuildOutput, Error>::Err(std::move(added).Error());
        }
    }

    BuildOutput output;
    output.stats = builder.Stats();
    output.graph = builder.Build();

    LogInfo("graph", "built graph: " + std::to_string(output.stats.node_count) + " nodes, " +
                         std::to_string(output.stats.edge_count) + " edges from " +
                         std::to_string(output.stats.edges_in) + " directed edges");
    if (!output.stats.key_collisions.empty()) {
        LogWarn("graph", std::to_string(output.stats.key_collisions.size()) +
                             " duplicate edge key(s) overwritten");
    }
    return Result<BuildOutput, Error>::Ok(std::move(output));
}

} // namespace roadnet
