#pragma once

#include <roadnet/core/result.hpp>
#include <roadnet/graph/directed_edge.hpp>
#include <roadnet/graph/graph.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace roadnet {

// What to do when two directed edges share (from, to, key).
enum class KeyCollisionPolicy {
    Overwrite,  // last edge wins, collision is counted and logged
    Reject,     // fail with ErrorCategory::KeyCollision
};

[[nodiscard]] std::string_view KeyCollisionPolicyName(KeyCollisionPolicy policy) noexcept;
[[nodiscard]] Result<KeyCollisionPolicy, std::string> ParseKeyCollisionPolicy(
    std::string_view text);

struct BuildOptions {
    KeyCollisionPolicy on_key_collision = KeyCollisionPolicy::Overwrite;
};

struct BuildStats {
    std::size_t edges_in = 0;
    std::size_t node_count = 0;
    std::size_t edge_count = 0;
    std::vector<EdgeId> key_collisions;
};

// ---------------------------------------------------------------------------
// GraphBuilder — the only writer of Graph.
//
// Nodes are created implicitly from edge endpoints. Parallel edges with
// distinct keys are kept side by side.
// ---------------------------------------------------------------------------
class GraphBuilder {
public:
    explicit GraphBuilder(BuildOptions options = {});

    [[nodiscard]] Result<void, Error> AddEdge(DirectedEdge edge);
    void AddNode(NodeId node);

    [[nodiscard]] const BuildStats& Stats() const noexcept { return stats_; }

    /// Hands out the graph built so far and resets the builder.
    [[nodiscard]] Graph Build();

private:
    BuildOptions options_;
    BuildStats stats_;
    Graph graph_;
};

struct BuildOutput {
    Graph graph;
    BuildStats stats;
};

/// Insert every edge in order. Fails only under KeyCollisionPolicy::Reject.
[[nodiscard]] Result<BuildOutput, Error> BuildGraph(const std::vector<DirectedEdge>& edges,
                                                    const BuildOptions& options = {});

} // namespace roadnet
