#pragma once

#include <roadnet/core/result.hpp>
#include <roadnet/graph/graph.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace roadnet {

// Strongly connected component: node ids in ascending order.
using Component = std::vector<NodeId>;

/// Tarjan's algorithm, iterative (road networks easily exceed the default
/// stack depth recursion would need). Components are returned ordered by
/// their smallest node id.
[[nodiscard]] std::vector<Component> StronglyConnectedComponents(const Graph& graph);

/// Index of the component with the most nodes; ties go to the component
/// holding the smallest node id. nullopt for an empty list.
[[nodiscard]] std::optional<std::size_t> SelectLargestComponent(
    const std::vector<Component>& components);

/// True when every node reaches every other node. An empty graph is not
/// strongly connected.
[[nodiscard]] bool IsStronglyConnected(const Graph& graph);

struct ReduceStats {
    std::size_t component_count = 0;
    std::size_t kept_nodes = 0;
    std::size_t kept_edges = 0;
    std::size_t dropped_nodes = 0;
    std::size_t dropped_edges = 0;
};

struct ReduceOutput {
    Graph graph;
    ReduceStats stats;
};

// ---------------------------------------------------------------------------
// ReduceToLargestComponent — keep the largest strongly connected component
// and every edge inside it.
//
// Idempotent: reducing an already reduced graph drops nothing. Fails with
// NotRoutable when the graph is empty or no edge survives (the largest
// component is a single node without a self-loop).
// ---------------------------------------------------------------------------
[[nodiscard]] Result<ReduceOutput, Error> ReduceToLargestComponent(const Graph& graph);

} // namespace roadnet
