#include <catch2/catch_test_macros.hpp>

#include <roadnet/graph/connectivity.hpp>
#include <roadnet/graph/edge_expander.hpp>
#include <roadnet/schema/tomtom_2021_adapter.hpp>

#include "fixtures/graph_edges.hpp"

#include <cstdint>

using namespace roadnet;
using namespace roadnet::fixtures;

// ===========================================================================
// StronglyConnectedComponents
// ===========================================================================

TEST_CASE("SCC: cycle plus tail", "[graph][scc]") {
    // 1 <-> 2 -> 3, 4 isolated by one-way edge 4 -> 1.
    auto graph = GraphOf({Edge(1, 2, 1), Edge(2, 1, 2), Edge(2, 3, 3), Edge(4, 1, 4)});
    auto components = StronglyConnectedComponents(graph);
    REQUIRE(components.size() == 3);
    CHECK(components[0] == Component{1, 2});
    CHECK(components[1] == Component{3});
    CHECK(components[2] == Component{4});
}

TEST_CASE("SCC: two cycles joined one way", "[graph][scc]") {
    auto graph = GraphOf({
        Edge(1, 2, 1), Edge(2, 3, 2), Edge(3, 1, 3),  // cycle A
        Edge(3, 4, 4),                                // bridge
        Edge(4, 5, 5), Edge(5, 4, 6),                 // cycle B
    });
    auto components = StronglyConnectedComponents(graph);
    REQUIRE(components.size() == 2);
    CHECK(components[0] == Component{1, 2, 3});
    CHECK(components[1] == Component{4, 5});
    CHECK_FALSE(IsStronglyConnected(graph));
}

TEST_CASE("SCC: long chain does not exhaust the stack", "[graph][scc]") {
    constexpr std::int64_t kLength = 200000;
    std::vector<DirectedEdge> edges;
    edges.reserve(kLength);
    for (std::int64_t i = 0; i < kLength; ++i) {
        edges.push_back(Edge(i, (i + 1) % kLength, i));
    }
    auto graph = GraphOf(edges);
    auto components = StronglyConnectedComponents(graph);
    REQUIRE(components.size() == 1);
    CHECK(components[0].size() == static_cast<std::size_t>(kLength));
    CHECK(IsStronglyConnected(graph));
}

TEST_CASE("SCC: empty graph has no components", "[graph][scc]") {
    Graph graph;
    CHECK(StronglyConnectedComponents(graph).empty());
    CHECK_FALSE(IsStronglyConnected(graph));
}

// ===========================================================================
// SelectLargestComponent
// ===========================================================================

TEST_CASE("SelectLargestComponent: largest wins", "[graph][scc]") {
    std::vector<Component> components = {{1}, {2, 3, 4}, {5, 6}};
    CHECK(SelectLargestComponent(components) == std::optional<std::size_t>{1});
}

TEST_CASE("SelectLargestComponent: tie goes to the smallest node id", "[graph][scc]") {
    std::vector<Component> components = {{3, 9}, {1, 7}, {5, 6}};
    CHECK(SelectLargestComponent(components) == std::optional<std::size_t>{1});
}

TEST_CASE("SelectLargestComponent: empty list", "[graph][scc]") {
    CHECK_FALSE(SelectLargestComponent({}).has_value());
}

// ===========================================================================
// ReduceToLargestComponent
// ===========================================================================

TEST_CASE("Reduce: keeps the largest component and its edges", "[graph][reduce]") {
    auto graph = GraphOf({
        Edge(1, 2, 1), Edge(2, 3, 2), Edge(3, 1, 3),
        Edge(3, 4, 4),
        Edge(4, 5, 5), Edge(5, 4, 6),
    });
    auto result = ReduceToLargestComponent(graph);
    REQUIRE(result.IsOk());

    const auto& out = result.Value();
    CHECK(out.graph.Nodes() == std::set<NodeId>{1, 2, 3});
    CHECK(out.graph.EdgeCount() == 3);
    CHECK(IsStronglyConnected(out.graph));
    CHECK(out.stats.component_count == 2);
    CHECK(out.stats.kept_nodes == 3);
    CHECK(out.stats.kept_edges == 3);
    CHECK(out.stats.dropped_nodes == 2);
    CHECK(out.stats.dropped_edges == 3);
}

TEST_CASE("Reduce: parallel edges inside the component survive", "[graph][reduce]") {
    auto graph = GraphOf({Edge(1, 2, 1), Edge(1, 2, 2), Edge(2, 1, 3), Edge(2, 9, 4)});
    auto result = ReduceToLargestComponent(graph);
    REQUIRE(result.IsOk());
    CHECK(result.Value().graph.EdgesBetween(1, 2).size() == 2);
    CHECK(result.Value().graph.EdgeCount() == 3);
}

TEST_CASE("Reduce: idempotent", "[graph][reduce]") {
    auto graph = GraphOf({Edge(1, 2, 1), Edge(2, 1, 2), Edge(2, 3, 3), Edge(3, 4, 4)});
    auto once = ReduceToLargestComponent(graph);
    REQUIRE(once.IsOk());
    auto twice = ReduceToLargestComponent(once.Value().graph);
    REQUIRE(twice.IsOk());
    CHECK(twice.Value().graph.Nodes() == once.Value().graph.Nodes());
    CHECK(twice.Value().graph.EdgeCount() == once.Value().graph.EdgeCount());
    CHECK(twice.Value().stats.dropped_nodes == 0);
    CHECK(twice.Value().stats.dropped_edges == 0);
}

TEST_CASE("Reduce: equal-size components pick the lowest node id", "[graph][reduce]") {
    auto graph = GraphOf({Edge(7, 8, 1), Edge(8, 7, 2), Edge(3, 4, 3), Edge(4, 3, 4)});
    auto result = ReduceToLargestComponent(graph);
    REQUIRE(result.IsOk());
    CHECK(result.Value().graph.Nodes() == std::set<NodeId>{3, 4});
}

TEST_CASE("Reduce: self-loop counts as a routable component", "[graph][reduce]") {
    auto graph = GraphOf({Edge(5, 5, 1)});
    auto result = ReduceToLargestComponent(graph);
    REQUIRE(result.IsOk());
    CHECK(result.Value().graph.NodeCount() == 1);
    CHECK(result.Value().graph.EdgeCount() == 1);
}

TEST_CASE("Reduce: acyclic graph is NotRoutable", "[graph][reduce]") {
    auto graph = GraphOf({Edge(1, 2, 1), Edge(2, 3, 2)});
    auto result = ReduceToLargestComponent(graph);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::NotRoutable);
    CHECK(result.Error().operation == "ReduceToLargestComponent");
    CHECK(result.Error().ExitCode() == 5);
}

TEST_CASE("Reduce: empty graph is NotRoutable", "[graph][reduce]") {
    auto result = ReduceToLargestComponent(Graph{});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::NotRoutable);
}

TEST_CASE("Reduce: input graph is not modified", "[graph][reduce]") {
    auto graph = GraphOf({Edge(1, 2, 1), Edge(2, 1, 2), Edge(2, 3, 3)});
    auto result = ReduceToLargestComponent(graph);
    REQUIRE(result.IsOk());
    CHECK(graph.NodeCount() == 3);
    CHECK(graph.EdgeCount() == 3);
}

// ===========================================================================
// End to end through expansion
// ===========================================================================

TEST_CASE("Reduce: one-way spur is cut from a two-way link", "[graph][reduce]") {
    TomTom2021Adapter adapter;
    // A: 1 <-> 2, 1 km at 20 km/h forward, 15 km/h backward.
    // B: 2 -> 3, 2 km at 24 km/h.
    auto normalized = adapter.Normalize({
        Link2021(1, 1, 2, 100000.0, 1, 20.0, 15.0),
        Link2021(2, 2, 3, 200000.0, 2, 24.0, 24.0),
    });
    REQUIRE(normalized.IsOk());

    auto built = BuildGraph(ExpandAll(normalized.Value().records));
    REQUIRE(built.IsOk());
    auto reduced = ReduceToLargestComponent(built.Value().graph);
    REQUIRE(reduced.IsOk());

    const auto& graph = reduced.Value().graph;
    CHECK(graph.Nodes() == std::set<NodeId>{1, 2});
    REQUIRE(graph.EdgeCount() == 2);
    auto forward = graph.EdgesBetween(1, 2);
    auto backward = graph.EdgesBetween(2, 1);
    REQUIRE(forward.size() == 1);
    REQUIRE(backward.size() == 1);

    auto fwd_minutes = graph.Weight(forward[0], kMinutesAttribute);
    auto bwd_minutes = graph.Weight(backward[0], kMinutesAttribute);
    REQUIRE(fwd_minutes.IsOk());
    REQUIRE(bwd_minutes.IsOk());
    CHECK(fwd_minutes.Value() > 2.999);
    CHECK(fwd_minutes.Value() < 3.001);
    CHECK(bwd_minutes.Value() > 3.999);
    CHECK(bwd_minutes.Value() < 4.001);
}
