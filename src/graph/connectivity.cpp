#include <roadnet/graph/connectivity.hpp>

#include <roadnet/core/log.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <string>

namespace roadnet {

namespace {

constexpr const char* kOperation = "ReduceToLargestComponent";

struct TarjanState {
    std::map<NodeId, std::size_t> index;
    std::map<NodeId, std::size_t> lowlink;
    std::set<NodeId> on_stack;
    std::vector<NodeId> stack;
    std::size_t next_index = 0;

    void Visit(NodeId node) {
        index[node] = next_index;
        lowlink[node] = next_index;
        ++next_index;
        stack.push_back(node);
        on_stack.insert(node);
    }
};

struct Frame {
    NodeId node;
    std::set<NodeId>::const_iterator next;
    std::set<NodeId>::const_iterator end;
};

void CollectFrom(const Graph& graph, NodeId root, TarjanState& state,
                 std::vector<Component>& components) {
    std::vector<Frame> frames;
    const auto& root_succ = graph.Successors(root);
    state.Visit(root);
    frames.push_back(Frame{root, root_succ.begin(), root_succ.end()});

    while (!frames.empty()) {
        const std::size_t top = frames.size() - 1;
        const NodeId node = frames[top].node;

        if (frames[top].next != frames[top].end) {
            const NodeId succ = *frames[top].next;
            ++frames[top].next;
            if (state.index.count(succ) == 0) {
                const auto& succ_succ = graph.Successors(succ);
                state.Visit(succ);
                frames.push_back(Frame{succ, succ_succ.begin(), succ_succ.end()});
            } else if (state.on_stack.count(succ) > 0) {
                state.lowlink[node] = std::min(state.lowlink[node], state.index[succ]);
            }
            continue;
        }

        // All successors done: node is a root if its lowlink never dropped.
        if (state.lowlink[node] == state.index[node]) {
            Component component;
            NodeId member;
            do {
                member = state.stack.back();
                state.stack.pop_back();
                state.on_stack.erase(member);
                component.push_back(member);
            } while (member != node);
            std::sort(component.begin(), component.end());
            components.push_back(std::move(component));
        }

        frames.pop_back();
        if (!frames.empty()) {
            const NodeId parent = frames.back().node;
            state.lowlink[parent] = std::min(state.lowlink[parent], state.lowlink[node]);
        }
    }
}

} // anonymous namespace

std::vector<Component> StronglyConnectedComponents(const Graph& graph) {
    TarjanState state;
    std::vector<Component> components;
    for (NodeId node : graph.Nodes()) {
        if (state.index.count(node) == 0) {
            CollectFrom(graph, node, state, components);
        }
    }
    std::sort(components.begin(), components.end(),
              [](const Component& a, const Component& b) { return a.front() < b.front(); });
    return components;
}

std::optional<std::size_t> SelectLargestComponent(const std::vector<Component>& components) {
    std::optional<std::size_t> best;
    for (std::size_t i = 0; i < components.size(); ++i) {
        const auto& candidate = components[i];
        if (candidate.empty()) {
            continue;
        }
        if (!best.has_value()) {
            best = i;
            continue;
        }
        const auto& current = components[*best];
        if (candidate.size() > current.size() ||
            (candidate.size() == current.size() && candidate.front() < current.front())) {
            best = i;
        }
    }
    return best;
}

bool IsStronglyConnected(const Graph& graph) {
    if (graph.Empty()) {
        return false;
    }
    return StronglyConnectedComponents(graph).size() == 1;
}

Result<ReduceOutput, Error> ReduceToLargestComponent(const Graph& graph) {
    if (graph.Empty()) {
        return Result<ReduceOutput, Error>::Err(
            Error::Make(ErrorCategory::NotRoutable, kOperation, "graph has no nodes"));
    }

    const auto components = StronglyConnectedComponents(graph);
    const auto largest = SelectLargestComponent(components);
    if (!largest.has_value()) {
        return Result<ReduceOutput, Error>::Err(
            Error::Make(ErrorCategory::Internal, kOperation,
                        "no strongly connected component found"));
    }

    const auto& keep_list = components[*largest];
    const std::set<NodeId> keep(keep_list.begin(), keep_list.end());

    ReduceOutput output;
    output.graph = graph.InducedSubgraph(keep);
    output.stats.component_count = components.size();
    output.stats.kept_nodes = output.graph.NodeCount();
    output.stats.kept_edges = output.graph.EdgeCount();
    output.stats.dropped_nodes = graph.NodeCount() - output.graph.NodeCount();
    output.stats.dropped_edges = graph.EdgeCount() - output.graph.EdgeCount();

    if (output.graph.EdgeCount() == 0) {
        return Result<ReduceOutput, Error>::Err(
            Error::Make(ErrorCategory::NotRoutable, kOperation,
                        "no edge survives reduction to the largest strongly connected component",
                        std::to_string(components.size()) + " components")
                .WithHint("the network has no cycle; check direction codes and the "
                          "query boundary"));
    }

    LogInfo("graph", "largest of " + std::to_string(output.stats.component_count) +
                         " strongly connected components kept: " +
                         std::to_string(output.stats.kept_nodes) + " nodes, " +
                         std::to_string(output.stats.kept_edges) + " edges (dropped " +
                         std::to_string(output.stats.dropped_nodes) + " nodes, " +
                         std::to_string(output.stats.dropped_edges) + " edges)");
    return Result<ReduceOutput, Error>::Ok(std::move(output));
}

} // namespace roadnet
