#pragma once

#include <weft/result.hpp>
#include <functional>
#include <queue>
#include <vector>

namespace weft {

// ---------------------------------------------------------------------------
// Graph<NodeData, EdgeData>: directed graph with adjacency lists.
// Node ids are dense and follow insertion order.
// ---------------------------------------------------------------------------

template<typename NodeData, typename EdgeData = std::monostate>
class Graph {
public:
    using NodeId = size_t;

    struct Edge {
        NodeId from;
        NodeId to;
        EdgeData data;
    };

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        adj_.push_back({});
        return id;
    }

    void add_edge(NodeId from, NodeId to, EdgeData data = {}) {
        adj_[from].push_back({from, to, std::move(data)});
    }

    const NodeData& node(NodeId id) const { return nodes_[id]; }

    const std::vector<Edge>& successors(NodeId id) const { return adj_[id]; }

    // Topological sort using Kahn's algorithm. Among nodes that are ready at
    // the same time the smallest id goes first, so the result is the
    // lexicographically smallest order and identical on every run.
    // Returns Cycle error if the graph has cycles.
    Result<std::vector<NodeId>> topological_sort() const {
        size_t n = nodes_.size();
        std::vector<size_t> in_deg(n, 0);
        for (const auto& edges : adj_) {
            for (const auto& e : edges) ++in_deg[e.to];
        }

        std::priority_queue<NodeId, std::vector<NodeId>, std::greater<NodeId>> ready;
        for (size_t i = 0; i < n; ++i) {
            if (in_deg[i] == 0) ready.push(i);
        }

        std::vector<NodeId> order;
        order.reserve(n);
        while (!ready.empty()) {
            NodeId u = ready.top();
            ready.pop();
            order.push_back(u);
            for (const auto& e : adj_[u]) {
                if (--in_deg[e.to] == 0) {
                    ready.push(e.to);
                }
            }
        }

        if (order.size() != n) {
            return WeftError{WeftError::Cycle, "graph contains a cycle"};
        }
        return Result<std::vector<NodeId>>::ok(std::move(order));
    }

    // One witness cycle as a closed walk [a, b, ..., a], or empty if acyclic.
    // Iterative DFS so long chains do not exhaust the stack.
    std::vector<NodeId> find_cycle() const {
        enum Color : unsigned char { White, Gray, Black };
        size_t n = nodes_.size();
        std::vector<Color> color(n, White);
        std::vector<NodeId> parent(n, 0);

        for (NodeId root = 0; root < n; ++root) {
            if (color[root] != White) continue;

            // (node, index of next successor to visit)
            std::vector<std::pair<NodeId, size_t>> stack;
            stack.push_back({root, 0});
            color[root] = Gray;

            while (!stack.empty()) {
                auto& [u, next] = stack.back();
                if (next == adj_[u].size()) {
                    color[u] = Black;
                    stack.pop_back();
                    continue;
                }
                NodeId v = adj_[u][next++].to;
                if (color[v] == Gray) {
                    // Back edge u -> v: walk parents from u back to v
                    std::vector<NodeId> cycle{v};
                    std::vector<NodeId> tail;
                    for (NodeId w = u; w != v; w = parent[w]) tail.push_back(w);
                    cycle.insert(cycle.end(), tail.rbegin(), tail.rend());
                    cycle.push_back(v);
                    return cycle;
                }
                if (color[v] == White) {
                    color[v] = Gray;
                    parent[v] = u;
                    stack.push_back({v, 0});
                }
            }
        }
        return {};
    }

private:
    std::vector<NodeData> nodes_;
    std::vector<std::vector<Edge>> adj_;
};

} // namespace weft
