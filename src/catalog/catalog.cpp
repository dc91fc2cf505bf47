#include <weft/catalog.hpp>
#include <weft/log.hpp>
#include <algorithm>

namespace weft {

std::vector<RelationshipEdge> Catalog::edges_from(NodeId id) const {
    std::vector<RelationshipEdge> out;
    for (const auto& e : graph_.successors(graph_id_[id])) {
        out.push_back(edges_[e.data]);
    }
    return out;
}

std::vector<NodeId> Catalog::notify_targets(NodeId id) const {
    std::vector<NodeId> out;
    for (const auto& e : graph_.successors(graph_id_[id])) {
        const auto& edge = edges_[e.data];
        if (edge.kind == EdgeKind::Notify &&
            std::find(out.begin(), out.end(), edge.target) == out.end()) {
            out.push_back(edge.target);
        }
    }
    return out;
}

Result<Catalog> build_catalog(ResourceRegistry registry,
                              std::vector<RelationshipEdge> edges) {
    Catalog catalog;

    // Graph ids must follow declaration order for the topological tie-break
    std::vector<NodeId> by_order(registry.size());
    for (NodeId id = 0; id < registry.size(); ++id) by_order[id] = id;
    std::stable_sort(by_order.begin(), by_order.end(), [&](NodeId a, NodeId b) {
        return registry.node(a).order < registry.node(b).order;
    });

    auto& graph_id = catalog.graph_id_;
    graph_id.resize(registry.size());
    for (NodeId id : by_order) {
        graph_id[id] = catalog.graph_.add_node(id);
    }

    for (size_t i = 0; i < edges.size(); ++i) {
        const auto& e = edges[i];
        if (e.source >= registry.size() || e.target >= registry.size()) {
            return WeftError{WeftError::Unresolved,
                "relationship endpoint is not a declared resource", "",
                e.pos.file, e.pos.line, e.pos.col};
        }
        catalog.graph_.add_edge(graph_id[e.source], graph_id[e.target], i);
    }

    auto sorted = catalog.graph_.topological_sort();
    if (sorted.is_err()) {
        auto cycle = catalog.graph_.find_cycle();
        std::string path;
        for (size_t i = 0; i < cycle.size(); ++i) {
            if (i > 0) path += " -> ";
            path += registry.node(catalog.graph_.node(cycle[i])).identity.str();
        }

        WeftError err{WeftError::Cycle, "dependency cycle: " + path,
                      "remove one of the relationships in the cycle"};
        // Point at the edge that closes the cycle
        if (cycle.size() >= 2) {
            for (const auto& e : catalog.graph_.successors(cycle[cycle.size() - 2])) {
                if (e.to == cycle.back()) {
                    const auto& pos = edges[e.data].pos;
                    err.file = pos.file;
                    err.line = pos.line;
                    err.col = pos.col;
                    break;
                }
            }
        }
        return err;
    }

    for (auto gid : sorted.value()) {
        catalog.order_.push_back(catalog.graph_.node(gid));
    }

    log::debug("catalog: %zu resources, %zu relationships",
               registry.size(), edges.size());

    catalog.registry_ = std::move(registry);
    catalog.edges_ = std::move(edges);
    return Result<Catalog>::ok(std::move(catalog));
}

} // namespace weft
