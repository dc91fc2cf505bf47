#pragma once

#include <weft/graph.hpp>
#include <weft/registry.hpp>
#include <weft/resolver.hpp>
#include <weft/result.hpp>
#include <optional>
#include <vector>

namespace weft {

// The compiled, validated resource graph. Every edge endpoint is a declared
// node, the edges are acyclic, and order() is a linear extension of them.
// Read-only once built.
class Catalog {
public:
    const std::vector<ResourceNode>& nodes() const { return registry_.nodes(); }
    const ResourceNode& node(NodeId id) const { return registry_.node(id); }
    size_t size() const { return registry_.size(); }

    const std::vector<RelationshipEdge>& edges() const { return edges_; }

    // Application order: dependencies first, ties by declaration order
    const std::vector<NodeId>& order() const { return order_; }

    std::optional<NodeId> find(const ResourceIdentity& identity) const {
        return registry_.find(identity);
    }

    // Edges leaving a node, in insertion order
    std::vector<RelationshipEdge> edges_from(NodeId id) const;

    // Nodes that receive a refresh when `id` changes
    std::vector<NodeId> notify_targets(NodeId id) const;

private:
    friend Result<Catalog> build_catalog(ResourceRegistry registry,
                                         std::vector<RelationshipEdge> edges);

    Catalog() = default;

    ResourceRegistry registry_;
    std::vector<RelationshipEdge> edges_;
    std::vector<NodeId> order_;
    Graph<NodeId, size_t> graph_;  // node data: registry id; edge data: index into edges_
    std::vector<size_t> graph_id_; // registry id -> graph id
};

// Assemble nodes and resolved edges; fails with Cycle naming one witness cycle.
Result<Catalog> build_catalog(ResourceRegistry registry,
                              std::vector<RelationshipEdge> edges);

} // namespace weft
