#pragma once

#include <weft/lang/ast.hpp>
#include <weft/registry.hpp>
#include <weft/result.hpp>
#include <vector>

namespace weft {

enum class EdgeKind {
    Order,   // source must be applied before target
    Notify   // ordering, plus refresh target when source changes
};

const char* edge_kind_name(EdgeKind kind);

struct RelationshipEdge {
    NodeId source;
    NodeId target;
    EdgeKind kind;
    SourcePos pos;  // statement or metaparameter that produced the edge

    // Positions do not take part in edge identity
    bool operator==(const RelationshipEdge& o) const {
        return source == o.source && target == o.target && kind == o.kind;
    }
};

struct ResolveOptions {
    // Report every undeclared reference in one error. When off, only the
    // first one in source order is reported. Either way every reference is
    // checked before failing.
    bool collect_unresolved = true;
};

// Expand every relationship chain (then every before/require/notify/subscribe
// metaparameter) into edges between registered nodes. Array operands expand
// to the cross product with their adjacent operand only. Duplicate
// (source, target, kind) triples are emitted once, in first-seen order.
Result<std::vector<RelationshipEdge>> resolve_relationships(
    const Manifest& manifest,
    const ResourceRegistry& registry,
    const ResolveOptions& options = {});

} // namespace weft
