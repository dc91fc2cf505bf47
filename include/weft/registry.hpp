#pragma once

#include <weft/identity.hpp>
#include <weft/lang/ast.hpp>
#include <weft/result.hpp>
#include <optional>
#include <unordered_map>
#include <vector>

namespace weft {

using NodeId = size_t;

struct ResourceNode {
    ResourceIdentity identity;
    std::vector<Attribute> attributes;
    size_t order = 0;  // declaration index, tie-break only
    SourcePos pos;
};

// Identity -> node table for one compilation. Not shared between compilations;
// each compile owns its registry.
class ResourceRegistry {
public:
    // Fails with Duplicate if the identity was already declared
    Result<NodeId> declare(ResourceIdentity identity,
                           std::vector<Attribute> attributes,
                           size_t order,
                           SourcePos pos);

    // Fails with Unresolved; pos is where the reference was written
    Result<NodeId> lookup(const ResourceIdentity& identity,
                          const SourcePos& pos) const;

    std::optional<NodeId> find(const ResourceIdentity& identity) const;

    const ResourceNode& node(NodeId id) const { return nodes_[id]; }
    const std::vector<ResourceNode>& nodes() const { return nodes_; }
    size_t size() const { return nodes_.size(); }

private:
    std::vector<ResourceNode> nodes_;
    std::unordered_map<ResourceIdentity, NodeId, ResourceIdentityHash> index_;
};

// Declare every resource of the manifest in declaration order.
// Node ids therefore follow declaration order.
Result<ResourceRegistry> register_resources(const Manifest& manifest);

// "file:line:col"
std::string format_pos(const SourcePos& pos);

} // namespace weft
