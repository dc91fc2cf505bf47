#include <weft/registry.hpp>
#include <weft/log.hpp>

namespace weft {

std::string format_pos(const SourcePos& pos) {
    return pos.file + ":" + std::to_string(pos.line) + ":" + std::to_string(pos.col);
}

Result<NodeId> ResourceRegistry::declare(ResourceIdentity identity,
                                         std::vector<Attribute> attributes,
                                         size_t order,
                                         SourcePos pos) {
    auto it = index_.find(identity);
    if (it != index_.end()) {
        const auto& prev = nodes_[it->second];
        return WeftError{WeftError::Duplicate,
            "duplicate declaration of " + identity.str(),
            "first declared at " + format_pos(prev.pos),
            pos.file, pos.line, pos.col};
    }

    NodeId id = nodes_.size();
    index_.emplace(identity, id);
    nodes_.push_back({std::move(identity), std::move(attributes), order, std::move(pos)});
    return Result<NodeId>::ok(id);
}

Result<NodeId> ResourceRegistry::lookup(const ResourceIdentity& identity,
                                        const SourcePos& pos) const {
    auto id = find(identity);
    if (!id) {
        return WeftError{WeftError::Unresolved,
            "reference to undeclared resource " + identity.str(),
            "declare it with: " + identity.type.normalized() + " { " +
                identity.title.quoted() + ": }",
            pos.file, pos.line, pos.col};
    }
    return Result<NodeId>::ok(*id);
}

std::optional<NodeId> ResourceRegistry::find(const ResourceIdentity& identity) const {
    auto it = index_.find(identity);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

Result<ResourceRegistry> register_resources(const Manifest& manifest) {
    ResourceRegistry registry;
    for (const auto& decl : manifest.resources) {
        auto id = registry.declare(decl.identity(), decl.attributes,
                                   decl.order, decl.pos);
        if (id.is_err()) return std::move(id).error();
        if (log::get_level() <= log::Trace) {
            log::trace("declared %s as node %zu", decl.identity().str().c_str(),
                       id.value());
        }
    }
    return Result<ResourceRegistry>::ok(std::move(registry));
}

} // namespace weft
