#include <weft/resolver.hpp>
#include <weft/log.hpp>
#include <algorithm>
#include <set>
#include <tuple>

namespace weft {

const char* edge_kind_name(EdgeKind kind) {
    switch (kind) {
    case EdgeKind::Order:  return "order";
    case EdgeKind::Notify: return "notify";
    }
    return "?";
}

namespace {

struct Direction {
    bool reversed;
    EdgeKind kind;
};

Direction direction_of(ChainOp op) {
    switch (op) {
    case ChainOp::Before:    return {false, EdgeKind::Order};
    case ChainOp::Notify:    return {false, EdgeKind::Notify};
    case ChainOp::Require:   return {true,  EdgeKind::Order};
    case ChainOp::Subscribe: return {true,  EdgeKind::Notify};
    }
    return {false, EdgeKind::Order};
}

ChainOp metaparam_op(const std::string& name) {
    if (name == "require")   return ChainOp::Require;
    if (name == "notify")    return ChainOp::Notify;
    if (name == "subscribe") return ChainOp::Subscribe;
    return ChainOp::Before;
}

class Resolver {
public:
    Resolver(const ResourceRegistry& registry, const ResolveOptions& options)
        : registry_(registry), options_(options) {}

    void resolve_chain(const ChainStatement& chain) {
        // Resolve each operand once; the middle of A -> B -> C borders two operators
        std::vector<std::vector<NodeId>> resolved;
        bool complete = true;
        for (const auto& operand : chain.operands) {
            auto ids = resolve_set(operand.refs);
            if (ids.size() != operand.refs.size()) complete = false;
            resolved.push_back(std::move(ids));
        }
        if (!complete) return;

        for (size_t i = 0; i < chain.ops.size(); ++i) {
            connect(resolved[i], resolved[i + 1], chain.ops[i], chain.pos);
        }
    }

    Status resolve_metaparams(const ResourceDecl& decl) {
        for (const auto& attr : decl.attributes) {
            if (!is_relationship_metaparam(attr.name)) continue;

            std::vector<ResourceRef> refs;
            if (attr.value.is<ResourceRef>()) {
                refs.push_back(attr.value.as<ResourceRef>());
            } else if (attr.value.is<ArrayValue>()) {
                for (const auto& item : attr.value.as<ArrayValue>().items) {
                    if (item.is<ResourceRef>()) refs.push_back(item.as<ResourceRef>());
                }
            }

            auto self = registry_.lookup(decl.identity(), decl.pos);
            if (self.is_err()) return std::move(self).error();
            auto others = resolve_set(refs);
            if (others.size() != refs.size()) continue;

            connect({self.value()}, others, metaparam_op(attr.name), attr.pos);
        }
        return ok_status();
    }

    Result<std::vector<RelationshipEdge>> finish() && {
        if (!unresolved_.empty()) {
            // Chains are walked before metaparameters; report in source order
            std::stable_sort(unresolved_.begin(), unresolved_.end(),
                             [](const WeftError& a, const WeftError& b) {
                                 return std::tie(a.line, a.col) < std::tie(b.line, b.col);
                             });
            WeftError err = std::move(unresolved_.front());
            if (!options_.collect_unresolved) return err;
            for (size_t i = 1; i < unresolved_.size(); ++i) {
                const auto& more = unresolved_[i];
                err.notes.push_back(more.message + " at " + more.file + ":" +
                                    std::to_string(more.line) + ":" +
                                    std::to_string(more.col));
            }
            if (unresolved_.size() > 1) {
                err.message += " (and " + std::to_string(unresolved_.size() - 1) +
                               " more)";
            }
            return err;
        }
        return Result<std::vector<RelationshipEdge>>::ok(std::move(edges_));
    }

private:
    const ResourceRegistry& registry_;
    const ResolveOptions& options_;
    std::vector<RelationshipEdge> edges_;
    std::set<std::tuple<NodeId, NodeId, EdgeKind>> seen_;
    std::vector<WeftError> unresolved_;

    // Ids of the refs that resolved; unresolved refs are recorded and skipped
    std::vector<NodeId> resolve_set(const std::vector<ResourceRef>& refs) {
        std::vector<NodeId> ids;
        for (const auto& ref : refs) {
            auto id = registry_.lookup(ref.identity(), ref.pos);
            if (id.is_ok()) {
                ids.push_back(id.value());
            } else {
                unresolved_.push_back(std::move(id).error());
            }
        }
        return ids;
    }

    void connect(const std::vector<NodeId>& left, const std::vector<NodeId>& right,
                 ChainOp op, const SourcePos& pos) {
        auto dir = direction_of(op);
        for (NodeId l : left) {
            for (NodeId r : right) {
                NodeId source = dir.reversed ? r : l;
                NodeId target = dir.reversed ? l : r;
                if (!seen_.emplace(source, target, dir.kind).second) continue;
                if (log::get_level() <= log::Trace) {
                    log::trace("edge %s -> %s (%s)",
                               registry_.node(source).identity.str().c_str(),
                               registry_.node(target).identity.str().c_str(),
                               edge_kind_name(dir.kind));
                }
                edges_.push_back({source, target, dir.kind, pos});
            }
        }
    }
};

} // anonymous namespace

Result<std::vector<RelationshipEdge>> resolve_relationships(
    const Manifest& manifest,
    const ResourceRegistry& registry,
    const ResolveOptions& options) {
    Resolver resolver(registry, options);
    for (const auto& chain : manifest.chains) {
        resolver.resolve_chain(chain);
    }
    for (const auto& decl : manifest.resources) {
        WEFT_TRY(resolver.resolve_metaparams(decl));
    }
    return std::move(resolver).finish();
}

} // namespace weft
