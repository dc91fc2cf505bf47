#include <weft/lang/ast.hpp>

namespace weft {

bool is_relationship_metaparam(const std::string& name) {
    return name == "before" || name == "require" ||
           name == "notify" || name == "subscribe";
}

const Attribute* ResourceDecl::find(const std::string& name) const {
    for (const auto& attr : attributes) {
        if (attr.name == name) return &attr;
    }
    return nullptr;
}

const char* chain_op_symbol(ChainOp op) {
    switch (op) {
    case ChainOp::Before:    return "->";
    case ChainOp::Notify:    return "~>";
    case ChainOp::Require:   return "<-";
    case ChainOp::Subscribe: return "<~";
    }
    return "?";
}

} // namespace weft
