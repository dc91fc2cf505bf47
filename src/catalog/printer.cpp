#include <weft/printer.hpp>
#include <algorithm>
#include <sstream>

namespace weft {

namespace {

void write_attributes(std::ostringstream& out,
                      const std::vector<Attribute>& attrs,
                      bool skip_metaparams) {
    size_t width = 0;
    for (const auto& a : attrs) {
        if (skip_metaparams && is_relationship_metaparam(a.name)) continue;
        width = std::max(width, a.name.size());
    }
    for (const auto& a : attrs) {
        if (skip_metaparams && is_relationship_metaparam(a.name)) continue;
        out << "  " << a.name << std::string(width - a.name.size(), ' ')
            << " => " << format_value(a.value) << ",\n";
    }
}

void write_declaration(std::ostringstream& out, const std::string& type,
                       const InterpString& title,
                       const std::vector<Attribute>& attrs,
                       bool skip_metaparams) {
    out << type << " { " << title.quoted() << ":\n";
    write_attributes(out, attrs, skip_metaparams);
    out << "}\n";
}

std::string dot_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

} // anonymous namespace

std::string format_value(const AttributeValue& value) {
    if (value.is<InterpString>()) return value.as<InterpString>().quoted();
    if (value.is<BareWord>()) return value.as<BareWord>().text;
    if (value.is<NumberLit>()) return value.as<NumberLit>().text;
    if (value.is<ResourceRef>()) return format_ref(value.as<ResourceRef>());

    std::string out = "[";
    const auto& items = value.as<ArrayValue>().items;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += format_value(items[i]);
    }
    out += "]";
    return out;
}

std::string format_ref(const ResourceRef& ref) {
    return ref.type.raw() + "[" + ref.title.quoted() + "]";
}

std::string format_manifest(const Manifest& manifest) {
    std::ostringstream out;
    for (const auto& decl : manifest.resources) {
        write_declaration(out, decl.type.raw(), decl.title, decl.attributes, false);
        out << "\n";
    }

    for (const auto& chain : manifest.chains) {
        for (size_t i = 0; i < chain.operands.size(); ++i) {
            if (i > 0) out << " " << chain_op_symbol(chain.ops[i - 1]) << " ";
            const auto& operand = chain.operands[i];
            if (operand.is_array) out << "[";
            for (size_t j = 0; j < operand.refs.size(); ++j) {
                if (j > 0) out << ", ";
                out << format_ref(operand.refs[j]);
            }
            if (operand.is_array) out << "]";
        }
        out << "\n";
    }
    return out.str();
}

std::string format_catalog(const Catalog& catalog) {
    std::vector<NodeId> by_order;
    for (NodeId id = 0; id < catalog.size(); ++id) by_order.push_back(id);
    std::stable_sort(by_order.begin(), by_order.end(), [&](NodeId a, NodeId b) {
        return catalog.node(a).order < catalog.node(b).order;
    });

    std::ostringstream out;
    for (NodeId id : by_order) {
        const auto& node = catalog.node(id);
        write_declaration(out, node.identity.type.normalized(),
                          node.identity.title, node.attributes, true);
        out << "\n";
    }

    for (const auto& e : catalog.edges()) {
        out << catalog.node(e.source).identity.str()
            << (e.kind == EdgeKind::Notify ? " ~> " : " -> ")
            << catalog.node(e.target).identity.str() << "\n";
    }
    return out.str();
}

std::string to_dot(const Catalog& catalog) {
    std::ostringstream out;
    out << "digraph catalog {\n";
    out << "  rankdir=LR;\n";
    for (NodeId id = 0; id < catalog.size(); ++id) {
        out << "  n" << id << " [label=\""
            << dot_escape(catalog.node(id).identity.str()) << "\"];\n";
    }
    for (const auto& e : catalog.edges()) {
        out << "  n" << e.source << " -> n" << e.target;
        if (e.kind == EdgeKind::Notify) {
            out << " [style=dashed, label=\"notify\"]";
        }
        out << ";\n";
    }
    out << "}\n";
    return out.str();
}

} // namespace weft
