#pragma once

#include <weft/catalog.hpp>
#include <weft/lang/ast.hpp>
#include <string>

namespace weft {

std::string format_value(const AttributeValue& value);

// Type['title'], type spelled as written
std::string format_ref(const ResourceRef& ref);

// Re-serialize a parsed manifest: declarations first, then chains.
std::string format_manifest(const Manifest& manifest);

// Serialize a catalog back to manifest source: every declaration without its
// relationship metaparameters, then one chain statement per edge.
// Compiling the output reproduces the same nodes and edges.
std::string format_catalog(const Catalog& catalog);

// Graphviz digraph; notify edges are dashed
std::string to_dot(const Catalog& catalog);

} // namespace weft
