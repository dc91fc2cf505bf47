#pragma once

#include <weft/identity.hpp>
#include <weft/lang/interp.hpp>
#include <weft/lang/token.hpp>
#include <string>
#include <variant>
#include <vector>

namespace weft {

// ---------------------------------------------------------------------------
// References
// ---------------------------------------------------------------------------

// Type['title'] as written; the type keeps its original spelling
struct ResourceRef {
    TypeName type;
    InterpString title;
    SourcePos pos;

    ResourceIdentity identity() const { return {type, title}; }

    bool operator==(const ResourceRef& o) const {
        return type == o.type && title == o.title;
    }
};

// Chain operand: one reference, or a bracketed array of references
struct ReferenceSet {
    std::vector<ResourceRef> refs;
    bool is_array = false;
    SourcePos pos;
};

// ---------------------------------------------------------------------------
// Attribute values
// ---------------------------------------------------------------------------

struct AttributeValue;

struct BareWord {
    std::string text;
    bool operator==(const BareWord& o) const { return text == o.text; }
};

struct NumberLit {
    std::string text;  // source spelling, not converted
    bool operator==(const NumberLit& o) const { return text == o.text; }
};

struct ArrayValue {
    std::vector<AttributeValue> items;
};

inline bool operator==(const ArrayValue& a, const ArrayValue& b);

struct AttributeValue {
    std::variant<InterpString, BareWord, NumberLit, ArrayValue, ResourceRef> v;
    SourcePos pos;

    template<typename T>
    bool is() const { return std::holds_alternative<T>(v); }

    template<typename T>
    const T& as() const { return std::get<T>(v); }

    bool operator==(const AttributeValue& o) const { return v == o.v; }
    bool operator!=(const AttributeValue& o) const { return !(*this == o); }
};

inline bool operator==(const ArrayValue& a, const ArrayValue& b) {
    return a.items == b.items;
}

struct Attribute {
    std::string name;
    AttributeValue value;
    SourcePos pos;
};

// Attributes whose values are relationships rather than resource state
bool is_relationship_metaparam(const std::string& name);

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

struct ResourceDecl {
    TypeName type;
    InterpString title;
    std::vector<Attribute> attributes;  // source order
    size_t order = 0;                   // declaration index within the manifest
    SourcePos pos;

    ResourceIdentity identity() const { return {type, title}; }

    const Attribute* find(const std::string& name) const;
};

enum class ChainOp {
    Before,     // ->
    Notify,     // ~>
    Require,    // <-
    Subscribe   // <~
};

const char* chain_op_symbol(ChainOp op);

// A -> B ~> C: operands.size() == ops.size() + 1
struct ChainStatement {
    std::vector<ReferenceSet> operands;
    std::vector<ChainOp> ops;
    SourcePos pos;
};

// ---------------------------------------------------------------------------
// Parse result
// ---------------------------------------------------------------------------

struct Manifest {
    std::vector<ResourceDecl> resources;
    std::vector<ChainStatement> chains;
    std::vector<Comment> comments;
};

} // namespace weft
