#pragma once

#include <weft/lang/interp.hpp>
#include <weft/result.hpp>
#include <string>

namespace weft {

// Resource type name: segments separated by "::", each [A-Za-z_][A-Za-z0-9_]*.
// Normalized form: lowercase, leading top-scope "::" dropped.
// `foo::bar`, `Foo::Bar` and `::foo::bar` all compare equal.
struct TypeName {
    static Result<TypeName> parse(const std::string& raw);

    const std::string& raw() const;
    const std::string& normalized() const;

    // Reference spelling: every segment capitalized (Foo::Bar)
    std::string display() const;

    bool operator==(const TypeName& o) const;
    bool operator!=(const TypeName& o) const;

private:
    std::string raw_;
    std::string normalized_;
};

// Canonical identity of a declared resource. Titles compare on their
// unevaluated segments, so "/root/${dir}" only matches the same spelling.
struct ResourceIdentity {
    TypeName type;
    InterpString title;

    // File['/tmp/one']
    std::string str() const;

    bool operator==(const ResourceIdentity& o) const {
        return type == o.type && title == o.title;
    }
    bool operator!=(const ResourceIdentity& o) const { return !(*this == o); }
};

struct ResourceIdentityHash {
    size_t operator()(const ResourceIdentity& id) const;
};

} // namespace weft
