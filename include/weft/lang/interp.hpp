#pragma once

#include <weft/lang/token.hpp>
#include <string>
#include <vector>

namespace weft {

// One piece of a quoted string: literal text or an unevaluated variable reference
struct Segment {
    enum Kind { Literal, Reference };

    Kind kind = Literal;
    std::string text;  // literal text, or the variable name for a Reference

    bool operator==(const Segment& o) const {
        return kind == o.kind && text == o.text;
    }
    bool operator!=(const Segment& o) const { return !(*this == o); }
};

// A string whose interpolations are kept as structure for a later evaluator.
// Equality is syntactic: two strings are equal when their segments are.
class InterpString {
public:
    InterpString() = default;
    explicit InterpString(std::vector<Segment> segments)
        : segments_(std::move(segments)) {}

    static InterpString literal(std::string text);

    const std::vector<Segment>& segments() const { return segments_; }

    bool has_references() const;

    // Concatenated literal text; only meaningful when !has_references()
    std::string literal_text() const;

    // Unquoted rendering, references written as ${name}
    std::string str() const;

    // Manifest source form: single-quoted when there are no references,
    // double-quoted with escapes otherwise
    std::string quoted() const;

    size_t hash() const;

    bool operator==(const InterpString& o) const { return segments_ == o.segments_; }
    bool operator!=(const InterpString& o) const { return !(*this == o); }

private:
    std::vector<Segment> segments_;
};

// Decompose a lexed String token into literal/reference segments using the
// spans the lexer recorded. No spans yields a single literal segment.
InterpString split_interpolation(const Token& token);

// Same, for decoded text and spans not attached to a token
InterpString split_interpolation(const std::string& text,
                                 const std::vector<InterpSpan>& spans);

} // namespace weft
