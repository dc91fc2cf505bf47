#pragma once

#include <string>
#include <vector>

namespace weft {

// Source position for error reporting
struct SourcePos {
    std::string file;
    int line = 1;
    int col = 1;
};

enum class TokenType {
    Identifier,     // bare word or type name, may contain :: segments
    Number,
    String,         // single- or double-quoted; text holds decoded content

    LBracket,
    RBracket,
    LBrace,
    RBrace,
    Comma,
    Colon,
    Semicolon,

    FatArrow,       // =>
    Before,         // ->
    Notify,         // ~>
    Require,        // <-
    Subscribe,      // <~

    Eof
};

// A ${...} or $name span inside a decoded double-quoted string
struct InterpSpan {
    size_t offset = 0;     // start of the span in Token::text
    size_t length = 0;     // length of the span text, delimiters included
    std::string variable;  // referenced variable name
};

struct Token {
    TokenType type;
    std::string text;
    SourcePos pos;
    std::vector<InterpSpan> spans;  // String tokens only
};

enum class CommentKind {
    Hash,   // # to end of line
    Block   // /* ... */
};

struct Comment {
    CommentKind kind;
    std::string text;     // content without comment markers
    SourcePos pos;
};

const char* token_name(TokenType t);

bool is_chain_operator(TokenType t);

} // namespace weft
