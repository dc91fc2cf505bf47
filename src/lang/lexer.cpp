#include <weft/lang/lexer.hpp>
#include <cctype>
#include <cstdio>

namespace weft {

const char* token_name(TokenType t) {
    switch (t) {
    case TokenType::Identifier: return "Identifier";
    case TokenType::Number:     return "Number";
    case TokenType::String:     return "String";
    case TokenType::LBracket:   return "'['";
    case TokenType::RBracket:   return "']'";
    case TokenType::LBrace:     return "'{'";
    case TokenType::RBrace:     return "'}'";
    case TokenType::Comma:      return "','";
    case TokenType::Colon:      return "':'";
    case TokenType::Semicolon:  return "';'";
    case TokenType::FatArrow:   return "'=>'";
    case TokenType::Before:     return "'->'";
    case TokenType::Notify:     return "'~>'";
    case TokenType::Require:    return "'<-'";
    case TokenType::Subscribe:  return "'<~'";
    case TokenType::Eof:        return "end of input";
    }
    return "?";
}

bool is_chain_operator(TokenType t) {
    return t == TokenType::Before || t == TokenType::Notify ||
           t == TokenType::Require || t == TokenType::Subscribe;
}

// ---------------------------------------------------------------------------
// Lexer state machine
// ---------------------------------------------------------------------------

namespace {

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

struct Lexer {
    const std::string& source;
    const std::string& filename;
    size_t pos;
    int line;
    int col;

    std::vector<Token> tokens;
    std::vector<Comment> comments;

    Lexer(const std::string& src, const std::string& fname)
        : source(src), filename(fname), pos(0), line(1), col(1) {}

    bool at_end() const { return pos >= source.size(); }

    char peek() const { return source[pos]; }

    char peek_next() const {
        return (pos + 1 < source.size()) ? source[pos + 1] : '\0';
    }

    char peek_at(size_t offset) const {
        return (pos + offset < source.size()) ? source[pos + offset] : '\0';
    }

    char advance() {
        char c = source[pos++];
        if (c == '\n') {
            ++line;
            col = 1;
        } else {
            ++col;
        }
        return c;
    }

    SourcePos current_pos() const {
        return {filename, line, col};
    }

    void emit(TokenType type, std::string text, SourcePos p) {
        tokens.push_back({type, std::move(text), std::move(p), {}});
    }

    WeftError error_at(const SourcePos& p, std::string msg,
                       std::string hint = "") const {
        return WeftError{WeftError::Lex, std::move(msg), std::move(hint),
                         p.file, p.line, p.col};
    }

    Result<LexResult> run() {
        while (!at_end()) {
            skip_whitespace();
            if (at_end()) break;

            auto p = current_pos();
            char c = peek();

            if (c == '#') {
                lex_hash_comment(p);
                continue;
            }
            if (c == '/' && peek_next() == '*') {
                WEFT_TRY(lex_block_comment(p));
                continue;
            }

            if (c == '"' || c == '\'') {
                WEFT_TRY(lex_string(p));
                continue;
            }

            if (std::isdigit(static_cast<unsigned char>(c))) {
                lex_number(p);
                continue;
            }

            // Qualified names, including the top-scope form ::name
            if (is_name_start(c) ||
                (c == ':' && peek_next() == ':' && is_name_start(peek_at(2)))) {
                lex_identifier(p);
                continue;
            }

            WEFT_TRY(lex_operator(p));
        }

        emit(TokenType::Eof, "", current_pos());

        LexResult result;
        result.tokens = std::move(tokens);
        result.comments = std::move(comments);
        return Result<LexResult>::ok(std::move(result));
    }

    void skip_whitespace() {
        while (!at_end()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                advance();
            } else {
                break;
            }
        }
    }

    void lex_hash_comment(SourcePos p) {
        advance(); // #
        std::string text;
        while (!at_end() && peek() != '\n') {
            text += advance();
        }
        size_t first_nonspace = text.find_first_not_of(' ');
        text = first_nonspace == std::string::npos ? "" : text.substr(first_nonspace);
        comments.push_back({CommentKind::Hash, text, p});
    }

    Status lex_block_comment(SourcePos p) {
        advance(); // /
        advance(); // *
        std::string text;
        while (!at_end()) {
            if (peek() == '*' && peek_next() == '/') {
                advance(); // *
                advance(); // /
                comments.push_back({CommentKind::Block, text, p});
                return ok_status();
            }
            text += advance();
        }
        return error_at(p, "unterminated block comment",
                        "add a closing '*/'");
    }

    // Strings may span lines. Double-quoted strings record interpolation
    // spans against the decoded text; single-quoted strings never interpolate.
    Status lex_string(SourcePos p) {
        char quote = advance();
        std::string text;
        std::vector<InterpSpan> spans;

        while (!at_end()) {
            char c = peek();
            if (c == quote) {
                advance();
                tokens.push_back({TokenType::String, std::move(text), p,
                                  std::move(spans)});
                return ok_status();
            }
            if (c == '\\') {
                advance();
                if (at_end()) break;
                decode_escape(quote, advance(), text);
                continue;
            }
            if (quote == '"' && c == '$') {
                WEFT_TRY(lex_interpolation(text, spans));
                continue;
            }
            text += advance();
        }
        return error_at(p, "unterminated string literal",
                        std::string("add a closing ") + quote);
    }

    static void decode_escape(char quote, char e, std::string& text) {
        if (e == quote || e == '\\') {
            text += e;
            return;
        }
        if (quote == '"') {
            switch (e) {
            case 'n': text += '\n'; return;
            case 't': text += '\t'; return;
            case 'r': text += '\r'; return;
            case '$': text += '$';  return;
            default: break;
            }
        }
        text += '\\';
        text += e;
    }

    Status lex_interpolation(std::string& text, std::vector<InterpSpan>& spans) {
        auto p = current_pos();

        if (peek_next() == '{') {
            std::string span_text;
            span_text += advance(); // $
            span_text += advance(); // {
            std::string inner;
            while (!at_end() && peek() != '}' && peek() != '"' && peek() != '\n') {
                inner += advance();
            }
            if (at_end() || peek() != '}') {
                return error_at(p, "unterminated interpolation",
                                "close the expression with '}'");
            }
            span_text += inner;
            span_text += advance(); // }

            size_t b = inner.find_first_not_of(" \t");
            size_t e = inner.find_last_not_of(" \t");
            std::string variable = b == std::string::npos ? "" : inner.substr(b, e - b + 1);
            if (!variable.empty() && variable[0] == '$') variable.erase(0, 1);
            if (variable.empty()) {
                return error_at(p, "empty interpolation '${}'");
            }

            spans.push_back({text.size(), span_text.size(), std::move(variable)});
            text += span_text;
            return ok_status();
        }

        if (is_name_start(peek_next()) ||
            (peek_next() == ':' && peek_at(2) == ':' && is_name_start(peek_at(3)))) {
            std::string span_text;
            span_text += advance(); // $
            std::string variable = scan_qualified_name();
            span_text += variable;
            spans.push_back({text.size(), span_text.size(), std::move(variable)});
            text += span_text;
            return ok_status();
        }

        // A lone dollar sign is plain text
        text += advance();
        return ok_status();
    }

    // name(::name)* ; a trailing "::" not followed by a name is left alone
    std::string scan_qualified_name() {
        std::string name;
        while (!at_end()) {
            if (is_name_char(peek())) {
                name += advance();
            } else if (peek() == ':' && peek_next() == ':' &&
                       is_name_start(peek_at(2))) {
                name += advance();
                name += advance();
            } else {
                break;
            }
        }
        return name;
    }

    void lex_number(SourcePos p) {
        std::string text;
        while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
            text += advance();
        }
        if (!at_end() && peek() == '.' &&
            std::isdigit(static_cast<unsigned char>(peek_next()))) {
            text += advance(); // .
            while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
                text += advance();
            }
        }
        emit(TokenType::Number, text, p);
    }

    void lex_identifier(SourcePos p) {
        std::string text;
        if (peek() == ':') {
            text += advance();
            text += advance();
        }
        text += scan_qualified_name();
        emit(TokenType::Identifier, text, p);
    }

    // Bytes of a multi-byte UTF-8 sequence are shown as \xNN
    static std::string printable(char c) {
        auto byte = static_cast<unsigned char>(c);
        if (byte < 0x80) return std::string(1, c);
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\x%02X", byte);
        return buf;
    }

    Status lex_operator(SourcePos p) {
        char c = advance();
        switch (c) {
        case '[': emit(TokenType::LBracket, "[", p); return ok_status();
        case ']': emit(TokenType::RBracket, "]", p); return ok_status();
        case '{': emit(TokenType::LBrace, "{", p); return ok_status();
        case '}': emit(TokenType::RBrace, "}", p); return ok_status();
        case ',': emit(TokenType::Comma, ",", p); return ok_status();
        case ':': emit(TokenType::Colon, ":", p); return ok_status();
        case ';': emit(TokenType::Semicolon, ";", p); return ok_status();
        case '=':
            if (!at_end() && peek() == '>') {
                advance();
                emit(TokenType::FatArrow, "=>", p);
                return ok_status();
            }
            break;
        case '-':
            if (!at_end() && peek() == '>') {
                advance();
                emit(TokenType::Before, "->", p);
                return ok_status();
            }
            break;
        case '~':
            if (!at_end() && peek() == '>') {
                advance();
                emit(TokenType::Notify, "~>", p);
                return ok_status();
            }
            break;
        case '<':
            if (!at_end() && peek() == '-') {
                advance();
                emit(TokenType::Require, "<-", p);
                return ok_status();
            }
            if (!at_end() && peek() == '~') {
                advance();
                emit(TokenType::Subscribe, "<~", p);
                return ok_status();
            }
            break;
        default:
            break;
        }
        return error_at(p, "invalid character '" + printable(c) + "'");
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<LexResult> lex(const std::string& source, const std::string& filename) {
    Lexer lexer(source, filename);
    return lexer.run();
}

} // namespace weft
