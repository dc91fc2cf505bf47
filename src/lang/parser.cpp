#include <weft/lang/parser.hpp>
#include <unordered_set>

namespace weft {

namespace {

using TT = TokenType;

// Deepest array value nesting accepted in an attribute
constexpr int kMaxValueDepth = 256;

// ---------------------------------------------------------------------------
// Parser state machine
// ---------------------------------------------------------------------------

struct Parser {
    const std::vector<Token>& tokens;
    size_t pos;

    Manifest result;
    int depth;  // nesting depth of array values

    explicit Parser(const std::vector<Token>& toks)
        : tokens(toks), pos(0), depth(0) {}

    // -- Navigation ---------------------------------------------------------

    bool at_end() const {
        return pos >= tokens.size() || tokens[pos].type == TT::Eof;
    }

    const Token& peek() const {
        return pos < tokens.size() ? tokens[pos] : tokens.back();
    }

    const Token& peek_at(size_t offset) const {
        size_t idx = pos + offset;
        if (idx >= tokens.size()) return tokens.back(); // Eof
        return tokens[idx];
    }

    const Token& advance() {
        const auto& tok = peek();
        if (pos < tokens.size() && tok.type != TT::Eof) ++pos;
        return tok;
    }

    bool check(TT type) const {
        return peek().type == type;
    }

    bool match(TT type) {
        if (check(type)) {
            advance();
            return true;
        }
        return false;
    }

    // -- Diagnostics --------------------------------------------------------

    static WeftError error_at(const SourcePos& p, std::string msg,
                              std::string hint = "") {
        return WeftError{WeftError::Parse, std::move(msg), std::move(hint),
                         p.file, p.line, p.col};
    }

    WeftError error_here(const std::string& msg, std::string hint = "") const {
        return error_at(peek().pos, msg + ", got " + token_name(peek().type),
                        std::move(hint));
    }

    // -- Top-level dispatch -------------------------------------------------

    Status parse_file() {
        while (!at_end()) {
            WEFT_TRY(parse_statement());
        }
        return ok_status();
    }

    // A statement is a declaration, a chain, or a chain whose operands
    // include declarations. `Name {` declares, `[` or `Name [` references.
    Status parse_statement() {
        ChainStatement chain;
        chain.pos = peek().pos;

        bool declared = false;
        auto first = parse_operand(true, &declared);
        if (first.is_err()) return std::move(first).error();
        chain.operands.push_back(std::move(first).value());

        if (!is_chain_operator(peek().type)) {
            if (declared) return ok_status();
            return error_here("expected a relationship operator after resource reference",
                              "references only appear in relationship chains: A -> B");
        }

        while (is_chain_operator(peek().type)) {
            chain.ops.push_back(to_chain_op(advance().type));
            auto operand = parse_operand(false, nullptr);
            if (operand.is_err()) return std::move(operand).error();
            chain.operands.push_back(std::move(operand).value());
        }

        result.chains.push_back(std::move(chain));
        return ok_status();
    }

    static ChainOp to_chain_op(TT t) {
        switch (t) {
        case TT::Notify:    return ChainOp::Notify;
        case TT::Require:   return ChainOp::Require;
        case TT::Subscribe: return ChainOp::Subscribe;
        default:            return ChainOp::Before;
        }
    }

    // -- Chain operands -----------------------------------------------------

    Result<ReferenceSet> parse_operand(bool statement_start, bool* declared) {
        if (check(TT::LBracket)) {
            return parse_reference_array();
        }
        if (check(TT::Identifier) && peek_at(1).type == TT::LBracket) {
            ReferenceSet set;
            set.pos = peek().pos;
            auto refs = parse_reference();
            if (refs.is_err()) return std::move(refs).error();
            set.refs = std::move(refs).value();
            set.is_array = set.refs.size() > 1;
            return Result<ReferenceSet>::ok(std::move(set));
        }
        if (check(TT::Identifier) && peek_at(1).type == TT::LBrace) {
            if (declared) *declared = true;
            return parse_resource_decl();
        }
        if (statement_start) {
            return error_here("expected resource declaration or relationship chain");
        }
        return error_here("relationship operand must be a resource reference "
                          "or an array of references");
    }

    // Type['a'] or Type['a', 'b']
    Result<std::vector<ResourceRef>> parse_reference() {
        const Token& type_tok = advance();
        auto type = TypeName::parse(type_tok.text);
        if (type.is_err()) {
            return error_at(type_tok.pos, type.error().message, type.error().hint);
        }
        advance(); // [

        std::vector<ResourceRef> refs;
        while (!check(TT::RBracket)) {
            auto title = parse_title_scalar();
            if (title.is_err()) return std::move(title).error();
            refs.push_back({type.value(), std::move(title).value(), type_tok.pos});
            if (!match(TT::Comma)) break;
        }
        if (refs.empty()) {
            return error_at(type_tok.pos,
                "empty resource reference '" + type_tok.text + "[]'",
                "a reference names at least one title");
        }
        if (!match(TT::RBracket)) {
            return error_here("expected ']' to close resource reference");
        }
        return Result<std::vector<ResourceRef>>::ok(std::move(refs));
    }

    // [Ref, Ref, ...]
    Result<ReferenceSet> parse_reference_array() {
        ReferenceSet set;
        set.pos = peek().pos;
        set.is_array = true;
        advance(); // [

        while (!check(TT::RBracket)) {
            if (!(check(TT::Identifier) && peek_at(1).type == TT::LBracket)) {
                return error_here("reference array elements must be resource references");
            }
            auto refs = parse_reference();
            if (refs.is_err()) return std::move(refs).error();
            for (auto& r : refs.value()) set.refs.push_back(std::move(r));
            if (!match(TT::Comma)) break;
        }
        if (!match(TT::RBracket)) {
            return error_here("expected ']' to close reference array");
        }
        if (set.refs.empty()) {
            return error_at(set.pos, "empty reference array in relationship");
        }
        return Result<ReferenceSet>::ok(std::move(set));
    }

    Result<InterpString> parse_title_scalar() {
        if (check(TT::String)) {
            return Result<InterpString>::ok(split_interpolation(advance()));
        }
        if (check(TT::Identifier) || check(TT::Number)) {
            return Result<InterpString>::ok(InterpString::literal(advance().text));
        }
        return error_here("expected resource title");
    }

    // -- Resource declarations ----------------------------------------------

    // type { title: attr => value, ... ; title2: ... }
    // Returns the declared resources as a chain operand.
    Result<ReferenceSet> parse_resource_decl() {
        const Token& type_tok = advance();
        auto type = TypeName::parse(type_tok.text);
        if (type.is_err()) {
            return error_at(type_tok.pos, type.error().message, type.error().hint);
        }
        advance(); // {

        ReferenceSet declared;
        declared.pos = type_tok.pos;

        while (true) {
            if (check(TT::RBrace) ||
                (check(TT::Identifier) && peek_at(1).type == TT::FatArrow)) {
                return error_here("missing title in '" + type_tok.text + "' declaration",
                                  "declarations take the form: type { 'title': attr => value }");
            }

            SourcePos body_pos = peek().pos;
            auto titles = parse_titles();
            if (titles.is_err()) return std::move(titles).error();

            if (!match(TT::Colon)) {
                return error_here("missing ':' after resource title");
            }

            auto attrs = parse_attributes();
            if (attrs.is_err()) return std::move(attrs).error();

            for (auto& title : titles.value()) {
                ResourceDecl decl;
                decl.type = type.value();
                decl.title = std::move(title);
                decl.attributes = attrs.value();
                decl.order = result.resources.size();
                decl.pos = body_pos;
                declared.refs.push_back({decl.type, decl.title, body_pos});
                result.resources.push_back(std::move(decl));
            }

            if (match(TT::Semicolon)) {
                if (check(TT::RBrace)) break;
                continue;
            }
            break;
        }

        if (!match(TT::RBrace)) {
            if (at_end()) {
                return error_at(type_tok.pos,
                    "missing closing '}' for '" + type_tok.text + "' declaration");
            }
            return error_here("expected ',', ';' or '}' in resource body");
        }

        declared.is_array = declared.refs.size() > 1;
        return Result<ReferenceSet>::ok(std::move(declared));
    }

    // 'title' | bareword | ['a', 'b']
    Result<std::vector<InterpString>> parse_titles() {
        std::vector<InterpString> titles;
        if (!check(TT::LBracket)) {
            auto t = parse_title_scalar();
            if (t.is_err()) return std::move(t).error();
            titles.push_back(std::move(t).value());
            return Result<std::vector<InterpString>>::ok(std::move(titles));
        }

        SourcePos open = advance().pos; // [
        while (!check(TT::RBracket)) {
            auto t = parse_title_scalar();
            if (t.is_err()) return std::move(t).error();
            titles.push_back(std::move(t).value());
            if (!match(TT::Comma)) break;
        }
        if (!match(TT::RBracket)) {
            return error_here("expected ']' to close title array");
        }
        if (titles.empty()) {
            return error_at(open, "empty title array");
        }
        return Result<std::vector<InterpString>>::ok(std::move(titles));
    }

    Result<std::vector<Attribute>> parse_attributes() {
        std::vector<Attribute> attrs;
        std::unordered_set<std::string> seen;

        while (check(TT::Identifier) && peek_at(1).type == TT::FatArrow) {
            const Token& name_tok = advance();
            advance(); // =>

            if (!seen.insert(name_tok.text).second) {
                return error_at(name_tok.pos,
                    "duplicate attribute '" + name_tok.text + "'",
                    "each attribute may be set once per resource");
            }

            auto value = parse_value();
            if (value.is_err()) return std::move(value).error();

            if (is_relationship_metaparam(name_tok.text) &&
                !is_reference_value(value.value())) {
                return error_at(value.value().pos,
                    "metaparameter '" + name_tok.text + "' expects resource references");
            }

            attrs.push_back({name_tok.text, std::move(value).value(), name_tok.pos});
            if (!match(TT::Comma)) break;
        }
        return Result<std::vector<Attribute>>::ok(std::move(attrs));
    }

    static bool is_reference_value(const AttributeValue& v) {
        if (v.is<ResourceRef>()) return true;
        if (!v.is<ArrayValue>()) return false;
        for (const auto& item : v.as<ArrayValue>().items) {
            if (!item.is<ResourceRef>()) return false;
        }
        return true;
    }

    // -- Attribute values ---------------------------------------------------

    Result<AttributeValue> parse_value() {
        AttributeValue value;
        value.pos = peek().pos;

        if (check(TT::String)) {
            value.v = split_interpolation(advance());
        } else if (check(TT::Number)) {
            value.v = NumberLit{advance().text};
        } else if (check(TT::Identifier) && peek_at(1).type == TT::LBracket) {
            auto refs = parse_reference();
            if (refs.is_err()) return std::move(refs).error();
            if (refs.value().size() == 1) {
                value.v = std::move(refs.value().front());
            } else {
                ArrayValue arr;
                for (auto& r : refs.value()) {
                    arr.items.push_back({std::move(r), value.pos});
                }
                value.v = std::move(arr);
            }
        } else if (check(TT::Identifier)) {
            value.v = BareWord{advance().text};
        } else if (check(TT::LBracket)) {
            if (depth >= kMaxValueDepth) {
                return error_here("array values nested too deeply",
                                  "at most " + std::to_string(kMaxValueDepth) +
                                  " levels of nested arrays are allowed");
            }
            advance(); // [
            ++depth;
            ArrayValue arr;
            while (!check(TT::RBracket)) {
                auto item = parse_value();
                if (item.is_err()) return std::move(item).error();
                arr.items.push_back(std::move(item).value());
                if (!match(TT::Comma)) break;
            }
            if (!match(TT::RBracket)) {
                return error_here("expected ']' to close array value");
            }
            --depth;
            value.v = std::move(arr);
        } else {
            return error_here("expected attribute value");
        }

        return Result<AttributeValue>::ok(std::move(value));
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<Manifest> parse(const LexResult& lex_result) {
    if (lex_result.tokens.empty()) {
        return Result<Manifest>::ok(Manifest{});
    }

    Parser parser(lex_result.tokens);
    WEFT_TRY(parser.parse_file());
    parser.result.comments = lex_result.comments;
    return Result<Manifest>::ok(std::move(parser.result));
}

} // namespace weft
