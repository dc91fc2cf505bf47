#pragma once

#include <weft/lang/ast.hpp>
#include <weft/lang/lexer.hpp>
#include <weft/result.hpp>
#include <string>

namespace weft {

// Parse a lexed manifest into resource declarations and relationship chains.
// Stops at the first malformed statement.
// Positions in the result come from the tokens, which carry the file name.
Result<Manifest> parse(const LexResult& lex_result);

} // namespace weft
