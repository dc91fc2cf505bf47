#pragma once

#include <weft/lang/token.hpp>
#include <weft/result.hpp>
#include <string>
#include <vector>

namespace weft {

struct LexResult {
    std::vector<Token> tokens;
    std::vector<Comment> comments;
};

// Lex manifest source into tokens + preserved comments.
// The token stream always ends with an Eof token.
Result<LexResult> lex(const std::string& source,
                      const std::string& filename = "<input>");

} // namespace weft
