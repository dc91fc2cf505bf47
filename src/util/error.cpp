#include <weft/error.hpp>

namespace weft {

const char* WeftError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Lex:        return "Lex";
        case Parse:      return "Parse";
        case Duplicate:  return "Duplicate";
        case Unresolved: return "Unresolved";
        case Cycle:      return "Cycle";
        case Config:     return "Config";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string WeftError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    for (const auto& note : notes) {
        result += "\n  note: ";
        result += note;
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
            if (col > 0) {
                result += ":";
                result += std::to_string(col);
            }
        }
    }

    return result;
}

} // namespace weft
