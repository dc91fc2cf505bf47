#pragma once

#include <string>
#include <vector>

namespace weft {

struct WeftError {
    enum Code {
        IO,
        Lex,
        Parse,
        Duplicate,
        Unresolved,
        Cycle,
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::vector<std::string> notes;  // further diagnostics batched into this error
    std::string file;
    int line = 0;
    int col = 0;

    WeftError() = default;
    WeftError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    WeftError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    WeftError(Code c, std::string msg, std::string h, std::string f, int l, int co = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l), col(co) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace weft
