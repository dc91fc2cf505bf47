#include <weft/log.hpp>
#include <cstdarg>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace weft::log {

namespace {

Level s_level = Info;
std::FILE* s_stream = nullptr;
bool s_color_initialized = false;
bool s_color_enabled = false;

std::FILE* out() {
    return s_stream ? s_stream : stderr;
}

void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(out()));
        s_color_initialized = true;
    }
}

const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";
        case Debug: return "\033[36m";
        case Info:  return "\033[32m";
        case Warn:  return "\033[33m";
        case Error: return "\033[1;31m";
    }
    return "";
}

void write_prefix(Level lvl) {
    init_color();
    if (s_color_enabled) {
        std::fprintf(out(), "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(out(), "%s: ", level_name(lvl));
    }
}

void vwrite(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    write_prefix(lvl);
    std::vfprintf(out(), fmt, args);
    std::fputc('\n', out());
}

} // anonymous namespace

void set_level(Level lvl) { s_level = lvl; }
Level get_level() { return s_level; }

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_stream(std::FILE* stream) {
    s_stream = stream;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

std::optional<Level> level_from_name(const std::string& name) {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (name == level_name(lvl)) return lvl;
    }
    if (name == "warning") return Warn;
    return std::nullopt;
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Error, fmt, args);
    va_end(args);
}

void report(const WeftError& err) {
    if (Error < s_level) return;
    // format() already starts with "error[Code]"; only the color is added here
    init_color();
    std::istringstream lines(err.format());
    std::string line;
    bool first = true;
    while (std::getline(lines, line)) {
        if (first && s_color_enabled) {
            std::fprintf(out(), "%s%s\033[0m\n", level_color(Error), line.c_str());
        } else {
            std::fprintf(out(), "%s\n", line.c_str());
        }
        first = false;
    }
}

} // namespace weft::log
