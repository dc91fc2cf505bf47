#pragma once

#include <weft/error.hpp>
#include <cstdio>
#include <optional>
#include <string>

namespace weft::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect output (defaults to stderr). Passing nullptr restores stderr.
void set_stream(std::FILE* stream);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Write a compile diagnostic at Error level, one line per rendered line.
void report(const WeftError& err);

const char* level_name(Level lvl);

// Inverse of level_name; nullopt for unknown names
std::optional<Level> level_from_name(const std::string& name);

} // namespace weft::log
