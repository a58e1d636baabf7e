#pragma once

#include <quid/result.hpp>
#include <cstdio>
#include <string>

namespace quid::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

// Parse "trace" .. "error" (case-insensitive) as used in the [log] config table.
Result<Level> parse_level(const std::string& name);
const char* level_name(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect output; nullptr restores stderr. Colour detection follows the sink.
void set_sink(std::FILE* sink);
std::FILE* get_sink();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

} // namespace quid::log
