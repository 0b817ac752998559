#pragma once

#include <string>
#include <optional>

namespace suture::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Lines are written to stderr whole; concurrent callers never interleave.
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Inverse of level_name(); nullopt for anything else
std::optional<Level> parse_level(const std::string& name);

} // namespace suture::log
