#pragma once

#include <scribe/result.hpp>
#include <string>
#include <cstdio>

namespace scribe::log {

enum Level { Trace, Debug, Info, Warn, Error, Off };

void set_level(Level lvl);
Level get_level();

// Parse "trace" .. "error" or "off" (case-sensitive)
Result<Level> parse_level(const std::string& name);

// Destination for log lines; stderr unless redirected
void set_sink(std::FILE* sink);
std::FILE* get_sink();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace scribe::log
