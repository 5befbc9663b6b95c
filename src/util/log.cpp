#include <scribe/log.hpp>
#include <cstdarg>
#include <cstdio>

#include <unistd.h>

namespace scribe::log {

static Level s_level = Info;
static std::FILE* s_sink = nullptr;
static bool s_color_initialized = false;
static bool s_color_enabled = false;

static std::FILE* sink() {
    return s_sink ? s_sink : stderr;
}

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(sink()));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

Result<Level> parse_level(const std::string& name) {
    for (Level lvl : {Trace, Debug, Info, Warn, Error, Off}) {
        if (name == level_name(lvl)) {
            return Result<Level>::ok(lvl);
        }
    }
    return ScribeError{ScribeError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error, off"};
}

void set_sink(std::FILE* s) {
    s_sink = s;
    // Re-detect the terminal on next use
    s_color_initialized = false;
}

std::FILE* get_sink() {
    return sink();
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
        case Off:   return "off";
    }
    return "unknown";
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
        case Off:   return "";
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level || s_level == Off) return;
    init_color();
    std::FILE* out = sink();

    if (s_color_enabled) {
        std::fprintf(out, "%sscribe %s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(out, "scribe %s: ", level_name(lvl));
    }

    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
}

#define SCRIBE_LOG_FN(fn, lvl)          \
    void fn(const char* fmt, ...) {     \
        va_list args;                   \
        va_start(args, fmt);            \
        log_message(lvl, fmt, args);    \
        va_end(args);                   \
    }

SCRIBE_LOG_FN(trace, Trace)
SCRIBE_LOG_FN(debug, Debug)
SCRIBE_LOG_FN(info, Info)
SCRIBE_LOG_FN(warn, Warn)
SCRIBE_LOG_FN(error, Error)

#undef SCRIBE_LOG_FN

} // namespace scribe::log
