#include <scribe/config.hpp>
#include <toml++/toml.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace scribe {

// Read `section.key` into `out` when present; a value of the wrong type is
// an error rather than being ignored
template<typename T>
static Status read_key(const toml::table& section, const std::string& section_name,
                       const char* key, const char* type_name, std::optional<T>& out) {
    auto node = section[key];
    if (!node) return ok_status();
    if (auto v = node.value<T>()) {
        out = *v;
        return ok_status();
    }
    return ScribeError{ScribeError::Config,
        "config key '" + section_name + "." + key + "' must be a " + type_name};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ScribeError{ScribeError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    if (auto tags = doc["tags"].as_table()) {
        SCRIBE_TRY(read_key(*tags, "tags", "open", "string", cfg.tag_open));
        SCRIBE_TRY(read_key(*tags, "tags", "close", "string", cfg.tag_close));
    }

    if (auto m = doc["match"].as_table()) {
        SCRIBE_TRY(read_key(*m, "match", "step-factor", "integer", cfg.step_factor));
        SCRIBE_TRY(read_key(*m, "match", "norm-ws", "boolean", cfg.norm_ws));
        SCRIBE_TRY(read_key(*m, "match", "rm", "string", cfg.rm));
    }

    if (auto g = doc["guess"].as_table()) {
        SCRIBE_TRY(read_key(*g, "guess", "enabled", "boolean", cfg.guess_enabled));
        SCRIBE_TRY(read_key(*g, "guess", "min-anchor-length", "integer", cfg.min_anchor_length));
    }

    if (auto d = doc["diff"].as_table()) {
        SCRIBE_TRY(read_key(*d, "diff", "algorithm", "string", cfg.diff_algorithm));
        SCRIBE_TRY(read_key(*d, "diff", "context-lines", "integer", cfg.context_lines));
        SCRIBE_TRY(read_key(*d, "diff", "enhance", "boolean", cfg.diff_enhance));
    }

    if (auto c = doc["captured"].as_table()) {
        SCRIBE_TRY(read_key(*c, "captured", "max-width", "integer", cfg.captured_max_width));
        SCRIBE_TRY(read_key(*c, "captured", "edge-chars", "integer", cfg.captured_edge_chars));
        SCRIBE_TRY(read_key(*c, "captured", "line-width", "integer", cfg.captured_line_width));
    }

    if (auto l = doc["log"].as_table()) {
        SCRIBE_TRY(read_key(*l, "log", "level", "string", cfg.log_level));
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ScribeError{ScribeError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) return std::move(cfg.error().at(path, 0));
    return cfg;
}

template<typename T>
static void overlay(std::optional<T>& dst, const std::optional<T>& src) {
    if (src.has_value()) dst = src;
}

void Config::merge(const Config& other) {
    overlay(tag_open, other.tag_open);
    overlay(tag_close, other.tag_close);
    overlay(step_factor, other.step_factor);
    overlay(norm_ws, other.norm_ws);
    overlay(rm, other.rm);
    overlay(guess_enabled, other.guess_enabled);
    overlay(min_anchor_length, other.min_anchor_length);
    overlay(diff_algorithm, other.diff_algorithm);
    overlay(context_lines, other.context_lines);
    overlay(diff_enhance, other.diff_enhance);
    overlay(captured_max_width, other.captured_max_width);
    overlay(captured_edge_chars, other.captured_edge_chars);
    overlay(captured_line_width, other.captured_line_width);
    overlay(log_level, other.log_level);
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

static Result<char> delimiter(const std::optional<std::string>& value, char fallback,
                              const char* key) {
    if (!value.has_value()) return Result<char>::ok(fallback);
    const std::string& s = value.value();
    if (s.size() != 1 || std::isalnum(static_cast<unsigned char>(s[0])) ||
        std::isspace(static_cast<unsigned char>(s[0]))) {
        return ScribeError{ScribeError::Config,
            std::string("tags.") + key + " must be a single punctuation character, got '" +
                s + "'"};
    }
    return Result<char>::ok(s[0]);
}

static Result<size_t> positive(const std::optional<int64_t>& value, size_t fallback,
                               const char* key, int64_t min = 1) {
    if (!value.has_value()) return Result<size_t>::ok(fallback);
    if (value.value() < min) {
        return ScribeError{ScribeError::Config,
            std::string(key) + " must be at least " + std::to_string(min) +
                ", got " + std::to_string(value.value())};
    }
    return Result<size_t>::ok(static_cast<size_t>(value.value()));
}

Result<EngineSettings> Config::settings() const {
    EngineSettings s;

    auto open = delimiter(tag_open, s.syntax.open, "open");
    if (open.is_err()) return std::move(open).error();
    auto close = delimiter(tag_close, s.syntax.close, "close");
    if (close.is_err()) return std::move(close).error();
    if (open.value() == close.value()) {
        return ScribeError{ScribeError::Config, "tags.open and tags.close must differ"};
    }
    s.syntax.open = open.value();
    s.syntax.close = close.value();

    auto steps = positive(step_factor, s.match.step_factor, "match.step-factor");
    if (steps.is_err()) return std::move(steps).error();
    s.match.step_factor = steps.value();

    s.defaults.norm_ws = norm_ws.value_or(s.defaults.norm_ws);
    s.defaults.rm = rm.value_or(s.defaults.rm);
    s.defaults.capture = guess_enabled.value_or(s.defaults.capture);

    auto anchor = positive(min_anchor_length, s.guess.min_anchor_length,
                           "guess.min-anchor-length");
    if (anchor.is_err()) return std::move(anchor).error();
    s.guess.min_anchor_length = anchor.value();

    if (diff_algorithm.has_value()) {
        auto algo = parse_diff_algorithm(diff_algorithm.value());
        if (algo.is_err()) return std::move(algo).error();
        s.defaults.diff = algo.value();
    }

    auto ctx = positive(context_lines, s.context_lines, "diff.context-lines", 0);
    if (ctx.is_err()) return std::move(ctx).error();
    s.context_lines = ctx.value();
    s.enhance_diff = diff_enhance.value_or(s.enhance_diff);

    auto width = positive(captured_max_width, s.captured.max_width, "captured.max-width");
    if (width.is_err()) return std::move(width).error();
    auto edge = positive(captured_edge_chars, s.captured.edge_chars, "captured.edge-chars");
    if (edge.is_err()) return std::move(edge).error();
    if (2 * edge.value() >= width.value()) {
        return ScribeError{ScribeError::Config,
            "captured.edge-chars is too large for captured.max-width",
            "keep 2 * edge-chars below max-width"};
    }
    s.captured.max_width = width.value();
    s.captured.edge_chars = edge.value();

    auto line = positive(captured_line_width, s.captured.line_width, "captured.line-width");
    if (line.is_err()) return std::move(line).error();
    s.captured.line_width = line.value();

    if (log_level.has_value()) {
        auto lvl = log::parse_level(log_level.value());
        if (lvl.is_err()) return std::move(lvl).error();
        s.log_level = lvl.value();
    }

    return Result<EngineSettings>::ok(std::move(s));
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.scribe/config.toml";
}

std::string project_config_path(const std::string& dir) {
    if (dir.empty()) return ".scribe.toml";
    if (dir.back() == '/') return dir + ".scribe.toml";
    return dir + "/.scribe.toml";
}

} // namespace scribe
