#pragma once

#include <scribe/diff/renderer.hpp>
#include <scribe/log.hpp>
#include <scribe/match/guesser.hpp>
#include <scribe/match/matcher.hpp>
#include <scribe/match/tokenizer.hpp>
#include <scribe/options.hpp>
#include <scribe/result.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace scribe {

// Validated settings the checker runs with
struct EngineSettings {
    TagSyntax syntax;
    ExampleOptions defaults;
    MatchOptions match;
    GuessOptions guess;
    size_t context_lines = 3;
    bool enhance_diff = true;
    CapturedOptions captured;
    log::Level log_level = log::Info;
};

// Layered configuration: global > project > local
// Lower layers override higher layers; unset keys fall through.
struct Config {
    // [tags]
    std::optional<std::string> tag_open;
    std::optional<std::string> tag_close;
    // [match]
    std::optional<int64_t> step_factor;
    std::optional<bool> norm_ws;
    std::optional<std::string> rm;
    // [guess]
    std::optional<bool> guess_enabled;
    std::optional<int64_t> min_anchor_length;
    // [diff]
    std::optional<std::string> diff_algorithm;
    std::optional<int64_t> context_lines;
    std::optional<bool> diff_enhance;
    // [captured]
    std::optional<int64_t> captured_max_width;
    std::optional<int64_t> captured_edge_chars;
    std::optional<int64_t> captured_line_width;
    // [log]
    std::optional<std::string> log_level;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& local);

    // Check ranges and names, filling unset values with defaults
    Result<EngineSettings> settings() const;
};

// Discover the global config file path: ~/.scribe/config.toml
std::string global_config_path();

// Project config file kept beside the documents: <dir>/.scribe.toml
std::string project_config_path(const std::string& dir = ".");

} // namespace scribe
