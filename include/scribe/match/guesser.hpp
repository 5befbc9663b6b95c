#pragma once

#include <scribe/match/pattern.hpp>
#include <string>
#include <vector>

namespace scribe {

enum class Confidence { High, Low };

struct Guess {
    std::string name;
    std::string text;
    Confidence confidence = Confidence::High;
    size_t unit = 0;   // capture unit the guess belongs to
};

struct GuessOptions {
    // Literal spans (or their partial prefixes/suffixes) shorter than this
    // are never used as anchors
    size_t min_anchor_length = 5;
};

struct GuessResult {
    std::vector<Guess> guesses;   // named tags only, in template order
    std::string expected;         // template with guessed values substituted
};

const char* confidence_name(Confidence c);

// Best-effort captures for a pattern that failed to match `actual`.
// A value is produced only between two anchors that occur exactly once in
// their search window; every other tag keeps its markup in `expected`.
GuessResult guess(const CompiledPattern& pattern, const std::string& actual,
                  const GuessOptions& options = GuessOptions{});

} // namespace scribe
