#pragma once

#include <scribe/match/pattern.hpp>
#include <cstddef>
#include <map>
#include <string>

namespace scribe {

struct Capture {
    std::string text;
    size_t start = 0;
    size_t end = 0;
};

enum class MatchFailure {
    None,
    Mismatch,
    DuplicateCaptureConflict,   // a repeated <name> cannot bind one value
    PatternTooComplex           // step budget exhausted
};

struct MatchOptions {
    // Budget = step_factor * (len(actual) + 1) * max(1, tags)
    size_t step_factor = 64;
};

struct MatchResult {
    bool matched = false;
    std::map<std::string, Capture> captures;   // named tags only
    MatchFailure failure = MatchFailure::None;
    size_t steps = 0;
};

const char* match_failure_name(MatchFailure f);

// Match the whole of `actual` against `pattern`. Never throws; a budget
// overrun is reported as PatternTooComplex instead of running on.
MatchResult match(const CompiledPattern& pattern, const std::string& actual,
                  const MatchOptions& options = MatchOptions{});

// Convert a failed result into the matching ScribeError (Mismatch has none)
Status failure_status(const MatchResult& result);

} // namespace scribe
