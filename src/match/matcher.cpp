#include <scribe/match/matcher.hpp>
#include <scribe/log.hpp>
#include <algorithm>
#include <optional>
#include <unordered_set>
#include <vector>

namespace scribe {

const char* match_failure_name(MatchFailure f) {
    switch (f) {
    case MatchFailure::None:                     return "none";
    case MatchFailure::Mismatch:                 return "mismatch";
    case MatchFailure::DuplicateCaptureConflict: return "duplicate-capture-conflict";
    case MatchFailure::PatternTooComplex:        return "pattern-too-complex";
    }
    return "unknown";
}

Status failure_status(const MatchResult& result) {
    switch (result.failure) {
    case MatchFailure::DuplicateCaptureConflict:
        return ScribeError{ScribeError::DuplicateCaptureConflict,
            "a repeated tag captured different text at its occurrences"};
    case MatchFailure::PatternTooComplex:
        return ScribeError{ScribeError::PatternTooComplex,
            "gave up matching after " + std::to_string(result.steps) + " steps",
            "anchor adjacent tags with literal text or raise match.step-factor"};
    case MatchFailure::None:
    case MatchFailure::Mismatch:
        break;
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Matcher state machine
// ---------------------------------------------------------------------------

namespace {

enum class Outcome { Matched, Failed, Exhausted };

constexpr size_t kNever = static_cast<size_t>(-1);

size_t saturating_mul(size_t a, size_t b) {
    if (a != 0 && b > kNever / a) return kNever;
    return a * b;
}

struct Matcher {
    const CompiledPattern& pattern;
    const std::vector<MatchUnit>& units;
    const std::string& actual;
    bool enforce_repeats;   // treat later <name> occurrences as back-references
    size_t budget;
    size_t steps = 0;

    // A capture unit whose span may still grow
    struct Choice {
        size_t unit;
        size_t start;
        size_t end;
    };
    std::vector<Choice> choices;

    // Current span per unit, valid for units before the cursor
    std::vector<std::pair<size_t, size_t>> spans;

    // Latest position unit u may start at in any full match, or kNever
    std::vector<size_t> latest;

    // True when a back-reference at or after u refers to a unit before u;
    // only then does the outcome from (u, pos) depend on earlier spans
    std::vector<bool> needs_history;

    // (unit, pos) states already entered; every one of them has failed
    std::unordered_set<size_t> visited;

    // Last find() per literal unit: hit `at` (or kNever) for a query from `from`
    struct Hit {
        size_t from = kNever;
        size_t at = kNever;
    };
    std::vector<Hit> hits;

    Matcher(const CompiledPattern& p, const std::string& a, bool enforce, size_t b)
        : pattern(p), units(p.units()), actual(a), enforce_repeats(enforce),
          budget(b), spans(p.units().size(), {0, 0}),
          latest(p.units().size() + 1, kNever),
          needs_history(p.units().size() + 1, false),
          hits(p.units().size()) {
        compute_latest();
        compute_history();
    }

    bool tick() {
        return ++steps <= budget;
    }

    void charge(size_t scanned) {
        steps = steps > kNever - scanned ? kNever : steps + scanned;
    }

    // Literals must appear in order; walk back from the end placing each
    // one as late as it can go. A literal with no room makes every unit
    // up to it unreachable.
    void compute_latest() {
        size_t n = units.size();
        latest[n] = actual.size();
        for (size_t i = n; i-- > 0;) {
            const auto& unit = units[i];
            if (!unit.is_literal()) {
                latest[i] = latest[i + 1];
                continue;
            }
            std::optional<size_t> bound;
            if (i + 1 == n && !unit.literal.is_normalized()) {
                // The final literal has to end the text
                const std::string& lit = unit.literal.text();
                if (actual.size() >= lit.size() &&
                    actual.compare(actual.size() - lit.size(), lit.size(), lit) == 0) {
                    bound = actual.size() - lit.size();
                }
            } else {
                bound = unit.literal.last_start(actual, latest[i + 1]);
            }
            if (!bound) return;
            latest[i] = *bound;
        }
    }

    void compute_history() {
        if (!enforce_repeats || !pattern.has_repeated_names()) return;
        std::vector<int> delta(units.size() + 2, 0);
        for (size_t v = 0; v < units.size(); ++v) {
            if (auto first = repeat_of(v)) {
                ++delta[*first + 1];
                --delta[v + 1];
            }
        }
        int open = 0;
        for (size_t u = 0; u < units.size(); ++u) {
            open += delta[u];
            needs_history[u] = open > 0;
        }
    }

    bool reachable(size_t u, size_t pos) const {
        return latest[u] != kNever && pos <= latest[u];
    }

    // First start >= from of literal unit `l`, reusing the previous scan
    // when it already answers the query
    std::optional<size_t> find_literal(size_t l, size_t from) {
        if (!reachable(l, from)) return std::nullopt;
        Hit& hit = hits[l];
        if (hit.from != kNever && hit.from <= from && (hit.at == kNever || from <= hit.at)) {
            if (hit.at == kNever) return std::nullopt;
            return hit.at;
        }
        auto found = units[l].literal.find(actual, from, actual.size());
        hit.from = from;
        hit.at = found ? found->first : kNever;
        charge((found ? found->first : actual.size()) - from);
        if (!found) return std::nullopt;
        return found->first;
    }

    // Earliest end >= from for capture unit `u` that lets the next unit start
    std::optional<size_t> next_end(size_t u, size_t from) {
        if (from > actual.size()) return std::nullopt;
        std::optional<size_t> end;
        if (u + 1 == units.size()) {
            // The last unit must consume the rest of the text
            end = actual.size();
        } else if (units[u + 1].is_literal()) {
            end = find_literal(u + 1, from);
        } else {
            end = from;
        }
        if (!end || !reachable(u + 1, *end)) return std::nullopt;
        return end;
    }

    // Index of the unit a repeated name must agree with, if it applies
    std::optional<size_t> repeat_of(size_t u) const {
        if (!enforce_repeats || !units[u].is_named()) return std::nullopt;
        size_t first = pattern.first_unit_of(units[u].name);
        if (first >= u) return std::nullopt;
        return first;
    }

    // Marks (u, pos) as entered; false when it was entered before
    bool enter(size_t u, size_t pos) {
        if (needs_history[u]) return true;
        return visited.insert(u * (actual.size() + 1) + pos).second;
    }

    Outcome run() {
        size_t u = 0;
        size_t pos = 0;

        for (;;) {
            if (!tick()) return Outcome::Exhausted;

            bool ok = true;
            if (!reachable(u, pos)) {
                ok = false;
            } else if (u == units.size()) {
                if (pos == actual.size()) return Outcome::Matched;
                ok = false;
            } else if (units[u].is_literal()) {
                auto len = units[u].literal.match_at(actual, pos);
                if (len) {
                    spans[u] = {pos, pos + *len};
                    pos += *len;
                    ++u;
                } else {
                    ok = false;
                }
            } else if (auto first = repeat_of(u)) {
                size_t s = spans[*first].first;
                size_t len = spans[*first].second - s;
                if (actual.size() - pos >= len &&
                    actual.compare(pos, len, actual, s, len) == 0) {
                    spans[u] = {pos, pos + len};
                    pos += len;
                    ++u;
                } else {
                    ok = false;
                }
            } else if (!enter(u, pos)) {
                ok = false;
            } else {
                auto end = next_end(u, pos);
                if (end) {
                    choices.push_back({u, pos, *end});
                    spans[u] = {pos, *end};
                    pos = *end;
                    ++u;
                } else {
                    ok = false;
                }
            }

            if (ok) continue;

            // Backtrack: grow the most recent capture that can still grow
            bool resumed = false;
            while (!choices.empty()) {
                if (!tick()) return Outcome::Exhausted;
                auto& top = choices.back();
                auto end = next_end(top.unit, top.end + 1);
                if (!end) {
                    choices.pop_back();
                    continue;
                }
                top.end = *end;
                spans[top.unit] = {top.start, top.end};
                u = top.unit + 1;
                pos = top.end;
                resumed = true;
                break;
            }
            if (!resumed) return Outcome::Failed;
        }
    }

    std::map<std::string, Capture> named_captures() const {
        std::map<std::string, Capture> out;
        for (size_t i = 0; i < units.size(); ++i) {
            if (!units[i].is_named() || out.count(units[i].name)) continue;
            auto [s, e] = spans[i];
            out[units[i].name] = Capture{actual.substr(s, e - s), s, e};
        }
        return out;
    }
};

} // anonymous namespace

MatchResult match(const CompiledPattern& pattern, const std::string& actual,
                  const MatchOptions& options) {
    size_t tags = std::max<size_t>(1, pattern.tag_count());
    size_t budget = saturating_mul(saturating_mul(std::max<size_t>(1, options.step_factor),
                                                  actual.size() + 1), tags);

    MatchResult result;
    Matcher matcher(pattern, actual, true, budget);
    Outcome outcome = matcher.run();
    result.steps = matcher.steps;

    if (outcome == Outcome::Matched) {
        result.matched = true;
        result.captures = matcher.named_captures();
        return result;
    }

    if (outcome == Outcome::Exhausted) {
        log::debug("match gave up after %zu steps (budget %zu)", matcher.steps, budget);
        result.failure = MatchFailure::PatternTooComplex;
        return result;
    }

    result.failure = MatchFailure::Mismatch;
    if (pattern.has_repeated_names()) {
        // Distinguish "content differs" from "repeated tag disagrees"
        Matcher naive(pattern, actual, false, budget);
        if (naive.run() == Outcome::Matched) {
            result.failure = MatchFailure::DuplicateCaptureConflict;
        }
        result.steps += naive.steps;
    }
    return result;
}

} // namespace scribe
