#include <scribe/match/guesser.hpp>
#include <scribe/log.hpp>
#include <algorithm>
#include <map>
#include <optional>

namespace scribe {

const char* confidence_name(Confidence c) {
    switch (c) {
    case Confidence::High: return "high";
    case Confidence::Low:  return "low";
    }
    return "unknown";
}

namespace {

enum class AnchorState {
    Pending,
    Located,
    Ambiguous,   // occurs more than once in its window
    Missing,     // does not occur in its window
    Short        // below min_anchor_length
};

struct Anchor {
    AnchorState state = AnchorState::Pending;
    size_t start = 0;
    size_t end = 0;
};

struct Guesser {
    const CompiledPattern& pattern;
    const std::vector<MatchUnit>& units;
    const std::string& actual;
    GuessOptions options;

    std::vector<Anchor> anchors;   // parallel to units; literals only

    Guesser(const CompiledPattern& p, const std::string& a, const GuessOptions& o)
        : pattern(p), units(p.units()), actual(a), options(o),
          anchors(p.units().size()) {}

    // End of the closest located anchor before unit `u`, or 0
    size_t window_lo(size_t u) const {
        for (size_t i = u; i-- > 0;) {
            if (anchors[i].state == AnchorState::Located) return anchors[i].end;
        }
        return 0;
    }

    // Start of the closest located anchor after unit `u`, or the text end
    size_t window_hi(size_t u) const {
        for (size_t i = u + 1; i < units.size(); ++i) {
            if (anchors[i].state == AnchorState::Located) return anchors[i].start;
        }
        return actual.size();
    }

    LiteralMatcher sub_literal(const MatchUnit& unit, std::string text) const {
        if (unit.literal.is_normalized()) {
            return LiteralMatcher::normalized(std::move(text), false, false);
        }
        return LiteralMatcher::exact(std::move(text));
    }

    // Phase 1: pin whole literals, longest first, each inside the window
    // left between the anchors already pinned around it.
    void synchronize() {
        std::vector<size_t> order;
        for (size_t i = 0; i < units.size(); ++i) {
            if (units[i].is_literal()) order.push_back(i);
        }
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return units[a].literal.text().size() > units[b].literal.text().size();
        });

        for (size_t i : order) {
            const auto& lit = units[i].literal;
            if (lit.text().size() < options.min_anchor_length) {
                anchors[i].state = AnchorState::Short;
                continue;
            }
            size_t lo = window_lo(i);
            size_t hi = window_hi(i);
            size_t n = lit.count(actual, lo, hi);
            if (n == 0) {
                anchors[i].state = AnchorState::Missing;
            } else if (n > 1) {
                anchors[i].state = AnchorState::Ambiguous;
            } else {
                auto hit = lit.find(actual, lo, hi);
                anchors[i] = {AnchorState::Located, hit->first, hit->first + hit->second};
            }
            log::trace("anchor %zu (%zu chars): %d", i, lit.text().size(),
                       static_cast<int>(anchors[i].state));
        }
    }

    // Longest proper suffix (or prefix) of literal unit `u` found in
    // [lo, hi), if it occurs there exactly once. A shorter piece occurs
    // wherever a longer one does, so the longest occurring length is
    // bisected and shorter ones are never unique when it is not.
    std::optional<std::pair<size_t, size_t>> unique_piece(size_t u, bool suffix,
                                                          size_t lo, size_t hi) const {
        const std::string& text = units[u].literal.text();
        size_t shortest = std::max<size_t>(1, options.min_anchor_length);
        if (text.size() <= shortest) return std::nullopt;

        auto piece = [&](size_t len) {
            return sub_literal(units[u], suffix ? text.substr(text.size() - len)
                                                : text.substr(0, len));
        };
        if (piece(shortest).count(actual, lo, hi, 1) == 0) return std::nullopt;

        // `found` occurs, `missing` does not
        size_t found = shortest;
        size_t missing = text.size();
        while (missing - found > 1) {
            size_t mid = found + (missing - found) / 2;
            if (piece(mid).count(actual, lo, hi, 1) > 0) {
                found = mid;
            } else {
                missing = mid;
            }
        }

        auto best = piece(found);
        if (best.count(actual, lo, hi) != 1) return std::nullopt;
        return best.find(actual, lo, hi);
    }

    // Where a tag's value begins: just after the literal before it
    std::optional<size_t> left_bound(size_t u) const {
        if (u == 0) return size_t{0};
        const auto& prev = units[u - 1];
        if (!prev.is_literal()) return std::nullopt;

        const auto& a = anchors[u - 1];
        if (a.state == AnchorState::Located) return a.end;
        if (a.state != AnchorState::Missing) return std::nullopt;

        auto hit = unique_piece(u - 1, true, window_lo(u - 1), window_hi(u));
        if (!hit) return std::nullopt;
        return hit->first + hit->second;
    }

    // Where a tag's value ends: at the start of the literal after it
    std::optional<size_t> right_bound(size_t u, size_t left) const {
        if (u + 1 == units.size()) return actual.size();
        const auto& next = units[u + 1];
        if (!next.is_literal()) return std::nullopt;

        const auto& a = anchors[u + 1];
        if (a.state == AnchorState::Located) return a.start;
        if (a.state != AnchorState::Missing) return std::nullopt;

        auto hit = unique_piece(u + 1, false, left, window_hi(u + 1));
        if (!hit) return std::nullopt;
        return hit->first;
    }

    GuessResult run() {
        synchronize();

        GuessResult result;
        std::map<size_t, std::string> values;
        for (size_t u = 0; u < units.size(); ++u) {
            if (units[u].is_literal()) continue;

            auto left = left_bound(u);
            if (!left) continue;
            auto right = right_bound(u, *left);
            if (!right || *right < *left) continue;

            std::string text = actual.substr(*left, *right - *left);
            values[u] = text;
            if (units[u].is_named()) {
                result.guesses.push_back({units[u].name, text, Confidence::High, u});
            }
        }

        // A repeated name whose guesses disagree is not trustworthy
        for (auto& g : result.guesses) {
            for (const auto& other : result.guesses) {
                if (other.name == g.name && other.text != g.text) {
                    g.confidence = Confidence::Low;
                }
            }
        }

        result.expected = pattern.render(values);
        return result;
    }
};

} // anonymous namespace

GuessResult guess(const CompiledPattern& pattern, const std::string& actual,
                  const GuessOptions& options) {
    Guesser guesser(pattern, actual, options);
    return guesser.run();
}

} // namespace scribe
