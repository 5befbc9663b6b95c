#pragma once

#include <scribe/result.hpp>
#include <string>
#include <vector>

namespace scribe {

enum class DiffAlgorithm { None, Plain, Unified, Context, Ndiff };

const char* diff_algorithm_name(DiffAlgorithm algo);

// "none", "plain", "unified", "context" or "ndiff"; anything else is
// an UnknownDiffAlgorithm error
Result<DiffAlgorithm> parse_diff_algorithm(const std::string& name);

struct Normalization {
    bool fold_whitespace = false;
    std::string strip_chars;   // removed from the end of every line

    bool empty() const { return !fold_whitespace && strip_chars.empty(); }
};

// Strip line endings first, then fold horizontal whitespace runs to one space
std::string normalize(const std::string& text, const Normalization& norm);

// Control characters in caret notation (tab is ^I) and trailing spaces
// as '~', so invisible differences show up in a report
std::string make_visible(const std::string& text);

struct DiffRequest {
    std::string expected;
    std::string actual;
    DiffAlgorithm algorithm = DiffAlgorithm::Plain;
    Normalization normalization;
    size_t context_lines = 3;
    bool enhance = true;   // show the diffed text through make_visible()
};

struct DiffReport {
    std::string text;            // "Differences:" / "Expected:"+"Got:" section
    std::string captured_line;   // "Captured: ..." or empty

    bool has_differences() const { return !text.empty(); }

    // Both parts, each ending with a newline
    std::string full() const;
};

// Render the difference section. Inputs that are equal after normalization
// produce an empty section whatever the algorithm.
DiffReport render_diff(const DiffRequest& request);

// ---------------------------------------------------------------------------
// Captured summary
// ---------------------------------------------------------------------------

struct CapturedEntry {
    std::string name;
    std::string value;
    bool uncertain = false;   // low-confidence guess, shown as "name?:"
};

struct CapturedOptions {
    size_t max_width = 36;    // longer values are ellipsized
    size_t edge_chars = 8;    // kept at each end of an ellipsized value
    size_t line_width = 80;   // entries wrap onto aligned rows past this
};

// "head ... tail" when `value` is longer than max_width. Widths count
// UTF-8 code points, and cuts never split one.
std::string ellipsize(const std::string& value, size_t max_width, size_t edge_chars);

// "Captured: a: 1    bb: 22" with entries padded to a common column width
std::string format_captured(const std::vector<CapturedEntry>& entries,
                            const CapturedOptions& options = CapturedOptions{});

} // namespace scribe
