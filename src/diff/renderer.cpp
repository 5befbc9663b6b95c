#include <scribe/diff/renderer.hpp>
#include <scribe/diff/differ.hpp>
#include <algorithm>

namespace scribe {

const char* diff_algorithm_name(DiffAlgorithm algo) {
    switch (algo) {
    case DiffAlgorithm::None:    return "none";
    case DiffAlgorithm::Plain:   return "plain";
    case DiffAlgorithm::Unified: return "unified";
    case DiffAlgorithm::Context: return "context";
    case DiffAlgorithm::Ndiff:   return "ndiff";
    }
    return "unknown";
}

Result<DiffAlgorithm> parse_diff_algorithm(const std::string& name) {
    for (auto algo : {DiffAlgorithm::None, DiffAlgorithm::Plain, DiffAlgorithm::Unified,
                      DiffAlgorithm::Context, DiffAlgorithm::Ndiff}) {
        if (name == diff_algorithm_name(algo)) {
            return Result<DiffAlgorithm>::ok(algo);
        }
    }
    return ScribeError{ScribeError::UnknownDiffAlgorithm,
        "unknown diff algorithm '" + name + "'",
        "expected one of: none, plain, unified, context, ndiff"};
}

// ---------------------------------------------------------------------------
// Normalization
// ---------------------------------------------------------------------------

static std::string strip_trailing(const std::string& text, const std::string& chars) {
    std::string out;
    out.reserve(text.size());
    auto trim = [&]() {
        while (!out.empty() && out.back() != '\n' &&
               chars.find(out.back()) != std::string::npos) {
            out.pop_back();
        }
    };
    for (char c : text) {
        if (c == '\n') trim();
        out.push_back(c);
    }
    trim();
    return out;
}

static std::string fold_whitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool in_run = false;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\v' || c == '\f') {
            if (!in_run) out.push_back(' ');
            in_run = true;
        } else {
            out.push_back(c);
            in_run = false;
        }
    }
    return out;
}

std::string normalize(const std::string& text, const Normalization& norm) {
    std::string out = text;
    if (!norm.strip_chars.empty()) out = strip_trailing(out, norm.strip_chars);
    if (norm.fold_whitespace) out = fold_whitespace(out);
    return out;
}

std::string make_visible(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t line_start = 0;
    auto mark_trailing_spaces = [&]() {
        size_t i = out.size();
        while (i > line_start && out[i - 1] == ' ') out[--i] = '~';
    };
    for (char c : text) {
        unsigned char u = static_cast<unsigned char>(c);
        if (c == '\n') {
            mark_trailing_spaces();
            out += c;
            line_start = out.size();
        } else if (u < 0x20 || u == 0x7f) {
            out += '^';
            out += static_cast<char>(u ^ 0x40);
        } else {
            out += c;
        }
    }
    mark_trailing_spaces();
    return out;
}

// ---------------------------------------------------------------------------
// Report
// ---------------------------------------------------------------------------

static void append_block(std::string& out, const std::string& block) {
    out += block;
    if (!block.empty() && block.back() != '\n') out += '\n';
}

std::string DiffReport::full() const {
    std::string out;
    append_block(out, text);
    append_block(out, captured_line);
    return out;
}

DiffReport render_diff(const DiffRequest& request) {
    DiffReport report;
    std::string expected = normalize(request.expected, request.normalization);
    std::string actual = normalize(request.actual, request.normalization);
    if (expected == actual || request.algorithm == DiffAlgorithm::None) {
        return report;
    }

    Lines a = split_lines(expected);
    Lines b = split_lines(actual);
    if (a == b) {
        // Only a trailing newline differs; line views are identical
        report.text = "Differences:\n";
        report.text += expected.size() < actual.size()
                       ? "(got an extra trailing newline)\n"
                       : "(missing trailing newline)\n";
        return report;
    }

    if (request.algorithm == DiffAlgorithm::Plain) {
        // Shown as given, for side-by-side reading
        report.text = "Expected:\n";
        append_block(report.text, request.enhance ? make_visible(request.expected)
                                                  : request.expected);
        report.text += "Got:\n";
        append_block(report.text, request.enhance ? make_visible(request.actual)
                                                  : request.actual);
        return report;
    }

    if (request.enhance) {
        Lines va = split_lines(make_visible(expected));
        Lines vb = split_lines(make_visible(actual));
        // Stand-ins can collide with real text; keep the raw lines then
        if (va != vb) {
            a = std::move(va);
            b = std::move(vb);
        }
    }

    Lines diff;
    if (request.algorithm == DiffAlgorithm::Unified) {
        diff = unified_diff(a, b, request.context_lines);
    } else if (request.algorithm == DiffAlgorithm::Context) {
        diff = context_diff(a, b, request.context_lines);
    } else {
        diff = ndiff(a, b);
    }

    report.text = "Differences:\n";
    for (const auto& line : diff) {
        report.text += line;
        report.text += '\n';
    }
    return report;
}

// ---------------------------------------------------------------------------
// Captured summary
// ---------------------------------------------------------------------------

static std::string escape_value(const std::string& value) {
    std::string out;
    for (char c : value) {
        switch (c) {
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\r': out += "\\r"; break;
        default:   out += c;
        }
    }
    return out;
}

// Code points in `text`; bytes of the form 10xxxxxx continue a sequence
static size_t utf8_length(const std::string& text) {
    size_t n = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xc0) != 0x80) ++n;
    }
    return n;
}

// Byte offset of the code point `index` code points into `text`
static size_t utf8_offset(const std::string& text, size_t index) {
    size_t i = 0;
    for (; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xc0) == 0x80) continue;
        if (index == 0) return i;
        --index;
    }
    return i;
}

std::string ellipsize(const std::string& value, size_t max_width, size_t edge_chars) {
    size_t length = utf8_length(value);
    if (length <= max_width) return value;
    size_t edge = std::min(edge_chars, length / 2);
    return value.substr(0, utf8_offset(value, edge)) + " ... " +
           value.substr(utf8_offset(value, length - edge));
}

std::string format_captured(const std::vector<CapturedEntry>& entries,
                            const CapturedOptions& options) {
    if (entries.empty()) return "";

    std::vector<std::string> cells;
    size_t width = 0;
    for (const auto& e : entries) {
        std::string cell = e.name + (e.uncertain ? "?: " : ": ") +
            ellipsize(escape_value(e.value), options.max_width, options.edge_chars);
        width = std::max(width, utf8_length(cell));
        cells.push_back(std::move(cell));
    }

    const std::string prefix = "Captured: ";
    const std::string gap = "    ";
    size_t room = options.line_width > prefix.size() ? options.line_width - prefix.size() : 0;
    size_t per_row = std::max<size_t>(1, (room + gap.size()) / (width + gap.size()));

    std::string out = prefix;
    for (size_t i = 0; i < cells.size(); ++i) {
        bool row_end = ((i + 1) % per_row == 0) || (i + 1 == cells.size());
        out += cells[i];
        if (row_end) {
            if (i + 1 != cells.size()) {
                out += '\n';
                out += std::string(prefix.size(), ' ');
            }
        } else {
            out += std::string(width - utf8_length(cells[i]), ' ');
            out += gap;
        }
    }
    return out;
}

} // namespace scribe
