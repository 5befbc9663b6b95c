#include <scribe/match/pattern.hpp>
#include <scribe/log.hpp>
#include <cctype>
#include <set>

namespace scribe {

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// ---------------------------------------------------------------------------
// LiteralMatcher
// ---------------------------------------------------------------------------

LiteralMatcher LiteralMatcher::exact(std::string text) {
    LiteralMatcher m;
    m.text_ = std::move(text);
    return m;
}

LiteralMatcher LiteralMatcher::normalized(std::string text,
                                          bool template_start,
                                          bool template_end) {
    LiteralMatcher m;
    m.text_ = std::move(text);
    m.normalized_ = true;

    const std::string& s = m.text_;
    size_t i = 0;
    while (i < s.size()) {
        Piece piece;
        size_t start = i;
        if (is_space(s[i])) {
            while (i < s.size() && is_space(s[i])) ++i;
            piece.whitespace = true;
            bool leading = (start == 0 && template_start);
            bool trailing = (i == s.size() && template_end);
            piece.min_run = (leading || trailing) ? 0 : 1;
        } else {
            while (i < s.size() && !is_space(s[i])) ++i;
            piece.text = s.substr(start, i - start);
        }
        m.pieces_.push_back(std::move(piece));
    }
    return m;
}

std::optional<size_t> LiteralMatcher::match_at(const std::string& text,
                                               size_t pos) const {
    if (pos > text.size()) return std::nullopt;

    if (!normalized_) {
        if (text.size() - pos < text_.size()) return std::nullopt;
        if (text.compare(pos, text_.size(), text_) != 0) return std::nullopt;
        return text_.size();
    }

    size_t p = pos;
    for (const auto& piece : pieces_) {
        if (piece.whitespace) {
            size_t run = 0;
            while (p + run < text.size() && is_space(text[p + run])) ++run;
            if (run < piece.min_run) return std::nullopt;
            p += run;
        } else {
            if (text.size() - p < piece.text.size()) return std::nullopt;
            if (text.compare(p, piece.text.size(), piece.text) != 0) return std::nullopt;
            p += piece.text.size();
        }
    }
    return p - pos;
}

std::optional<std::pair<size_t, size_t>> LiteralMatcher::find(
    const std::string& text, size_t from, size_t limit) const
{
    if (limit > text.size()) limit = text.size();
    if (from > limit) return std::nullopt;

    if (!normalized_) {
        size_t s = text.find(text_, from);
        if (s == std::string::npos || s + text_.size() > limit) return std::nullopt;
        return std::make_pair(s, text_.size());
    }

    // Jump between occurrences of the first word when there is one
    const std::string* first_word = nullptr;
    if (!pieces_.empty() && !pieces_.front().whitespace) {
        first_word = &pieces_.front().text;
    }

    size_t s = from;
    while (s <= limit) {
        if (first_word) {
            s = text.find(*first_word, s);
            if (s == std::string::npos || s > limit) return std::nullopt;
        }
        auto len = match_at(text, s);
        if (len && s + *len <= limit) {
            return std::make_pair(s, *len);
        }
        ++s;
    }
    return std::nullopt;
}

std::optional<size_t> LiteralMatcher::last_start(const std::string& text,
                                                 size_t limit) const {
    if (limit > text.size()) limit = text.size();

    if (!normalized_) {
        if (limit < text_.size()) return std::nullopt;
        size_t s = text.rfind(text_, limit - text_.size());
        if (s == std::string::npos) return std::nullopt;
        return s;
    }

    // Any match starts at or before the last fitting copy of its first word
    for (const auto& piece : pieces_) {
        if (piece.whitespace) continue;
        if (limit < piece.text.size()) return std::nullopt;
        size_t s = text.rfind(piece.text, limit - piece.text.size());
        if (s == std::string::npos) return std::nullopt;
        return s;
    }
    return limit;
}

size_t LiteralMatcher::count(const std::string& text, size_t from,
                             size_t limit, size_t cap) const {
    size_t n = 0;
    size_t s = from;
    while (n < cap) {
        auto hit = find(text, s, limit);
        if (!hit) break;
        ++n;
        s = hit->first + 1;
    }
    return n;
}

// ---------------------------------------------------------------------------
// CompiledPattern
// ---------------------------------------------------------------------------

size_t CompiledPattern::first_unit_of(const std::string& name) const {
    auto it = first_unit_.find(name);
    return it == first_unit_.end() ? units_.size() : it->second;
}

std::string CompiledPattern::render(const std::map<size_t, std::string>& values) const {
    std::string out;
    for (size_t i = 0; i < units_.size(); ++i) {
        const auto& unit = units_[i];
        if (unit.is_literal()) {
            out += unit.literal.text();
            continue;
        }
        auto it = values.find(i);
        if (it != values.end()) {
            out += it->second;
        } else {
            out += tokens_[unit.token_index].markup;
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Compilation
// ---------------------------------------------------------------------------

// Strip `chars` before every newline of `text`, and at its end if `at_end`
static std::string strip_before_newlines(const std::string& text,
                                         const std::string& chars,
                                         bool at_end) {
    if (chars.empty()) return text;

    std::string out;
    out.reserve(text.size());
    auto trim_tail = [&]() {
        while (!out.empty() && chars.find(out.back()) != std::string::npos) {
            out.pop_back();
        }
    };
    for (char c : text) {
        if (c == '\n') trim_tail();
        out.push_back(c);
    }
    if (at_end) trim_tail();
    return out;
}

std::string strip_line_endings(const std::string& text, const std::string& chars) {
    return strip_before_newlines(text, chars, true);
}

CompiledPattern compile(const TokenizeResult& tokenized, const CompileOptions& options) {
    CompiledPattern pattern;
    pattern.tokens_ = tokenized.tokens;
    pattern.warnings_ = tokenized.warnings;
    pattern.normalized_ = options.normalize_whitespace;

    for (const auto& w : pattern.warnings_) {
        log::warn("template line %d: %s", w.pos.line, w.message.c_str());
    }

    const auto& tokens = pattern.tokens_;
    size_t anon = 0;
    std::set<std::string> seen;

    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        MatchUnit unit;
        unit.token_index = i;

        if (tok.type == TemplateTokenType::Literal) {
            bool last = (i + 1 == tokens.size());
            std::string text = strip_before_newlines(tok.text, options.strip_chars, last);
            if (text.empty()) continue;

            unit.kind = MatchUnit::Literal;
            if (options.normalize_whitespace) {
                unit.literal = LiteralMatcher::normalized(std::move(text), i == 0, last);
            } else {
                unit.literal = LiteralMatcher::exact(std::move(text));
            }
            pattern.units_.push_back(std::move(unit));
            continue;
        }

        unit.kind = MatchUnit::Capture;
        unit.tag_type = tok.type;
        ++pattern.tag_count_;
        if (tok.type == TemplateTokenType::Named) {
            unit.name = tok.text;
            if (!seen.insert(unit.name).second) {
                pattern.repeated_names_ = true;
            } else {
                pattern.first_unit_[unit.name] = pattern.units_.size();
            }
        } else if (tok.type == TemplateTokenType::Unnamed) {
            unit.name = "__anon_" + std::to_string(anon++);
        }
        pattern.units_.push_back(std::move(unit));
    }

    return pattern;
}

Result<CompiledPattern> compile(const std::string& tmpl, const TagSyntax& syntax,
                                const CompileOptions& options) {
    auto tokenized = tokenize(tmpl, syntax);
    if (tokenized.is_err()) return std::move(tokenized).error();
    return Result<CompiledPattern>::ok(compile(tokenized.value(), options));
}

} // namespace scribe
