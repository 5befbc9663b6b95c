#pragma once

#include <scribe/match/tokenizer.hpp>
#include <scribe/result.hpp>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace scribe {

struct CompileOptions {
    bool normalize_whitespace = false;
    // Characters stripped from the end of every literal line (the "rm" option)
    std::string strip_chars;
};

// A literal span compiled for matching. In exact mode it compares bytes;
// in normalized mode every whitespace run matches one or more whitespace
// characters (zero or more when the run touches the template boundary).
class LiteralMatcher {
public:
    static LiteralMatcher exact(std::string text);
    static LiteralMatcher normalized(std::string text,
                                     bool template_start, bool template_end);

    // Length consumed when the literal matches at `pos`
    std::optional<size_t> match_at(const std::string& text, size_t pos) const;

    // First match starting at or after `from` and ending at or before `limit`.
    // Returns (start, length).
    std::optional<std::pair<size_t, size_t>> find(const std::string& text,
                                                  size_t from,
                                                  size_t limit) const;

    // Upper bound on the start of a match ending at or before `limit`.
    // Exact in exact mode; normalized mode bounds it by its first word.
    // Empty when no match can end by `limit`.
    std::optional<size_t> last_start(const std::string& text, size_t limit) const;

    // Occurrences in [from, limit), stopping once `cap` are seen
    size_t count(const std::string& text, size_t from, size_t limit,
                 size_t cap = 2) const;

    const std::string& text() const { return text_; }
    bool is_normalized() const { return normalized_; }

private:
    struct Piece {
        bool whitespace = false;
        std::string text;     // non-whitespace run
        size_t min_run = 1;   // whitespace pieces only
    };

    std::string text_;
    std::vector<Piece> pieces_;
    bool normalized_ = false;
};

struct MatchUnit {
    enum Kind { Literal, Capture };

    Kind kind = Literal;
    LiteralMatcher literal;               // Literal units
    TemplateTokenType tag_type = TemplateTokenType::Wildcard;
    std::string name;                     // Named: tag name, Unnamed: __anon_<n>
    size_t token_index = 0;               // position in the token list

    bool is_literal() const { return kind == Literal; }
    bool is_named() const {
        return kind == Capture && tag_type == TemplateTokenType::Named;
    }
};

// Immutable once built; safe to share between threads.
class CompiledPattern {
public:
    const std::vector<MatchUnit>& units() const { return units_; }
    const std::vector<TemplateToken>& tokens() const { return tokens_; }
    const std::vector<TokenizeWarning>& warnings() const { return warnings_; }

    size_t tag_count() const { return tag_count_; }
    bool is_normalized() const { return normalized_; }

    // True when some named tag appears more than once
    bool has_repeated_names() const { return repeated_names_; }

    // Index of the first unit capturing `name`, or units().size()
    size_t first_unit_of(const std::string& name) const;

    // Expected text with literals resolved. Tags listed in `values`
    // (keyed by unit index) are replaced; the rest keep their markup.
    std::string render(const std::map<size_t, std::string>& values = {}) const;

private:
    friend CompiledPattern compile(const TokenizeResult& tokenized,
                                   const CompileOptions& options);

    std::vector<TemplateToken> tokens_;
    std::vector<TokenizeWarning> warnings_;
    std::vector<MatchUnit> units_;
    std::map<std::string, size_t> first_unit_;
    size_t tag_count_ = 0;
    bool normalized_ = false;
    bool repeated_names_ = false;
};

// Remove `chars` from the end of each line of `text`
std::string strip_line_endings(const std::string& text, const std::string& chars);

CompiledPattern compile(const TokenizeResult& tokenized,
                        const CompileOptions& options = CompileOptions{});

// Tokenize and compile in one step; fails with InvalidTagSyntax
Result<CompiledPattern> compile(const std::string& tmpl,
                                const TagSyntax& syntax = TagSyntax{},
                                const CompileOptions& options = CompileOptions{});

} // namespace scribe
