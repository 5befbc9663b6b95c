#include <scribe/match/tokenizer.hpp>
#include <cctype>

namespace scribe {

const char* template_token_name(TemplateTokenType t) {
    switch (t) {
    case TemplateTokenType::Literal:  return "Literal";
    case TemplateTokenType::Wildcard: return "Wildcard";
    case TemplateTokenType::Named:    return "Named";
    case TemplateTokenType::Unnamed:  return "Unnamed";
    }
    return "Unknown";
}

bool is_reserved_tag_name(const std::string& name) {
    return name.size() >= 2 && name[0] == '_' && name[1] == '_';
}

bool is_valid_tag_name(const std::string& name) {
    if (name.empty()) return false;
    if (std::isdigit(static_cast<unsigned char>(name[0]))) return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return !is_reserved_tag_name(name);
}

// ---------------------------------------------------------------------------
// Tokenizer state machine
// ---------------------------------------------------------------------------

namespace {

struct Tokenizer {
    const std::string& source;
    TagSyntax syntax;
    size_t pos;
    int line;
    int col;

    std::vector<TemplateToken> tokens;
    std::vector<TokenizeWarning> warnings;

    // Pending literal text, flushed when a tag starts or at the end
    std::string literal;
    std::string literal_markup;
    SourcePos literal_pos;

    Tokenizer(const std::string& src, const TagSyntax& s)
        : source(src), syntax(s), pos(0), line(1), col(1) {}

    bool at_end() const { return pos >= source.size(); }

    char peek() const { return source[pos]; }

    char peek_next() const {
        return (pos + 1 < source.size()) ? source[pos + 1] : '\0';
    }

    char advance() {
        char c = source[pos++];
        if (c == '\n') {
            ++line;
            col = 1;
        } else {
            ++col;
        }
        return c;
    }

    SourcePos current_pos() const {
        return {line, col};
    }

    ScribeError tag_error(const std::string& msg, const std::string& hint,
                          SourcePos p) const {
        ScribeError err{ScribeError::InvalidTagSyntax, msg, hint};
        err.line = p.line;
        return err;
    }

    void append_literal(char c, const std::string& markup) {
        if (literal.empty() && literal_markup.empty()) {
            literal_pos = current_pos();
        }
        literal += c;
        literal_markup += markup;
    }

    void flush_literal() {
        if (literal_markup.empty()) return;
        tokens.push_back({TemplateTokenType::Literal, literal,
                          literal_markup, literal_pos});
        literal.clear();
        literal_markup.clear();
    }

    Result<TokenizeResult> run() {
        if (syntax.open == syntax.close) {
            return ScribeError{ScribeError::InvalidTagSyntax,
                std::string("tag delimiters must differ, got '") +
                    syntax.open + "' twice"};
        }

        while (!at_end()) {
            char c = peek();

            if (c == syntax.open) {
                if (peek_next() == syntax.open) {
                    // Record the position before consuming the escape
                    append_literal(c, std::string(2, c));
                    advance();
                    advance();
                    continue;
                }
                flush_literal();
                auto r = lex_tag();
                if (r.is_err()) return std::move(r).error();
                continue;
            }

            if (c == syntax.close && peek_next() == syntax.close) {
                append_literal(c, std::string(2, c));
                advance();
                advance();
                continue;
            }

            // A lone closing delimiter is plain text
            std::string one(1, c);
            append_literal(c, one);
            advance();
        }
        flush_literal();

        TokenizeResult result;
        result.tokens = std::move(tokens);
        result.warnings = std::move(warnings);
        return Result<TokenizeResult>::ok(std::move(result));
    }

    Status lex_tag() {
        auto p = current_pos();
        size_t start = pos;
        advance(); // open delimiter

        std::string name;
        while (!at_end() && peek() != syntax.close) {
            name += advance();
        }
        if (at_end()) {
            return tag_error("unterminated tag starting at line " +
                    std::to_string(p.line) + ", column " + std::to_string(p.col),
                std::string("write '") + syntax.open + syntax.open +
                    "' for a literal '" + syntax.open + "'",
                p);
        }
        advance(); // close delimiter

        std::string markup = source.substr(start, pos - start);
        TemplateTokenType type;
        if (name == "...") {
            type = TemplateTokenType::Wildcard;
        } else if (name == "_") {
            type = TemplateTokenType::Unnamed;
        } else if (name.empty()) {
            return tag_error("empty tag '" + markup + "'",
                "use <...> to match anything or <name> to capture", p);
        } else if (is_reserved_tag_name(name)) {
            return tag_error("reserved tag name '" + name + "'",
                "names starting with '__' are reserved", p);
        } else if (!is_valid_tag_name(name)) {
            return tag_error("invalid tag name '" + name + "'",
                "tag names may only contain letters, digits and '_' "
                "and may not start with a digit", p);
        } else {
            type = TemplateTokenType::Named;
        }

        if (!tokens.empty() && tokens.back().is_tag()) {
            warnings.push_back({"tags " + tokens.back().markup + " and " + markup +
                " are adjacent; their boundary cannot be anchored", p});
        }
        tokens.push_back({type, name, markup, p});
        return ok_status();
    }
};

} // anonymous namespace

Result<TokenizeResult> tokenize(const std::string& tmpl, const TagSyntax& syntax) {
    Tokenizer tokenizer(tmpl, syntax);
    return tokenizer.run();
}

} // namespace scribe
