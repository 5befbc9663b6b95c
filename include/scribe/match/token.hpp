#pragma once

#include <string>
#include <vector>

namespace scribe {

// Position inside a template, for error reporting
struct SourcePos {
    int line = 1;
    int col = 1;
};

enum class TemplateTokenType {
    Literal,   // plain expected text, escapes resolved
    Wildcard,  // <...>
    Named,     // <name>
    Unnamed    // <_>
};

struct TemplateToken {
    TemplateTokenType type;
    std::string text;     // literal text, or the tag name
    std::string markup;   // verbatim template spelling
    SourcePos pos;

    bool is_tag() const { return type != TemplateTokenType::Literal; }
};

// Ambiguity detected while tokenizing; compilation still succeeds
struct TokenizeWarning {
    std::string message;
    SourcePos pos;
};

const char* template_token_name(TemplateTokenType t);

} // namespace scribe
