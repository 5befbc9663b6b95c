#pragma once

#include <scribe/match/token.hpp>
#include <scribe/result.hpp>
#include <string>
#include <vector>

namespace scribe {

// Tag delimiters. Doubling a delimiter ("<<", ">>") yields it literally.
struct TagSyntax {
    char open = '<';
    char close = '>';
};

struct TokenizeResult {
    std::vector<TemplateToken> tokens;
    std::vector<TokenizeWarning> warnings;
};

// Split an expected-output template into literal and tag tokens.
// Fails with InvalidTagSyntax on an unterminated tag, an empty or illegal
// tag name, or a reserved name (leading "__").
Result<TokenizeResult> tokenize(const std::string& tmpl,
                                const TagSyntax& syntax = TagSyntax{});

// Names usable in <name>: [A-Za-z_][A-Za-z0-9_]*, not starting with "__"
bool is_valid_tag_name(const std::string& name);
bool is_reserved_tag_name(const std::string& name);

} // namespace scribe
