#include <catch2/catch.hpp>
#include <scribe/match/tokenizer.hpp>

using namespace scribe;

// ===== Basic tokenization =====

TEST_CASE("tokenize empty template", "[tokenizer]") {
    auto r = tokenize("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().tokens.empty());
    REQUIRE(r.value().warnings.empty());
}

TEST_CASE("tokenize plain text", "[tokenizer]") {
    auto r = tokenize("hello\nworld\n");
    REQUIRE(r.is_ok());
    auto& toks = r.value().tokens;
    REQUIRE(toks.size() == 1);
    REQUIRE(toks[0].type == TemplateTokenType::Literal);
    REQUIRE(toks[0].text == "hello\nworld\n");
    REQUIRE(toks[0].markup == "hello\nworld\n");
}

TEST_CASE("tokenize named, unnamed and wildcard tags", "[tokenizer]") {
    auto r = tokenize("id=<id> user=<_> rest=<...>");
    REQUIRE(r.is_ok());
    auto& toks = r.value().tokens;
    REQUIRE(toks.size() == 6);
    REQUIRE(toks[0].type == TemplateTokenType::Literal);
    REQUIRE(toks[0].text == "id=");
    REQUIRE(toks[1].type == TemplateTokenType::Named);
    REQUIRE(toks[1].text == "id");
    REQUIRE(toks[1].markup == "<id>");
    REQUIRE(toks[3].type == TemplateTokenType::Unnamed);
    REQUIRE(toks[3].markup == "<_>");
    REQUIRE(toks[5].type == TemplateTokenType::Wildcard);
    REQUIRE(toks[5].markup == "<...>");
    REQUIRE(toks[5].is_tag());
    REQUIRE_FALSE(toks[4].is_tag());
}

TEST_CASE("tokenize records tag positions", "[tokenizer]") {
    auto r = tokenize("first\n  <x>");
    REQUIRE(r.is_ok());
    auto& toks = r.value().tokens;
    REQUIRE(toks.size() == 2);
    REQUIRE(toks[0].pos.line == 1);
    REQUIRE(toks[0].pos.col == 1);
    REQUIRE(toks[1].pos.line == 2);
    REQUIRE(toks[1].pos.col == 3);
}

// ===== Escapes =====

TEST_CASE("doubled delimiters are literal", "[tokenizer]") {
    auto r = tokenize("a <<b>> c");
    REQUIRE(r.is_ok());
    auto& toks = r.value().tokens;
    REQUIRE(toks.size() == 1);
    REQUIRE(toks[0].text == "a <b> c");
    REQUIRE(toks[0].markup == "a <<b>> c");
}

TEST_CASE("lone closing delimiter is literal", "[tokenizer]") {
    auto r = tokenize("x > y");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().tokens.size() == 1);
    REQUIRE(r.value().tokens[0].text == "x > y");
}

TEST_CASE("custom delimiters", "[tokenizer]") {
    TagSyntax syntax{'{', '}'};
    auto r = tokenize("<html> {body} {{x}}", syntax);
    REQUIRE(r.is_ok());
    auto& toks = r.value().tokens;
    REQUIRE(toks.size() == 3);
    REQUIRE(toks[0].text == "<html> ");
    REQUIRE(toks[1].type == TemplateTokenType::Named);
    REQUIRE(toks[1].text == "body");
    REQUIRE(toks[2].text == " {x}");
}

TEST_CASE("identical delimiters are rejected", "[tokenizer]") {
    auto r = tokenize("|x|", TagSyntax{'|', '|'});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::InvalidTagSyntax);
}

// ===== Errors =====

TEST_CASE("unterminated tag", "[tokenizer]") {
    auto r = tokenize("line one\nvalue <oops");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::InvalidTagSyntax);
    REQUIRE(r.error().line == 2);
    REQUIRE(r.error().message.find("unterminated") != std::string::npos);
    REQUIRE(r.error().hint.find("<<") != std::string::npos);
}

TEST_CASE("empty tag", "[tokenizer]") {
    auto r = tokenize("a <> b");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::InvalidTagSyntax);
}

TEST_CASE("illegal tag names", "[tokenizer]") {
    for (const char* tmpl : {"<1abc>", "<a-b>", "<a b>", "<..>"}) {
        auto r = tokenize(tmpl);
        INFO(tmpl);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == ScribeError::InvalidTagSyntax);
    }
}

TEST_CASE("reserved tag names", "[tokenizer]") {
    auto r = tokenize("<__anon_0>");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("reserved") != std::string::npos);
}

TEST_CASE("tag name validation", "[tokenizer]") {
    REQUIRE(is_valid_tag_name("x"));
    REQUIRE(is_valid_tag_name("_private"));
    REQUIRE(is_valid_tag_name("prevent2"));
    REQUIRE_FALSE(is_valid_tag_name(""));
    REQUIRE_FALSE(is_valid_tag_name("2x"));
    REQUIRE_FALSE(is_valid_tag_name("__x"));
    REQUIRE(is_reserved_tag_name("__x"));
    REQUIRE_FALSE(is_reserved_tag_name("_x"));
}

// ===== Warnings =====

TEST_CASE("adjacent tags produce a warning", "[tokenizer]") {
    auto r = tokenize("<a><b> and <c> <d>");
    REQUIRE(r.is_ok());
    auto& warnings = r.value().warnings;
    REQUIRE(warnings.size() == 1);
    REQUIRE(warnings[0].message.find("<a>") != std::string::npos);
    REQUIRE(warnings[0].message.find("<b>") != std::string::npos);
}

TEST_CASE("template_token_name", "[tokenizer]") {
    REQUIRE(std::string(template_token_name(TemplateTokenType::Literal)) == "Literal");
    REQUIRE(std::string(template_token_name(TemplateTokenType::Wildcard)) == "Wildcard");
    REQUIRE(std::string(template_token_name(TemplateTokenType::Named)) == "Named");
    REQUIRE(std::string(template_token_name(TemplateTokenType::Unnamed)) == "Unnamed");
}
