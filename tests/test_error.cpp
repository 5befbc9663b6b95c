#include <catch2/catch.hpp>
#include <scribe/diff/renderer.hpp>
#include <scribe/match/matcher.hpp>
#include <scribe/options.hpp>

using namespace scribe;

// The diff algorithm an option list selects, stopping at its first error
static Result<DiffAlgorithm> selected_diff(const std::vector<std::string>& words) {
    auto opts = parse_options(words);
    SCRIBE_TRY(opts);
    return Result<DiffAlgorithm>::ok(opts.value().diff);
}

static CompiledPattern pattern_of(const std::string& tmpl) {
    auto r = compile(tmpl);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

// ===== Result =====

TEST_CASE("result holds a value or an error", "[error]") {
    auto ok = parse_diff_algorithm("ndiff");
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value() == DiffAlgorithm::Ndiff);

    auto bad = parse_diff_algorithm("wdiff");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == ScribeError::UnknownDiffAlgorithm);
    REQUIRE(bad.error().message == "unknown diff algorithm 'wdiff'");
    REQUIRE_THROWS_AS(bad.value(), std::bad_variant_access);
}

TEST_CASE("SCRIBE_TRY forwards the first error", "[error]") {
    REQUIRE(selected_diff({"diff=unified"}).value() == DiffAlgorithm::Unified);

    auto unknown = selected_diff({"diff=wdiff"});
    REQUIRE(unknown.is_err());
    REQUIRE(unknown.error().code == ScribeError::UnknownDiffAlgorithm);

    auto first = selected_diff({"bogus", "diff=wdiff"});
    REQUIRE(first.is_err());
    REQUIRE(first.error().code == ScribeError::Config);
    REQUIRE(first.error().message == "option 'bogus' is not a flag");
}

TEST_CASE("failure_status maps match failures", "[error]") {
    auto p = pattern_of("<id> is <id>\n");
    REQUIRE(failure_status(match(p, "7 is 7\n")).is_ok());
    REQUIRE(failure_status(match(p, "7 was 7\n")).is_ok());

    auto conflict = failure_status(match(p, "7 is 8\n"));
    REQUIRE(conflict.is_err());
    REQUIRE(conflict.error().code == ScribeError::DuplicateCaptureConflict);
    REQUIRE(conflict.error().hint.empty());
}

// ===== Formatting =====

TEST_CASE("format with a message only", "[error]") {
    ScribeError e{ScribeError::IO, "cannot open guide.md"};
    REQUIRE(e.format() == "error[IO]: cannot open guide.md");
}

TEST_CASE("format with hint and origin", "[error]") {
    ScribeError e{ScribeError::Runner, "interpreter exited with status 1",
                  "check the interpreter path"};
    e.at("guide.md:40", 3);
    REQUIRE(e.format() ==
            "error[Runner]: interpreter exited with status 1\n"
            "  hint: check the interpreter path\n"
            "  --> guide.md:40:3");

    ScribeError no_line{ScribeError::Config, "bad option"};
    no_line.at("guide.md:12", 0);
    REQUIRE(no_line.format() == "error[Config]: bad option\n  --> guide.md:12");
}

TEST_CASE("tokenizer errors carry the template line", "[error]") {
    auto r = compile("first\nsecond <open\n");
    REQUIRE(r.is_err());
    ScribeError e = std::move(r).error();
    REQUIRE(e.code == ScribeError::InvalidTagSyntax);
    REQUIRE(e.line == 2);
    REQUIRE(e.file.empty());
    REQUIRE(e.format().find("\n  hint: write '<<'") != std::string::npos);
}

TEST_CASE("at() keeps the first origin", "[error]") {
    ScribeError e{ScribeError::Parse, "bad TOML"};
    e.at("project/.scribe.toml", 0).at("other.toml", 9);
    REQUIRE(e.file == "project/.scribe.toml");
    REQUIRE(e.line == 0);
}

// ===== Classification =====

TEST_CASE("configuration errors are told apart from per-run errors", "[error]") {
    for (auto code : {ScribeError::InvalidTagSyntax, ScribeError::UnknownDiffAlgorithm,
                      ScribeError::Config}) {
        INFO(ScribeError::code_name(code));
        REQUIRE(ScribeError{code, ""}.is_configuration_error());
    }
    for (auto code : {ScribeError::DuplicateCaptureConflict, ScribeError::PatternTooComplex,
                      ScribeError::Parse, ScribeError::IO, ScribeError::Runner}) {
        INFO(ScribeError::code_name(code));
        REQUIRE_FALSE(ScribeError{code, ""}.is_configuration_error());
    }
}

TEST_CASE("code names", "[error]") {
    REQUIRE(std::string(ScribeError::code_name(ScribeError::InvalidTagSyntax)) == "InvalidTagSyntax");
    REQUIRE(std::string(ScribeError::code_name(ScribeError::DuplicateCaptureConflict)) ==
            "DuplicateCaptureConflict");
    REQUIRE(std::string(ScribeError::code_name(ScribeError::PatternTooComplex)) == "PatternTooComplex");
    REQUIRE(std::string(ScribeError::code_name(ScribeError::UnknownDiffAlgorithm)) ==
            "UnknownDiffAlgorithm");
    REQUIRE(std::string(ScribeError::code_name(ScribeError::Config)) == "Config");
    REQUIRE(std::string(ScribeError::code_name(ScribeError::Parse)) == "Parse");
    REQUIRE(std::string(ScribeError::code_name(ScribeError::IO)) == "IO");
    REQUIRE(std::string(ScribeError::code_name(ScribeError::Runner)) == "Runner");
}
