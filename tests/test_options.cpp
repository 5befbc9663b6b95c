#include <catch2/catch.hpp>
#include <scribe/options.hpp>

using namespace scribe;

// ===== Parsing =====

TEST_CASE("defaults", "[options]") {
    auto r = parse_options({});
    REQUIRE(r.is_ok());
    auto& o = r.value();
    REQUIRE_FALSE(o.norm_ws);
    REQUIRE(o.rm.empty());
    REQUIRE(o.diff == DiffAlgorithm::Plain);
    REQUIRE(o.timeout == Approx(2.0));
    REQUIRE(o.capture);
    REQUIRE(o.normalization().empty());
}

TEST_CASE("flag spellings", "[options]") {
    REQUIRE(parse_options({"+norm-ws"}).value().norm_ws);
    REQUIRE(parse_options({"norm-ws"}).value().norm_ws);
    REQUIRE(parse_options({"norm-ws=yes"}).value().norm_ws);
    REQUIRE_FALSE(parse_options({"-capture"}).value().capture);
    REQUIRE_FALSE(parse_options({"capture=false"}).value().capture);
    REQUIRE_FALSE(parse_options({"capture=0"}).value().capture);
}

TEST_CASE("valued options", "[options]") {
    auto r = parse_options({"rm=.;", "diff=ndiff", "timeout=4.5"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().rm == ".;");
    REQUIRE(r.value().diff == DiffAlgorithm::Ndiff);
    REQUIRE(r.value().timeout == Approx(4.5));
    REQUIRE(r.value().normalization().strip_chars == ".;");
}

TEST_CASE("options overlay a base", "[options]") {
    ExampleOptions base;
    base.norm_ws = true;
    base.diff = DiffAlgorithm::Unified;
    auto r = parse_options({"diff=context"}, base);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().norm_ws);
    REQUIRE(r.value().diff == DiffAlgorithm::Context);
}

TEST_CASE("later words win", "[options]") {
    auto r = parse_options({"+norm-ws", "-norm-ws"});
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().norm_ws);
}

// ===== Errors =====

TEST_CASE("unknown diff algorithm in options", "[options]") {
    auto r = parse_options({"diff=fancy"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::UnknownDiffAlgorithm);
}

TEST_CASE("unknown option", "[options]") {
    auto r = parse_options({"colour=red"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::Config);
    REQUIRE(r.error().message.find("colour") != std::string::npos);

    auto flag = parse_options({"+verbose"});
    REQUIRE(flag.is_err());
    REQUIRE(flag.error().code == ScribeError::Config);
}

TEST_CASE("bad booleans and timeouts", "[options]") {
    REQUIRE(parse_options({"capture=maybe"}).is_err());
    REQUIRE(parse_options({"timeout=abc"}).is_err());
    REQUIRE(parse_options({"timeout=3s"}).is_err());
    REQUIRE(parse_options({"timeout=0"}).is_err());
    REQUIRE(parse_options({"timeout=-1"}).is_err());
}

// ===== Splitting =====

TEST_CASE("split option words", "[options]") {
    auto words = split_option_words("  +norm-ws   diff=unified\ttimeout=3 ");
    REQUIRE(words == std::vector<std::string>{"+norm-ws", "diff=unified", "timeout=3"});
    REQUIRE(split_option_words("").empty());
}

TEST_CASE("trailing rm= keeps its whitespace", "[options]") {
    auto words = split_option_words("diff=ndiff rm= \t");
    REQUIRE(words.size() == 2);
    REQUIRE(words[1] == "rm= \t");

    auto r = parse_options(words);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().rm == " \t");
}

TEST_CASE("rm= followed by other words is empty", "[options]") {
    auto words = split_option_words("rm= +norm-ws");
    REQUIRE(words == std::vector<std::string>{"rm=", "+norm-ws"});
}
