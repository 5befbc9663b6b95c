#include <catch2/catch.hpp>
#include <scribe/checker.hpp>
#include <scribe/log.hpp>
#include <scribe/match/matcher.hpp>
#include <cstdio>
#include <string>

using namespace scribe;

// Sends log lines to a temporary file while in scope
struct LogCapture {
    std::FILE* file;
    log::Level saved;

    explicit LogCapture(log::Level lvl)
        : file(std::tmpfile()), saved(log::get_level()) {
        REQUIRE(file != nullptr);
        log::set_sink(file);
        log::set_color_enabled(false);
        log::set_level(lvl);
    }

    ~LogCapture() {
        log::set_sink(nullptr);
        log::set_level(saved);
        std::fclose(file);
    }

    std::string text() {
        std::fflush(file);
        std::rewind(file);
        std::string out;
        char buf[512];
        size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), file)) > 0) {
            out.append(buf, n);
        }
        return out;
    }
};

// ===== Levels =====

TEST_CASE("every level name parses back", "[log]") {
    for (auto lvl : {log::Trace, log::Debug, log::Info, log::Warn, log::Error, log::Off}) {
        INFO(log::level_name(lvl));
        auto parsed = log::parse_level(log::level_name(lvl));
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.value() == lvl);
    }
}

TEST_CASE("level names are case-sensitive", "[log]") {
    auto r = log::parse_level("WARN");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::Config);
    REQUIRE(r.error().message == "unknown log level 'WARN'");
    REQUIRE(r.error().hint.find("off") != std::string::npos);
}

// ===== Engine messages =====

TEST_CASE("compiler warns about adjacent tags", "[log]") {
    LogCapture cap(log::Warn);
    REQUIRE(compile("<a><b>\n").is_ok());
    REQUIRE(cap.text() ==
            "scribe warn: template line 1: tags <a> and <b> are adjacent; "
            "their boundary cannot be anchored\n");
}

TEST_CASE("warnings below the threshold are dropped", "[log]") {
    LogCapture cap(log::Error);
    REQUIRE(compile("<a><b>\n").is_ok());
    REQUIRE(cap.text().empty());
}

TEST_CASE("checker reports each outcome at debug", "[log]") {
    LogCapture cap(log::Debug);
    Checker checker;
    Example ex;
    ex.name = "guide.md:7";
    ex.expected = "x = <x>\n";
    auto prepared = checker.prepare(ex);
    REQUIRE(prepared.is_ok());

    checker.check(prepared.value(), "x = 1\n");
    checker.check(prepared.value(), "y\n");

    auto text = cap.text();
    REQUIRE(text.find("scribe debug: guide.md:7: passed (") != std::string::npos);
    REQUIRE(text.find("scribe debug: guide.md:7: failed (mismatch, 0 guesses)\n") !=
            std::string::npos);
}

TEST_CASE("checker outcomes stay quiet at info", "[log]") {
    LogCapture cap(log::Info);
    Checker checker;
    Example ex;
    ex.name = "guide.md:7";
    ex.expected = "x\n";
    auto prepared = checker.prepare(ex);
    REQUIRE(prepared.is_ok());
    REQUIRE(checker.check(prepared.value(), "x\n").passed);
    REQUIRE(cap.text().empty());
}

TEST_CASE("matcher logs an exhausted budget", "[log]") {
    LogCapture cap(log::Debug);
    auto p = compile("<k>|<...>a<...>a<...>a<...>a|<k>");
    REQUIRE(p.is_ok());
    MatchOptions opts;
    opts.step_factor = 1;
    auto m = match(p.value(), "1|" + std::string(40, 'a') + "|2", opts);
    REQUIRE(m.failure == MatchFailure::PatternTooComplex);
    REQUIRE(cap.text().rfind("scribe debug: match gave up after ", 0) == 0);
}

// ===== Sink =====

TEST_CASE("Off silences every level", "[log]") {
    LogCapture cap(log::Off);
    log::error("nobody hears this");
    REQUIRE(cap.text().empty());
}

TEST_CASE("sink receives formatted lines", "[log]") {
    {
        LogCapture cap(log::Trace);
        REQUIRE(log::get_sink() == cap.file);
        log::trace("%s has %d tags", "guide.md", 3);
        REQUIRE(cap.text() == "scribe trace: guide.md has 3 tags\n");
    }
    REQUIRE(log::get_sink() == stderr);
}

TEST_CASE("colour wraps the level label", "[log]") {
    LogCapture cap(log::Warn);
    log::set_color_enabled(true);
    log::warn("slow example");
    REQUIRE(cap.text() == "\033[33mscribe warn\033[0m: slow example\n");
}

TEST_CASE("a file sink is not a terminal", "[log]") {
    LogCapture cap(log::Info);
    log::set_sink(cap.file);   // forget the forced setting
    REQUIRE_FALSE(log::is_color_enabled());
}
