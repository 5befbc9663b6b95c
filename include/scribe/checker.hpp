#pragma once

#include <scribe/config.hpp>
#include <scribe/diff/renderer.hpp>
#include <scribe/match/guesser.hpp>
#include <scribe/match/matcher.hpp>
#include <scribe/match/pattern.hpp>
#include <scribe/options.hpp>
#include <scribe/result.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace scribe {

// One runnable snippet and its expected-output template
struct Example {
    std::string name;                     // used as the error origin
    std::string source;                   // handed to the runner as-is
    std::string expected;                 // template text
    std::optional<TagSyntax> syntax;      // falls back to the configured tags
    std::vector<std::string> options;     // option words, see parse_options()
};

// Produces the actual text of an example, typically by feeding its source
// to an interpreter session. Implementations own timeouts and cancellation.
class Runner {
public:
    virtual ~Runner() = default;

    virtual std::string interpreter_name() const = 0;
    virtual Result<std::string> run(const Example& example,
                                    const ExampleOptions& options) = 0;
};

struct PreparedExample {
    std::string name;
    ExampleOptions options;
    CompiledPattern pattern;
};

struct CheckOutcome {
    bool passed = false;
    MatchFailure failure = MatchFailure::None;
    std::map<std::string, Capture> captures;   // set when passed
    std::vector<Guess> guesses;                // set on failure with capture on
    DiffReport report;
    std::string diagnostic;                    // conflict / budget explanation

    // Report followed by the diagnostic, if any
    std::string text() const;
};

class Checker {
public:
    explicit Checker(EngineSettings settings = EngineSettings{});

    const EngineSettings& settings() const { return settings_; }

    // Parse options and compile the template. Errors here are
    // configuration errors of the example.
    Result<PreparedExample> prepare(const Example& example) const;

    CheckOutcome check(const PreparedExample& prepared, const std::string& actual) const;

    // prepare + runner + check
    Result<CheckOutcome> run(const Example& example, Runner& runner) const;

private:
    EngineSettings settings_;
};

// Convert "\r\n" and lone "\r" line breaks to "\n", and end non-empty
// text with a newline. Applied to templates and to runner output alike.
std::string universal_newlines(const std::string& text);

} // namespace scribe
