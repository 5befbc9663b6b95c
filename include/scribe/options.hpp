#pragma once

#include <scribe/diff/renderer.hpp>
#include <scribe/result.hpp>
#include <string>
#include <vector>

namespace scribe {

// Per-example settings, as written next to an example in a document
struct ExampleOptions {
    bool norm_ws = false;                        // norm-ws
    std::string rm;                              // rm=<charset>
    DiffAlgorithm diff = DiffAlgorithm::Plain;   // diff=<name>
    double timeout = 2.0;                        // timeout=<seconds>, for the runner
    bool capture = true;                         // capture=<bool>, enables guessing

    Normalization normalization() const {
        return Normalization{norm_ws, rm};
    }
};

// Overlay option words on `base`. Accepted spellings: "+flag", "-flag",
// "flag", "flag=true|false", "rm=<chars>", "diff=<name>", "timeout=<secs>".
Result<ExampleOptions> parse_options(const std::vector<std::string>& words,
                                     const ExampleOptions& base = ExampleOptions{});

// Split "+norm-ws diff=unified" on whitespace. "rm=" keeps the rest of its
// word verbatim, so "rm= " (a space) must be the last word.
std::vector<std::string> split_option_words(const std::string& line);

} // namespace scribe
