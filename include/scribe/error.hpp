#pragma once

#include <string>

namespace scribe {

struct ScribeError {
    enum Code {
        InvalidTagSyntax,
        DuplicateCaptureConflict,
        PatternTooComplex,
        UnknownDiffAlgorithm,
        Config,
        Parse,
        IO,
        Runner
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;   // example or template origin
    int line = 0;

    ScribeError() = default;
    ScribeError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ScribeError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    ScribeError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Attach an origin (example name and template line) if none is set yet
    ScribeError& at(const std::string& f, int l);

    // Setup-time errors make an example unusable; the rest are per-attempt
    bool is_configuration_error() const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace scribe
