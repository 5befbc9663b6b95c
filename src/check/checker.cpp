#include <scribe/checker.hpp>
#include <scribe/log.hpp>
#include <set>

namespace scribe {

std::string universal_newlines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            out += text[i];
        }
    }
    if (!out.empty() && out.back() != '\n') out += '\n';
    return out;
}

std::string CheckOutcome::text() const {
    std::string out = report.full();
    if (!diagnostic.empty()) {
        out += diagnostic;
        out += '\n';
    }
    return out;
}

Checker::Checker(EngineSettings settings)
    : settings_(std::move(settings)) {}

Result<PreparedExample> Checker::prepare(const Example& example) const {
    auto opts = parse_options(example.options, settings_.defaults);
    if (opts.is_err()) return std::move(opts.error().at(example.name, 0));

    CompileOptions copts;
    copts.normalize_whitespace = opts.value().norm_ws;
    copts.strip_chars = opts.value().rm;

    auto pattern = compile(universal_newlines(example.expected),
                           example.syntax.value_or(settings_.syntax), copts);
    if (pattern.is_err()) {
        ScribeError& e = pattern.error();
        return std::move(e.at(example.name, e.line));
    }

    PreparedExample prepared;
    prepared.name = example.name;
    prepared.options = std::move(opts).value();
    prepared.pattern = std::move(pattern).value();
    return Result<PreparedExample>::ok(std::move(prepared));
}

// Named captures in template order, one entry per name
static std::vector<CapturedEntry> matched_entries(const CompiledPattern& pattern,
                                                  const std::map<std::string, Capture>& captures) {
    std::vector<CapturedEntry> entries;
    const auto& units = pattern.units();
    for (size_t i = 0; i < units.size(); ++i) {
        if (!units[i].is_named() || pattern.first_unit_of(units[i].name) != i) continue;
        auto it = captures.find(units[i].name);
        if (it == captures.end()) continue;
        entries.push_back(CapturedEntry{it->first, it->second.text, false});
    }
    return entries;
}

static std::vector<CapturedEntry> guessed_entries(const std::vector<Guess>& guesses) {
    std::vector<CapturedEntry> entries;
    std::set<std::string> seen;
    for (const auto& g : guesses) {
        if (!seen.insert(g.name).second) continue;
        entries.push_back(CapturedEntry{g.name, g.text, g.confidence == Confidence::Low});
    }
    return entries;
}

CheckOutcome Checker::check(const PreparedExample& prepared, const std::string& actual) const {
    CheckOutcome outcome;
    const ExampleOptions& opts = prepared.options;

    std::string got = universal_newlines(actual);
    if (!opts.rm.empty()) got = strip_line_endings(got, opts.rm);

    MatchResult m = match(prepared.pattern, got, settings_.match);
    outcome.failure = m.failure;

    if (m.matched) {
        outcome.passed = true;
        outcome.captures = std::move(m.captures);
        if (opts.capture) {
            outcome.report.captured_line = format_captured(
                matched_entries(prepared.pattern, outcome.captures), settings_.captured);
        }
        log::debug("%s: passed (%zu steps)", prepared.name.c_str(), m.steps);
        return outcome;
    }

    auto status = failure_status(m);
    if (status.is_err()) outcome.diagnostic = status.error().at(prepared.name, 0).format();

    DiffRequest request;
    request.actual = got;
    request.algorithm = opts.diff;
    request.normalization = opts.normalization();
    request.context_lines = settings_.context_lines;
    request.enhance = settings_.enhance_diff;

    if (opts.capture) {
        GuessResult g = guess(prepared.pattern, got, settings_.guess);
        request.expected = std::move(g.expected);
        outcome.guesses = std::move(g.guesses);
    } else {
        request.expected = prepared.pattern.render();
    }

    outcome.report = render_diff(request);
    outcome.report.captured_line = format_captured(guessed_entries(outcome.guesses),
                                                   settings_.captured);

    log::debug("%s: failed (%s, %zu guesses)", prepared.name.c_str(),
               match_failure_name(m.failure), outcome.guesses.size());
    return outcome;
}

Result<CheckOutcome> Checker::run(const Example& example, Runner& runner) const {
    auto prepared = prepare(example);
    if (prepared.is_err()) return std::move(prepared).error();

    log::trace("%s: running with %s", example.name.c_str(),
               runner.interpreter_name().c_str());
    auto actual = runner.run(example, prepared.value().options);
    if (actual.is_err()) return std::move(actual.error().at(example.name, 0));

    return Result<CheckOutcome>::ok(check(prepared.value(), actual.value()));
}

} // namespace scribe
