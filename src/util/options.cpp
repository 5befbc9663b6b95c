#include <scribe/options.hpp>
#include <cctype>
#include <stdexcept>

namespace scribe {

static Result<bool> parse_bool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "yes" || value == "1") return Result<bool>::ok(true);
    if (value == "false" || value == "no" || value == "0") return Result<bool>::ok(false);
    return ScribeError{ScribeError::Config,
        "option '" + key + "' expects a boolean, got '" + value + "'",
        "use true/false, yes/no or 1/0"};
}

static Status apply_flag(ExampleOptions& opts, const std::string& key, bool value) {
    if (key == "norm-ws") {
        opts.norm_ws = value;
    } else if (key == "capture") {
        opts.capture = value;
    } else {
        return ScribeError{ScribeError::Config,
            "option '" + key + "' is not a flag",
            "flags: norm-ws, capture"};
    }
    return ok_status();
}

Result<ExampleOptions> parse_options(const std::vector<std::string>& words,
                                     const ExampleOptions& base) {
    ExampleOptions opts = base;

    for (const auto& word : words) {
        if (word.empty()) continue;

        // +flag / -flag
        if (word[0] == '+' || word[0] == '-') {
            SCRIBE_TRY(apply_flag(opts, word.substr(1), word[0] == '+'));
            continue;
        }

        size_t eq = word.find('=');
        if (eq == std::string::npos) {
            SCRIBE_TRY(apply_flag(opts, word, true));
            continue;
        }

        std::string key = word.substr(0, eq);
        std::string value = word.substr(eq + 1);

        if (key == "rm") {
            opts.rm = value;
        } else if (key == "diff") {
            auto algo = parse_diff_algorithm(value);
            if (algo.is_err()) return std::move(algo).error();
            opts.diff = algo.value();
        } else if (key == "timeout") {
            double secs = 0;
            try {
                size_t used = 0;
                secs = std::stod(value, &used);
                if (used != value.size()) throw std::invalid_argument(value);
            } catch (const std::exception&) {
                return ScribeError{ScribeError::Config,
                    "invalid timeout '" + value + "'", "expected seconds, e.g. timeout=4"};
            }
            if (secs <= 0) {
                return ScribeError{ScribeError::Config,
                    "timeout must be positive, got '" + value + "'"};
            }
            opts.timeout = secs;
        } else if (key == "norm-ws" || key == "capture") {
            auto b = parse_bool(key, value);
            if (b.is_err()) return std::move(b).error();
            SCRIBE_TRY(apply_flag(opts, key, b.value()));
        } else {
            return ScribeError{ScribeError::Config,
                "unknown option '" + key + "'",
                "known options: norm-ws, rm, diff, timeout, capture"};
        }
    }

    return Result<ExampleOptions>::ok(std::move(opts));
}

std::vector<std::string> split_option_words(const std::string& line) {
    std::vector<std::string> words;
    size_t i = 0;
    auto is_ws = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    while (i < line.size()) {
        while (i < line.size() && is_ws(line[i])) ++i;
        if (i >= line.size()) break;

        size_t start = i;
        while (i < line.size() && !is_ws(line[i])) ++i;
        std::string word = line.substr(start, i - start);

        // A bare trailing "rm=" takes the whitespace after it as its charset
        if (word == "rm=" && i < line.size()) {
            size_t rest = i;
            while (rest < line.size() && is_ws(line[rest])) ++rest;
            if (rest == line.size()) {
                word += line.substr(i);
                i = rest;
            }
        }
        words.push_back(std::move(word));
    }
    return words;
}

} // namespace scribe
