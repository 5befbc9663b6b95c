#include <scribe/checker.hpp>
#include <scribe/config.hpp>
#include <scribe/log.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace scribe;

static Result<std::string> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return ScribeError{ScribeError::IO, "cannot open " + path};
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return Result<std::string>::ok(ss.str());
}

// Replays a recorded output file instead of starting an interpreter
class FileRunner : public Runner {
public:
    explicit FileRunner(std::string path) : path_(std::move(path)) {}

    std::string interpreter_name() const override { return "file"; }

    Result<std::string> run(const Example&, const ExampleOptions&) override {
        auto text = read_file(path_);
        if (text.is_err()) {
            ScribeError e = std::move(text).error();
            e.code = ScribeError::Runner;
            return e;
        }
        return text;
    }

private:
    std::string path_;
};

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: scribe-check <template> <actual> [options] [config.toml]\n"
                  << "  options: e.g. \"+norm-ws diff=unified\"\n"
                  << "  also reads ~/.scribe/config.toml and ./.scribe.toml\n";
        return 2;
    }

    std::string tmpl_path = argv[1];
    std::string actual_path = argv[2];
    std::string option_line = argc > 3 ? argv[3] : "";

    // Global and project layers are optional; the local one must exist
    std::optional<Config> layers[3];
    std::string paths[3] = {global_config_path(), project_config_path(),
                            argc > 4 ? argv[4] : ""};
    for (int i = 0; i < 3; ++i) {
        if (paths[i].empty()) continue;
        if (i < 2 && !std::ifstream(paths[i])) continue;
        auto layer = Config::load(paths[i]);
        if (layer.is_err()) {
            std::cerr << layer.error().format() << "\n";
            return 2;
        }
        layers[i] = std::move(layer).value();
    }

    auto settings = Config::effective(layers[0], layers[1], layers[2]).settings();
    if (settings.is_err()) {
        std::cerr << settings.error().format() << "\n";
        return 2;
    }
    log::set_level(settings.value().log_level);

    auto tmpl = read_file(tmpl_path);
    if (tmpl.is_err()) {
        std::cerr << tmpl.error().format() << "\n";
        return 2;
    }

    Example example;
    example.name = tmpl_path;
    example.expected = tmpl.value();
    example.options = split_option_words(option_line);

    Checker checker(settings.value());
    FileRunner runner(actual_path);
    auto outcome = checker.run(example, runner);
    if (outcome.is_err()) {
        std::cerr << outcome.error().format() << "\n";
        return 2;
    }

    const CheckOutcome& result = outcome.value();
    std::cout << (result.passed ? "PASS " : "FAIL ") << tmpl_path << "\n";
    std::cout << result.text();
    return result.passed ? 0 : 1;
}
