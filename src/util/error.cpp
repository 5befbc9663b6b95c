#include <scribe/error.hpp>

namespace scribe {

const char* ScribeError::code_name(Code c) {
    switch (c) {
        case InvalidTagSyntax:         return "InvalidTagSyntax";
        case DuplicateCaptureConflict: return "DuplicateCaptureConflict";
        case PatternTooComplex:        return "PatternTooComplex";
        case UnknownDiffAlgorithm:     return "UnknownDiffAlgorithm";
        case Config:                   return "Config";
        case Parse:                    return "Parse";
        case IO:                       return "IO";
        case Runner:                   return "Runner";
    }
    return "Unknown";
}

ScribeError& ScribeError::at(const std::string& f, int l) {
    if (file.empty()) {
        file = f;
        line = l;
    }
    return *this;
}

bool ScribeError::is_configuration_error() const {
    return code == InvalidTagSyntax || code == UnknownDiffAlgorithm ||
           code == Config;
}

std::string ScribeError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace scribe
