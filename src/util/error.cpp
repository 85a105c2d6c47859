#include <cnbkit/error.hpp>

namespace cnbkit {

const char* CnbError::code_name(Code c) {
    switch (c) {
        case IO:              return "IO";
        case LayerIO:         return "LayerIO";
        case Parse:           return "Parse";
        case Contract:        return "Contract";
        case ApiMismatch:     return "ApiMismatch";
        case FrameworkMisuse: return "FrameworkMisuse";
        case Buildpack:       return "Buildpack";
        case InvalidArg:      return "InvalidArg";
        case NotFound:        return "NotFound";
        case Duplicate:       return "Duplicate";
    }
    return "Unknown";
}

std::string CnbError::format() const {
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

} // namespace cnbkit
