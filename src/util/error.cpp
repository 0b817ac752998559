#include <suture/error.hpp>

namespace suture {

const char* SutureError::code_name(Code c) {
    switch (c) {
        case IO:               return "IO";
        case Parse:            return "Parse";
        case Config:           return "Config";
        case Manifest:         return "Manifest";
        case GraphBuild:       return "GraphBuild";
        case Cycle:            return "Cycle";
        case FragmentNotFound: return "FragmentNotFound";
        case NotFound:         return "NotFound";
        case Duplicate:        return "Duplicate";
        case InvalidArg:       return "InvalidArg";
    }
    return "Unknown";
}

std::string SutureError::format() const {
    std::string out = "error[";
    out += code_name(code);
    out += "]: ";
    out += message;

    if (!hint.empty()) {
        out += "\n  hint: ";
        out += hint;
    }

    if (!file.empty()) {
        out += "\n  --> ";
        out += file;
        if (line > 0) {
            out += ":" + std::to_string(line);
        }
    }

    return out;
}

} // namespace suture
