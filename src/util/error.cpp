#include <pkgindex/error.hpp>

namespace pkgindex {

const char* IndexError::code_name(Code c) {
    switch (c) {
        case ToolMissing:  return "ToolMissing";
        case Subprocess:   return "Subprocess";
        case Signature:    return "Signature";
        case Network:      return "Network";
        case Timeout:      return "Timeout";
        case IndexCorrupt: return "IndexCorrupt";
        case IO:           return "IO";
        case Parse:        return "Parse";
        case Version:      return "Version";
        case Config:       return "Config";
        case InvalidArg:   return "InvalidArg";
        case NotFound:     return "NotFound";
    }
    return "Unknown";
}

std::string IndexError::format() const {
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

} // namespace pkgindex
