#include <quid/error.hpp>

namespace quid {

const char* QuidError::code_name(Code c) {
    switch (c) {
        case NodeUnavailable:    return "NodeUnavailable";
        case UnsupportedVersion: return "UnsupportedVersion";
        case ClockOverflow:      return "ClockOverflow";
        case Config:             return "Config";
        case Parse:              return "Parse";
        case IO:                 return "IO";
        case InvalidArg:         return "InvalidArg";
    }
    return "Unknown";
}

std::string QuidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }
    return result;
}

} // namespace quid
