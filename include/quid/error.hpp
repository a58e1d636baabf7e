#pragma once

#include <string>

namespace quid {

struct QuidError {
    enum Code {
        NodeUnavailable,
        UnsupportedVersion,
        ClockOverflow,
        Config,
        Parse,
        IO,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;

    QuidError() = default;
    QuidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    QuidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace quid
