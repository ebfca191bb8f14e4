#pragma once

#include <string>

namespace pkgindex {

struct IndexError {
    enum Code {
        ToolMissing,
        Subprocess,
        Signature,
        Network,
        Timeout,
        IndexCorrupt,
        IO,
        Parse,
        Version,
        Config,
        InvalidArg,
        NotFound
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    IndexError() = default;
    IndexError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    IndexError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    IndexError(Code c, std::string msg, std::string h, std::string f, int l = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace pkgindex
