#pragma once

#include <string>

namespace cnbkit {

struct CnbError {
    enum Code {
        IO,
        LayerIO,  // the framework failed to read or write layer state
        Parse,
        Contract,
        ApiMismatch,
        FrameworkMisuse,
        Buildpack,
        InvalidArg,
        NotFound,
        Duplicate
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    CnbError() = default;
    CnbError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    CnbError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    CnbError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace cnbkit
