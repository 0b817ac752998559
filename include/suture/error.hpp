#pragma once

#include <string>

namespace suture {

struct SutureError {
    enum Code {
        IO,
        Parse,
        Config,
        Manifest,
        GraphBuild,
        Cycle,
        FragmentNotFound,
        NotFound,
        Duplicate,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    SutureError() = default;
    SutureError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    SutureError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    SutureError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Multi-line rendering for the CLI layer: "error[Code]: msg" + hint + location
    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace suture
