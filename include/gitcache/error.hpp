#pragma once

#include <string>

namespace gitcache {

struct GitcacheError {
    enum Code {
        IO,
        Parse,
        Config,
        Command,
        Interrupted,
        NotFound,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    // Signal number for Interrupted errors, 0 otherwise
    int signal = 0;

    GitcacheError() = default;
    GitcacheError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    GitcacheError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    GitcacheError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    static GitcacheError interrupted(int sig);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace gitcache
