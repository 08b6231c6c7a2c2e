#include <gitcache/error.hpp>

#include <cstring>

namespace gitcache {

const char* GitcacheError::code_name(Code c) {
    switch (c) {
        case IO:          return "IO";
        case Parse:       return "Parse";
        case Config:      return "Config";
        case Command:     return "Command";
        case Interrupted: return "Interrupted";
        case NotFound:    return "NotFound";
        case InvalidArg:  return "InvalidArg";
    }
    return "Unknown";
}

GitcacheError GitcacheError::interrupted(int sig) {
    GitcacheError e{Interrupted,
        std::string("interrupted by signal ") + std::to_string(sig)
            + " (" + strsignal(sig) + ")"};
    e.signal = sig;
    return e;
}

std::string GitcacheError::format() const {
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

} // namespace gitcache
