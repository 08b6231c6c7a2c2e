#include <gitcache/commands.hpp>
#include <gitcache/dispatch.hpp>
#include <gitcache/log.hpp>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

using namespace gitcache;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    Dispatcher dispatcher = make_dispatcher();

    if (args.empty()) {
        dispatcher.print_usage(stderr);
        return 2;
    }
    if (args[0] == "cache-help") {
        dispatcher.print_usage(stderr);
        return 0;
    }

    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    if (ec) {
        log::error("cannot determine current directory: %s", ec.message().c_str());
        return 1;
    }

    auto r = dispatcher.run(args, [](const char* name) { return std::getenv(name); }, cwd);
    if (r.is_err()) {
        const GitcacheError& err = r.error();
        std::fprintf(stderr, "%s\n", err.format().c_str());
        if (err.code == GitcacheError::Interrupted && err.signal > 0) {
            return 128 + err.signal;
        }
        return 1;
    }
    return r.value();
}
