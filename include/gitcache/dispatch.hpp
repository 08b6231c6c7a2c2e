#pragma once

#include <gitcache/commands.hpp>
#include <gitcache/config.hpp>
#include <gitcache/result.hpp>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace gitcache {

using Handler = std::function<Result<int>(Context&, const std::vector<std::string>&)>;

// Routes a subcommand to its handler, or passes the whole argument list
// through to git untouched
class Dispatcher {
public:
    struct Entry {
        std::string name;   // as shown in usage
        Handler fn;
        std::string help;
    };

    void add(const std::string& name, Handler fn, const std::string& help);

    // Handler for `name`, nullptr if git should receive it unchanged
    const Entry* find(const std::string& name) const;

    // argv without the program name
    Result<int> dispatch(Context& ctx, const std::vector<std::string>& argv) const;

    // Resolve settings from `env`, then dispatch. Broken settings only
    // fail our own subcommands; anything bound for git still reaches it.
    Result<int> run(const std::vector<std::string>& argv, const EnvLookup& env,
                    const std::filesystem::path& cwd) const;

    void print_usage(std::FILE* out) const;

    // Lookup key: dashes folded to underscores
    static std::string normalize(const std::string& name);

private:
    std::map<std::string, Entry> table_;
};

// Dispatcher with every git-cache subcommand registered
Dispatcher make_dispatcher();

} // namespace gitcache
