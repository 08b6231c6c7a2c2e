#pragma once

#include <gitcache/cache.hpp>
#include <gitcache/config.hpp>
#include <gitcache/result.hpp>
#include <gitcache/url.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace gitcache {

// Everything a handler needs; nothing relies on the process's cwd
struct Context {
    Context(Settings s, std::filesystem::path invoked_from);

    Settings settings;
    CacheManager cache;
    std::filesystem::path cwd;  // where the tool was invoked

    GitCli& git() { return cache.git(); }
};

// Handlers receive the arguments following the subcommand name and
// return the exit status to report. Guard conditions (already attached,
// nothing to detach, unknown cache) log and return 0.

// Prime the cache, then `git clone --reference <cache> <args...>`
Result<int> cmd_clone(Context& ctx, const std::vector<std::string>& args);

// Refresh the cache if the working copy uses one, then `git <verb> <args...>`
// for verb "fetch" or "pull"
Result<int> cmd_fetch(Context& ctx, const std::string& verb,
                      const std::vector<std::string>& args);

Result<int> cmd_attach(Context& ctx, const std::vector<std::string>& args);
Result<int> cmd_detach(Context& ctx, const std::vector<std::string>& args);

// Detach followed by attach
Result<int> cmd_repair(Context& ctx, const std::vector<std::string>& args);

// `cache <name> <git-args...>`: run git inside <root>/<name>
Result<int> cmd_cache(Context& ctx, const std::vector<std::string>& args);

// Report the working copy's cache wiring on stdout
Result<int> cmd_status(Context& ctx, const std::vector<std::string>& args);

// List the shared caches and their projects on stdout
Result<int> cmd_list(Context& ctx, const std::vector<std::string>& args);

// Directory `git clone <args...>` creates, relative to the invoking
// directory: the first non-option argument after the URL, else the
// project name (with ".git" for --bare and --mirror)
std::string clone_destination(const std::vector<std::string>& args, const RepoUrl& url);

} // namespace gitcache
