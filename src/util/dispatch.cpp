#include <gitcache/dispatch.hpp>
#include <gitcache/log.hpp>

#include <algorithm>

namespace gitcache {

std::string Dispatcher::normalize(const std::string& name) {
    std::string key = name;
    std::replace(key.begin(), key.end(), '-', '_');
    return key;
}

void Dispatcher::add(const std::string& name, Handler fn, const std::string& help) {
    table_[normalize(name)] = Entry{name, std::move(fn), help};
}

const Dispatcher::Entry* Dispatcher::find(const std::string& name) const {
    auto it = table_.find(normalize(name));
    return it == table_.end() ? nullptr : &it->second;
}

Result<int> Dispatcher::dispatch(Context& ctx, const std::vector<std::string>& argv) const {
    if (argv.empty()) {
        return GitcacheError{GitcacheError::InvalidArg,
            "no command given", "run 'git-cache cache-help' for usage"};
    }

    if (const Entry* entry = find(argv[0])) {
        log::debug("handling '%s'", entry->name.c_str());
        std::vector<std::string> rest(argv.begin() + 1, argv.end());
        return entry->fn(ctx, rest);
    }

    return ctx.git().passthrough(argv, ctx.cwd.string());
}

Result<int> Dispatcher::run(const std::vector<std::string>& argv, const EnvLookup& env,
                            const std::filesystem::path& cwd) const {
    auto settings = Settings::resolve(env);
    if (settings.is_err()) {
        if (argv.empty() || find(argv[0])) return std::move(settings).error();

        log::warn("%s; passing '%s' to git with default settings",
                  settings.error().message.c_str(), argv[0].c_str());
        const char* home = env("HOME");
        Context ctx(Settings::defaults(home && *home ? home : "/tmp"), cwd);
        return dispatch(ctx, argv);
    }

    log::set_level(settings.value().log_level);
    Context ctx(std::move(settings).value(), cwd);
    return dispatch(ctx, argv);
}

void Dispatcher::print_usage(std::FILE* out) const {
    std::fprintf(out, "usage: git-cache <command> [args...]\n\n");
    std::fprintf(out, "commands:\n");
    for (const auto& [key, e] : table_) {
        std::fprintf(out, "  %-14s %s\n", e.name.c_str(), e.help.c_str());
    }
    std::fprintf(out, "\nany other command is passed to git unchanged\n");
}

Dispatcher make_dispatcher() {
    Dispatcher d;
    d.add("clone", cmd_clone, "clone through the shared cache of the URL's domain");
    d.add("fetch", [](Context& ctx, const std::vector<std::string>& args) {
        return cmd_fetch(ctx, "fetch", args);
    }, "refresh the shared cache, then git fetch");
    d.add("pull", [](Context& ctx, const std::vector<std::string>& args) {
        return cmd_fetch(ctx, "pull", args);
    }, "refresh the shared cache, then git pull");
    d.add("cache-attach", cmd_attach, "borrow objects from the shared cache");
    d.add("cache-detach", cmd_detach, "stop borrowing objects from the shared cache");
    d.add("cache-repair", cmd_repair, "detach, then attach again");
    d.add("cache", cmd_cache, "<@domain> <git-command>: run git inside a cache");
    d.add("cache-status", cmd_status, "show this working copy's cache wiring");
    d.add("cache-list", cmd_list, "list shared caches and their projects");
    return d;
}

} // namespace gitcache
