#include <gitcache/commands.hpp>
#include <gitcache/alternates.hpp>
#include <gitcache/log.hpp>
#include <gitcache/metadata.hpp>
#include <gitcache/repo.hpp>

#include <ctime>
#include <iostream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace gitcache {

Context::Context(Settings s, fs::path invoked_from)
    : settings(std::move(s)),
      cache(settings.cache_root, GitCli(settings.git_program)),
      cwd(std::move(invoked_from)) {
    cache.git().set_timeout(settings.command_timeout);
}

static std::vector<std::string> concat(std::vector<std::string> head,
                                       const std::vector<std::string>& tail) {
    head.insert(head.end(), tail.begin(), tail.end());
    return head;
}

static std::string objects_dir(const std::string& cache_dir) {
    return cache_dir + "/objects";
}

// ---------------------------------------------------------------------------
// clone
// ---------------------------------------------------------------------------

std::string clone_destination(const std::vector<std::string>& args, const RepoUrl& url) {
    // Options of `git clone` that consume the following argument
    static const std::unordered_set<std::string> with_value = {
        "-b", "--branch", "-o", "--origin", "-c", "--config", "-u", "--upload-pack",
        "-j", "--jobs", "--depth", "--reference", "--reference-if-able",
        "--separate-git-dir", "--template", "--shallow-since", "--shallow-exclude",
        "--filter", "--server-option", "--bundle-uri", "--revision",
    };

    bool bare = false;
    bool seen_url = false;
    bool options_done = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (!options_done && a == "--") {
            options_done = true;
            continue;
        }
        if (!options_done && !a.empty() && a[0] == '-') {
            if (a == "--bare" || a == "--mirror") bare = true;
            if (with_value.count(a)) ++i;
            continue;
        }
        if (!seen_url) {
            seen_url = a == url.address || RepoUrl::parse(a).is_ok();
            continue;
        }
        return a;
    }
    return bare ? url.project + ".git" : url.project;
}

Result<int> cmd_clone(Context& ctx, const std::vector<std::string>& args) {
    auto url = RepoUrl::find_in(args);
    if (url.is_err()) return std::move(url).error();

    auto entry = ctx.cache.ensure(url.value());
    if (entry.is_err()) return std::move(entry).error();

    auto code = ctx.git().passthrough(
        concat({"clone", "--reference", entry.value().directory}, args),
        ctx.cwd.string());
    if (code.is_err()) return code;
    if (code.value() != 0) return code;

    fs::path dest = ctx.cwd / clone_destination(args, url.value());
    auto wc = WorkingCopy::open(ctx.git(), dest);
    if (wc.is_err()) return std::move(wc).error();
    GITCACHE_TRY(write_metadata(ctx.git(), wc.value(), entry.value()));

    return Result<int>::ok(0);
}

// ---------------------------------------------------------------------------
// fetch / pull
// ---------------------------------------------------------------------------

Result<int> cmd_fetch(Context& ctx, const std::string& verb,
                      const std::vector<std::string>& args) {
    auto wc = WorkingCopy::open(ctx.git(), ctx.cwd);
    if (wc.is_ok()) {
        auto meta = read_metadata(ctx.git(), wc.value());
        if (meta.is_err()) return std::move(meta).error();

        const CacheEntry& entry = meta.value();
        if (entry.is_cached() && !entry.project.empty()) {
            GITCACHE_TRY(ctx.cache.refresh(entry));
        }
    } else {
        // git itself reports the missing repository below
        log::debug("no working copy at %s: %s",
                   ctx.cwd.c_str(), wc.error().message.c_str());
    }

    return ctx.git().passthrough(concat({verb}, args), ctx.cwd.string());
}

// ---------------------------------------------------------------------------
// attach / detach / repair
// ---------------------------------------------------------------------------

Result<int> cmd_attach(Context& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) {
        log::warn("cache-attach takes no arguments, ignoring %zu", args.size());
    }

    auto wc = WorkingCopy::open(ctx.git(), ctx.cwd);
    if (wc.is_err()) return std::move(wc).error();

    auto meta = read_metadata(ctx.git(), wc.value());
    if (meta.is_err()) return std::move(meta).error();
    if (meta.value().is_cached()) {
        log::info("already attached to %s", meta.value().directory.c_str());
        return Result<int>::ok(0);
    }

    auto remote_url = ctx.git().remote_get_url(wc.value().repo_arg(),
                                               ctx.settings.default_remote);
    if (remote_url.is_err()) return std::move(remote_url).error();

    auto entry = ctx.cache.initialize({remote_url.value()}, wc.value());
    if (entry.is_err()) return std::move(entry).error();

    auto appended = append_alternate(wc.value(), objects_dir(entry.value().directory));
    if (appended.is_err()) return std::move(appended).error();

    // Shed objects the cache now provides
    GITCACHE_TRY(ctx.git().gc(wc.value().repo_arg()));

    log::info("attached %s to %s",
              wc.value().worktree.c_str(), entry.value().directory.c_str());
    return Result<int>::ok(0);
}

Result<int> cmd_detach(Context& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) {
        log::warn("cache-detach takes no arguments, ignoring %zu", args.size());
    }

    auto wc = WorkingCopy::open(ctx.git(), ctx.cwd);
    if (wc.is_err()) return std::move(wc).error();

    auto meta = read_metadata(ctx.git(), wc.value());
    if (meta.is_err()) return std::move(meta).error();
    if (!meta.value().is_cached()) {
        log::info("nothing to detach");
        return Result<int>::ok(0);
    }

    // Copy every borrowed object locally before the link goes away
    GITCACHE_TRY(ctx.git().repack_full(wc.value().repo_arg()));

    auto blanked = blank_alternate(wc.value(), objects_dir(meta.value().directory),
                                   static_cast<int64_t>(std::time(nullptr)));
    if (blanked.is_err()) return std::move(blanked).error();

    GITCACHE_TRY(clear_metadata(ctx.git(), wc.value()));

    log::info("detached %s from %s",
              wc.value().worktree.c_str(), meta.value().directory.c_str());
    return Result<int>::ok(0);
}

Result<int> cmd_repair(Context& ctx, const std::vector<std::string>& args) {
    auto detached = cmd_detach(ctx, args);
    if (detached.is_err()) return detached;
    return cmd_attach(ctx, args);
}

// ---------------------------------------------------------------------------
// direct cache access
// ---------------------------------------------------------------------------

Result<int> cmd_cache(Context& ctx, const std::vector<std::string>& args) {
    if (args.empty()) {
        return GitcacheError{GitcacheError::InvalidArg,
            "missing cache name",
            "usage: git-cache cache <@domain> <git-command> [args...]"};
    }

    std::string dir = ctx.cache.named_dir(args[0]);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        log::info("no cache named '%s' under %s",
                  args[0].c_str(), ctx.cache.cache_root().c_str());
        return Result<int>::ok(0);
    }

    if (args.size() < 2) {
        return GitcacheError{GitcacheError::InvalidArg,
            "missing git command for cache '" + args[0] + "'",
            "usage: git-cache cache <@domain> <git-command> [args...]"};
    }

    std::vector<std::string> rest(args.begin() + 1, args.end());
    return ctx.git().passthrough(rest, dir);
}

// ---------------------------------------------------------------------------
// status / list
// ---------------------------------------------------------------------------

Result<int> cmd_status(Context& ctx, const std::vector<std::string>&) {
    auto wc = WorkingCopy::open(ctx.git(), ctx.cwd);
    if (wc.is_err()) return std::move(wc).error();

    auto meta = read_metadata(ctx.git(), wc.value());
    if (meta.is_err()) return std::move(meta).error();

    const CacheEntry& entry = meta.value();
    if (!entry.is_cached()) {
        std::cout << "not attached\n";
        return Result<int>::ok(0);
    }

    auto live = count_alternate(wc.value(), objects_dir(entry.directory));
    if (live.is_err()) return std::move(live).error();

    std::cout << "attached\n"
              << "  project:    " << entry.project << "\n"
              << "  repository: " << entry.key << "\n"
              << "  directory:  " << entry.directory << "\n"
              << "  alternates: " << live.value() << "\n";
    return Result<int>::ok(0);
}

Result<int> cmd_list(Context& ctx, const std::vector<std::string>&) {
    auto caches = ctx.cache.list();
    if (caches.is_err()) return std::move(caches).error();

    for (const auto& c : caches.value()) {
        std::cout << c.key << "\t" << c.directory << "\n";
        for (const auto& p : c.projects) {
            std::cout << "  " << p << "\n";
        }
    }
    return Result<int>::ok(0);
}

} // namespace gitcache
