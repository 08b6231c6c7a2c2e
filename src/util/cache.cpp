#include <gitcache/cache.hpp>
#include <gitcache/cleanup.hpp>
#include <gitcache/log.hpp>

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace gitcache {

CacheManager::CacheManager(const std::string& cache_root, GitCli git)
    : git_(std::move(git)) {
    std::error_code ec;
    fs::path abs = fs::absolute(cache_root, ec);
    cache_root_ = ec ? cache_root : abs.lexically_normal().string();
    while (cache_root_.size() > 1 && cache_root_.back() == '/') cache_root_.pop_back();
}

std::string CacheManager::cache_key(const std::string& domain) {
    return "@" + domain;
}

std::string CacheManager::cache_dir(const std::string& domain) const {
    return cache_root_ + "/" + cache_key(domain);
}

std::string CacheManager::named_dir(const std::string& name) const {
    return cache_root_ + "/" + name;
}

static void remove_partial_cache(const std::string& dir) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        log::warn("could not remove partial cache %s: %s",
                  dir.c_str(), ec.message().c_str());
    } else {
        log::debug("removed partial cache %s", dir.c_str());
    }
}

Status CacheManager::create_cache_dir(const std::string& dir) {
    log::info("creating shared cache %s", dir.c_str());

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return GitcacheError{GitcacheError::IO,
            "cannot create cache directory " + dir + ": " + ec.message()};
    }

    ScopedCleanup cleanup([&dir]() { remove_partial_cache(dir); });

    GITCACHE_TRY(git_.init_bare(dir));

    // A signal may land after git exited but before we return
    if (int sig = pending_signal()) return GitcacheError::interrupted(sig);

    cleanup.dismiss();
    return ok_status();
}

Status CacheManager::bootstrap_project(const std::string& dir, const RepoUrl& url) {
    log::info("caching %s as '%s' in %s",
              url.address.c_str(), url.project.c_str(), dir.c_str());

    auto tmp = TempDir::create("git-cache-" + url.project);
    if (tmp.is_err()) return std::move(tmp).error();
    std::string staging = (tmp.value().path() / (url.project + ".git")).string();

    GITCACHE_TRY(git_.clone_bare(url.address, staging));

    // Until the final fetch succeeds the remote must not survive, or a
    // later run would take the half-registered remote as cached
    GITCACHE_TRY(git_.remote_add(dir, url.project, staging, /*no_tags=*/true));
    ScopedCleanup unregister([this, &dir, &url]() {
        SignalPause pause;
        auto r = git_.remote_remove(dir, url.project);
        if (r.is_err()) {
            log::warn("could not unregister '%s': %s",
                      url.project.c_str(), r.error().message.c_str());
        }
    });

    GITCACHE_TRY(git_.fetch_remote(dir, url.project, false));
    GITCACHE_TRY(git_.remote_set_url(dir, url.project, url.address));
    GITCACHE_TRY(git_.fetch_remote(dir, url.project, false));

    if (int sig = pending_signal()) return GitcacheError::interrupted(sig);

    unregister.dismiss();
    return ok_status();
}

Result<bool> CacheManager::has_project(const std::string& dir, const std::string& project) {
    auto names = git_.remote_names(dir);
    if (names.is_err()) return std::move(names).error();

    const auto& v = names.value();
    return Result<bool>::ok(std::find(v.begin(), v.end(), project) != v.end());
}

Result<CacheEntry> CacheManager::ensure(const RepoUrl& url) {
    CacheEntry entry;
    entry.project = url.project;
    entry.key = cache_key(url.domain);
    entry.directory = cache_dir(url.domain);

    // Signals become Interrupted errors so cleanups below always run
    SignalGuard guard;

    // A cache created here is only kept once its first project is in
    bool created = false;
    ScopedCleanup discard([&entry, &created]() {
        if (created) remove_partial_cache(entry.directory);
    });

    std::error_code ec;
    if (!fs::exists(entry.directory, ec)) {
        GITCACHE_TRY(create_cache_dir(entry.directory));
        created = true;
    }

    auto known = has_project(entry.directory, entry.project);
    if (known.is_err()) return std::move(known).error();

    if (known.value()) {
        log::debug("project '%s' already cached in %s",
                   entry.project.c_str(), entry.directory.c_str());
    } else {
        GITCACHE_TRY(bootstrap_project(entry.directory, url));
    }

    discard.dismiss();
    return Result<CacheEntry>::ok(std::move(entry));
}

Result<CacheEntry> CacheManager::ensure_from(const std::vector<std::string>& args) {
    auto url = RepoUrl::find_in(args);
    if (url.is_err()) return std::move(url).error();
    return ensure(url.value());
}

Result<CacheEntry> CacheManager::initialize(const std::vector<std::string>& args,
                                            const WorkingCopy& wc) {
    auto entry = ensure_from(args);
    if (entry.is_err()) return entry;
    GITCACHE_TRY(write_metadata(git_, wc, entry.value()));
    return entry;
}

Status CacheManager::refresh(const CacheEntry& entry) {
    log::info("updating shared cache %s (%s)", entry.key.c_str(), entry.project.c_str());
    GITCACHE_TRY(git_.fetch_remote(entry.directory, entry.project, /*append=*/true));

    auto gc = git_.gc_auto(entry.directory);
    if (gc.is_err()) {
        log::warn("gc --auto in %s failed: %s",
                  entry.directory.c_str(), gc.error().message.c_str());
    }
    return ok_status();
}

Result<std::vector<CacheListing>> CacheManager::list() {
    std::vector<CacheListing> caches;

    std::error_code ec;
    if (!fs::is_directory(cache_root_, ec)) {
        return Result<std::vector<CacheListing>>::ok(std::move(caches));
    }

    for (const auto& entry : fs::directory_iterator(cache_root_, ec)) {
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] != '@') continue;
        std::error_code dir_ec;
        if (!entry.is_directory(dir_ec)) continue;

        CacheListing listing;
        listing.key = name;
        listing.directory = entry.path().string();

        auto remotes = git_.remote_names(listing.directory);
        if (remotes.is_err()) return std::move(remotes).error();
        listing.projects = std::move(remotes).value();
        std::sort(listing.projects.begin(), listing.projects.end());

        caches.push_back(std::move(listing));
    }
    if (ec) {
        return GitcacheError{GitcacheError::IO,
            "cannot list " + cache_root_ + ": " + ec.message()};
    }

    std::sort(caches.begin(), caches.end(),
              [](const CacheListing& a, const CacheListing& b) { return a.key < b.key; });
    return Result<std::vector<CacheListing>>::ok(std::move(caches));
}

} // namespace gitcache
