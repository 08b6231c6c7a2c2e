#pragma once

#include <gitcache/git.hpp>
#include <gitcache/metadata.hpp>
#include <gitcache/repo.hpp>
#include <gitcache/result.hpp>
#include <gitcache/url.hpp>
#include <string>
#include <vector>

namespace gitcache {

// One shared cache directory as found on disk
struct CacheListing {
    std::string key;
    std::string directory;
    std::vector<std::string> projects;
};

// Per-domain shared bare repositories
//
// Layout:
//   <root>/@<domain>/             bare repo, one remote per project
//   <root>/@<domain>/objects/     borrowed by attached working copies
class CacheManager {
public:
    CacheManager(const std::string& cache_root, GitCli git);

    // "@<domain>"
    static std::string cache_key(const std::string& domain);

    // <root>/@<domain>. Pure: no normalization of the domain.
    std::string cache_dir(const std::string& domain) const;

    // <root>/<name>, for addressing a cache by its key directly
    std::string named_dir(const std::string& name) const;

    // Make sure the domain's shared cache exists and holds a fetched
    // remote for the URL's project
    Result<CacheEntry> ensure(const RepoUrl& url);

    // ensure() for the first URL found among `args`
    Result<CacheEntry> ensure_from(const std::vector<std::string>& args);

    // ensure_from(), then record the entry in `wc`'s local config
    Result<CacheEntry> initialize(const std::vector<std::string>& args,
                                  const WorkingCopy& wc);

    // Fetch the project's remote into the shared cache (appending to
    // FETCH_HEAD), then a best-effort `gc --auto` of the cache
    Status refresh(const CacheEntry& entry);

    // True if `project` is registered as a remote of the cache at `dir`
    Result<bool> has_project(const std::string& dir, const std::string& project);

    // Every @-prefixed cache directory under the root, sorted by key
    Result<std::vector<CacheListing>> list();

    GitCli& git() { return git_; }
    const std::string& cache_root() const { return cache_root_; }

private:
    // Create and `git init --bare` a cache directory. The directory is
    // removed again if anything fails or a signal arrives.
    Status create_cache_dir(const std::string& dir);

    // Register `url` as remote `project` of the cache at `dir` and fetch it
    Status bootstrap_project(const std::string& dir, const RepoUrl& url);

    std::string cache_root_;
    GitCli git_;
};

} // namespace gitcache
