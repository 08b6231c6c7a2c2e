#pragma once

#include <gitcache/git.hpp>
#include <gitcache/repo.hpp>
#include <gitcache/result.hpp>
#include <string>

namespace gitcache {

// Config keys recorded in a participating working copy's local config
inline constexpr const char* kProjectKey = "gitcache.project";
inline constexpr const char* kRepositoryKey = "gitcache.repository";
inline constexpr const char* kDirectoryKey = "gitcache.directory";

// What ties a working copy to a shared cache
struct CacheEntry {
    std::string project;     // project remote inside the shared cache
    std::string key;         // cache key, "@<domain>"
    std::string directory;   // shared cache directory

    // A working copy participates iff the directory is known
    bool is_cached() const { return !directory.empty(); }
};

// Read all three keys; unset keys come back empty. When the key itself
// is unset it is derived from the directory's basename.
Result<CacheEntry> read_metadata(GitCli& git, const WorkingCopy& wc);

Result<std::string> get_cache_directory(GitCli& git, const WorkingCopy& wc);
Result<std::string> get_project(GitCli& git, const WorkingCopy& wc);

// Replace the three keys with `entry`
Status write_metadata(GitCli& git, const WorkingCopy& wc, const CacheEntry& entry);

// Remove the three keys
Status clear_metadata(GitCli& git, const WorkingCopy& wc);

} // namespace gitcache
