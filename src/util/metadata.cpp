#include <gitcache/metadata.hpp>
#include <gitcache/log.hpp>

#include <filesystem>

namespace gitcache {

Result<std::string> get_cache_directory(GitCli& git, const WorkingCopy& wc) {
    return git.config_get(wc.repo_arg(), kDirectoryKey);
}

Result<std::string> get_project(GitCli& git, const WorkingCopy& wc) {
    return git.config_get(wc.repo_arg(), kProjectKey);
}

Result<CacheEntry> read_metadata(GitCli& git, const WorkingCopy& wc) {
    CacheEntry entry;

    auto dir = get_cache_directory(git, wc);
    if (dir.is_err()) return std::move(dir).error();
    entry.directory = std::move(dir).value();

    auto project = get_project(git, wc);
    if (project.is_err()) return std::move(project).error();
    entry.project = std::move(project).value();

    auto key = git.config_get(wc.repo_arg(), kRepositoryKey);
    if (key.is_err()) return std::move(key).error();
    entry.key = std::move(key).value();

    if (entry.key.empty() && !entry.directory.empty()) {
        entry.key = std::filesystem::path(entry.directory).filename().string();
    }

    return Result<CacheEntry>::ok(std::move(entry));
}

Status write_metadata(GitCli& git, const WorkingCopy& wc, const CacheEntry& entry) {
    log::debug("recording cache %s (%s) in %s",
               entry.key.c_str(), entry.project.c_str(), wc.worktree.c_str());
    GITCACHE_TRY(git.config_set(wc.repo_arg(), kProjectKey, entry.project));
    GITCACHE_TRY(git.config_set(wc.repo_arg(), kRepositoryKey, entry.key));
    GITCACHE_TRY(git.config_set(wc.repo_arg(), kDirectoryKey, entry.directory));
    return ok_status();
}

Status clear_metadata(GitCli& git, const WorkingCopy& wc) {
    for (const char* key : {kProjectKey, kRepositoryKey, kDirectoryKey}) {
        GITCACHE_TRY(git.config_unset(wc.repo_arg(), key));
    }
    return ok_status();
}

} // namespace gitcache
