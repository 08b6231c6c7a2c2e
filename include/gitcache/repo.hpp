#pragma once

#include <gitcache/git.hpp>
#include <gitcache/result.hpp>
#include <filesystem>

namespace gitcache {

// Handle to a working copy (or bare repository) on disk. Operations take
// a handle instead of relying on the process's current directory.
struct WorkingCopy {
    std::filesystem::path worktree;  // directory git was pointed at
    std::filesystem::path git_dir;   // absolute .git directory

    // Resolve `path` through `git rev-parse --absolute-git-dir`
    static Result<WorkingCopy> open(GitCli& git, const std::filesystem::path& path);

    // <git_dir>/objects/info/alternates
    std::filesystem::path alternates_path() const;

    // Path handed to `git -C`
    std::string repo_arg() const { return worktree.string(); }
};

} // namespace gitcache
