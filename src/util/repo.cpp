#include <gitcache/repo.hpp>

namespace fs = std::filesystem;

namespace gitcache {

Result<WorkingCopy> WorkingCopy::open(GitCli& git, const fs::path& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) {
        return GitcacheError{GitcacheError::IO,
            "cannot resolve path " + path.string() + ": " + ec.message()};
    }
    if (!fs::is_directory(abs, ec)) {
        return GitcacheError{GitcacheError::NotFound,
            "not a directory: " + abs.string()};
    }

    auto git_dir = git.absolute_git_dir(abs.string());
    if (git_dir.is_err()) return std::move(git_dir).error();

    WorkingCopy wc;
    wc.worktree = abs.lexically_normal();
    wc.git_dir = fs::path(git_dir.value());
    return Result<WorkingCopy>::ok(std::move(wc));
}

fs::path WorkingCopy::alternates_path() const {
    return git_dir / "objects" / "info" / "alternates";
}

} // namespace gitcache
