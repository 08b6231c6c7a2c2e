#pragma once

#include <gitcache/result.hpp>
#include <string>
#include <vector>

namespace gitcache {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// A non-positive timeout waits indefinitely.
// Returns error on fork/exec failure, timeout, or a signal recorded by
// an active SignalGuard.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 0);

// Run an external command with inherited stdin/stdout/stderr and return
// its exit status. Exit statuses of signalled children follow the shell
// convention of 128 + signal.
Result<int> run_interactive(const std::vector<std::string>& args,
                            const std::string& working_dir = "");

// Strip trailing newlines from captured command output
std::string trim_output(std::string s);

// Wrapper around the git CLI. Every repository-scoped call names its
// repository explicitly and runs as `git -C <repo> ...`.
class GitCli {
public:
    GitCli() = default;
    explicit GitCli(std::string program) : program_(std::move(program)) {}

    // "git version X.Y.Z" -> "X.Y.Z"
    Result<std::string> version();

    // `git init --bare <dest>`
    Status init_bare(const std::string& dest);

    // `git clone --bare <url> <dest>`
    Status clone_bare(const std::string& url, const std::string& dest);

    // `git -C <repo> remote`, one name per element
    Result<std::vector<std::string>> remote_names(const std::string& repo);

    // `git -C <repo> remote add [--no-tags] <name> <url>`
    Status remote_add(const std::string& repo, const std::string& name,
                      const std::string& url, bool no_tags);

    // `git -C <repo> remote remove <name>`
    Status remote_remove(const std::string& repo, const std::string& name);

    // `git -C <repo> remote set-url <name> <url>`
    Status remote_set_url(const std::string& repo, const std::string& name,
                          const std::string& url);

    // Configured URL of remote <name>, without insteadOf rewriting
    Result<std::string> remote_get_url(const std::string& repo, const std::string& name);

    // `git -C <repo> fetch [--append] <remote>`
    Status fetch_remote(const std::string& repo, const std::string& remote, bool append);

    // `git -C <repo> gc`
    Status gc(const std::string& repo);

    // `git -C <repo> gc --auto`
    Status gc_auto(const std::string& repo);

    // `git -C <repo> repack -a -d -f -F`: copy every reachable object,
    // including ones borrowed through alternates, into one local pack and
    // drop redundant packs and loose objects
    Status repack_full(const std::string& repo);

    // `git -C <repo> config --local --get <key>`; an unset key yields ""
    Result<std::string> config_get(const std::string& repo, const std::string& key);

    // `git -C <repo> config --local <key> <value>`
    Status config_set(const std::string& repo, const std::string& key,
                      const std::string& value);

    // `git -C <repo> config --local --unset-all <key>`; an unset key is fine
    Status config_unset(const std::string& repo, const std::string& key);

    // `git -C <path> rev-parse --absolute-git-dir`
    Result<std::string> absolute_git_dir(const std::string& path);

    // Run `git <args...>` in `working_dir` with inherited stdio
    Result<int> passthrough(const std::vector<std::string>& args,
                            const std::string& working_dir = "");

    const std::string& program() const { return program_; }
    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    int timeout() const { return timeout_seconds_; }

private:
    // Run git capturing output; non-zero exit becomes a Command error
    Result<CommandResult> run_checked(const std::vector<std::string>& args,
                                      const std::string& what);
    Result<CommandResult> run(const std::vector<std::string>& args);

    std::string program_ = "git";
    int timeout_seconds_ = 0;
};

} // namespace gitcache
