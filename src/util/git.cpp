#include <gitcache/git.hpp>
#include <gitcache/cleanup.hpp>
#include <gitcache/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gitcache {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

static std::string join_args(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return GitcacheError{GitcacheError::InvalidArg, "run_command: empty args"};
    }

    // Build argv for execvp
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        return GitcacheError{GitcacheError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return GitcacheError{GitcacheError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return GitcacheError{GitcacheError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        // Never let a captured git block on a credential or pager prompt
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (!working_dir.empty()) {
            if (chdir(working_dir.c_str()) != 0) {
                _exit(127);
            }
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);  // execvp failed
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    char buf[4096];
    auto start = std::chrono::steady_clock::now();

    auto drain = [&]() {
        ssize_t n;
        while ((n = read(stdout_pipe[0], buf, sizeof(buf))) > 0) {
            out_buf.append(buf, static_cast<size_t>(n));
        }
        while ((n = read(stderr_pipe[0], buf, sizeof(buf))) > 0) {
            err_buf.append(buf, static_cast<size_t>(n));
        }
    };
    auto close_pipes = [&]() {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
    };

    for (;;) {
        if (int sig = pending_signal()) {
            kill(pid, SIGTERM);
            waitpid(pid, nullptr, 0);
            close_pipes();
            return GitcacheError::interrupted(sig);
        }

        if (timeout_seconds > 0) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                    >= timeout_seconds) {
                kill(pid, SIGKILL);
                waitpid(pid, nullptr, 0);
                close_pipes();
                return GitcacheError{GitcacheError::IO,
                    "command timed out after " + std::to_string(timeout_seconds) + "s: "
                        + join_args(args),
                    "raise [git] timeout in the config file"};
            }
        }

        drain();

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain();
            close_pipes();
            return Result<CommandResult>::ok(
                CommandResult{decode_status(status), std::move(out_buf), std::move(err_buf)});
        } else if (w < 0 && errno != EINTR) {
            close_pipes();
            return GitcacheError{GitcacheError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        usleep(1000);  // 1ms
    }
}

Result<int> run_interactive(const std::vector<std::string>& args,
                            const std::string& working_dir) {
    if (args.empty()) {
        return GitcacheError{GitcacheError::InvalidArg, "run_interactive: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    // Keep our own buffered output ahead of the child's
    std::fflush(stdout);
    std::fflush(stderr);

    pid_t pid = fork();
    if (pid < 0) {
        return GitcacheError{GitcacheError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    for (;;) {
        if (int sig = pending_signal()) {
            kill(pid, SIGTERM);
            waitpid(pid, nullptr, 0);
            return GitcacheError::interrupted(sig);
        }

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            return Result<int>::ok(decode_status(status));
        } else if (w < 0 && errno != EINTR) {
            return GitcacheError{GitcacheError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        usleep(1000);
    }
}

std::string trim_output(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

Result<CommandResult> GitCli::run(const std::vector<std::string>& args) {
    std::vector<std::string> full;
    full.reserve(args.size() + 1);
    full.push_back(program_);
    full.insert(full.end(), args.begin(), args.end());

    log::debug("%s", join_args(full).c_str());
    return run_command(full, "", timeout_seconds_);
}

Result<CommandResult> GitCli::run_checked(const std::vector<std::string>& args,
                                          const std::string& what) {
    auto r = run(args);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        std::string detail = trim_output(cmd.stderr_str);
        if (detail.empty()) detail = "exit status " + std::to_string(cmd.exit_code);
        return GitcacheError{GitcacheError::Command,
            what + " failed: " + detail};
    }
    return r;
}

Result<std::string> GitCli::version() {
    auto r = run_checked({"--version"}, "git --version");
    if (r.is_err()) {
        return GitcacheError{GitcacheError::NotFound,
            "git not found or failed: " + r.error().message,
            "install git or set [git] program in the config file"};
    }

    std::string out = trim_output(r.value().stdout_str);
    auto pos = out.find("git version ");
    if (pos == std::string::npos) {
        return GitcacheError{GitcacheError::Parse,
            "unexpected git --version output: " + out};
    }
    return Result<std::string>::ok(out.substr(pos + 12));
}

Status GitCli::init_bare(const std::string& dest) {
    GITCACHE_TRY(run_checked({"init", "--quiet", "--bare", dest}, "git init --bare"));
    return ok_status();
}

Status GitCli::clone_bare(const std::string& url, const std::string& dest) {
    GITCACHE_TRY(run_checked({"clone", "--quiet", "--bare", url, dest},
                             "git clone --bare " + url));
    return ok_status();
}

Result<std::vector<std::string>> GitCli::remote_names(const std::string& repo) {
    auto r = run_checked({"-C", repo, "remote"}, "git remote");
    if (r.is_err()) return std::move(r).error();

    std::vector<std::string> names;
    std::istringstream stream(r.value().stdout_str);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim_output(line);
        if (!line.empty()) names.push_back(line);
    }
    return Result<std::vector<std::string>>::ok(std::move(names));
}

Status GitCli::remote_add(const std::string& repo, const std::string& name,
                          const std::string& url, bool no_tags) {
    std::vector<std::string> args = {"-C", repo, "remote", "add"};
    if (no_tags) args.push_back("--no-tags");
    args.push_back(name);
    args.push_back(url);
    GITCACHE_TRY(run_checked(args, "git remote add " + name));
    return ok_status();
}

Status GitCli::remote_remove(const std::string& repo, const std::string& name) {
    GITCACHE_TRY(run_checked({"-C", repo, "remote", "remove", name},
                             "git remote remove " + name));
    return ok_status();
}

Status GitCli::remote_set_url(const std::string& repo, const std::string& name,
                              const std::string& url) {
    GITCACHE_TRY(run_checked({"-C", repo, "remote", "set-url", name, url},
                             "git remote set-url " + name));
    return ok_status();
}

Result<std::string> GitCli::remote_get_url(const std::string& repo, const std::string& name) {
    // Read the configured value; `remote get-url` would apply insteadOf
    auto r = run({"-C", repo, "config", "--get", "remote." + name + ".url"});
    if (r.is_err()) return std::move(r).error();

    if (r.value().exit_code != 0) {
        return GitcacheError{GitcacheError::NotFound,
            "no remote named '" + name + "' in " + repo,
            "set [cache] remote in the config file to the remote to cache"};
    }
    return Result<std::string>::ok(trim_output(r.value().stdout_str));
}

Status GitCli::fetch_remote(const std::string& repo, const std::string& remote, bool append) {
    std::vector<std::string> args = {"-C", repo, "fetch", "--quiet"};
    if (append) args.push_back("--append");
    args.push_back(remote);
    GITCACHE_TRY(run_checked(args, "git fetch " + remote));
    return ok_status();
}

Status GitCli::gc(const std::string& repo) {
    GITCACHE_TRY(run_checked({"-C", repo, "gc", "--quiet"}, "git gc"));
    return ok_status();
}

Status GitCli::gc_auto(const std::string& repo) {
    GITCACHE_TRY(run_checked({"-C", repo, "gc", "--auto", "--quiet"}, "git gc --auto"));
    return ok_status();
}

Status GitCli::repack_full(const std::string& repo) {
    GITCACHE_TRY(run_checked({"-C", repo, "repack", "-a", "-d", "-f", "-F", "-q"},
                             "git repack"));
    return ok_status();
}

Result<std::string> GitCli::config_get(const std::string& repo, const std::string& key) {
    auto r = run({"-C", repo, "config", "--local", "--get", key});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    // Exit status 1 means the key is not set
    if (cmd.exit_code == 1) return Result<std::string>::ok("");
    if (cmd.exit_code != 0) {
        return GitcacheError{GitcacheError::Command,
            "git config --get " + key + " failed: " + trim_output(cmd.stderr_str)};
    }
    return Result<std::string>::ok(trim_output(cmd.stdout_str));
}

Status GitCli::config_set(const std::string& repo, const std::string& key,
                          const std::string& value) {
    GITCACHE_TRY(run_checked({"-C", repo, "config", "--local", key, value},
                             "git config " + key));
    return ok_status();
}

Status GitCli::config_unset(const std::string& repo, const std::string& key) {
    auto r = run({"-C", repo, "config", "--local", "--unset-all", key});
    if (r.is_err()) return std::move(r).error();

    // Exit status 5 means there was nothing to unset
    int code = r.value().exit_code;
    if (code != 0 && code != 5) {
        return GitcacheError{GitcacheError::Command,
            "git config --unset-all " + key + " failed: "
                + trim_output(r.value().stderr_str)};
    }
    return ok_status();
}

Result<std::string> GitCli::absolute_git_dir(const std::string& path) {
    auto r = run({"-C", path, "rev-parse", "--absolute-git-dir"});
    if (r.is_err()) return std::move(r).error();

    if (r.value().exit_code != 0) {
        return GitcacheError{GitcacheError::NotFound,
            "not a git repository: " + path,
            "run this inside a working copy"};
    }
    return Result<std::string>::ok(trim_output(r.value().stdout_str));
}

Result<int> GitCli::passthrough(const std::vector<std::string>& args,
                                const std::string& working_dir) {
    std::vector<std::string> full;
    full.reserve(args.size() + 1);
    full.push_back(program_);
    full.insert(full.end(), args.begin(), args.end());

    log::debug("exec %s", join_args(full).c_str());
    return run_interactive(full, working_dir);
}

} // namespace gitcache
