#include <catch2/catch.hpp>
#include <gitcache/cleanup.hpp>
#include <gitcache/git.hpp>
#include "test_support.hpp"

#include <cctype>
#include <csignal>

using namespace gitcache;

// ===== run_command() =====

TEST_CASE("run_command echo", "[git]") {
    auto r = run_command({"echo", "hello"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 0);
    REQUIRE(r.value().stdout_str == "hello\n");
}

TEST_CASE("run_command false returns nonzero", "[git]") {
    auto r = run_command({"false"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code != 0);
}

TEST_CASE("run_command captures stderr", "[git]") {
    auto r = run_command({"sh", "-c", "echo err >&2; exit 3"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 3);
    REQUIRE(r.value().stderr_str.find("err") != std::string::npos);
}

TEST_CASE("run_command empty args error", "[git]") {
    auto r = run_command({});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == GitcacheError::InvalidArg);
}

TEST_CASE("run_command with working dir", "[git]") {
    auto r = run_command({"pwd"}, "/tmp");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str.find("tmp") != std::string::npos);
}

TEST_CASE("run_command nonexistent binary", "[git]") {
    auto r = run_command({"__gitcache_nonexistent_binary__"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 127);
}

TEST_CASE("run_command times out", "[git]") {
    auto r = run_command({"sleep", "5"}, "", 1);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("timed out") != std::string::npos);
}

TEST_CASE("run_command stops on a recorded signal", "[git]") {
    set_pending_signal(SIGTERM);
    auto r = run_command({"sleep", "5"});
    clear_pending_signal();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == GitcacheError::Interrupted);
    REQUIRE(r.error().signal == SIGTERM);
}

// ===== run_interactive() =====

TEST_CASE("run_interactive returns the exit status", "[git]") {
    auto r = run_interactive({"sh", "-c", "exit 7"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == 7);
}

TEST_CASE("run_interactive reports signalled children as 128+N", "[git]") {
    auto r = run_interactive({"sh", "-c", "kill -TERM $$"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == 128 + SIGTERM);
}

TEST_CASE("run_interactive honours the working dir", "[git]") {
    ScratchDir td;
    auto r = run_interactive({"sh", "-c", "touch marker"}, td.path.string());
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == 0);
    REQUIRE(fs::exists(td.path / "marker"));
}

TEST_CASE("trim_output strips trailing newlines only", "[git]") {
    REQUIRE(trim_output("abc\r\n\n") == "abc");
    REQUIRE(trim_output(" abc ") == " abc ");
    REQUIRE(trim_output("") == "");
}

// ===== GitCli =====

TEST_CASE("GitCli reports a missing program", "[git]") {
    GitCli git("__gitcache_no_such_git__");
    auto r = git.version();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == GitcacheError::NotFound);
}

TEST_CASE("GitCli version", "[git][integration]") {
    if (!git_available()) { WARN("git not available"); return; }
    GitCli git;
    auto r = git.version();
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().empty());
    REQUIRE(std::isdigit(static_cast<unsigned char>(r.value()[0])));
}

TEST_CASE("GitCli config get/set/unset", "[git][integration]") {
    if (!git_available()) { WARN("git not available"); return; }
    GitSandbox sb;
    GitCli git;
    std::string repo = (sb.work / "repo").string();
    REQUIRE(git_ok({"init", "-q", repo}));

    auto unset = git.config_get(repo, "gitcache.project");
    REQUIRE(unset.is_ok());
    REQUIRE(unset.value().empty());

    REQUIRE(git.config_set(repo, "gitcache.project", "proj").is_ok());
    REQUIRE(git.config_get(repo, "gitcache.project").value() == "proj");

    REQUIRE(git.config_unset(repo, "gitcache.project").is_ok());
    REQUIRE(git.config_get(repo, "gitcache.project").value().empty());

    // Unsetting again is not an error
    REQUIRE(git.config_unset(repo, "gitcache.project").is_ok());
}

TEST_CASE("GitCli remotes in a bare repo", "[git][integration]") {
    if (!git_available()) { WARN("git not available"); return; }
    GitSandbox sb;
    GitCli git;
    std::string bare = (sb.dir.path / "bare.git").string();
    REQUIRE(git.init_bare(bare).is_ok());

    auto none = git.remote_names(bare);
    REQUIRE(none.is_ok());
    REQUIRE(none.value().empty());

    REQUIRE(git.remote_add(bare, "proj", "https://example.org/group/proj.git", true).is_ok());
    REQUIRE(git.remote_names(bare).value() == std::vector<std::string>{"proj"});
    REQUIRE(git_out({"-C", bare, "config", "remote.proj.tagOpt"}) == "--no-tags");

    REQUIRE(git.remote_set_url(bare, "proj", "git@example.org:group/proj.git").is_ok());
    REQUIRE(git.remote_get_url(bare, "proj").value() == "git@example.org:group/proj.git");

    auto missing = git.remote_get_url(bare, "origin");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == GitcacheError::NotFound);

    REQUIRE(git.remote_remove(bare, "proj").is_ok());
    REQUIRE(git.remote_names(bare).value().empty());
}

TEST_CASE("GitCli failing command becomes a Command error", "[git][integration]") {
    if (!git_available()) { WARN("git not available"); return; }
    GitSandbox sb;
    GitCli git;
    auto r = git.clone_bare(sb.dir.path.string() + "/does-not-exist.git",
                            (sb.dir.path / "out.git").string());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == GitcacheError::Command);
    REQUIRE(r.error().message.find("git clone --bare") != std::string::npos);
}

TEST_CASE("GitCli absolute_git_dir", "[git][integration]") {
    if (!git_available()) { WARN("git not available"); return; }
    GitSandbox sb;
    GitCli git;
    std::string repo = (sb.work / "repo").string();
    REQUIRE(git_ok({"init", "-q", repo}));

    auto dir = git.absolute_git_dir(repo);
    REQUIRE(dir.is_ok());
    REQUIRE(fs::equivalent(dir.value(), fs::path(repo) / ".git"));

    auto outside = git.absolute_git_dir(sb.upstream.string());
    REQUIRE(outside.is_err());
    REQUIRE(outside.error().code == GitcacheError::NotFound);
}
