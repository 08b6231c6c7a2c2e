#include <catch2/catch.hpp>
#include <gitcache/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

#include <unistd.h>

using namespace gitcache::log;

// Helper: capture stderr output from a callable
static std::string capture_stderr(std::function<void()> fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));

    int pipefd[2];
    if (pipe(pipefd) != 0) return "";
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("parse_level accepts every level name", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        Level parsed = Info;
        REQUIRE(parse_level(level_name(lvl), parsed));
        REQUIRE(parsed == lvl);
    }
}

TEST_CASE("parse_level rejects unknown names", "[log]") {
    Level parsed = Warn;
    REQUIRE_FALSE(parse_level("verbose", parsed));
    REQUIRE_FALSE(parse_level("", parsed));
    REQUIRE_FALSE(parse_level("INFO", parsed));
    REQUIRE(parsed == Warn);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("refreshing cache");
    });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages carry the tool and level prefix", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("gc --auto in %s failed", "/cache/@example.org");
    });
    REQUIRE(output == "git-cache warn: gc --auto in /cache/@example.org failed\n");
}

TEST_CASE("Colored output wraps the level name", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_stderr([] {
        error("boom");
    });
    REQUIRE(output.find("\033[31merror\033[0m") != std::string::npos);
    REQUIRE(output.find("boom") != std::string::npos);

    set_color_enabled(false);
}

TEST_CASE("Each level function writes its own level name", "[log]") {
    set_level(Trace);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        trace("t");
        debug("d");
        info("i");
        warn("w");
        error("e");
    });
    REQUIRE(output == "git-cache trace: t\n"
                      "git-cache debug: d\n"
                      "git-cache info: i\n"
                      "git-cache warn: w\n"
                      "git-cache error: e\n");

    set_level(Info);
}
