#include <catch2/catch.hpp>
#include <gitcache/url.hpp>

using namespace gitcache;

// ===== Scheme-qualified URLs =====

TEST_CASE("parse https URL", "[url]") {
    auto r = RepoUrl::parse("https://example.org/group/proj.git");
    REQUIRE(r.is_ok());
    const auto& u = r.value();
    REQUIRE(u.protocol == "https");
    REQUIRE(u.user.empty());
    REQUIRE(u.domain == "example.org");
    REQUIRE(u.port.empty());
    REQUIRE(u.path == "group");
    REQUIRE(u.project == "proj");
    REQUIRE(u.address == "https://example.org/group/proj.git");
}

TEST_CASE("parse ssh URL with user and port", "[url]") {
    auto r = RepoUrl::parse("ssh://git@example.org:2222/group/sub/proj.git");
    REQUIRE(r.is_ok());
    const auto& u = r.value();
    REQUIRE(u.protocol == "ssh");
    REQUIRE(u.user == "git");
    REQUIRE(u.domain == "example.org");
    REQUIRE(u.port == "2222");
    REQUIRE(u.path == "group/sub");
    REQUIRE(u.project == "proj");
}

TEST_CASE("parse URL with port but no user", "[url]") {
    auto r = RepoUrl::parse("http://example.org:8080/proj.git");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().user.empty());
    REQUIRE(r.value().port == "8080");
    REQUIRE(r.value().path.empty());
    REQUIRE(r.value().project == "proj");
}

TEST_CASE("parse URL with user but no port", "[url]") {
    auto r = RepoUrl::parse("https://alice@example.org/group/proj.git");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().user == "alice");
    REQUIRE(r.value().port.empty());
    REQUIRE(r.value().domain == "example.org");
}

TEST_CASE("parse URL without .git suffix or with trailing slash", "[url]") {
    auto plain = RepoUrl::parse("https://example.org/group/proj");
    REQUIRE(plain.is_ok());
    REQUIRE(plain.value().project == "proj");

    auto slash = RepoUrl::parse("https://example.org/group/proj.git/");
    REQUIRE(slash.is_ok());
    REQUIRE(slash.value().project == "proj");
    REQUIRE(slash.value().address == "https://example.org/group/proj.git");
}

TEST_CASE("parse URL with bracketed IPv6 host", "[url]") {
    auto r = RepoUrl::parse("ssh://git@[::1]:22/group/proj.git");
    REQUIRE(r.is_ok());
    const auto& u = r.value();
    REQUIRE(u.user == "git");
    REQUIRE(u.domain == "::1");
    REQUIRE(u.port == "22");
    REQUIRE(u.path == "group");
    REQUIRE(u.project == "proj");

    auto no_port = RepoUrl::parse("https://[fe80::2]/proj.git");
    REQUIRE(no_port.is_ok());
    REQUIRE(no_port.value().domain == "fe80::2");
    REQUIRE(no_port.value().port.empty());
}

TEST_CASE("unterminated IPv6 host fails", "[url]") {
    auto r = RepoUrl::parse("ssh://[::1/group/proj.git");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == GitcacheError::Parse);
}

TEST_CASE("domain case is preserved", "[url]") {
    auto r = RepoUrl::parse("https://Example.ORG/group/proj.git");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().domain == "Example.ORG");
}

// ===== scp-like URLs =====

TEST_CASE("parse scp-like URL", "[url]") {
    auto r = RepoUrl::parse("git@example.org:group/sub/proj.git");
    REQUIRE(r.is_ok());
    const auto& u = r.value();
    REQUIRE(u.protocol.empty());
    REQUIRE(u.user == "git");
    REQUIRE(u.domain == "example.org");
    REQUIRE(u.port.empty());
    REQUIRE(u.path == "group/sub");
    REQUIRE(u.project == "proj");
}

TEST_CASE("parse scp-like URL without user", "[url]") {
    auto r = RepoUrl::parse("example.org:proj.git");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().user.empty());
    REQUIRE(r.value().domain == "example.org");
    REQUIRE(r.value().path.empty());
    REQUIRE(r.value().project == "proj");
}

TEST_CASE("parse scp-like URL with bracketed IPv6 host", "[url]") {
    auto r = RepoUrl::parse("git@[fe80::1]:group/proj.git");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().user == "git");
    REQUIRE(r.value().domain == "fe80::1");
    REQUIRE(r.value().path == "group");
    REQUIRE(r.value().project == "proj");
}

TEST_CASE("scp-like digits after colon are a path, not a port", "[url]") {
    auto r = RepoUrl::parse("git@example.org:22/proj.git");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().port.empty());
    REQUIRE(r.value().path == "22");
}

// ===== Failures =====

TEST_CASE("local paths are not remote URLs", "[url]") {
    REQUIRE(RepoUrl::parse("/srv/git/proj.git").is_err());
    REQUIRE(RepoUrl::parse("../proj.git").is_err());
    REQUIRE(RepoUrl::parse("./a:b/proj.git").is_err());
    REQUIRE(RepoUrl::parse("proj").is_err());
}

TEST_CASE("file URL has no domain", "[url]") {
    auto r = RepoUrl::parse("file:///srv/git/proj.git");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == GitcacheError::Parse);
    REQUIRE(r.error().message.find("no domain") != std::string::npos);
}

TEST_CASE("URL without project fails", "[url]") {
    REQUIRE(RepoUrl::parse("https://example.org").is_err());
    REQUIRE(RepoUrl::parse("https://example.org/").is_err());
    REQUIRE(RepoUrl::parse("git@example.org:").is_err());
}

TEST_CASE("non-numeric port fails", "[url]") {
    auto r = RepoUrl::parse("https://example.org:abc/proj.git");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("port") != std::string::npos);
}

TEST_CASE("empty input fails", "[url]") {
    REQUIRE(RepoUrl::parse("").is_err());
}

// ===== Searching argument lists =====

TEST_CASE("find_in skips options and their values", "[url]") {
    auto r = RepoUrl::find_in({"--depth", "1", "-b", "main",
                               "https://example.org/group/proj.git", "dest"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().project == "proj");
}

TEST_CASE("find_in ignores config values containing URLs", "[url]") {
    auto r = RepoUrl::find_in({"-c", "http.proxy=http://proxy:8080/",
                               "git@example.org:team/tool.git"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().domain == "example.org");
    REQUIRE(r.value().project == "tool");
}

TEST_CASE("find_in without URL is a parse error", "[url]") {
    auto r = RepoUrl::find_in({"--bare", "somewhere"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == GitcacheError::Parse);
    REQUIRE(r.error().message.find("--bare somewhere") != std::string::npos);
}

TEST_CASE("search tolerates trailing text", "[url]") {
    auto r = RepoUrl::search("clone https://example.org/group/proj.git my-copy");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().domain == "example.org");
    REQUIRE(r.value().project == "proj");
}
