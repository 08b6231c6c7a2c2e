#include <catch2/catch.hpp>
#include <gitcache/alternates.hpp>
#include "test_support.hpp"

using namespace gitcache;

// Working copy handle over a hand-made .git layout; no git needed
static WorkingCopy fake_copy(const ScratchDir& td) {
    WorkingCopy wc;
    wc.worktree = td.path;
    wc.git_dir = td.path / ".git";
    fs::create_directories(wc.git_dir / "objects" / "info");
    return wc;
}

TEST_CASE("append to a missing alternates file", "[alternates]") {
    ScratchDir td;
    auto wc = fake_copy(td);

    auto r = append_alternate(wc, "/cache/@example.org/objects");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == true);
    REQUIRE(read_file(wc.alternates_path()) == "/cache/@example.org/objects\n");
}

TEST_CASE("append keeps existing lines and adds a newline", "[alternates]") {
    ScratchDir td;
    auto wc = fake_copy(td);
    std::ofstream(wc.alternates_path()) << "/other/objects";

    REQUIRE(append_alternate(wc, "/cache/@example.org/objects").is_ok());
    REQUIRE(read_file(wc.alternates_path()) ==
            "/other/objects\n/cache/@example.org/objects\n");
}

TEST_CASE("append is idempotent", "[alternates]") {
    ScratchDir td;
    auto wc = fake_copy(td);

    REQUIRE(append_alternate(wc, "/cache/@example.org/objects").value() == true);
    REQUIRE(append_alternate(wc, "/cache/@example.org/objects").value() == false);
    REQUIRE(append_alternate(wc, "/cache/@example.org/objects/").value() == false);
    REQUIRE(count_alternate(wc, "/cache/@example.org/objects").value() == 1);
}

TEST_CASE("blank leaves an empty line and a backup", "[alternates]") {
    ScratchDir td;
    auto wc = fake_copy(td);
    std::ofstream(wc.alternates_path()) << "/other/objects\n/cache/@example.org/objects\n";

    auto r = blank_alternate(wc, "/cache/@example.org/objects", 1700000000);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == 1);

    REQUIRE(read_file(wc.alternates_path()) == "/other/objects\n\n");
    fs::path backup = wc.alternates_path().string() + ".1700000000";
    REQUIRE(read_file(backup) == "/other/objects\n/cache/@example.org/objects\n");

    REQUIRE(count_alternate(wc, "/cache/@example.org/objects").value() == 0);
    REQUIRE(count_alternate(wc, "/other/objects").value() == 1);
}

TEST_CASE("blank without alternates file is a no-op", "[alternates]") {
    ScratchDir td;
    auto wc = fake_copy(td);

    auto r = blank_alternate(wc, "/cache/@example.org/objects", 1);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == 0);
    REQUIRE_FALSE(fs::exists(wc.alternates_path()));
}

TEST_CASE("append after blank yields one live line", "[alternates]") {
    ScratchDir td;
    auto wc = fake_copy(td);
    std::string dir = "/cache/@example.org/objects";

    REQUIRE(append_alternate(wc, dir).is_ok());
    REQUIRE(blank_alternate(wc, dir, 2).is_ok());
    REQUIRE(append_alternate(wc, dir).value() == true);
    REQUIRE(count_alternate(wc, dir).value() == 1);
}

TEST_CASE("lines through a symlink match their target", "[alternates]") {
    ScratchDir td;
    auto wc = fake_copy(td);
    fs::create_directories(td.path / "real" / "objects");
    fs::create_directory_symlink(td.path / "real", td.path / "link");

    std::ofstream(wc.alternates_path()) << (td.path / "real" / "objects").string() << "\n";
    REQUIRE(count_alternate(wc, (td.path / "link" / "objects").string()).value() == 1);
}
