#include <doctest/doctest.h>
#include <vdl/platform.hpp>

#include "../test_helpers.hpp"

#include <sys/stat.h>

using namespace vdl;
using vdl::test::TempTestDir;

TEST_CASE("join_path never lets the right side replace the base") {
    CHECK(join_path("/base", "a/b.mp4") == "/base/a/b.mp4");
    CHECK(join_path("/base", "/etc/passwd") == "/base/etc/passwd");
    CHECK(join_path("/base", "\\\\x") == "/base/x");
    CHECK(join_path("/base", "") == "/base");
    CHECK(join_path("", "rel") == "rel");
}

TEST_CASE("path helpers") {
    CHECK(to_portable_path("a\\b\\c") == "a/b/c");
    CHECK(get_filename("/base/dir/clip.mp4") == "clip.mp4");
    CHECK(get_parent_directory("/base/dir/clip.mp4") == "/base/dir");
}

TEST_CASE("weakly_canonical_path resolves the existing prefix") {
    TempTestDir temp;
    std::filesystem::create_directories(temp.sub("real"));
    std::filesystem::create_directory_symlink(temp.sub("real"), temp.sub("link"));

    CHECK(*weakly_canonical_path(temp.sub("link/not/yet/here.mp4")) ==
          temp.sub("real/not/yet/here.mp4"));
    CHECK(*weakly_canonical_path(temp.sub("real/a/../b")) == temp.sub("real/b"));
}

TEST_CASE("ensure_directory") {
    TempTestDir temp;

    SUBCASE("creates nested directories with mode 0755") {
        auto r = ensure_directory(temp.sub("a/b/c"));
        REQUIRE(r.ok);
        CHECK(is_directory(temp.sub("a/b/c")));

        struct stat st {};
        REQUIRE(::stat(temp.sub("a/b").c_str(), &st) == 0);
        CHECK((st.st_mode & 07777) == 0755);
    }

    SUBCASE("existing directory is fine") {
        REQUIRE(ensure_directory(temp.path).ok);
        CHECK(ensure_directory(temp.path).ok);
    }

    SUBCASE("a file in the way fails without leaking the full path") {
        vdl::test::write_file(temp.sub("blocker"), "x");
        auto r = ensure_directory(temp.sub("blocker/child"));
        CHECK_FALSE(r.ok);
        CHECK(r.error_code == ENOTDIR);
        CHECK(r.error == "not a directory: blocker");
    }

    SUBCASE("empty path") {
        CHECK_FALSE(ensure_directory("").ok);
    }
}

TEST_CASE("remove_file removes a symlink, not its target") {
    TempTestDir temp;
    vdl::test::write_file(temp.sub("target.mp4"), "data");
    std::filesystem::create_symlink(temp.sub("target.mp4"), temp.sub("link.mp4"));

    CHECK(remove_file(temp.sub("link.mp4")));
    CHECK_FALSE(path_exists(temp.sub("link.mp4")));
    CHECK(path_exists(temp.sub("target.mp4")));
}

TEST_CASE("read_file") {
    TempTestDir temp;
    vdl::test::write_file(temp.sub("f.txt"), "hello");
    CHECK(*read_file(temp.sub("f.txt")) == "hello");
    CHECK_FALSE(read_file(temp.sub("missing.txt")).has_value());
}

TEST_CASE("run_process captures both streams") {
    auto r = run_process({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"});
    REQUIRE(r.ok);
    CHECK(r.exit_code == 3);
    CHECK(r.out == "out\n");
    CHECK(r.err == "err\n");
}

TEST_CASE("run_process passes arguments without a shell") {
    auto r = run_process({"echo", "$(whoami)", ";", "rm"});
    REQUIRE(r.ok);
    CHECK(r.exit_code == 0);
    CHECK(r.out == "$(whoami) ; rm\n");
}

TEST_CASE("run_process reports a missing binary as exit 127") {
    auto r = run_process({"vdl-no-such-binary-anywhere"});
    REQUIRE(r.ok);
    CHECK(r.exit_code == 127);
}

TEST_CASE("run_process kills the child on timeout") {
    auto r = run_process({"sleep", "5"}, 1);
    CHECK_FALSE(r.ok);
    CHECK(r.timed_out);
    CHECK(r.error.find("timed out") != std::string::npos);
}

TEST_CASE("run_process rejects an empty command") {
    auto r = run_process({});
    CHECK_FALSE(r.ok);
    CHECK(r.error == "empty command");
}
