#include <doctest/doctest.h>
#include <vdl/location_resolver.hpp>
#include <vdl/platform.hpp>

#include "../test_helpers.hpp"

#include <cstdlib>
#include <filesystem>

#include <sys/stat.h>

using namespace vdl;
using vdl::test::TempTestDir;
using vdl::test::test_policy;

TEST_CASE("resolve_base creates a missing base directory") {
    TempTestDir temp;
    LocationTable table{{"movies", temp.sub("media/movies")}};

    auto r = resolve_base(std::string("movies"), table, test_policy());
    REQUIRE(r.ok());
    CHECK(r.base->location_id == "movies");
    CHECK(r.base->directory == temp.sub("media/movies"));
    CHECK(r.base->configured == temp.sub("media/movies"));
    CHECK(is_directory(temp.sub("media/movies")));

    struct stat st {};
    REQUIRE(::stat(temp.sub("media/movies").c_str(), &st) == 0);
    CHECK((st.st_mode & 07777) == 0755);
}

TEST_CASE("resolve_base is idempotent") {
    TempTestDir temp;
    LocationTable table{{"default", temp.sub("dl")}};

    auto first = resolve_base(std::string("default"), table, test_policy());
    auto second = resolve_base(std::string("default"), table, test_policy());
    REQUIRE(first.ok());
    REQUIRE(second.ok());
    CHECK(first.base->directory == second.base->directory);
}

TEST_CASE("resolve_base returns the canonical directory") {
    TempTestDir temp;
    std::filesystem::create_directories(temp.sub("real"));
    std::filesystem::create_directory_symlink(temp.sub("real"), temp.sub("link"));
    LocationTable table{{"linked", temp.sub("link/")}};

    auto r = resolve_base(std::string("linked"), table, test_policy());
    REQUIRE(r.ok());
    CHECK(r.base->directory == temp.sub("real"));
}

TEST_CASE("resolve_base location id rules") {
    TempTestDir temp;
    LocationTable table{{"default", temp.sub("default")}, {"music", temp.sub("music")}};
    auto policy = test_policy();

    SUBCASE("unknown id lists the configured ids") {
        auto r = resolve_base(std::string("photos"), table, policy);
        CHECK(r.error == ErrorKind::UnknownLocation);
        CHECK(r.detail.find("default, music") != std::string::npos);
        CHECK(r.detail.find(temp.path) == std::string::npos);
    }

    SUBCASE("missing id is required when enforcing") {
        auto r = resolve_base(std::nullopt, table, policy);
        CHECK(r.error == ErrorKind::LocationRequired);

        auto empty = resolve_base(std::string(""), table, policy);
        CHECK(empty.error == ErrorKind::LocationRequired);
    }

    SUBCASE("missing id falls back to default when not enforcing") {
        policy.enforce_location_restrictions = false;
        auto r = resolve_base(std::nullopt, table, policy);
        REQUIRE(r.ok());
        CHECK(r.base->location_id == "default");
    }

    SUBCASE("fallback without a default location") {
        policy.enforce_location_restrictions = false;
        table.erase("default");
        auto r = resolve_base(std::nullopt, table, policy);
        CHECK(r.error == ErrorKind::UnknownLocation);
    }
}

TEST_CASE("resolve_base reports an unusable base without its path") {
    TempTestDir temp;
    vdl::test::write_file(temp.sub("file"), "x");
    LocationTable table{{"broken", temp.sub("file/sub")}, {"relative", "~nosuchuser_vdl/x"}};

    auto r = resolve_base(std::string("broken"), table, test_policy());
    CHECK(r.error == ErrorKind::LocationNotWritable);
    CHECK_FALSE(r.retryable);
    CHECK(r.detail.find(temp.path) == std::string::npos);

    auto unknown_user = resolve_base(std::string("relative"), table, test_policy());
    CHECK(unknown_user.error == ErrorKind::LocationNotWritable);
}

TEST_CASE("resolve_base warns about world-writable directories") {
    TempTestDir temp;
    std::filesystem::create_directories(temp.sub("open"));
    std::filesystem::create_directories(temp.sub("sticky"));
    REQUIRE(::chmod(temp.sub("open").c_str(), 0777) == 0);
    REQUIRE(::chmod(temp.sub("sticky").c_str(), 01777) == 0);
    LocationTable table{{"open", temp.sub("open")}, {"sticky", temp.sub("sticky")}};

    WarningCollector open_warnings;
    REQUIRE(resolve_base(std::string("open"), table, test_policy(), &open_warnings).ok());
    auto emitted = open_warnings.get_warnings();
    REQUIRE(emitted.size() == 1);
    CHECK(emitted[0].key == "location_world_writable");
    CHECK(emitted[0].fields["location_id"] == "open");

    WarningCollector sticky_warnings;
    REQUIRE(resolve_base(std::string("sticky"), table, test_policy(), &sticky_warnings).ok());
    CHECK(sticky_warnings.get_warnings().empty());
}

TEST_CASE("expand_user_path") {
    const char* saved = std::getenv("HOME");
    std::string saved_home = saved ? saved : "";
    ::setenv("HOME", "/home/tester", 1);

    CHECK(*expand_user_path("~") == "/home/tester");
    CHECK(*expand_user_path("~/video-downloader") == "/home/tester/video-downloader");
    CHECK(*expand_user_path("/srv/media") == "/srv/media");
    CHECK(*expand_user_path("~root") == *get_user_home_directory("root"));
    CHECK_FALSE(expand_user_path("~nosuchuser_vdl/x").has_value());

    if (saved) {
        ::setenv("HOME", saved_home.c_str(), 1);
    } else {
        ::unsetenv("HOME");
    }
}

TEST_CASE("describe_locations reports each location") {
    TempTestDir temp;
    vdl::test::write_file(temp.sub("file"), "x");
    LocationTable table{{"good", temp.sub("good")}, {"bad", temp.sub("file/bad")}};

    auto statuses = describe_locations(table, test_policy());
    REQUIRE(statuses.size() == 2);

    // std::map order
    CHECK(statuses[0].id == "bad");
    CHECK_FALSE(statuses[0].writable);
    CHECK_FALSE(statuses[0].error.empty());

    CHECK(statuses[1].id == "good");
    CHECK(statuses[1].writable);
    CHECK(statuses[1].path == temp.sub("good"));
}
