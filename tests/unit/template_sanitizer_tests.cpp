#include <doctest/doctest.h>
#include <vdl/template_sanitizer.hpp>

using namespace vdl;

TEST_CASE("sanitize_template keeps recognized placeholders") {
    CHECK(sanitize_template("%(title)s.%(ext)s") == "%(title)s.%(ext)s");
    CHECK(sanitize_template("%(playlist_index)03d - %(title)s.%(ext)s") ==
          "%(playlist_index)03d - %(title)s.%(ext)s");
    CHECK(sanitize_template("%(duration)-5.2f") == "%(duration)-5.2f");
    CHECK(sanitize_template("100%% %(id)s") == "100%% %(id)s");
}

TEST_CASE("sanitize_template replaces separators and shell metacharacters") {
    CHECK(sanitize_template("../../etc/%(title)s") == "_.._etc_%(title)s");
    CHECK(sanitize_template("a\\b") == "a_b");
    CHECK(sanitize_template("$(rm -rf ~);`x`|&<>*?\"'") == "_(rm -rf _)__x_________");
}

TEST_CASE("sanitize_template neutralizes malformed placeholders") {
    CHECK(sanitize_template("%(title") == "_(title");
    CHECK(sanitize_template("%(title)") == "_(title)");
    CHECK(sanitize_template("%(ti/tle)s") == "_(ti_tle)s");
    CHECK(sanitize_template("50%") == "50_");
    CHECK(sanitize_template("%s") == "_s");
    CHECK(sanitize_template("%(upload_date>%Y-%m-%d)s") == "_(upload_date__Y-_m-_d)s");
}

TEST_CASE("sanitize_template strips leading dots and spaces") {
    CHECK(sanitize_template(".hidden.mp4") == "hidden.mp4");
    CHECK(sanitize_template("...") == "");
    CHECK(sanitize_template(" . %(title)s") == "%(title)s");
}

TEST_CASE("sanitize_template drops control characters") {
    CHECK(sanitize_template(std::string("a") + '\0' + "b\tc\n") == "abc");
}

TEST_CASE("sanitize_template replaces each non-ASCII sequence once") {
    CHECK(sanitize_template("caf\xc3\xa9.mp4") == "caf_.mp4");
    CHECK(sanitize_template("\xe2\x80\xae" "4pm.exe") == "_4pm.exe");
    CHECK(sanitize_template("\xf0\x9f\x8e\xac film") == "_ film");
}

TEST_CASE("sanitize_template output never contains a separator or parent entry") {
    for (const char* input : {"../x", "..\\x", "a/../b", "/abs/path", "%(a)s/../%(b)s"}) {
        CAPTURE(input);
        auto out = sanitize_template(input);
        CHECK(out.find('/') == std::string::npos);
        CHECK(out.find('\\') == std::string::npos);
        CHECK(out.rfind("..", 0) != 0);
    }
}

TEST_CASE("has_placeholders") {
    CHECK(has_placeholders("%(title)s.%(ext)s"));
    CHECK(has_placeholders("clip-%(id)s.mp4"));
    CHECK_FALSE(has_placeholders("video.mp4"));
    CHECK_FALSE(has_placeholders("100%%(title)s"));
    CHECK_FALSE(has_placeholders("%(title"));
}
