/**
 * End-to-end download flow through the tool server.
 *
 * The extractor binary is a shell script that writes to the -o template the
 * server hands it, so these tests exercise the real process runner, the
 * path construction and the post-download verification together.
 */

#include <doctest/doctest.h>
#include <vdl/mcp_server.hpp>
#include <vdl/platform.hpp>

#include "../test_helpers.hpp"

#include <sys/stat.h>

using namespace vdl;
using vdl::test::TempTestDir;
using json = nlohmann::json;

namespace {

// Parses -o, expands %(title)s and %(ext)s, then runs the given write step
std::string fake_extractor(const TempTestDir& temp, const std::string& write_step) {
    std::string path = temp.sub("fake-yt-dlp");
    vdl::test::write_file(path,
        "#!/bin/sh\n"
        "out=\"\"\n"
        "while [ $# -gt 0 ]; do\n"
        "  case \"$1\" in\n"
        "    -o) out=\"$2\"; shift 2 ;;\n"
        "    --) shift; break ;;\n"
        "    *) shift ;;\n"
        "  esac\n"
        "done\n"
        "file=$(printf '%s' \"$out\" | sed -e 's/%(title)s/Clip/' -e 's/%(ext)s/mp4/')\n"
        "mkdir -p \"$(dirname \"$file\")\"\n" +
        write_step +
        "echo \"[download] Destination: $file\" 1>&2\n"
        "echo \"$file\"\n");
    ::chmod(path.c_str(), 0755);
    return path;
}

json call_tool(ToolServer& server, const std::string& name, const json& arguments) {
    json request = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
                    {"params", {{"name", name}, {"arguments", arguments}}}};
    auto response = server.handle_message(request.dump());
    REQUIRE(response.has_value());
    REQUIRE(response->contains("result"));
    const auto& result = (*response)["result"];
    json payload = json::parse(result["content"][0]["text"].get<std::string>());
    payload["_is_error"] = result["isError"];
    return payload;
}

ServerConfig flow_config(const TempTestDir& temp, const std::string& binary) {
    auto config = vdl::test::test_config(temp.path);
    config.download_locations["private"] = temp.sub("private");
    config.ytdlp.binary = binary;
    return config;
}

} // namespace

TEST_CASE("download lands inside the requested location") {
    TempTestDir temp;
    auto config = flow_config(temp, fake_extractor(temp, "echo data > \"$file\"\n"));
    ToolServer server(ToolContext{config, make_ytdlp_engine(config.ytdlp), fetch_page});

    auto payload = call_tool(server, "download_video",
                             {{"url", "https://example.com/watch?v=1"},
                              {"location_id", "movies"},
                              {"relative_path", "2024/action"}});

    CHECK(payload["_is_error"] == false);
    CHECK(payload["success"] == true);
    CHECK(payload["file_path"] == temp.sub("movies/2024/action/Clip.mp4"));
    CHECK(payload["log"].get<std::string>().find("Destination") != std::string::npos);
    CHECK(is_regular_file(temp.sub("movies/2024/action/Clip.mp4")));
}

TEST_CASE("traversal attempts never spawn the extractor") {
    TempTestDir temp;
    auto config = flow_config(temp, fake_extractor(temp, "echo data > \"$file\"\n"));
    ToolServer server(ToolContext{config, make_ytdlp_engine(config.ytdlp), fetch_page});

    for (const char* rel : {"../private", "a/../../private", "%2e%2e/private", "/etc"}) {
        CAPTURE(rel);
        auto payload = call_tool(server, "download_video",
                                 {{"url", "https://example.com/watch?v=1"},
                                  {"location_id", "movies"},
                                  {"relative_path", rel}});
        CHECK(payload["_is_error"] == true);
        CHECK(payload["success"] == false);
    }

    CHECK_FALSE(path_exists(temp.sub("private")));
    CHECK_FALSE(path_exists(temp.sub("Clip.mp4")));
}

TEST_CASE("a hostile filename template stays inside the location") {
    TempTestDir temp;
    auto config = flow_config(temp, fake_extractor(temp, "echo data > \"$file\"\n"));
    ToolServer server(ToolContext{config, make_ytdlp_engine(config.ytdlp), fetch_page});

    auto payload = call_tool(server, "download_video",
                             {{"url", "https://example.com/watch?v=1"},
                              {"location_id", "default"},
                              {"filename_template", "../../%(title)s.%(ext)s"}});

    REQUIRE(payload["success"] == true);
    std::string file = payload["file_path"].get<std::string>();
    CHECK(file.rfind(temp.sub("default/"), 0) == 0);
    CHECK(get_filename(file) == "_.._Clip.mp4");
}

TEST_CASE("output swapped for a symlink after the download is rejected") {
    TempTestDir temp;
    vdl::test::write_file(temp.sub("secret.mp4"), "secret");
    auto config = flow_config(temp, fake_extractor(temp,
        "ln -s '" + temp.sub("secret.mp4") + "' \"$file\"\n"));
    ToolServer server(ToolContext{config, make_ytdlp_engine(config.ytdlp), fetch_page});

    auto payload = call_tool(server, "download_video",
                             {{"url", "https://example.com/watch?v=1"},
                              {"location_id", "default"}});

    CHECK(payload["_is_error"] == true);
    CHECK(payload["error_kind"] == "boundary_escape");
    CHECK_FALSE(path_exists(temp.sub("default/Clip.mp4")));
    CHECK(path_exists(temp.sub("secret.mp4")));
}

TEST_CASE("a playlist with one forbidden file leaves nothing behind") {
    TempTestDir temp;
    std::string script = temp.sub("playlist-yt-dlp");
    vdl::test::write_file(script,
        "#!/bin/sh\n"
        "out=\"\"\n"
        "while [ $# -gt 0 ]; do\n"
        "  case \"$1\" in\n"
        "    -o) out=\"$2\"; shift 2 ;;\n"
        "    *) shift ;;\n"
        "  esac\n"
        "done\n"
        "dir=$(dirname \"$out\")\n"
        "echo data > \"$dir/First.exe\"\n"
        "echo data > \"$dir/Second.mp4\"\n"
        "echo \"$dir/First.exe\"\n"
        "echo \"$dir/Second.mp4\"\n");
    ::chmod(script.c_str(), 0755);
    auto config = flow_config(temp, script);
    ToolServer server(ToolContext{config, make_ytdlp_engine(config.ytdlp), fetch_page});

    auto payload = call_tool(server, "download_video",
                             {{"url", "https://example.com/playlist?list=1"},
                              {"location_id", "default"}});

    CHECK(payload["_is_error"] == true);
    CHECK(payload["success"] == false);
    CHECK(payload["error_kind"] == "extension_not_allowed");
    CHECK_FALSE(path_exists(temp.sub("default/First.exe")));
    CHECK_FALSE(path_exists(temp.sub("default/Second.mp4")));
}

TEST_CASE("a download that reports no file is not trusted") {
    TempTestDir temp;
    auto config = flow_config(temp, fake_extractor(temp, "echo data > \"$file\"\nexit 0\n"));
    ToolServer server(ToolContext{config, make_ytdlp_engine(config.ytdlp), fetch_page});

    auto payload = call_tool(server, "download_video",
                             {{"url", "https://example.com/watch?v=1"},
                              {"location_id", "default"}});

    CHECK(payload["_is_error"] == true);
    CHECK(payload["error_kind"] == "download_unverified");
}

TEST_CASE("engine errors do not disclose other locations") {
    TempTestDir temp;
    std::string script = temp.sub("failing-yt-dlp");
    vdl::test::write_file(script,
        "#!/bin/sh\necho \"ERROR: cannot read " + temp.sub("private/key") + "\" 1>&2\nexit 1\n");
    ::chmod(script.c_str(), 0755);
    auto config = flow_config(temp, script);
    ToolServer server(ToolContext{config, make_ytdlp_engine(config.ytdlp), fetch_page});

    auto payload = call_tool(server, "download_video",
                             {{"url", "https://example.com/watch?v=1"},
                              {"location_id", "movies"}});

    CHECK(payload["success"] == false);
    std::string error = payload["error"].get<std::string>();
    CHECK(error.find(temp.sub("private")) == std::string::npos);
    CHECK(error.find("<location:private>/key") != std::string::npos);
}

TEST_CASE("get_download_locations through the server") {
    TempTestDir temp;
    auto config = flow_config(temp, "yt-dlp");
    ToolServer server(ToolContext{config, make_ytdlp_engine(config.ytdlp), fetch_page});

    auto payload = call_tool(server, "get_download_locations", json::object());
    CHECK(payload["locations"].size() == 3);
    CHECK(payload["locations"]["private"]["writable"] == true);
}
