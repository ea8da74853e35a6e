#pragma once

#include <vdl/config.hpp>

#include <atomic>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <unistd.h>

namespace vdl::test {

// Unique temporary directory, removed with everything in it on destruction.
// path is canonical so it can be compared with resolver output directly.
class TempTestDir {
public:
    TempTestDir() {
        static std::atomic<int> counter{0};
        std::string unique_name = "vdl_test_" + std::to_string(::getpid()) + "_" +
                                  std::to_string(std::time(nullptr)) + "_" +
                                  std::to_string(counter++);
        auto created = std::filesystem::temp_directory_path() / unique_name;
        std::filesystem::create_directories(created);
        path = std::filesystem::canonical(created).string();
    }

    ~TempTestDir() {
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
    }

    TempTestDir(const TempTestDir&) = delete;
    TempTestDir& operator=(const TempTestDir&) = delete;

    std::string sub(const std::string& rel) const { return path + "/" + rel; }

    std::string path;
};

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream(path, std::ios::binary) << content;
}

// Restrictive policy with the default extension list
inline SecurityPolicy test_policy() {
    SecurityPolicy policy;
    policy.allowed_extensions = {"mp4", "webm", "mkv", "avi", "mov", "m4a", "mp3",
                                 "aac", "ogg", "wav", "vtt", "srt", "ass", "ssa"};
    return policy;
}

// Configuration whose only locations live under root
inline ServerConfig test_config(const std::string& root) {
    ServerConfig config;
    config.download_locations = {{"default", root + "/default"},
                                 {"movies", root + "/movies"}};
    config.security = test_policy();
    return config;
}

} // namespace vdl::test
