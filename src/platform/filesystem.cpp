#include "vdl/platform.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace vdl {

namespace fs = std::filesystem;

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    for (char& c : result) {
        if (c == '\\') c = '/';
    }
    return result;
}

std::string get_parent_directory(const std::string& path) {
    return to_portable_path(fs::path(path).parent_path().string());
}

std::string get_filename(const std::string& path) {
    return fs::path(path).filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    if (base.empty()) return to_portable_path(rel);
    if (rel.empty()) return to_portable_path(base);

    // operator/ replaces the left side when rel is absolute; strip leading
    // separators so rel always stays under base
    size_t start = 0;
    while (start < rel.size() && (rel[start] == '/' || rel[start] == '\\')) {
        start++;
    }
    fs::path p(base);
    p /= rel.substr(start);
    return to_portable_path(p.string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_symlink(const std::string& path) {
    std::error_code ec;
    return fs::is_symlink(path, ec);
}

std::optional<std::string> canonical_path(const std::string& path) {
    std::error_code ec;
    auto p = fs::canonical(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return to_portable_path(p.string());
}

std::optional<std::string> weakly_canonical_path(const std::string& path) {
    std::error_code ec;
    auto p = fs::weakly_canonical(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return to_portable_path(p.lexically_normal().string());
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec) && !ec;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

DirectoryResult ensure_directory(const std::string& path) {
    DirectoryResult result;

    if (path.empty()) {
        result.error = "empty directory path";
        result.error_code = EINVAL;
        return result;
    }

    // Walk the components so that every directory we create gets 0755
    // regardless of what create_directories would pick.
    fs::path target = fs::path(path).lexically_normal();
    fs::path current;
    for (const auto& part : target) {
        current /= part;
        if (part == current.root_path() || part.empty()) {
            continue;
        }

        struct stat st;
        if (::stat(current.c_str(), &st) == 0) {
            if (!S_ISDIR(st.st_mode)) {
                result.error = "not a directory: " + part.string();
                result.error_code = ENOTDIR;
                return result;
            }
            continue;
        }

        if (::mkdir(current.c_str(), 0755) == 0) {
            // umask may have stripped bits we want; never add world-write
            if (::chmod(current.c_str(), 0755) != 0) {
                result.error_code = errno;
                result.error = std::string("chmod failed: ") + std::strerror(errno);
                return result;
            }
            continue;
        }

        if (errno != EEXIST) {
            result.error_code = errno;
            result.error = std::string("mkdir failed: ") + std::strerror(errno);
            return result;
        }

        // Another process created it between our stat and mkdir
        if (::stat(current.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
            result.error = "not a directory: " + part.string();
            result.error_code = ENOTDIR;
            return result;
        }
    }

    result.ok = true;
    return result;
}

DirectoryResult check_writable(const std::string& path) {
    DirectoryResult result;
    if (::access(path.c_str(), W_OK | X_OK) != 0) {
        result.error_code = errno;
        result.error = std::string("not writable: ") + std::strerror(errno);
        return result;
    }
    result.ok = true;
    return result;
}

bool is_world_writable(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    return (st.st_mode & S_IWOTH) != 0 && (st.st_mode & S_ISVTX) == 0;
}

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

std::optional<std::string> get_home_directory() {
    auto home = get_env("HOME");
    if (home && !home->empty()) {
        return home;
    }

    struct passwd* pw = ::getpwuid(::getuid());
    if (pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }
    return std::nullopt;
}

std::optional<std::string> get_user_home_directory(const std::string& user) {
    struct passwd* pw = ::getpwnam(user.c_str());
    if (pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }
    return std::nullopt;
}

} // namespace vdl
