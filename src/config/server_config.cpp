#include "vdl/config.hpp"
#include "vdl/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace vdl {

namespace {

const char* kConfigDirName = "video-downloader-mcp";
const char* kConfigFileName = "config.json";

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string normalize_extension(const std::string& ext) {
    std::string result = to_lower(trim(ext));
    while (!result.empty() && result.front() == '.') {
        result.erase(result.begin());
    }
    return result;
}

nlohmann::json builtin_document() {
    return {
        {"download_locations", {{"default", "~/video-downloader"}}},
        {"security", {
            {"enforce_location_restrictions", true},
            {"max_filename_length", 255},
            {"allowed_extensions", {"mp4", "webm", "mkv", "avi", "mov", "m4a", "mp3",
                                    "aac", "ogg", "wav", "vtt", "srt", "ass", "ssa"}},
            {"block_path_traversal", true},
        }},
        {"ytdlp", {
            {"binary", "yt-dlp"},
            {"default_format", "best[height<=1080]"},
            {"default_filename_template", "%(title)s.%(ext)s"},
            {"max_download_size", std::uint64_t{0}},
            {"info_timeout_seconds", 30},
        }},
        {"logging", {
            {"level", "info"},
            {"log_security_events", true},
            {"log_downloads", true},
        }},
        {"warnings", nlohmann::json::object()},
    };
}

// Typed readers: a present value of the wrong type keeps the default and
// records an invalid_configuration warning.
void read_bool(const nlohmann::json& section, const char* key, bool& out,
               const std::string& prefix, std::vector<std::string>& warnings) {
    if (!section.contains(key)) return;
    if (section[key].is_boolean()) {
        out = section[key].get<bool>();
    } else {
        warnings.push_back("invalid_configuration:" + prefix + "." + key);
    }
}

void read_string(const nlohmann::json& section, const char* key, std::string& out,
                 const std::string& prefix, std::vector<std::string>& warnings) {
    if (!section.contains(key)) return;
    if (section[key].is_string()) {
        out = section[key].get<std::string>();
    } else {
        warnings.push_back("invalid_configuration:" + prefix + "." + key);
    }
}

// Integers must also fit T; get<T>() would silently wrap them.
template <typename T>
void read_number(const nlohmann::json& section, const char* key, T& out,
                 const std::string& prefix, std::vector<std::string>& warnings) {
    if (!section.contains(key)) return;
    const auto& value = section[key];
    bool acceptable = false;
    if (value.is_number_unsigned()) {
        acceptable = value.get<std::uint64_t>() <=
                     static_cast<std::uint64_t>(std::numeric_limits<T>::max());
    } else if constexpr (std::is_signed<T>::value) {
        if (value.is_number_integer()) {
            auto v = value.get<std::int64_t>();
            acceptable = v >= static_cast<std::int64_t>(std::numeric_limits<T>::min()) &&
                         v <= static_cast<std::int64_t>(std::numeric_limits<T>::max());
        }
    }
    if (acceptable) {
        out = value.get<T>();
    } else {
        warnings.push_back("invalid_configuration:" + prefix + "." + key);
    }
}

bool is_acceptable_location_path(const std::string& path) {
    if (path.empty()) return false;
    if (path[0] == '/') return true;
    return path[0] == '~';
}

} // namespace

ServerConfig get_builtin_config() {
    auto result = parse_server_config("{}");
    return result.config;
}

ServerConfigParseResult parse_server_config(const std::string& json_str,
                                            const std::string& source_path) {
    ServerConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto user = nlohmann::json::parse(json_str);

        if (!user.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // Objects merge key by key; scalars and arrays replace
        auto j = builtin_document();
        j.merge_patch(user);

        auto& config = result.config;

        // "download_locations" section
        if (!j["download_locations"].is_object()) {
            result.error = "download_locations must be an object";
            return result;
        }
        for (auto& [id, val] : j["download_locations"].items()) {
            if (id.empty()) {
                result.error = "download_locations: location id must not be empty";
                return result;
            }
            if (!val.is_string()) {
                result.error = "download_locations." + id + ": path must be a string";
                return result;
            }
            std::string path = trim(val.get<std::string>());
            if (!is_acceptable_location_path(path)) {
                result.error = "download_locations." + id + ": path must be absolute or start with ~";
                return result;
            }
            config.download_locations[id] = path;
        }

        // "security" section
        if (j["security"].is_object()) {
            const auto& sec = j["security"];
            read_bool(sec, "enforce_location_restrictions",
                      config.security.enforce_location_restrictions, "security", result.warnings);
            read_bool(sec, "block_path_traversal",
                      config.security.block_path_traversal, "security", result.warnings);
            read_number(sec, "max_filename_length",
                        config.security.max_filename_length, "security", result.warnings);

            if (sec.contains("allowed_extensions")) {
                if (sec["allowed_extensions"].is_array()) {
                    for (const auto& elem : sec["allowed_extensions"]) {
                        if (!elem.is_string()) {
                            result.warnings.push_back(
                                "invalid_configuration:security.allowed_extensions");
                            continue;
                        }
                        auto ext = normalize_extension(elem.get<std::string>());
                        if (!ext.empty()) {
                            config.security.allowed_extensions.insert(ext);
                        }
                    }
                } else {
                    result.warnings.push_back("invalid_configuration:security.allowed_extensions");
                }
            }
        } else {
            result.warnings.push_back("invalid_configuration:security");
        }

        if (config.security.max_filename_length <= 0) {
            result.error = "security.max_filename_length must be greater than 0";
            return result;
        }
        if (config.security.enforce_location_restrictions &&
            config.security.allowed_extensions.empty()) {
            result.error = "security.allowed_extensions must not be empty when "
                           "enforce_location_restrictions is enabled";
            return result;
        }

        // "ytdlp" section
        if (j["ytdlp"].is_object()) {
            const auto& yt = j["ytdlp"];
            read_string(yt, "binary", config.ytdlp.binary, "ytdlp", result.warnings);
            read_string(yt, "default_format", config.ytdlp.default_format, "ytdlp", result.warnings);
            read_string(yt, "default_filename_template",
                        config.ytdlp.default_filename_template, "ytdlp", result.warnings);
            read_number(yt, "max_download_size", config.ytdlp.max_download_size, "ytdlp",
                        result.warnings);
            read_number(yt, "info_timeout_seconds", config.ytdlp.info_timeout_seconds, "ytdlp",
                        result.warnings);
        } else {
            result.warnings.push_back("invalid_configuration:ytdlp");
        }

        if (config.ytdlp.binary.empty()) {
            result.warnings.push_back("invalid_configuration:ytdlp.binary");
            config.ytdlp.binary = "yt-dlp";
        }

        // "logging" section
        if (j["logging"].is_object()) {
            const auto& log = j["logging"];
            read_string(log, "level", config.logging.level, "logging", result.warnings);
            read_bool(log, "log_security_events", config.logging.log_security_events, "logging",
                      result.warnings);
            read_bool(log, "log_downloads", config.logging.log_downloads, "logging",
                      result.warnings);
        } else {
            result.warnings.push_back("invalid_configuration:logging");
        }

        // "warnings" section
        if (j["warnings"].is_object()) {
            for (auto& [key, val] : j["warnings"].items()) {
                std::string key_str = to_lower(key);
                if (!parse_warning_key(key_str)) {
                    result.warnings.push_back("invalid_configuration:unknown_warning:" + key_str);
                    continue;
                }
                std::optional<WarningAction> action;
                if (val.is_string()) {
                    action = parse_warning_action(val.get<std::string>());
                }
                if (action) {
                    config.warnings[key_str] = *action;
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_warning_action:" + key_str);
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

ServerConfigParseResult load_server_config(const std::string& path) {
    if (!path_exists(path)) {
        ServerConfigParseResult result;
        result.ok = true;
        result.config = get_builtin_config();
        return result;
    }

    auto content = read_file(path);
    if (!content) {
        ServerConfigParseResult result;
        result.error = "cannot read configuration file";
        return result;
    }

    return parse_server_config(*content, path);
}

std::string resolve_config_path(const std::string& override_path) {
    // 1. Explicit override
    if (!override_path.empty()) {
        return override_path;
    }

    // 2. Environment variable
    auto env_path = get_env("VDL_CONFIG");
    if (env_path && !env_path->empty()) {
        return *env_path;
    }

    // 3. XDG config home
    auto xdg = get_env("XDG_CONFIG_HOME");
    if (xdg && !xdg->empty()) {
        return join_path(join_path(*xdg, kConfigDirName), kConfigFileName);
    }

    // 4. Default: ~/.config
    auto home = get_home_directory();
    if (home) {
        return join_path(join_path(*home, std::string(".config/") + kConfigDirName),
                         kConfigFileName);
    }

    return kConfigFileName;
}

std::string serialize_server_config(const ServerConfig& config) {
    nlohmann::json j;

    j["download_locations"] = nlohmann::json::object();
    for (const auto& [id, path] : config.download_locations) {
        j["download_locations"][id] = path;
    }

    j["security"] = {
        {"enforce_location_restrictions", config.security.enforce_location_restrictions},
        {"max_filename_length", config.security.max_filename_length},
        {"allowed_extensions", config.security.allowed_extensions},
        {"block_path_traversal", config.security.block_path_traversal},
    };

    j["ytdlp"] = {
        {"binary", config.ytdlp.binary},
        {"default_format", config.ytdlp.default_format},
        {"default_filename_template", config.ytdlp.default_filename_template},
        {"max_download_size", config.ytdlp.max_download_size},
        {"info_timeout_seconds", config.ytdlp.info_timeout_seconds},
    };

    j["logging"] = {
        {"level", config.logging.level},
        {"log_security_events", config.logging.log_security_events},
        {"log_downloads", config.logging.log_downloads},
    };

    j["warnings"] = nlohmann::json::object();
    for (const auto& [key, action] : config.warnings) {
        j["warnings"][key] = action_to_string(action);
    }

    return j.dump(2);
}

} // namespace vdl
