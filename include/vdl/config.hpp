#pragma once

#include "vdl/types.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace vdl {

// ============================================================================
// Security Policy
// ============================================================================

struct SecurityPolicy {
    bool enforce_location_restrictions = true;
    int max_filename_length = 255;
    std::set<std::string> allowed_extensions;  // lowercase, no leading dot
    bool block_path_traversal = true;
};

// location id -> configured base directory (unexpanded, e.g. "~/video-downloader")
using LocationTable = std::map<std::string, std::string>;

// ============================================================================
// Server Configuration
// ============================================================================

struct ExtractorSettings {
    std::string binary = "yt-dlp";
    std::string default_format = "best[height<=1080]";
    std::string default_filename_template = "%(title)s.%(ext)s";
    std::uint64_t max_download_size = 0;  // bytes, 0 = unlimited
    int info_timeout_seconds = 30;
};

struct LoggingSettings {
    std::string level = "info";
    bool log_security_events = true;
    bool log_downloads = true;
};

// Loaded once at startup and never mutated afterwards; every component
// receives it (or a part of it) by const reference.
struct ServerConfig {
    LocationTable download_locations;
    SecurityPolicy security;
    ExtractorSettings ytdlp;
    LoggingSettings logging;

    // [warnings] section - maps warning key to action
    std::unordered_map<std::string, WarningAction> warnings;

    // Source path for diagnostics (empty for built-in defaults)
    std::string source_path;
};

// Built-in defaults used when no configuration file exists
ServerConfig get_builtin_config();

// ============================================================================
// Parsing and Loading
// ============================================================================

struct ServerConfigParseResult {
    bool ok = false;
    std::string error;
    ServerConfig config;
    std::vector<std::string> warnings;
};

// Parse a configuration document and deep-merge it over the built-in defaults
ServerConfigParseResult parse_server_config(const std::string& json_str,
                                            const std::string& source_path = "");

// Load the configuration file at path; a missing file yields the defaults
ServerConfigParseResult load_server_config(const std::string& path);

// Resolve the configuration path.
// Priority: explicit path > VDL_CONFIG > $XDG_CONFIG_HOME/... > ~/.config/...
std::string resolve_config_path(const std::string& override_path = "");

// Serialize the effective configuration (for `vdl config`)
std::string serialize_server_config(const ServerConfig& config);

} // namespace vdl
