#pragma once

#include "vdl/config.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vdl {

// ============================================================================
// Extraction Engine
// ============================================================================

struct InfoResult {
    bool ok = false;
    nlohmann::json info;     // engine metadata document (-J output)
    std::string error;
};

struct DownloadRequest {
    std::string url;
    std::optional<std::string> format_id;
    std::string destination_template;   // absolute path, may hold placeholders
    std::uint64_t max_filesize = 0;     // 0 = unlimited
};

struct DownloadResult {
    bool success = false;
    std::vector<std::string> file_paths;    // every file the engine reports it wrote
    std::string log;                        // combined engine output excerpt
    std::string error;
};

// The engine as seen by the tools. Each operation is a plain function so
// tests can substitute canned behaviour without spawning processes.
struct ExtractionEngine {
    std::function<bool()> available;
    std::function<InfoResult(const std::string& url, bool flat_playlist)> extract_info;
    std::function<DownloadResult(const DownloadRequest& request)> download;
};

// Engine backed by the yt-dlp executable named in settings.binary.
// Runs it directly (argv, no shell) and never writes to stdout.
ExtractionEngine make_ytdlp_engine(const ExtractorSettings& settings);

// argv builders, exposed for inspection
std::vector<std::string> build_info_command(const ExtractorSettings& settings,
                                            const std::string& url, bool flat_playlist);

std::vector<std::string> build_download_command(const ExtractorSettings& settings,
                                                const DownloadRequest& request);

// Non-empty stdout lines in order. "--print after_move:filepath" emits one
// line per downloaded entry, so a playlist yields several.
std::vector<std::string> parse_printed_filepaths(const std::string& stdout_text);

} // namespace vdl
