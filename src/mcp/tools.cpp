#include "vdl/tools.hpp"
#include "vdl/download_path.hpp"
#include "vdl/location_resolver.hpp"
#include "vdl/log.hpp"
#include "vdl/warnings.hpp"

#include <algorithm>
#include <cctype>

namespace vdl {

using json = nlohmann::json;

namespace {

// ============================================================================
// Helpers
// ============================================================================

std::string require_string(const json& args, const std::string& key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        throw ToolArgumentError("missing required argument '" + key + "'");
    }
    if (!it->is_string()) {
        throw ToolArgumentError("argument '" + key + "' must be a string");
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        throw ToolArgumentError("argument '" + key + "' must not be empty");
    }
    return value;
}

// Absent, null and "" all mean "not supplied"
std::optional<std::string> optional_string(const json& args, const std::string& key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw ToolArgumentError("argument '" + key + "' must be a string");
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

json field_or_null(const json& info, const char* key) {
    auto it = info.find(key);
    return it == info.end() ? json(nullptr) : *it;
}

// At most limit bytes, never splitting a UTF-8 sequence, followed by "...".
// The marker is appended even when nothing was cut.
std::string excerpt_with_ellipsis(const std::string& text, size_t limit) {
    if (text.size() <= limit) {
        return text + "...";
    }
    size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + "...";
}

json url_schema(const std::string& description) {
    return {{"type", "object"},
            {"properties", {{"url", {{"type", "string"}, {"description", description}}}}},
            {"required", json::array({"url"})}};
}

ToolResult failure(const std::string& message) {
    return {{{"success", false}, {"error", message}}, true};
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

json metadata_to_json(const PageMetadata& metadata) {
    json out = json::object();
    if (metadata.title) out["title"] = *metadata.title;
    if (metadata.duration) out["duration"] = *metadata.duration;
    return out;
}

// ============================================================================
// Engine tools
// ============================================================================

ToolDef make_check_support_tool() {
    return {
        "check_ytdlp_support",
        "Check if a URL is supported by yt-dlp and get basic info",
        url_schema("Video URL to check"),
        [](const json& args, const ToolContext& ctx) -> ToolResult {
            std::string url = require_string(args, "url");

            if (!ctx.engine.available()) {
                return {{{"supported", false},
                         {"error", ctx.config.ytdlp.binary + " is not installed or available"}}, false};
            }

            auto extracted = ctx.engine.extract_info(url, false);
            if (!extracted.ok) {
                return {{{"supported", false}, {"error", "URL not supported by yt-dlp"}}, false};
            }

            const auto& info = extracted.info;
            json description = nullptr;
            auto desc = info.find("description");
            if (desc != info.end() && desc->is_string() && !desc->get<std::string>().empty()) {
                description = excerpt_with_ellipsis(desc->get<std::string>(), 200);
            }

            return {{{"supported", true},
                     {"title", field_or_null(info, "title")},
                     {"duration", field_or_null(info, "duration")},
                     {"uploader", field_or_null(info, "uploader")},
                     {"view_count", field_or_null(info, "view_count")},
                     {"upload_date", field_or_null(info, "upload_date")},
                     {"description", description}}, false};
        }
    };
}

ToolDef make_video_info_tool() {
    return {
        "get_video_info",
        "Get detailed video information including available formats",
        url_schema("Video URL to analyze"),
        [](const json& args, const ToolContext& ctx) -> ToolResult {
            std::string url = require_string(args, "url");

            auto extracted = ctx.engine.extract_info(url, false);
            if (!extracted.ok) {
                return failure("Could not extract video information");
            }
            const auto& info = extracted.info;

            size_t format_count = 0;
            auto formats = info.find("formats");
            if (formats != info.end() && formats->is_array()) {
                format_count = formats->size();
            }

            json languages = json::array();
            auto subtitles = info.find("subtitles");
            if (subtitles != info.end() && subtitles->is_object()) {
                for (const auto& [lang, tracks] : subtitles->items()) {
                    languages.push_back(lang);
                }
            }

            return {{{"success", true},
                     {"title", field_or_null(info, "title")},
                     {"duration", field_or_null(info, "duration")},
                     {"thumbnail", field_or_null(info, "thumbnail")},
                     {"description", field_or_null(info, "description")},
                     {"uploader", field_or_null(info, "uploader")},
                     {"upload_date", field_or_null(info, "upload_date")},
                     {"view_count", field_or_null(info, "view_count")},
                     {"webpage_url", field_or_null(info, "webpage_url")},
                     {"format_count", format_count},
                     {"subtitle_languages", languages}}, false};
        }
    };
}

ToolDef make_formats_tool() {
    return {
        "get_video_formats",
        "Get available video/audio formats and quality options",
        url_schema("Video URL to get formats for"),
        [](const json& args, const ToolContext& ctx) -> ToolResult {
            std::string url = require_string(args, "url");

            auto extracted = ctx.engine.extract_info(url, false);
            if (!extracted.ok) {
                return failure("Could not get video formats");
            }
            auto formats = extracted.info.find("formats");
            if (formats == extracted.info.end() || !formats->is_array() || formats->empty()) {
                return failure("Could not get video formats");
            }

            json processed = json::array();
            for (const auto& fmt : *formats) {
                if (!fmt.is_object()) continue;

                std::string resolution = "audio-only";
                auto height = fmt.find("height");
                if (height != fmt.end() && height->is_number() && height->get<double>() > 0) {
                    resolution = std::to_string(static_cast<long long>(height->get<double>())) + "p";
                }

                json media_url = nullptr;
                auto url_field = fmt.find("url");
                if (url_field != fmt.end() && url_field->is_string() &&
                    !url_field->get<std::string>().empty()) {
                    media_url = excerpt_with_ellipsis(url_field->get<std::string>(), 100);
                }

                processed.push_back({{"format_id", field_or_null(fmt, "format_id")},
                                     {"ext", field_or_null(fmt, "ext")},
                                     {"resolution", resolution},
                                     {"fps", field_or_null(fmt, "fps")},
                                     {"vcodec", field_or_null(fmt, "vcodec")},
                                     {"acodec", field_or_null(fmt, "acodec")},
                                     {"filesize", field_or_null(fmt, "filesize")},
                                     {"tbr", field_or_null(fmt, "tbr")},
                                     {"format_note", field_or_null(fmt, "format_note")},
                                     {"url", media_url}});
            }

            return {{{"success", true}, {"formats", processed}}, false};
        }
    };
}

// ============================================================================
// Downloads
// ============================================================================

ToolResult download_rejected(const PathConstructionResult& rejected,
                             const ServerConfig& config,
                             const std::string& keep_id,
                             const WarningCollector& warnings) {
    json payload = {{"success", false},
                    {"error", redact_location_paths(rejected.detail, config.download_locations, keep_id)},
                    {"error_kind", error_kind_to_string(rejected.error)}};
    if (rejected.retryable) {
        payload["retryable"] = true;
    }
    payload["warnings"] = warnings_to_json(warnings.get_warnings());
    return {payload, true};
}

ToolDef make_download_tool() {
    return {
        "download_video",
        "Download a video into a configured download location.\n"
        "Use location_id (see get_download_locations), an optional relative_path "
        "inside it and an optional yt-dlp filename_template. output_path is "
        "deprecated and unvalidated; it is ignored when any location field is given.",
        {{"type", "object"}, {"properties", {
            {"url", {{"type", "string"}, {"description", "Video URL to download"}}},
            {"location_id", {{"type", "string"}, {"description", "Configured download location id"}}},
            {"relative_path", {{"type", "string"}, {"description", "Subdirectory inside the location (optional)"}}},
            {"filename_template", {{"type", "string"}, {"description", "yt-dlp output template, e.g. %(title)s.%(ext)s (optional)"}}},
            {"format_id", {{"type", "string"}, {"description", "Specific format ID to download (optional)"}}},
            {"output_path", {{"type", "string"}, {"description", "Deprecated: unvalidated output path template"}}}
        }}, {"required", json::array({"url"})}},
        [](const json& args, const ToolContext& ctx) -> ToolResult {
            const auto& config = ctx.config;
            std::string url = require_string(args, "url");

            PathRequest request;
            request.location_id = optional_string(args, "location_id");
            request.relative_path = optional_string(args, "relative_path");
            request.filename_template = optional_string(args, "filename_template");
            auto format_id = optional_string(args, "format_id");
            auto output_path = optional_string(args, "output_path");

            WarningCollector warnings(config);
            bool secure_fields = request.location_id || request.relative_path ||
                                 request.filename_template;

            PathConstructionResult resolved;
            if (output_path && !secure_fields) {
                resolved = construct_legacy_path(*output_path, warnings);
            } else {
                if (output_path) {
                    warnings.emit(Warning::legacy_output_path_ignored,
                                  warnings::legacy_output_path_ignored());
                }
                resolved = construct_download_path(request, config, &warnings);
            }

            std::string keep_id = resolved.ok() ? resolved.path->location_id
                                                : request.location_id.value_or("");
            if (!resolved.ok()) {
                return download_rejected(resolved, config, keep_id, warnings);
            }

            DownloadRequest download;
            download.url = url;
            download.format_id = format_id ? format_id : std::optional<std::string>(config.ytdlp.default_format);
            download.destination_template = resolved.path->absolute_path;
            download.max_filesize = config.ytdlp.max_download_size;

            auto outcome = ctx.engine.download(download);
            std::string log = redact_location_paths(outcome.log, config.download_locations, keep_id);

            if (!outcome.success) {
                return {{{"success", false},
                         {"error", redact_location_paths(outcome.error, config.download_locations, keep_id)},
                         {"log", log},
                         {"warnings", warnings_to_json(warnings.get_warnings())}}, true};
            }

            if (!resolved.path->validated && outcome.file_paths.empty()) {
                warnings.emit(Warning::download_unverified,
                              warnings::download_unverified("engine did not report the output file"));
            }
            auto verified = verify_downloaded_files(*resolved.path, outcome.file_paths, config.security);
            if (!verified.ok()) {
                PathConstructionResult rejected;
                rejected.error = verified.error;
                rejected.detail = verified.detail;
                return download_rejected(rejected, config, keep_id, warnings);
            }

            json file_path = nullptr;
            if (!verified.files.empty()) {
                file_path = verified.files.back();
            }

            json location = nullptr;
            if (resolved.path->validated) {
                location = resolved.path->location_id;
            }

            return {{{"success", true},
                     {"download_path", resolved.path->absolute_path},
                     {"file_path", file_path},
                     {"file_paths", verified.files},
                     {"location_id", location},
                     {"validated", resolved.path->validated},
                     {"log", log},
                     {"warnings", warnings_to_json(warnings.get_warnings())}}, false};
        }
    };
}

ToolDef make_locations_tool() {
    return {
        "get_download_locations",
        "List the configured download locations and whether each one is usable",
        {{"type", "object"}, {"properties", json::object()}},
        [](const json&, const ToolContext& ctx) -> ToolResult {
            json locations = json::object();
            for (const auto& status : describe_locations(ctx.config.download_locations,
                                                         ctx.config.security)) {
                json entry = {{"original", status.configured},
                              {"path", status.path},
                              {"writable", status.writable}};
                if (!status.error.empty()) {
                    entry["error"] = status.error;
                }
                locations[status.id] = entry;
            }

            return {{{"success", true},
                     {"locations", locations},
                     {"enforce_location_restrictions",
                      ctx.config.security.enforce_location_restrictions}}, false};
        }
    };
}

// ============================================================================
// Webpage tools
// ============================================================================

ToolDef make_analyze_webpage_tool() {
    return {
        "analyze_webpage",
        "Fallback: Analyze webpage for video content when yt-dlp fails",
        url_schema("Webpage URL to analyze"),
        [](const json& args, const ToolContext& ctx) -> ToolResult {
            std::string url = require_string(args, "url");

            auto page = ctx.fetch(url);
            if (!page.ok || page.body.empty()) {
                spdlog::debug("fetch of {} failed: {}", url, page.error);
                return failure("Could not fetch webpage content");
            }

            std::string lowered = lowercase(page.body);
            return {{{"success", true},
                     {"metadata", metadata_to_json(extract_metadata(page.body))},
                     {"content_length", page.body.size()},
                     {"has_video_tags", lowered.find("<video") != std::string::npos},
                     {"has_iframe", lowered.find("<iframe") != std::string::npos}}, false};
        }
    };
}

ToolDef make_media_patterns_tool() {
    return {
        "extract_media_patterns",
        "Extract video/audio URLs from webpage HTML using pattern matching",
        url_schema("Webpage URL to extract media from"),
        [](const json& args, const ToolContext& ctx) -> ToolResult {
            std::string url = require_string(args, "url");

            auto page = ctx.fetch(url);
            if (!page.ok || page.body.empty()) {
                spdlog::debug("fetch of {} failed: {}", url, page.error);
                return failure("Could not fetch webpage content");
            }

            auto patterns = extract_media_patterns(page.body, url);
            return {{{"success", true},
                     {"total_media_urls", patterns.total()},
                     {"patterns", {{"mpd_manifests", patterns.mpd_manifests},
                                   {"m3u8_playlists", patterns.m3u8_playlists},
                                   {"video_files", patterns.video_files},
                                   {"audio_files", patterns.audio_files},
                                   {"subtitle_files", patterns.subtitle_files}}},
                     {"metadata", metadata_to_json(extract_metadata(page.body))}}, false};
        }
    };
}

} // namespace

json warnings_to_json(const std::vector<WarningObject>& warnings) {
    json out = json::array();
    for (const auto& w : warnings) {
        json fields = json::object();
        for (const auto& [k, v] : w.fields) {
            fields[k] = v;
        }
        out.push_back({{"key", w.key}, {"action", w.action}, {"fields", fields}});
    }
    return out;
}

std::vector<ToolDef> register_all_tools() {
    return {
        make_check_support_tool(),
        make_video_info_tool(),
        make_formats_tool(),
        make_download_tool(),
        make_analyze_webpage_tool(),
        make_media_patterns_tool(),
        make_locations_tool()
    };
}

} // namespace vdl
