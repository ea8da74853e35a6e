#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vdl {

// ============================================================================
// Page Fetching
// ============================================================================

struct FetchResult {
    bool ok = false;
    std::string body;
    long http_status = 0;
    std::string content_type;
    std::string error;
};

// Fetch function used by the analyzer tools; replaceable in tests
using PageFetcher = std::function<FetchResult(const std::string& url)>;

// Fetch a page over HTTP(S) with libcurl. Follows redirects, verifies TLS,
// sends a desktop browser User-Agent and gives up after 30 seconds.
// Non-2xx responses and bodies over 10 MiB are failures.
FetchResult fetch_page(const std::string& url);

// ============================================================================
// Pattern Extraction
// ============================================================================

struct MediaPatterns {
    std::vector<std::string> mpd_manifests;
    std::vector<std::string> m3u8_playlists;
    std::vector<std::string> video_files;
    std::vector<std::string> audio_files;
    std::vector<std::string> subtitle_files;

    size_t total() const {
        return mpd_manifests.size() + m3u8_playlists.size() + video_files.size() +
               audio_files.size() + subtitle_files.size();
    }
};

struct PageMetadata {
    std::optional<std::string> title;
    std::optional<long long> duration;
};

// Scan HTML for manifest, playlist, video, audio and subtitle URLs.
// Relative URLs are resolved against base_url; each category keeps the
// first occurrence of every URL, in document order per pattern.
MediaPatterns extract_media_patterns(const std::string& html, const std::string& base_url);

// Title from <title>, a JSON "title" field or og:title (first match wins),
// duration in seconds from a "duration" field.
PageMetadata extract_metadata(const std::string& html);

// Resolve a reference found in a page against the page URL.
// "//host/x" becomes https, "/x" is rooted at the base authority and
// anything else not starting with "http" is relative to the base path.
std::string resolve_url(const std::string& base_url, const std::string& ref);

} // namespace vdl
