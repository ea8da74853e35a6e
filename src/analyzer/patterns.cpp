#include "vdl/webpage_analyzer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace vdl {

namespace {

struct PatternSet {
    std::vector<std::string>* target;
    std::vector<const char*> expressions;
};

const char* kTitlePatterns[] = {
    R"(<title[^>]*>([^<]+)</title>)",
    R"(["']title["']:\s*["']([^"']+)["'])",
    R"(<meta[^>]*property=["']og:title["'][^>]*content=["']([^"']+)["'])",
};

const char* kDurationPatterns[] = {
    R"(duration["']:\s*["']?(\d+)["']?)",
    R"(["']duration["']:\s*(\d+))",
};

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::regex compile(const char* expression) {
    return std::regex(expression, std::regex::ECMAScript | std::regex::icase);
}

// Scheme and authority of a URL ("https://host:port"), empty when absent
std::string url_origin(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return "";
    auto path_start = url.find_first_of("/?#", scheme_end + 3);
    return url.substr(0, path_start);
}

// Apply "." and ".." segments of a URL path
std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        std::string segment = path.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        bool last = next == std::string::npos;

        if (segment == "..") {
            if (segments.size() > 1) segments.pop_back();
            if (last) segments.push_back("");
        } else if (segment == ".") {
            if (last) segments.push_back("");
        } else {
            segments.push_back(segment);
        }

        if (last) break;
        pos = next + 1;
    }

    std::string out;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += '/';
        out += segments[i];
    }
    return out;
}

} // namespace

std::string resolve_url(const std::string& base_url, const std::string& ref) {
    if (ref.rfind("//", 0) == 0) {
        return "https:" + ref;
    }

    std::string lowered = ref.substr(0, 4);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "http") {
        return ref;
    }

    std::string origin = url_origin(base_url);
    if (origin.empty()) {
        return ref;
    }

    if (!ref.empty() && ref[0] == '/') {
        return origin + remove_dot_segments(ref);
    }

    // Directory of the base path, without query or fragment
    std::string base_path = base_url.substr(origin.size());
    auto cut = base_path.find_first_of("?#");
    if (cut != std::string::npos) base_path = base_path.substr(0, cut);
    auto slash = base_path.rfind('/');
    base_path = slash == std::string::npos ? "/" : base_path.substr(0, slash + 1);

    return origin + remove_dot_segments(base_path + ref);
}

MediaPatterns extract_media_patterns(const std::string& html, const std::string& base_url) {
    MediaPatterns result;

    const std::vector<PatternSet> sets = {
        {&result.mpd_manifests, {
            R"((["'])(https?://[^"']*\.mpd(?:\?[^"']*)?)\1)",
            R"(manifest["']:\s*["']([^"']*\.mpd(?:\?[^"']*)?)["'])",
        }},
        {&result.m3u8_playlists, {
            R"((["'])(https?://[^"']*\.m3u8(?:\?[^"']*)?)\1)",
            R"(playlist["']:\s*["']([^"']*\.m3u8(?:\?[^"']*)?)["'])",
        }},
        {&result.video_files, {
            R"((["'])(https?://[^"']*\.(?:mp4|webm|mkv|avi|mov)(?:\?[^"']*)?)\1)",
            R"(src["']:\s*["']([^"']*\.(?:mp4|webm|mkv)(?:\?[^"']*)?)["'])",
        }},
        {&result.audio_files, {
            R"((["'])(https?://[^"']*\.(?:mp3|m4a|aac|ogg|wav)(?:\?[^"']*)?)\1)",
        }},
        {&result.subtitle_files, {
            R"((["'])(https?://[^"']*\.(?:vtt|srt|ass|ssa)(?:\?[^"']*)?)\1)",
        }},
    };

    for (const auto& set : sets) {
        for (const char* expression : set.expressions) {
            try {
                std::regex re = compile(expression);
                for (auto it = std::sregex_iterator(html.begin(), html.end(), re);
                     it != std::sregex_iterator(); ++it) {
                    const auto& match = *it;
                    std::string found = match.size() > 2 ? match[2].str() : match[1].str();
                    std::string url = resolve_url(base_url, found);
                    auto& bucket = *set.target;
                    if (std::find(bucket.begin(), bucket.end(), url) == bucket.end()) {
                        bucket.push_back(std::move(url));
                    }
                }
            } catch (const std::regex_error& e) {
                spdlog::debug("media pattern scan stopped: {}", e.what());
            }
        }
    }

    return result;
}

PageMetadata extract_metadata(const std::string& html) {
    PageMetadata metadata;

    try {
        for (const char* expression : kTitlePatterns) {
            std::smatch match;
            if (std::regex_search(html, match, compile(expression))) {
                metadata.title = trim(match[1].str());
                break;
            }
        }

        for (const char* expression : kDurationPatterns) {
            std::smatch match;
            if (std::regex_search(html, match, compile(expression))) {
                try {
                    metadata.duration = std::stoll(match[1].str());
                } catch (const std::out_of_range&) {
                    spdlog::debug("ignoring out-of-range duration {}", match[1].str());
                }
                break;
            }
        }
    } catch (const std::regex_error& e) {
        spdlog::debug("metadata scan stopped: {}", e.what());
    }

    return metadata;
}

} // namespace vdl
