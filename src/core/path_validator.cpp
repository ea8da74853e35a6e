#include "vdl/path_validator.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <vector>

namespace vdl {

namespace {

// Percent-encoding can be nested ("%252e%252e"); decode a bounded number of
// rounds and check every form.
constexpr int kMaxDecodeRounds = 3;

ValidationResult reject(ErrorKind kind, std::string detail) {
    ValidationResult result;
    result.error = kind;
    result.detail = std::move(detail);
    return result;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

// The raw candidate followed by each distinct decoded form
std::vector<std::string> decoded_forms(const std::string& candidate) {
    std::vector<std::string> forms{candidate};
    std::string current = candidate;
    for (int round = 0; round < kMaxDecodeRounds; ++round) {
        std::string next = percent_decode(current);
        if (next == current) break;
        forms.push_back(next);
        current = std::move(next);
    }
    return forms;
}

bool is_control(unsigned char c) {
    return c < 0x20 || c == 0x7f;
}

std::optional<std::string> find_control_char(const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        auto c = static_cast<unsigned char>(s[i]);
        if (!is_control(c)) continue;
        if (c == 0) {
            return "NUL byte at offset " + std::to_string(i);
        }
        char buf[8];
        std::snprintf(buf, sizeof(buf), "0x%02x", c);
        return std::string("control character ") + buf + " at offset " + std::to_string(i);
    }
    return std::nullopt;
}

bool is_separator(char c) {
    return c == '/' || c == '\\';
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool starts_with_icase(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
    }
    return true;
}

// Leading separator, "C:" drive prefix, "file:" or any "scheme://"
std::optional<std::string> absolute_form(const std::string& s) {
    if (s.empty()) return std::nullopt;

    if (is_separator(s[0])) {
        return std::string("leading separator");
    }
    if (s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':') {
        return std::string("drive letter ") + s.substr(0, 2);
    }
    if (starts_with_icase(s, "file:")) {
        return std::string("file: scheme");
    }

    auto colon = s.find("://");
    if (colon != std::string::npos && colon > 0 &&
        std::isalpha(static_cast<unsigned char>(s[0]))) {
        bool scheme_chars = std::all_of(s.begin(), s.begin() + static_cast<std::string::difference_type>(colon),
                                        [](unsigned char c) {
                                            return std::isalnum(c) || c == '+' || c == '-' || c == '.';
                                        });
        if (scheme_chars) {
            return "scheme " + s.substr(0, colon) + "://";
        }
    }
    return std::nullopt;
}

std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (is_separator(c)) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

// 1-based index of the first ".." segment, 0 when there is none
size_t find_parent_segment(const std::string& s) {
    auto parts = split_segments(s);
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i] == "..") return i + 1;
    }
    return 0;
}

std::string normalize_segments(const std::string& s) {
    std::vector<std::string> normalized;
    for (const auto& part : split_segments(s)) {
        if (part.empty() || part == ".") {
            continue;
        }
        // Only reachable with block_path_traversal off; a leading ".." is
        // kept so the final boundary check sees the escape.
        if (part == ".." && !normalized.empty() && normalized.back() != "..") {
            normalized.pop_back();
            continue;
        }
        normalized.push_back(part);
    }

    std::string out;
    for (size_t i = 0; i < normalized.size(); ++i) {
        if (i > 0) out += '/';
        out += normalized[i];
    }
    return out;
}

std::string form_label(size_t index) {
    return index == 0 ? std::string() : " (after URL decoding)";
}

} // namespace

std::string get_extension(const std::string& filename) {
    auto pos = filename.rfind('.');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= filename.size()) {
        return {};
    }
    std::string ext = filename.substr(pos + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

ValidationResult validate_relative_path(const std::string& candidate,
                                        const SecurityPolicy& policy,
                                        bool require_non_empty) {
    auto forms = decoded_forms(candidate);

    for (size_t i = 0; i < forms.size(); ++i) {
        if (auto what = find_control_char(forms[i])) {
            return reject(ErrorKind::NullOrControlChar, *what + form_label(i));
        }
    }

    if (is_blank(candidate)) {
        if (require_non_empty) {
            return reject(ErrorKind::EmptyPath, "relative path is empty");
        }
        ValidationResult result;
        result.path = ValidatedPath(std::string());
        return result;
    }

    for (size_t i = 0; i < forms.size(); ++i) {
        if (auto what = absolute_form(forms[i])) {
            return reject(ErrorKind::AbsolutePath,
                          "absolute paths are not allowed: " + *what + form_label(i));
        }
    }

    if (policy.block_path_traversal) {
        for (size_t i = 0; i < forms.size(); ++i) {
            if (size_t segment = find_parent_segment(forms[i])) {
                return reject(ErrorKind::PathTraversal,
                              "parent-directory segment '..' at segment " +
                              std::to_string(segment) + form_label(i));
            }
        }
    }

    ValidationResult result;
    result.path = ValidatedPath(normalize_segments(candidate));
    return result;
}

ValidationResult validate_filename(const std::string& candidate,
                                   const SecurityPolicy& policy) {
    if (auto what = find_control_char(candidate)) {
        return reject(ErrorKind::NullOrControlChar, *what);
    }

    if (is_blank(candidate)) {
        return reject(ErrorKind::EmptyPath, "filename is empty");
    }

    if (std::any_of(candidate.begin(), candidate.end(), is_separator)) {
        return reject(ErrorKind::InvalidFilename, "filename must not contain a path separator");
    }

    if (candidate == "." || candidate == "..") {
        return reject(ErrorKind::PathTraversal, "filename must not be '.' or '..'");
    }

    if (candidate.size() > static_cast<size_t>(policy.max_filename_length)) {
        return reject(ErrorKind::FilenameTooLong,
                      "filename is " + std::to_string(candidate.size()) +
                      " bytes (max " + std::to_string(policy.max_filename_length) + ")");
    }

    std::string ext = get_extension(candidate);
    if (!ext.empty() && !policy.allowed_extensions.empty() &&
        policy.allowed_extensions.count(ext) == 0) {
        return reject(ErrorKind::ExtensionNotAllowed,
                      "file extension ." + ext + " is not allowed");
    }

    ValidationResult result;
    result.path = ValidatedPath(candidate);
    return result;
}

} // namespace vdl
