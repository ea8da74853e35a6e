#include "vdl/template_sanitizer.hpp"

#include <cctype>
#include <cstring>

namespace vdl {

namespace {

const char* kSafePunctuation = ".-_()[] ";
const char* kConversionFlags = "#0-+ ";
const char* kConversionTypes = "diouxXeEfFgGcrsaBjhlqDSU";

bool is_ascii_alnum(unsigned char c) {
    return c < 0x80 && std::isalnum(c) != 0;
}

bool is_safe_literal(unsigned char c) {
    if (c == 0) return false;
    return is_ascii_alnum(c) || std::strchr(kSafePunctuation, c) != nullptr;
}

bool is_field_char(unsigned char c) {
    return is_ascii_alnum(c) || c == '_' || c == '.' || c == ',' || c == ':' ||
           c == '+' || c == '-';
}

// Length of the placeholder starting at pos ("%(...)..."), 0 if none
size_t match_placeholder(const std::string& s, size_t pos) {
    if (pos + 1 >= s.size() || s[pos] != '%' || s[pos + 1] != '(') {
        return 0;
    }

    size_t i = pos + 2;
    size_t field_start = i;
    while (i < s.size() && is_field_char(static_cast<unsigned char>(s[i]))) {
        ++i;
    }
    if (i == field_start || i >= s.size() || s[i] != ')') {
        return 0;
    }
    ++i;

    while (i < s.size() && s[i] != '\0' && std::strchr(kConversionFlags, s[i]) != nullptr) ++i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i < s.size() && s[i] == '.') {
        size_t digits = i + 1;
        while (digits < s.size() && std::isdigit(static_cast<unsigned char>(s[digits]))) ++digits;
        if (digits == i + 1) return 0;
        i = digits;
    }

    if (i >= s.size() || s[i] == '\0' || std::strchr(kConversionTypes, s[i]) == nullptr) {
        return 0;
    }
    return i + 1 - pos;
}

// Number of bytes in the UTF-8 sequence introduced by lead (at least 1)
size_t utf8_sequence_length(unsigned char lead) {
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

} // namespace

std::string sanitize_template(const std::string& tmpl) {
    std::string out;
    out.reserve(tmpl.size());

    size_t i = 0;
    while (i < tmpl.size()) {
        auto c = static_cast<unsigned char>(tmpl[i]);

        if (c == '%') {
            if (size_t len = match_placeholder(tmpl, i)) {
                out.append(tmpl, i, len);
                i += len;
                continue;
            }
            if (i + 1 < tmpl.size() && tmpl[i + 1] == '%') {
                out += "%%";
                i += 2;
                continue;
            }
            out += '_';
            ++i;
            continue;
        }

        if (c < 0x20 || c == 0x7f) {
            ++i;
            continue;
        }

        if (c >= 0x80) {
            size_t len = utf8_sequence_length(c);
            size_t end = i + 1;
            while (end < tmpl.size() && end < i + len &&
                   (static_cast<unsigned char>(tmpl[end]) & 0xC0) == 0x80) {
                ++end;
            }
            out += '_';
            i = end;
            continue;
        }

        out += is_safe_literal(c) ? static_cast<char>(c) : '_';
        ++i;
    }

    size_t leading = 0;
    while (leading < out.size() && (out[leading] == '.' || out[leading] == ' ')) {
        ++leading;
    }
    return out.substr(leading);
}

bool has_placeholders(const std::string& tmpl) {
    for (size_t i = 0; i < tmpl.size(); ++i) {
        if (tmpl[i] != '%') continue;
        if (match_placeholder(tmpl, i) > 0) {
            return true;
        }
        if (i + 1 < tmpl.size() && tmpl[i + 1] == '%') {
            ++i;  // "%%" escape
        }
    }
    return false;
}

} // namespace vdl
