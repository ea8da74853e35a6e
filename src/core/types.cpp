#include "vdl/types.hpp"

#include <algorithm>
#include <cctype>

namespace vdl {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Warning> parse_warning_key(const std::string& key) {
    std::string lower = to_lower(key);

    if (lower == "deprecated_unsafe_path") return Warning::deprecated_unsafe_path;
    if (lower == "legacy_output_path_ignored") return Warning::legacy_output_path_ignored;
    if (lower == "location_world_writable") return Warning::location_world_writable;
    if (lower == "download_unverified") return Warning::download_unverified;
    if (lower == "invalid_configuration") return Warning::invalid_configuration;

    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    if (lower == "error") return WarningAction::Error;
    return std::nullopt;
}

} // namespace vdl
