#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace vdl {

// ============================================================================
// Error Kinds
// ============================================================================

// Every rejection produced by the path subsystem carries exactly one kind.
// DeprecatedUnsafePath is normally a warning; it only becomes a rejection
// when the warning policy escalates it to an error.
enum class ErrorKind {
    None,
    UnknownLocation,
    LocationRequired,
    LocationNotWritable,
    PathTraversal,
    AbsolutePath,
    NullOrControlChar,
    EmptyPath,
    FilenameTooLong,
    ExtensionNotAllowed,
    BoundaryEscape,
    DeprecatedUnsafePath,
    InvalidFilename,
    InvalidConfiguration,
    DownloadUnverified,
};

inline const char* error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "none";
        case ErrorKind::UnknownLocation: return "unknown_location";
        case ErrorKind::LocationRequired: return "location_required";
        case ErrorKind::LocationNotWritable: return "location_not_writable";
        case ErrorKind::PathTraversal: return "path_traversal";
        case ErrorKind::AbsolutePath: return "absolute_path";
        case ErrorKind::NullOrControlChar: return "null_or_control_char";
        case ErrorKind::EmptyPath: return "empty_path";
        case ErrorKind::FilenameTooLong: return "filename_too_long";
        case ErrorKind::ExtensionNotAllowed: return "extension_not_allowed";
        case ErrorKind::BoundaryEscape: return "boundary_escape";
        case ErrorKind::DeprecatedUnsafePath: return "deprecated_unsafe_path";
        case ErrorKind::InvalidFilename: return "invalid_filename";
        case ErrorKind::InvalidConfiguration: return "invalid_configuration";
        case ErrorKind::DownloadUnverified: return "download_unverified";
        default: return "unknown";
    }
}

// ============================================================================
// Warnings
// ============================================================================

enum class Warning {
    deprecated_unsafe_path,
    legacy_output_path_ignored,
    location_world_writable,
    download_unverified,
    invalid_configuration,
};

inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::deprecated_unsafe_path: return "deprecated_unsafe_path";
        case Warning::legacy_output_path_ignored: return "legacy_output_path_ignored";
        case Warning::location_world_writable: return "location_world_writable";
        case Warning::download_unverified: return "download_unverified";
        case Warning::invalid_configuration: return "invalid_configuration";
        default: return "unknown";
    }
}

// Parse warning key string to enum (case-insensitive)
std::optional<Warning> parse_warning_key(const std::string& key);

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

} // namespace vdl
