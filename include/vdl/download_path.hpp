#pragma once

#include "vdl/config.hpp"
#include "vdl/types.hpp"
#include "vdl/warnings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vdl {

// ============================================================================
// Download Path Construction
// ============================================================================

struct PathRequest {
    std::optional<std::string> location_id;
    std::optional<std::string> relative_path;
    std::optional<std::string> filename_template;
};

struct ResolvedPath {
    std::string absolute_path;    // destination template handed to the engine
    std::string location_id;      // empty for legacy results
    std::string base_directory;   // canonical base the path is confined to
    bool validated = true;        // false only for legacy output_path results
};

struct PathConstructionResult {
    std::optional<ResolvedPath> path;
    ErrorKind error = ErrorKind::None;
    std::string detail;
    bool retryable = false;

    bool ok() const { return path.has_value(); }
};

struct DownloadVerification {
    std::vector<std::string> files;   // accepted outputs, canonical when validated
    ErrorKind error = ErrorKind::None;
    std::string detail;

    bool ok() const { return error == ErrorKind::None; }
};

// True when candidate lies strictly below base. Both are compared after
// separator normalization with trailing separators removed, and the prefix
// must end on a separator boundary so "/base2" is not inside "/base".
// Pure string operation; callers pass canonical paths.
bool is_strict_descendant(const std::string& base, const std::string& candidate);

// Turn (location_id, relative_path?, filename_template?) into a confined
// absolute path. Steps, stopping at the first failure:
//   1. resolve the location's base directory
//   2. validate the relative path (omitted = base itself)
//   3. sanitize the template (omitted or empty = configured default);
//      a template without placeholders is validated as a filename now
//   4. join base + relative path + template
//   5. canonicalize and require a strict descendant of the base
//      (BoundaryEscape otherwise, e.g. a symlink pointing outside or a
//      dangling symlink anywhere below the base)
PathConstructionResult construct_download_path(const PathRequest& request,
                                               const ServerConfig& config,
                                               WarningCollector* warnings = nullptr);

// Legacy mode: the caller's output_path is used as-is with no validation.
// Always emits deprecated_unsafe_path; when the warning policy escalates it
// to an error the request is rejected with DeprecatedUnsafePath instead.
PathConstructionResult construct_legacy_path(const std::string& output_path,
                                             WarningCollector& warnings);

// Re-check the file the engine actually produced. Applies the boundary check
// and validate_filename to it; a file that fails is deleted (when it sits
// lexically inside the base) and the rejection returned. Legacy results are
// passed through untouched.
PathConstructionResult verify_downloaded_file(const ResolvedPath& resolved,
                                              const std::string& actual_path,
                                              const SecurityPolicy& policy);

// Check every file the engine reports (one per playlist entry). The first
// failure rejects the whole download and every reported file
// lexically inside the base is deleted. When nothing is reported the only
// file that can be checked is a literal destination that exists; otherwise
// the download is rejected with DownloadUnverified. Legacy results pass.
DownloadVerification verify_downloaded_files(const ResolvedPath& resolved,
                                             const std::vector<std::string>& actual_paths,
                                             const SecurityPolicy& policy);

// Replace the directories of every location except keep_id (configured,
// expanded and canonical forms) with "<location:ID>" so error payloads
// never disclose where other locations live.
std::string redact_location_paths(const std::string& message,
                                  const LocationTable& table,
                                  const std::string& keep_id);

} // namespace vdl
