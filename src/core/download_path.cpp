#include "vdl/download_path.hpp"
#include "vdl/location_resolver.hpp"
#include "vdl/log.hpp"
#include "vdl/path_validator.hpp"
#include "vdl/platform.hpp"
#include "vdl/template_sanitizer.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace vdl {

namespace {

PathConstructionResult reject(ErrorKind kind, std::string detail, bool retryable = false) {
    PathConstructionResult result;
    result.error = kind;
    result.detail = std::move(detail);
    result.retryable = retryable;
    return result;
}

PathConstructionResult rejected_request(const std::string& location_id, ErrorKind kind,
                                        std::string detail, bool retryable = false) {
    security_logger()->info("rejected download path for location '{}': {} ({})",
                            location_id, error_kind_to_string(kind), detail);
    return reject(kind, std::move(detail), retryable);
}

std::string strip_trailing_separators(const std::string& path) {
    std::string out = to_portable_path(path);
    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

// Template to hand to the engine: the caller's, else the configured default
std::string effective_template(const PathRequest& request, const ServerConfig& config) {
    if (request.filename_template) {
        std::string sanitized = sanitize_template(*request.filename_template);
        if (!sanitized.empty()) {
            return sanitized;
        }
    }
    return sanitize_template(config.ytdlp.default_filename_template);
}

// weakly_canonical stops resolving at the first missing component, and a
// dangling symlink counts as missing. Every symlink between the base and
// path must resolve to an existing target inside the base.
bool symlinks_stay_inside(const std::string& base_dir, const std::string& path) {
    std::string base = strip_trailing_separators(base_dir);
    std::string full = to_portable_path(path);
    if (full.compare(0, base.size(), base) != 0) {
        return true;
    }
    if (base != "/" && full.size() > base.size() && full[base.size()] != '/') {
        return true;
    }

    std::string rest = full.substr(base.size());
    std::string current = base;
    size_t pos = 0;
    while (pos < rest.size()) {
        size_t next = rest.find('/', pos);
        if (next == std::string::npos) next = rest.size();
        std::string component = rest.substr(pos, next - pos);
        pos = next + 1;

        if (component.empty() || component == ".") continue;
        if (component == "..") break;

        current = join_path(current, component);
        if (!is_symlink(current)) {
            if (!path_exists(current)) break;
            continue;
        }
        auto target = canonical_path(current);
        if (!target || (*target != base && !is_strict_descendant(base, *target))) {
            return false;
        }
    }
    return true;
}

} // namespace

bool is_strict_descendant(const std::string& base, const std::string& candidate) {
    std::string norm_base = strip_trailing_separators(base);
    std::string norm_path = strip_trailing_separators(candidate);

    if (norm_base.empty() || norm_path.size() <= norm_base.size()) {
        return false;
    }
    if (norm_path.compare(0, norm_base.size(), norm_base) != 0) {
        return false;
    }

    // Prefix must end on a separator boundary: /base2 is not inside /base
    std::string rel = norm_base == "/" ? norm_path.substr(1)
                                       : norm_path.substr(norm_base.size());
    if (norm_base != "/") {
        if (rel.empty() || rel[0] != '/') {
            return false;
        }
        rel = rel.substr(1);
    }
    if (rel.empty()) {
        return false;
    }

    // A canonical path has no ".." left, but never trust that blindly
    int depth = 0;
    size_t pos = 0;
    while (pos <= rel.size()) {
        size_t next = rel.find('/', pos);
        std::string component = (next == std::string::npos)
            ? rel.substr(pos)
            : rel.substr(pos, next - pos);

        if (component == "..") {
            depth--;
            if (depth < 0) return false;
        } else if (!component.empty() && component != ".") {
            depth++;
        }

        if (next == std::string::npos) break;
        pos = next + 1;
    }

    return depth > 0;
}

PathConstructionResult construct_download_path(const PathRequest& request,
                                               const ServerConfig& config,
                                               WarningCollector* warnings) {
    const auto& policy = config.security;
    std::string requested_id = request.location_id.value_or("");

    // 1. Base directory
    auto base = resolve_base(request.location_id, config.download_locations, policy, warnings);
    if (!base.ok()) {
        return rejected_request(requested_id, base.error, base.detail, base.retryable);
    }
    const auto& base_dir = base.base->directory;
    const auto& location_id = base.base->location_id;

    // 2. Relative path
    auto rel = validate_relative_path(request.relative_path.value_or(""), policy);
    if (!rel.ok()) {
        return rejected_request(location_id, rel.error, "relative_path: " + rel.detail);
    }

    // 3. Filename template
    std::string tmpl = effective_template(request, config);
    if (tmpl.empty()) {
        return rejected_request(location_id, ErrorKind::EmptyPath,
                                "filename_template is empty after sanitization");
    }
    if (!has_placeholders(tmpl)) {
        auto name = validate_filename(tmpl, policy);
        if (!name.ok()) {
            return rejected_request(location_id, name.error, "filename_template: " + name.detail);
        }
    }

    // 4. Join
    std::string joined = join_path(join_path(base_dir, rel.path->str()), tmpl);

    // 5. Boundary check on the canonical form
    auto canonical = weakly_canonical_path(joined);
    if (!canonical || !symlinks_stay_inside(base_dir, joined) ||
        !is_strict_descendant(base_dir, *canonical)) {
        security_logger()->critical(
            "boundary escape for location '{}': relative_path '{}' resolves outside the base",
            location_id, rel.path->str());
        return reject(ErrorKind::BoundaryEscape,
                      "resolved path escapes location '" + location_id + "'");
    }

    ResolvedPath resolved;
    resolved.absolute_path = *canonical;
    resolved.location_id = location_id;
    resolved.base_directory = base_dir;
    resolved.validated = true;

    PathConstructionResult result;
    result.path = std::move(resolved);
    return result;
}

PathConstructionResult construct_legacy_path(const std::string& output_path,
                                             WarningCollector& warnings) {
    auto action = warnings.emit(Warning::deprecated_unsafe_path,
                                warnings::deprecated_unsafe_path(output_path));

    if (action == WarningAction::Error) {
        security_logger()->warn("legacy output_path refused by warning policy");
        return reject(ErrorKind::DeprecatedUnsafePath,
                      "output_path is disabled; use location_id, relative_path and filename_template");
    }

    security_logger()->warn("legacy output_path used without validation: {}", output_path);

    ResolvedPath resolved;
    resolved.absolute_path = output_path;
    resolved.validated = false;

    PathConstructionResult result;
    result.path = std::move(resolved);
    return result;
}

PathConstructionResult verify_downloaded_file(const ResolvedPath& resolved,
                                              const std::string& actual_path,
                                              const SecurityPolicy& policy) {
    if (!resolved.validated) {
        ResolvedPath passthrough = resolved;
        passthrough.absolute_path = actual_path;
        PathConstructionResult result;
        result.path = std::move(passthrough);
        return result;
    }

    bool lexically_inside = is_strict_descendant(
        resolved.base_directory, to_portable_path(actual_path));

    auto remove_output = [&](std::string detail) {
        if (lexically_inside && path_exists(actual_path)) {
            if (remove_file(actual_path)) {
                detail += " (output removed)";
            } else {
                detail += " (output could not be removed)";
                spdlog::error("failed to remove rejected download in location '{}'",
                              resolved.location_id);
            }
        }
        return detail;
    };

    auto canonical = weakly_canonical_path(actual_path);
    if (!canonical || !symlinks_stay_inside(resolved.base_directory, actual_path) ||
        !is_strict_descendant(resolved.base_directory, *canonical)) {
        security_logger()->critical("boundary escape after download in location '{}'",
                                    resolved.location_id);
        return reject(ErrorKind::BoundaryEscape,
                      remove_output("downloaded file escapes location '" +
                                    resolved.location_id + "'"));
    }

    auto name = validate_filename(get_filename(*canonical), policy);
    if (!name.ok()) {
        security_logger()->info("rejected downloaded file in location '{}': {} ({})",
                                resolved.location_id, error_kind_to_string(name.error),
                                name.detail);
        return reject(name.error, remove_output("downloaded file: " + name.detail));
    }

    ResolvedPath verified = resolved;
    verified.absolute_path = *canonical;

    PathConstructionResult result;
    result.path = std::move(verified);
    return result;
}

DownloadVerification verify_downloaded_files(const ResolvedPath& resolved,
                                             const std::vector<std::string>& actual_paths,
                                             const SecurityPolicy& policy) {
    DownloadVerification result;
    if (!resolved.validated) {
        result.files = actual_paths;
        return result;
    }

    std::vector<std::string> reported = actual_paths;
    if (reported.empty()) {
        const auto& destination = resolved.absolute_path;
        if (has_placeholders(get_filename(destination)) || !path_exists(destination)) {
            security_logger()->warn("engine reported no output file in location '{}'",
                                    resolved.location_id);
            result.error = ErrorKind::DownloadUnverified;
            result.detail = "engine did not report the downloaded file; it cannot be checked";
            return result;
        }
        reported.push_back(destination);
    }

    for (const auto& actual : reported) {
        auto verified = verify_downloaded_file(resolved, actual, policy);
        if (verified.ok()) {
            result.files.push_back(verified.path->absolute_path);
            continue;
        }

        // One bad file condemns the whole download
        int removed = 0;
        bool failed = false;
        for (const auto& other : reported) {
            if (!is_strict_descendant(resolved.base_directory, to_portable_path(other)) ||
                !path_exists(other)) {
                continue;
            }
            if (remove_file(other)) {
                ++removed;
            } else {
                failed = true;
                spdlog::error("failed to remove rejected download in location '{}'",
                              resolved.location_id);
            }
        }

        result.files.clear();
        result.error = verified.error;
        result.detail = verified.detail;
        if (removed > 0) {
            result.detail += " (" + std::to_string(removed) + " other output" +
                             (removed == 1 ? "" : "s") + " removed)";
        }
        if (failed) {
            result.detail += " (some outputs could not be removed)";
        }
        return result;
    }
    return result;
}

std::string redact_location_paths(const std::string& message,
                                  const LocationTable& table,
                                  const std::string& keep_id) {
    auto location_forms = [](const std::string& configured) {
        std::vector<std::string> forms{strip_trailing_separators(configured)};
        if (auto expanded = expand_user_path(configured)) {
            forms.push_back(strip_trailing_separators(*expanded));
            if (auto canonical = canonical_path(*expanded)) {
                forms.push_back(*canonical);
            }
        }
        return forms;
    };

    std::vector<std::pair<std::string, std::string>> replacements;
    std::vector<std::string> kept;

    for (const auto& [id, configured] : table) {
        auto forms = location_forms(configured);
        if (id == keep_id) {
            kept = std::move(forms);
            continue;
        }
        std::string marker = "<location:" + id + ">";
        for (auto& form : forms) {
            if (form.size() > 1) {
                replacements.emplace_back(std::move(form), marker);
            }
        }
    }

    // A parent location's path inside the caller's own location stays visible
    auto inside_kept = [&kept](const std::string& text, size_t pos, size_t len) {
        for (const auto& k : kept) {
            if (k.size() > len && text.compare(pos, k.size(), k) == 0) {
                return true;
            }
        }
        return false;
    };

    // Longest first so a nested location is not half-replaced by its parent
    std::sort(replacements.begin(), replacements.end(),
              [](const auto& a, const auto& b) { return a.first.size() > b.first.size(); });

    std::string out = message;
    for (const auto& [needle, marker] : replacements) {
        size_t pos = 0;
        while ((pos = out.find(needle, pos)) != std::string::npos) {
            if (inside_kept(out, pos, needle.size())) {
                pos += needle.size();
                continue;
            }
            out.replace(pos, needle.size(), marker);
            pos += marker.size();
        }
    }
    return out;
}

} // namespace vdl
