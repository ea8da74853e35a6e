#pragma once

#include "vdl/config.hpp"
#include "vdl/types.hpp"

#include <optional>
#include <string>
#include <utility>

namespace vdl {

struct ValidationResult;

// Classify a relative subpath supplied by a caller.
// - NUL/control characters (raw or percent-encoded) -> NullOrControlChar
// - leading separator, drive letter, scheme (file:, x://) -> AbsolutePath
// - any ".." segment in raw or decoded form, either separator, when
//   policy.block_path_traversal is set -> PathTraversal
// - empty/whitespace -> EmptyPath only when require_non_empty
// On success the value has '/' separators and no empty or "." segments.
ValidationResult validate_relative_path(const std::string& candidate,
                                        const SecurityPolicy& policy,
                                        bool require_non_empty = false);

// Classify a single filename (an expanded one, or a template that has no
// placeholders). Adds length and extension checks to the above.
ValidationResult validate_filename(const std::string& candidate,
                                   const SecurityPolicy& policy);

// A path that passed validation. Only the validators can create one, so an
// unvalidated string cannot reach the path joiner by accident.
class ValidatedPath {
public:
    const std::string& str() const { return value_; }

    // Empty denotes the location's base directory itself
    bool empty() const { return value_.empty(); }

private:
    explicit ValidatedPath(std::string value) : value_(std::move(value)) {}

    std::string value_;

    friend ValidationResult validate_relative_path(const std::string&, const SecurityPolicy&, bool);
    friend ValidationResult validate_filename(const std::string&, const SecurityPolicy&);
};

struct ValidationResult {
    std::optional<ValidatedPath> path;  // set exactly when validation passed
    ErrorKind error = ErrorKind::None;
    std::string detail;                 // what triggered the rejection

    bool ok() const { return path.has_value(); }
};

// Lowercased extension without the dot; empty when the name has none.
// A leading dot (".hidden") does not start an extension.
std::string get_extension(const std::string& filename);

} // namespace vdl
