#pragma once

#include "vdl/config.hpp"
#include "vdl/types.hpp"
#include "vdl/warnings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vdl {

// Location used when the caller names none and restrictions are not enforced
constexpr const char* kDefaultLocationId = "default";

struct ResolvedBase {
    std::string location_id;
    std::string configured;   // as written in the configuration
    std::string directory;    // canonical absolute directory, '/' separators
};

struct LocationResult {
    std::optional<ResolvedBase> base;
    ErrorKind error = ErrorKind::None;
    std::string detail;
    bool retryable = false;   // LocationNotWritable caused by a transient condition

    bool ok() const { return base.has_value(); }
};

// Expand a leading "~" or "~user" in a configured path.
// Returns nullopt when the home directory cannot be determined.
std::optional<std::string> expand_user_path(const std::string& path);

// Resolve a location id to its canonical base directory.
// - no id: LocationRequired when restrictions are enforced, else "default"
// - id not in the table: UnknownLocation (detail lists the known ids)
// - the directory is created (0755) when missing; "already exists" is success
// - not creatable / not writable: LocationNotWritable
// Filesystem state is re-read on every call; nothing is cached.
LocationResult resolve_base(const std::optional<std::string>& location_id,
                            const LocationTable& table,
                            const SecurityPolicy& policy,
                            WarningCollector* warnings = nullptr);

// One entry per configured location, for listing
struct LocationStatus {
    std::string id;
    std::string configured;
    std::string path;         // expanded (canonical when resolvable)
    bool writable = false;
    std::string error;
};

std::vector<LocationStatus> describe_locations(const LocationTable& table,
                                               const SecurityPolicy& policy);

} // namespace vdl
