#include "vdl/location_resolver.hpp"
#include "vdl/log.hpp"
#include "vdl/platform.hpp"

#include <cerrno>

namespace vdl {

namespace {

LocationResult reject(ErrorKind kind, std::string detail, bool retryable = false) {
    LocationResult result;
    result.error = kind;
    result.detail = std::move(detail);
    result.retryable = retryable;
    return result;
}

bool is_transient_errno(int code) {
    switch (code) {
        case ENOSPC:
        case EDQUOT:
        case EIO:
        case EAGAIN:
        case EBUSY:
        case ETIMEDOUT:
            return true;
        default:
            return false;
    }
}

std::string known_ids(const LocationTable& table) {
    std::string out;
    for (const auto& [id, path] : table) {
        if (!out.empty()) out += ", ";
        out += id;
    }
    return out.empty() ? std::string("(none)") : out;
}

} // namespace

std::optional<std::string> expand_user_path(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }

    auto slash = path.find('/');
    std::string user = path.substr(1, slash == std::string::npos ? std::string::npos : slash - 1);
    std::string rest = slash == std::string::npos ? std::string() : path.substr(slash + 1);

    auto home = user.empty() ? get_home_directory() : get_user_home_directory(user);
    if (!home) {
        return std::nullopt;
    }
    return rest.empty() ? *home : join_path(*home, rest);
}

LocationResult resolve_base(const std::optional<std::string>& location_id,
                            const LocationTable& table,
                            const SecurityPolicy& policy,
                            WarningCollector* warnings) {
    std::string id;
    if (location_id && !location_id->empty()) {
        id = *location_id;
    } else if (policy.enforce_location_restrictions) {
        return reject(ErrorKind::LocationRequired,
                      "location_id is required; available: " + known_ids(table));
    } else {
        id = kDefaultLocationId;
    }

    auto it = table.find(id);
    if (it == table.end()) {
        return reject(ErrorKind::UnknownLocation,
                      "unknown location '" + id + "'; available: " + known_ids(table));
    }

    const std::string& configured = it->second;
    auto expanded = expand_user_path(configured);
    if (!expanded) {
        return reject(ErrorKind::LocationNotWritable,
                      "location '" + id + "': home directory cannot be determined");
    }
    if (expanded->empty() || (*expanded)[0] != '/') {
        return reject(ErrorKind::LocationNotWritable,
                      "location '" + id + "': base directory is not absolute");
    }

    auto created = ensure_directory(*expanded);
    if (!created.ok) {
        return reject(ErrorKind::LocationNotWritable,
                      "location '" + id + "' cannot be created: " + created.error,
                      is_transient_errno(created.error_code));
    }

    auto writable = check_writable(*expanded);
    if (!writable.ok) {
        return reject(ErrorKind::LocationNotWritable,
                      "location '" + id + "' is " + writable.error,
                      is_transient_errno(writable.error_code));
    }

    auto canonical = canonical_path(*expanded);
    if (!canonical) {
        return reject(ErrorKind::LocationNotWritable,
                      "location '" + id + "' cannot be canonicalized", true);
    }

    if (is_world_writable(*canonical)) {
        security_logger()->warn("location '{}' is world-writable", id);
        if (warnings) {
            warnings->emit(Warning::location_world_writable, warnings::location_world_writable(id));
        }
    }

    ResolvedBase base;
    base.location_id = id;
    base.configured = configured;
    base.directory = *canonical;

    LocationResult result;
    result.base = std::move(base);
    return result;
}

std::vector<LocationStatus> describe_locations(const LocationTable& table,
                                               const SecurityPolicy& policy) {
    std::vector<LocationStatus> statuses;

    for (const auto& [id, configured] : table) {
        LocationStatus status;
        status.id = id;
        status.configured = configured;

        auto resolved = resolve_base(id, table, policy);
        if (resolved.ok()) {
            status.path = resolved.base->directory;
            status.writable = true;
        } else {
            auto expanded = expand_user_path(configured);
            status.path = expanded ? *expanded : configured;
            status.error = resolved.detail;
            spdlog::warn("Location {} is not usable: {}", id, resolved.detail);
        }
        statuses.push_back(std::move(status));
    }

    return statuses;
}

} // namespace vdl
