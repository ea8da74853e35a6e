#pragma once

#include "vdl/types.hpp"
#include "vdl/config.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace vdl {

// ============================================================================
// Warning Collector
// ============================================================================

// Collects warnings for one request and applies the configured policy.
// One collector per request; never shared between requests.
class WarningCollector {
public:
    WarningCollector() = default;

    explicit WarningCollector(const std::unordered_map<std::string, WarningAction>& policy)
        : policy_(policy) {}

    explicit WarningCollector(const ServerConfig& config)
        : policy_(config.warnings) {}

    // Emit a warning with fields; returns the effective action
    WarningAction emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);

    // Get all emitted warnings after policy application.
    // Warnings with action "ignore" are excluded.
    std::vector<WarningObject> get_warnings() const;

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    std::unordered_map<std::string, WarningAction> policy_;
    std::vector<CollectedWarning> warnings_;

    WarningAction get_effective_action(const std::string& key) const;
};

namespace warnings {

inline std::unordered_map<std::string, std::string> deprecated_unsafe_path(
    const std::string& output_path) {
    return {{"output_path", output_path},
            {"message", "output_path bypasses location validation; use location_id"}};
}

inline std::unordered_map<std::string, std::string> legacy_output_path_ignored() {
    return {{"message", "output_path ignored because location fields were supplied"}};
}

inline std::unordered_map<std::string, std::string> location_world_writable(
    const std::string& location_id) {
    return {{"location_id", location_id}};
}

inline std::unordered_map<std::string, std::string> download_unverified(
    const std::string& reason) {
    return {{"reason", reason}};
}

} // namespace warnings

} // namespace vdl
