/**
 * vdl CLI - locations command
 *
 * Show every configured download location and whether it is usable.
 */

#include "../common.hpp"
#include <vdl/location_resolver.hpp>
#include <CLI/CLI.hpp>

namespace vdl::cli::commands {

namespace {

int cmd_locations(const GlobalOptions& opts) {
    auto config = load_effective_config(opts);
    if (!config) {
        return 1;
    }

    auto statuses = describe_locations(config->download_locations, config->security);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["enforce_location_restrictions"] = config->security.enforce_location_restrictions;
        j["locations"] = nlohmann::json::object();
        for (const auto& status : statuses) {
            nlohmann::json entry;
            entry["original"] = status.configured;
            entry["path"] = status.path;
            entry["writable"] = status.writable;
            if (!status.error.empty()) {
                entry["error"] = status.error;
            }
            j["locations"][status.id] = entry;
        }
        output_json(j);
        return 0;
    }

    if (statuses.empty()) {
        std::cout << "No download locations configured" << std::endl;
        return 0;
    }

    for (const auto& status : statuses) {
        std::cout << status.id << std::endl;
        std::cout << "  Configured: " << status.configured << std::endl;
        std::cout << "  Path: " << status.path << std::endl;
        if (status.writable) {
            std::cout << "  Status: writable" << std::endl;
        } else {
            std::cout << "  Status: " << status.error << std::endl;
        }
    }

    return 0;
}

} // anonymous namespace

void setup_locations(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_locations(opts));
    });
}

} // namespace vdl::cli::commands
