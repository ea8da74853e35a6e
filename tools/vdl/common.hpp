/**
 * vdl CLI - Common utilities and types
 */

#pragma once

#include <vdl/config.hpp>
#include <vdl/log.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <optional>
#include <iostream>
#include <cstdlib>

namespace vdl::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config_path;       // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg, bool quiet) {
    if (!quiet) {
        std::cerr << "Warning: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

/**
 * Load the effective configuration and set up logging from it.
 * Priority for the file: --config > VDL_CONFIG > XDG config dir > ~/.config.
 * Errors are reported with print_error unless to_stderr forces plain text
 * (the server's stdout belongs to the protocol).
 */
inline std::optional<ServerConfig> load_effective_config(const GlobalOptions& opts,
                                                         bool to_stderr = false) {
    std::string path = resolve_config_path(opts.config_path);
    auto result = load_server_config(path);
    if (!result.ok) {
        print_error(result.error, opts.json && !to_stderr);
        return std::nullopt;
    }

    LoggingSettings logging = result.config.logging;
    if (opts.verbose) {
        logging.level = "debug";
    } else if (opts.quiet) {
        logging.level = "error";
    }
    init_logging(logging);

    for (const auto& warning : result.warnings) {
        spdlog::warn("{} ({})", warning, path);
    }

    return result.config;
}

} // namespace vdl::cli
