/**
 * vdl CLI - Entry Point
 *
 * Video downloader tool server and location inspection commands.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace vdl::cli::commands {
    void setup_serve(CLI::App* app, GlobalOptions& opts);
    void setup_locations(CLI::App* app, GlobalOptions& opts);
    void setup_resolve(CLI::App* app, GlobalOptions& opts);
    void setup_config(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace vdl::cli;

    CLI::App app{"vdl - video downloader tool server"};
    app.set_version_flag("-V,--version", VDL_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config_path, "Configuration file (JSON)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    // Commands
    auto* serve_cmd = app.add_subcommand("serve", "Run the tool server on stdin/stdout");
    commands::setup_serve(serve_cmd, opts);

    auto* locations_cmd = app.add_subcommand("locations", "List download locations");
    commands::setup_locations(locations_cmd, opts);

    auto* resolve_cmd = app.add_subcommand("resolve", "Resolve a download path without downloading");
    commands::setup_resolve(resolve_cmd, opts);

    auto* config_cmd = app.add_subcommand("config", "Print the effective configuration");
    commands::setup_config(config_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
