/**
 * vdl CLI - resolve command
 *
 * Run the download path construction for a location without downloading.
 */

#include "../common.hpp"
#include <vdl/download_path.hpp>
#include <vdl/tools.hpp>
#include <vdl/warnings.hpp>
#include <CLI/CLI.hpp>

namespace vdl::cli::commands {

namespace {

struct ResolveOptions {
    std::string location;
    std::string relative_path;
    std::string filename_template;
};

int cmd_resolve(const GlobalOptions& opts, const ResolveOptions& resolve_opts) {
    auto config = load_effective_config(opts);
    if (!config) {
        return 1;
    }

    PathRequest request;
    if (!resolve_opts.location.empty()) request.location_id = resolve_opts.location;
    if (!resolve_opts.relative_path.empty()) request.relative_path = resolve_opts.relative_path;
    if (!resolve_opts.filename_template.empty()) request.filename_template = resolve_opts.filename_template;

    WarningCollector warnings(*config);
    auto result = construct_download_path(request, *config, &warnings);

    if (!result.ok()) {
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = false;
            j["error"] = result.detail;
            j["error_kind"] = error_kind_to_string(result.error);
            if (result.retryable) {
                j["retryable"] = true;
            }
            j["warnings"] = warnings_to_json(warnings.get_warnings());
            output_json(j);
        } else {
            std::cerr << "Error: " << error_kind_to_string(result.error) << ": "
                      << result.detail << std::endl;
            if (result.retryable) {
                std::cerr << "  (transient condition, retry later)" << std::endl;
            }
        }
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["absolute_path"] = result.path->absolute_path;
        j["location_id"] = result.path->location_id;
        j["base_directory"] = result.path->base_directory;
        j["warnings"] = warnings_to_json(warnings.get_warnings());
        output_json(j);
    } else {
        for (const auto& w : warnings.get_warnings()) {
            print_warning(w.key, opts.quiet);
        }
        std::cout << result.path->absolute_path << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_resolve(CLI::App* app, GlobalOptions& opts) {
    static ResolveOptions resolve_opts;

    app->add_option("location", resolve_opts.location, "Download location id");
    app->add_option("--path", resolve_opts.relative_path, "Subdirectory inside the location");
    app->add_option("--template", resolve_opts.filename_template, "Filename template");

    app->callback([&opts]() {
        std::exit(cmd_resolve(opts, resolve_opts));
    });
}

} // namespace vdl::cli::commands
