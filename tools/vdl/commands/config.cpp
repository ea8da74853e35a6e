/**
 * vdl CLI - config command
 *
 * Print the effective configuration after merging over the defaults.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace vdl::cli::commands {

namespace {

int cmd_config(const GlobalOptions& opts) {
    auto config = load_effective_config(opts);
    if (!config) {
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["source"] = config->source_path.empty() ? nlohmann::json(nullptr)
                                                  : nlohmann::json(config->source_path);
        j["config"] = nlohmann::json::parse(serialize_server_config(*config));
        output_json(j);
    } else {
        if (!opts.quiet) {
            std::cerr << "# "
                      << (config->source_path.empty() ? "built-in defaults" : config->source_path)
                      << std::endl;
        }
        std::cout << serialize_server_config(*config) << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_config(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_config(opts));
    });
}

} // namespace vdl::cli::commands
