/**
 * vdl CLI - serve command
 *
 * Run the JSON-RPC tool server on stdin/stdout.
 */

#include "../common.hpp"
#include <vdl/extractor.hpp>
#include <vdl/mcp_server.hpp>
#include <vdl/webpage_analyzer.hpp>
#include <CLI/CLI.hpp>

#include <csignal>
#include <utility>

namespace vdl::cli::commands {

namespace {

int cmd_serve(const GlobalOptions& opts) {
    auto config = load_effective_config(opts, true);
    if (!config) {
        return 1;
    }

    // A client that hangs up should end the loop, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    ToolContext context{*config, make_ytdlp_engine(config->ytdlp), fetch_page};
    ToolServer server(std::move(context));

    spdlog::debug("configuration: {}",
                  config->source_path.empty() ? "built-in defaults" : config->source_path);
    return server.run(std::cin, std::cout);
}

} // anonymous namespace

void setup_serve(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_serve(opts));
    });
}

} // namespace vdl::cli::commands
