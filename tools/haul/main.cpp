/**
 * haul CLI - Entry Point
 *
 * Resumable downloads, cached installs and port-coordinated launches.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#ifndef HAUL_VERSION
#define HAUL_VERSION "unknown"
#endif

// Forward declarations for commands
namespace haul::cli::commands {
    void setup_fetch(CLI::App* app, GlobalOptions& opts);
    void setup_install(CLI::App* app, GlobalOptions& opts);
    void setup_extract(CLI::App* app, GlobalOptions& opts);
    void setup_cache(CLI::App* app, GlobalOptions& opts);
    void setup_port(CLI::App* app, GlobalOptions& opts);
    void setup_launch(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace haul::cli;

    CLI::App app{"haul - resumable downloads, cached installs, coordinated launches"};
    app.set_version_flag("-V,--version", HAUL_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Config file (default: user config dir)");
    app.add_option("--cache-dir", opts.cache_dir, "Download cache directory");
    app.add_option("--lock-dir", opts.lock_dir, "Port lock directory");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    auto* fetch_cmd = app.add_subcommand("fetch", "Download one URL to a file, resuming if possible");
    commands::setup_fetch(fetch_cmd, opts);

    auto* install_cmd = app.add_subcommand("install", "Download and extract an install request");
    commands::setup_install(install_cmd, opts);

    auto* extract_cmd = app.add_subcommand("extract", "Extract an archive");
    commands::setup_extract(extract_cmd, opts);

    auto* cache_cmd = app.add_subcommand("cache", "Inspect and prune the download cache");
    commands::setup_cache(cache_cmd, opts);

    auto* port_cmd = app.add_subcommand("port", "Port probing and lock primitives");
    commands::setup_port(port_cmd, opts);

    auto* launch_cmd = app.add_subcommand("launch", "Start a process on a coordinated port");
    commands::setup_launch(launch_cmd, opts);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? EXIT_OK : EXIT_USAGE;
    }

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return EXIT_OK;
}
