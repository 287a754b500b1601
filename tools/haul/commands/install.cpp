/**
 * haul CLI - install command
 *
 * Download every file of an install request into the cache, then extract.
 */

#include "../common.hpp"

#include <haul/cache.hpp>
#include <haul/installer.hpp>
#include <haul/request.hpp>

#include <CLI/CLI.hpp>

namespace haul::cli::commands {

namespace {

struct InstallOptions {
    std::string request_file;
    std::string dest;       // overrides the request's dest
};

int cmd_install(const GlobalOptions& opts, const InstallOptions& install_opts) {
    init_command(opts);

    auto config = resolve_config(opts);
    if (!config) return EXIT_FAILED;

    auto request = load_install_request(install_opts.request_file);
    if (request.isErr()) {
        return report_error(request.error(), opts);
    }
    InstallRequest req = request.value();
    if (!install_opts.dest.empty()) req.dest = install_opts.dest;

    ContentCache cache(config->cache_dir, config->max_cache_entries);
    std::size_t stale = cache.cleanStalePartials(config->partial_max_age);
    if (stale > 0 && opts.verbose) {
        print_warning("removed " + std::to_string(stale) + " stale partial download(s)", opts.json);
    }

    ProgressLine line(opts);
    std::string current_phase;

    InstallerOptions options;
    options.cancel = command_cancel_token();
    options.transfer.user_agent = config->user_agent;
    options.extract.seven_zip_path = config->seven_zip_path;
    options.on_progress = [&](const std::string& phase, int percent, const std::string& status) {
        if (phase != current_phase) {
            line.finish();
            current_phase = phase;
        }
        line.update(phase + " " + std::to_string(percent) + "%  " + status);
    };

    Installer installer(cache, options);
    auto result = installer.install(req);
    line.finish();

    if (result.isErr()) {
        return report_error(result.error(), opts);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["dest"] = req.dest;
        j["cache_key"] = req.cache_key;
        j["cache_path"] = cache.resolve(req.cache_key);
        j["files"] = req.files.size();
        output_json(j);
    } else {
        print_success("Installed " + req.cache_key + " into " + req.dest, false);
    }
    return EXIT_OK;
}

} // namespace

void setup_install(CLI::App* app, GlobalOptions& opts) {
    static InstallOptions install_opts;

    app->add_option("request", install_opts.request_file, "Install request (JSON)")
        ->required()
        ->check(CLI::ExistingFile);
    app->add_option("--dest", install_opts.dest, "Override the destination directory");

    app->callback([&opts]() {
        std::exit(cmd_install(opts, install_opts));
    });
}

} // namespace haul::cli::commands
