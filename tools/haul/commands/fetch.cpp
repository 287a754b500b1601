/**
 * haul CLI - fetch command
 *
 * Download a single URL to a file, resuming an earlier partial transfer.
 */

#include "../common.hpp"

#include <haul/installer.hpp>
#include <haul/platform.hpp>
#include <haul/transfer.hpp>

#include <CLI/CLI.hpp>

namespace haul::cli::commands {

namespace {

struct FetchOptions {
    std::string url;
    std::string dest;
    std::uint64_t size = 0;
};

int cmd_fetch(const GlobalOptions& opts, const FetchOptions& fetch_opts) {
    init_command(opts);

    auto config = resolve_config(opts);
    if (!config) return EXIT_FAILED;

    TransferOptions options;
    options.cancel = command_cancel_token();
    options.user_agent = config->user_agent;
    if (fetch_opts.size > 0) options.expected_size = fetch_opts.size;

    ProgressLine line(opts);
    std::uint64_t received = 0;
    auto result = transfer(fetch_opts.url, fetch_opts.dest,
        [&](const TransferProgress& p) {
            received = p.received_bytes;
            std::string text = p.percent ? std::to_string(*p.percent) + "%  " : std::string();
            line.update(text + format_download_status(p.received_bytes, p.total_bytes,
                                                      p.speed_mbs, p.elapsed_secs, p.eta_secs));
        },
        options);
    line.finish();

    if (result.isErr()) {
        return report_error(result.error(), opts);
    }

    auto size = file_size(result.value());
    if (size) received = *size;

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["path"] = result.value();
        j["bytes"] = received;
        output_json(j);
    } else {
        print_success("Saved " + result.value() + " (" + std::to_string(received) + " bytes)", false);
    }
    return EXIT_OK;
}

} // namespace

void setup_fetch(CLI::App* app, GlobalOptions& opts) {
    static FetchOptions fetch_opts;

    app->add_option("url", fetch_opts.url, "URL to download")->required();
    app->add_option("dest", fetch_opts.dest, "Destination file")->required();
    app->add_option("--size", fetch_opts.size, "Expected size in bytes");

    app->callback([&opts]() {
        std::exit(cmd_fetch(opts, fetch_opts));
    });
}

} // namespace haul::cli::commands
