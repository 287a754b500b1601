/**
 * haul CLI - extract command
 */

#include "../common.hpp"

#include <haul/extract.hpp>
#include <haul/installer.hpp>

#include <CLI/CLI.hpp>

namespace haul::cli::commands {

namespace {

struct ExtractCmdOptions {
    std::string archive;
    std::string dest;
    std::string seven_zip;
};

int cmd_extract(const GlobalOptions& opts, const ExtractCmdOptions& extract_opts) {
    init_command(opts);

    auto config = resolve_config(opts);
    if (!config) return EXIT_FAILED;

    ExtractOptions options;
    options.cancel = command_cancel_token();
    options.seven_zip_path = extract_opts.seven_zip.empty() ? config->seven_zip_path
                                                            : extract_opts.seven_zip;

    ProgressLine line(opts);
    auto result = extract(extract_opts.archive, extract_opts.dest,
        [&](const ExtractProgress& p) { line.update(format_extract_status(p)); },
        options);
    line.finish();

    if (result.isErr()) {
        return report_error(result.error(), opts);
    }

    if (opts.json) {
        output_json({{"ok", true}, {"archive", extract_opts.archive}, {"dest", extract_opts.dest}});
    } else {
        print_success("Extracted " + extract_opts.archive + " into " + extract_opts.dest, false);
    }
    return EXIT_OK;
}

} // namespace

void setup_extract(CLI::App* app, GlobalOptions& opts) {
    static ExtractCmdOptions extract_opts;

    app->add_option("archive", extract_opts.archive, "Archive (7z, zip, .001 split, tar.gz)")
        ->required();
    app->add_option("dest", extract_opts.dest, "Destination directory")->required();
    app->add_option("--7z", extract_opts.seven_zip, "7-Zip executable");

    app->callback([&opts]() {
        std::exit(cmd_extract(opts, extract_opts));
    });
}

} // namespace haul::cli::commands
