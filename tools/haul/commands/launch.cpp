/**
 * haul CLI - launch command
 *
 * Start an external process on a coordinated port, wait until it is
 * reachable, hold the port lock while it runs.
 *
 *   haul launch --port-start 8188 --url http://127.0.0.1:{port}/ -- python main.py
 */

#include "../common.hpp"

#include <haul/launcher.hpp>
#include <haul/process.hpp>
#include <haul/platform.hpp>
#include <haul/port_lock.hpp>
#include <haul/process_probe.hpp>

#include <CLI/CLI.hpp>

#include <memory>

namespace haul::cli::commands {

namespace {

struct LaunchCmdOptions {
    std::vector<std::string> command;
    std::string host = "127.0.0.1";
    int port = 0;
    int port_start = 0;
    int port_end = 0;
    std::string label;
    std::string url;
    std::string log_file;
    std::string cwd;
    std::vector<std::string> env;
    std::vector<std::string> markers;
    std::string on_conflict = "fail";
    int timeout_ms = 0;
    bool detach = false;
};

// Killed listeners may hold the socket for a moment
void wait_port_released(const std::string& host, int port, const CancelToken& cancel) {
    for (int i = 0; i < 50; ++i) {
        if (find_available_port(host, port, port).isOk()) return;
        if (!sleep_interruptible(std::chrono::milliseconds(100), [&]() { return cancel.cancelled(); })) {
            return;
        }
    }
}

int cmd_launch(const GlobalOptions& opts, const LaunchCmdOptions& launch_opts) {
    init_command(opts);

    auto config = resolve_config(opts);
    if (!config) return EXIT_FAILED;

    LaunchCommand command;
    command.executable = launch_opts.command.front();
    command.args.assign(launch_opts.command.begin() + 1, launch_opts.command.end());
    command.cwd = launch_opts.cwd;
    command.environment = launch_opts.env;
    command.instance_markers = launch_opts.markers;

    LaunchOptions options;
    options.host = launch_opts.host;
    if (launch_opts.port > 0) options.preferred_port = launch_opts.port;
    options.port_start = launch_opts.port_start > 0 ? launch_opts.port_start : config->port_start;
    options.port_end = launch_opts.port_end > 0 ? launch_opts.port_end : config->port_end;
    options.label = launch_opts.label.empty() ? get_filename(command.executable) : launch_opts.label;
    options.ready_url = launch_opts.url;
    options.log_file = launch_opts.log_file;
    options.wait.timeout = launch_opts.timeout_ms > 0
                               ? std::chrono::milliseconds(launch_opts.timeout_ms)
                               : config->ready_timeout;
    options.wait.interval = config->ready_interval;
    options.cancel = command_cancel_token();
    options.on_state = [](LaunchState state) {
        spdlog::debug("state: {}", launch_state_name(state));
    };

    PortLockStore locks(config->lock_dir);
    auto& probe = process_probe();

    auto launcher = std::make_unique<Launcher>(locks, probe, options);
    auto started = launcher->start(command);

    // A busy --port: fail, move on to the range, or replace a known instance
    if (started.isErr() && started.error().code() == ErrorCode::PORT_CONFLICT) {
        const PortConflict& conflict = *started.error().conflict();

        if (launch_opts.on_conflict == "next") {
            print_warning(started.error().message() + "; searching " +
                          std::to_string(options.port_start) + "-" + std::to_string(options.port_end),
                          opts.json);
            options.preferred_port.reset();
        } else if (launch_opts.on_conflict == "kill" && conflict.owned_by_known_instance) {
            print_warning(started.error().message() + "; stopping it", opts.json);
            probe.killByPort(conflict.port);
            locks.remove(conflict.port);
            wait_port_released(options.host, conflict.port, options.cancel);
        } else {
            if (launch_opts.on_conflict == "kill") {
                print_warning("not killing: the owner does not look like a known instance", opts.json);
            }
            return report_error(started.error(), opts);
        }

        launcher = std::make_unique<Launcher>(locks, probe, options);
        started = launcher->start(command);
    }

    if (started.isErr()) {
        if (started.error().code() == ErrorCode::TIMEOUT) {
            launcher->stop();
        }
        return report_error(started.error(), opts);
    }

    int port = started.value();
    std::string where = "http://" + options.host + ":" + std::to_string(port);
    if (opts.json) {
        output_json({{"ok", true}, {"event", "ready"}, {"port", port},
                     {"pid", launcher->pid()}, {"url", where}});
    } else {
        print_success("Ready on " + where + " (pid " + std::to_string(launcher->pid()) + ")", false);
    }

    if (launch_opts.detach) {
        return EXIT_OK;
    }

    auto exited = launcher->waitForExit(command_cancel_token());
    if (exited.isErr()) {
        launcher->stop();
        return report_error(exited.error(), opts);
    }

    int code = exited.value();
    bool crashed = launcher->state() == LaunchState::Crashed;
    if (opts.json) {
        output_json({{"ok", !crashed}, {"event", "exit"}, {"port", port},
                     {"exit_code", code}, {"state", launch_state_name(launcher->state())}});
    } else if (crashed) {
        print_error("process exited with code " + std::to_string(code), false);
    } else {
        print_success("Process stopped", false);
    }
    return crashed ? EXIT_FAILED : EXIT_OK;
}

} // namespace

void setup_launch(CLI::App* app, GlobalOptions& opts) {
    static LaunchCmdOptions launch_opts;

    app->add_option("command", launch_opts.command, "Executable and its arguments (after --)")
        ->required();
    app->add_option("--host", launch_opts.host, "Address to bind and probe");
    app->add_option("--port", launch_opts.port, "Insist on this port")
        ->check(CLI::Range(1, 65535));
    app->add_option("--port-start", launch_opts.port_start, "First port of the search range")
        ->check(CLI::Range(1, 65535));
    app->add_option("--port-end", launch_opts.port_end, "Last port of the search range")
        ->check(CLI::Range(1, 65535));
    app->add_option("--label", launch_opts.label, "Label recorded in the port lock");
    app->add_option("--url", launch_opts.url,
                    "Readiness URL; {port} is replaced (default: TCP connect)");
    app->add_option("--log", launch_opts.log_file, "Append the child's output to this file");
    app->add_option("--cwd", launch_opts.cwd, "Working directory for the child");
    app->add_option("--env", launch_opts.env, "KEY=VALUE added to the child environment");
    app->add_option("--marker", launch_opts.markers,
                    "Command-line substring identifying a known instance (repeatable)");
    app->add_option("--on-conflict", launch_opts.on_conflict, "When --port is busy")
        ->check(CLI::IsMember({"fail", "next", "kill"}));
    app->add_option("--timeout-ms", launch_opts.timeout_ms, "Readiness timeout");
    app->add_flag("--detach", launch_opts.detach, "Exit once ready, leaving the process running");

    app->callback([&opts]() {
        std::exit(cmd_launch(opts, launch_opts));
    });
}

} // namespace haul::cli::commands
