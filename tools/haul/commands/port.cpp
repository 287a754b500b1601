/**
 * haul CLI - port command
 *
 * find | lock | unlock | owners | kill
 */

#include "../common.hpp"

#include <haul/launcher.hpp>
#include <haul/port_lock.hpp>
#include <haul/process.hpp>
#include <haul/process_probe.hpp>
#include <haul/subprocess.hpp>

#include <CLI/CLI.hpp>

namespace haul::cli::commands {

namespace {

struct PortOptions {
    std::string host = "127.0.0.1";
    int start = 0;
    int end = 0;
    int port = 0;
    int pid = 0;
    std::string label;
    std::vector<std::string> markers;
};

int cmd_port_find(const GlobalOptions& opts, const PortOptions& port_opts) {
    init_command(opts);
    auto config = resolve_config(opts);
    if (!config) return EXIT_FAILED;

    int start = port_opts.start > 0 ? port_opts.start : config->port_start;
    int end = port_opts.end > 0 ? port_opts.end : config->port_end;

    auto port = find_available_port(port_opts.host, start, end);
    if (port.isErr()) {
        return report_error(port.error(), opts);
    }

    if (opts.json) {
        output_json({{"ok", true}, {"port", port.value()}});
    } else {
        std::cout << port.value() << std::endl;
    }
    return EXIT_OK;
}

int cmd_port_lock(const GlobalOptions& opts, const PortOptions& port_opts) {
    init_command(opts);
    auto config = resolve_config(opts);
    if (!config) return EXIT_FAILED;

    if (!is_process_alive(port_opts.pid)) {
        print_error("pid " + std::to_string(port_opts.pid) + " is not running", opts.json);
        return EXIT_FAILED;
    }

    PortLockStore locks(config->lock_dir);
    if (!locks.write(port_opts.port, port_opts.pid, port_opts.label.empty() ? "haul" : port_opts.label)) {
        print_error("failed to write " + locks.lockPath(port_opts.port), opts.json);
        return EXIT_FAILED;
    }

    if (opts.json) {
        output_json({{"ok", true}, {"port", port_opts.port}, {"path", locks.lockPath(port_opts.port)}});
    } else {
        print_success("Locked port " + std::to_string(port_opts.port) + " for pid " +
                      std::to_string(port_opts.pid), false);
    }
    return EXIT_OK;
}

int cmd_port_unlock(const GlobalOptions& opts, const PortOptions& port_opts) {
    init_command(opts);
    auto config = resolve_config(opts);
    if (!config) return EXIT_FAILED;

    PortLockStore(config->lock_dir).remove(port_opts.port);
    if (opts.json) {
        output_json({{"ok", true}, {"port", port_opts.port}});
    } else {
        print_success("Unlocked port " + std::to_string(port_opts.port), false);
    }
    return EXIT_OK;
}

nlohmann::json lock_to_json(const PortLock& lock) {
    return {{"port", lock.port}, {"pid", lock.pid}, {"label", lock.label}, {"timestamp", lock.timestamp}};
}

int cmd_port_owners(const GlobalOptions& opts, const PortOptions& port_opts) {
    init_command(opts);
    auto config = resolve_config(opts);
    if (!config) return EXIT_FAILED;

    PortLockStore locks(config->lock_dir);

    // Without a port: every live lock
    if (port_opts.port == 0) {
        auto all = locks.list();
        if (opts.json) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& lock : all) arr.push_back(lock_to_json(lock));
            output_json({{"ok", true}, {"locks", arr}});
            return EXIT_OK;
        }
        if (all.empty()) {
            std::cout << "No port locks" << std::endl;
        }
        for (const auto& lock : all) {
            std::cout << lock.port << "  pid " << lock.pid << "  " << lock.label << std::endl;
        }
        return EXIT_OK;
    }

    auto& probe = process_probe();
    PortConflict conflict = inspect_port_conflict(port_opts.port, locks, probe, port_opts.markers);
    auto lock = locks.read(port_opts.port);

    if (opts.json) {
        nlohmann::json owners = nlohmann::json::array();
        for (int pid : conflict.pids) {
            nlohmann::json o;
            o["pid"] = pid;
            if (auto info = probe.getProcessInfo(pid)) {
                o["name"] = info->name;
                o["command_line"] = info->command_line;
            }
            owners.push_back(o);
        }
        nlohmann::json j;
        j["ok"] = true;
        j["port"] = port_opts.port;
        j["owners"] = owners;
        j["owned_by_known_instance"] = conflict.owned_by_known_instance;
        j["lock"] = lock ? lock_to_json(*lock) : nlohmann::json(nullptr);
        output_json(j);
        return EXIT_OK;
    }

    if (conflict.pids.empty()) {
        std::cout << "Port " << port_opts.port << " is free" << std::endl;
        return EXIT_OK;
    }
    std::cout << "Port " << port_opts.port << ":" << std::endl;
    for (int pid : conflict.pids) {
        auto info = probe.getProcessInfo(pid);
        std::cout << "  pid " << pid;
        if (info) std::cout << "  " << info->name;
        if (lock && lock->pid == pid) std::cout << "  (locked: " << lock->label << ")";
        std::cout << std::endl;
    }
    if (conflict.owned_by_known_instance) {
        std::cout << "  held by a known instance" << std::endl;
    }
    return EXIT_OK;
}

int cmd_port_kill(const GlobalOptions& opts, const PortOptions& port_opts) {
    init_command(opts);
    auto config = resolve_config(opts);
    if (!config) return EXIT_FAILED;

    auto killed = process_probe().killByPort(port_opts.port);
    PortLockStore(config->lock_dir).remove(port_opts.port);

    if (opts.json) {
        output_json({{"ok", true}, {"port", port_opts.port}, {"killed", killed}});
    } else if (killed.empty()) {
        print_success("Nothing listening on port " + std::to_string(port_opts.port), false);
    } else {
        for (int pid : killed) {
            print_success("Killed pid " + std::to_string(pid), false);
        }
    }
    return EXIT_OK;
}

} // namespace

void setup_port(CLI::App* app, GlobalOptions& opts) {
    static PortOptions port_opts;

    app->require_subcommand(1);

    auto* find = app->add_subcommand("find", "Print the first free port in a range");
    find->add_option("--host", port_opts.host, "Bind address to probe");
    find->add_option("--start", port_opts.start, "First port")->check(CLI::Range(1, 65535));
    find->add_option("--end", port_opts.end, "Last port")->check(CLI::Range(1, 65535));
    find->callback([&opts]() { std::exit(cmd_port_find(opts, port_opts)); });

    auto* lock = app->add_subcommand("lock", "Record a process as the owner of a port");
    lock->add_option("port", port_opts.port, "Port")->required()->check(CLI::Range(1, 65535));
    lock->add_option("--pid", port_opts.pid, "Owner process id")->required();
    lock->add_option("--label", port_opts.label, "Free-form label");
    lock->callback([&opts]() { std::exit(cmd_port_lock(opts, port_opts)); });

    auto* unlock = app->add_subcommand("unlock", "Remove a port lock");
    unlock->add_option("port", port_opts.port, "Port")->required()->check(CLI::Range(1, 65535));
    unlock->callback([&opts]() { std::exit(cmd_port_unlock(opts, port_opts)); });

    auto* owners = app->add_subcommand("owners", "Show who holds a port (all locks if omitted)");
    owners->add_option("port", port_opts.port, "Port")->check(CLI::Range(1, 65535));
    owners->add_option("--marker", port_opts.markers,
                       "Command-line substring identifying a known instance (repeatable)");
    owners->callback([&opts]() { std::exit(cmd_port_owners(opts, port_opts)); });

    auto* kill = app->add_subcommand("kill", "Kill every process listening on a port");
    kill->add_option("port", port_opts.port, "Port")->required()->check(CLI::Range(1, 65535));
    kill->callback([&opts]() { std::exit(cmd_port_kill(opts, port_opts)); });
}

} // namespace haul::cli::commands
