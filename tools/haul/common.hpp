/**
 * haul CLI - Common utilities and types
 */

#pragma once

#include <haul/config.hpp>
#include <haul/types.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace haul::cli {

/**
 * Process exit codes shared by every command.
 */
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_CANCELLED = 130;

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    std::string cache_dir;         // --cache-dir
    std::string lock_dir;          // --lock-dir
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg, bool /* json_mode */) {
    get_warning_collector().add(msg);
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Single self-overwriting status line on stderr. Silent in --json and -q.
 */
class ProgressLine {
public:
    explicit ProgressLine(const GlobalOptions& opts) : enabled_(!opts.json && !opts.quiet) {}
    ~ProgressLine() { finish(); }

    void update(const std::string& text) {
        if (!enabled_) return;
        std::cerr << "\r" << text << "\033[K" << std::flush;
        dirty_ = true;
    }

    void finish() {
        if (dirty_) std::cerr << std::endl;
        dirty_ = false;
    }

private:
    bool enabled_;
    bool dirty_ = false;
};

/**
 * Report a library error and map it to an exit code.
 * Cancellation is not a failure: it is reported once, without "Error:".
 */
inline int report_error(const Error& err, const GlobalOptions& opts) {
    if (err.isCancelled()) {
        if (opts.json) {
            output_json({{"ok", false}, {"cancelled", true}});
        } else if (!opts.quiet) {
            std::cerr << "Cancelled" << std::endl;
        }
        return EXIT_CANCELLED;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = err.message();
        j["code"] = error_code_name(err.code());
        if (!err.diagnostics().empty()) j["diagnostics"] = err.diagnostics();
        if (err.conflict()) {
            j["conflict"] = {
                {"port", err.conflict()->port},
                {"pids", err.conflict()->pids},
                {"owned_by_known_instance", err.conflict()->owned_by_known_instance},
            };
        }
        output_json(j);
    } else {
        print_error(err.message(), false);
        for (const auto& line : err.diagnostics()) {
            std::cerr << "  " << line << std::endl;
        }
    }
    return EXIT_FAILED;
}

/**
 * Route spdlog to stderr so stdout stays clean for --json.
 * -v enables debug, -q drops everything below error.
 */
inline void setup_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("haul");
    if (!logger) {
        logger = spdlog::stderr_color_mt("haul");
        logger->set_pattern("[%l] %v");
        spdlog::set_default_logger(logger);
    }
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet || opts.json) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Resolve the effective configuration.
 * Priority: command-line flag > HAUL_* env > config file > defaults
 */
inline std::optional<Config> resolve_config(const GlobalOptions& opts) {
    auto loaded = load_config(opts.config.empty() ? std::nullopt
                                                  : std::make_optional(opts.config));
    if (loaded.isErr()) {
        print_error(loaded.error().message(), opts.json);
        return std::nullopt;
    }

    for (const auto& w : loaded.value().warnings) {
        print_warning("config: " + w, opts.json);
    }

    Config config = loaded.value().config;
    if (!opts.cache_dir.empty()) config.cache_dir = opts.cache_dir;
    if (!opts.lock_dir.empty()) config.lock_dir = opts.lock_dir;
    return config;
}

/**
 * Cancel token fired by SIGINT / SIGTERM for the running command.
 */
inline CancelToken& command_cancel_token() {
    static CancelToken token;
    return token;
}

namespace detail {
inline void on_terminate_signal(int) {
    command_cancel_token().cancel();
}
} // namespace detail

inline void install_signal_handlers() {
    command_cancel_token();
    std::signal(SIGINT, detail::on_terminate_signal);
    std::signal(SIGTERM, detail::on_terminate_signal);
}

/**
 * Per-command setup: warnings, logging and the cancel signal handlers.
 */
inline void init_command(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);
    setup_logging(opts);
    install_signal_handlers();
}

} // namespace haul::cli
