/**
 * haul CLI - cache command
 *
 * path | evict | touch | clean | list over the download cache.
 */

#include "../common.hpp"

#include <haul/cache.hpp>

#include <CLI/CLI.hpp>

namespace haul::cli::commands {

namespace {

struct CacheOptions {
    std::string key;
    int max_entries = -1;          // -1: use the configured limit
    int max_age_hours = -1;        // -1: use the configured age
};

std::optional<ContentCache> open_cache(const GlobalOptions& opts) {
    auto config = resolve_config(opts);
    if (!config) return std::nullopt;
    return ContentCache(config->cache_dir, config->max_cache_entries);
}

int cmd_cache_path(const GlobalOptions& opts, const CacheOptions& cache_opts) {
    init_command(opts);
    auto cache = open_cache(opts);
    if (!cache) return EXIT_FAILED;

    std::string path = cache_opts.key.empty() ? cache->baseDir() : cache->resolve(cache_opts.key);
    if (opts.json) {
        output_json({{"ok", true}, {"path", path}});
    } else {
        std::cout << path << std::endl;
    }
    return EXIT_OK;
}

int cmd_cache_touch(const GlobalOptions& opts, const CacheOptions& cache_opts) {
    init_command(opts);
    auto cache = open_cache(opts);
    if (!cache) return EXIT_FAILED;

    cache->touch(cache_opts.key);
    if (opts.json) {
        output_json({{"ok", true}, {"key", cache_opts.key}});
    } else if (!opts.quiet) {
        print_success("Touched " + cache_opts.key, false);
    }
    return EXIT_OK;
}

int cmd_cache_evict(const GlobalOptions& opts, const CacheOptions& cache_opts) {
    init_command(opts);
    auto cache = open_cache(opts);
    if (!cache) return EXIT_FAILED;

    std::size_t keep = cache_opts.max_entries >= 0
                           ? static_cast<std::size_t>(cache_opts.max_entries)
                           : cache->maxEntries();
    auto removed = cache->evict(keep);

    if (opts.json) {
        output_json({{"ok", true}, {"kept", keep}, {"removed", removed}});
    } else if (!opts.quiet) {
        if (removed.empty()) {
            print_success("Nothing to evict", false);
        }
        for (const auto& name : removed) {
            print_success("Removed " + name, false);
        }
    }
    return EXIT_OK;
}

int cmd_cache_clean(const GlobalOptions& opts, const CacheOptions& cache_opts) {
    init_command(opts);
    auto config = resolve_config(opts);
    if (!config) return EXIT_FAILED;
    ContentCache cache(config->cache_dir, config->max_cache_entries);

    auto max_age = cache_opts.max_age_hours >= 0
                       ? std::chrono::milliseconds(std::chrono::hours(cache_opts.max_age_hours))
                       : config->partial_max_age;
    std::size_t removed = cache.cleanStalePartials(max_age);

    if (opts.json) {
        output_json({{"ok", true}, {"removed", removed}});
    } else if (!opts.quiet) {
        print_success("Removed " + std::to_string(removed) + " stale partial download(s)", false);
    }
    return EXIT_OK;
}

int cmd_cache_list(const GlobalOptions& opts) {
    init_command(opts);
    auto cache = open_cache(opts);
    if (!cache) return EXIT_FAILED;

    auto entries = cache->list();
    if (opts.json) {
        output_json({{"ok", true}, {"path", cache->baseDir()}, {"entries", entries}});
        return EXIT_OK;
    }

    if (entries.empty()) {
        std::cout << "Cache is empty (" << cache->baseDir() << ")" << std::endl;
        return EXIT_OK;
    }
    std::cout << "Cache entries (newest first):" << std::endl;
    for (const auto& name : entries) {
        std::cout << "  " << name << std::endl;
    }
    return EXIT_OK;
}

} // namespace

void setup_cache(CLI::App* app, GlobalOptions& opts) {
    static CacheOptions cache_opts;

    app->require_subcommand(1);

    auto* path = app->add_subcommand("path", "Print the cache directory or an entry's folder");
    path->add_option("key", cache_opts.key, "Cache key");
    path->callback([&opts]() { std::exit(cmd_cache_path(opts, cache_opts)); });

    auto* touch = app->add_subcommand("touch", "Mark an entry as most recently used");
    touch->add_option("key", cache_opts.key, "Cache key")->required();
    touch->callback([&opts]() { std::exit(cmd_cache_touch(opts, cache_opts)); });

    auto* evict = app->add_subcommand("evict", "Remove all but the most recently used entries");
    evict->add_option("--max", cache_opts.max_entries, "Entries to keep")
        ->check(CLI::NonNegativeNumber);
    evict->callback([&opts]() { std::exit(cmd_cache_evict(opts, cache_opts)); });

    auto* clean = app->add_subcommand("clean", "Remove stale partial downloads");
    clean->add_option("--max-age-hours", cache_opts.max_age_hours, "Age threshold")
        ->check(CLI::NonNegativeNumber);
    clean->callback([&opts]() { std::exit(cmd_cache_clean(opts, cache_opts)); });

    auto* list = app->add_subcommand("list", "List cache entries");
    list->callback([&opts]() { std::exit(cmd_cache_list(opts)); });
}

} // namespace haul::cli::commands
