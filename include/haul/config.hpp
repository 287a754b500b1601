#pragma once

#include "haul/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace haul {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Tunables shared by the library and the CLI.
 *
 * Resolution order per field: explicit override > environment variable >
 * config file > built-in default.
 */
struct Config {
    std::string cache_dir;
    std::size_t max_cache_entries = 5;
    std::chrono::milliseconds partial_max_age = std::chrono::hours(24);

    std::string lock_dir;
    int port_start = 8188;
    int port_end = 8288;

    std::chrono::milliseconds ready_timeout = std::chrono::seconds(60);
    std::chrono::milliseconds ready_interval = std::chrono::milliseconds(500);

    std::string seven_zip_path;
    std::string user_agent;

    // Set by load_config(): the file that was read, if any
    std::string source_path;
};

Config default_config();

// $XDG_CONFIG_HOME/haul/config.json (or the platform equivalent)
std::string default_config_path();

struct ConfigLoadResult {
    Config config;
    std::vector<std::string> warnings;
};

// Apply a JSON document on top of `base`. Unknown keys are ignored; keys of
// the wrong type are reported in warnings and leave the field untouched.
// A document that is not a JSON object is a VALIDATION error.
Result<ConfigLoadResult> apply_config_json(const Config& base, const std::string& json_str);

// Defaults, then the config file (explicit path, else the default path if it
// exists), then HAUL_* environment overrides. An explicit path that cannot
// be read is NOT_FOUND.
Result<ConfigLoadResult> load_config(const std::optional<std::string>& explicit_path = std::nullopt);

// HAUL_CACHE_DIR, HAUL_MAX_CACHE_ENTRIES, HAUL_LOCK_DIR, HAUL_7Z
void apply_env_overrides(Config& config, std::vector<std::string>& warnings);

std::string serialize_config(const Config& config);

} // namespace haul
