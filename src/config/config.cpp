#include "haul/config.hpp"
#include "haul/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>

#ifndef HAUL_VERSION
#define HAUL_VERSION "unknown"
#endif

namespace fs = std::filesystem;

namespace haul {

namespace {

template<typename T>
bool read_unsigned(const nlohmann::json& j, const std::string& key, T& out,
                   std::vector<std::string>& warnings) {
    if (!j.contains(key)) return false;
    if (!j[key].is_number_unsigned()) {
        warnings.push_back(key + " must be a non-negative integer");
        return false;
    }
    out = static_cast<T>(j[key].get<std::uint64_t>());
    return true;
}

bool read_string(const nlohmann::json& j, const std::string& key, std::string& out,
                 std::vector<std::string>& warnings) {
    if (!j.contains(key)) return false;
    if (!j[key].is_string()) {
        warnings.push_back(key + " must be a string");
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

bool read_port(const nlohmann::json& j, const std::string& key, int& out,
               std::vector<std::string>& warnings) {
    std::uint64_t value = 0;
    if (!read_unsigned(j, key, value, warnings)) return false;
    if (value < 1 || value > 65535) {
        warnings.push_back(key + " must be between 1 and 65535");
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

} // namespace

Config default_config() {
    Config config;
    config.cache_dir = join_path(user_cache_dir(), "download-cache");
    config.lock_dir = join_path(user_state_dir(), "port-locks");
    config.user_agent = std::string("haul/") + HAUL_VERSION;
    return config;
}

std::string default_config_path() {
    return join_path(user_config_dir(), "config.json");
}

Result<ConfigLoadResult> apply_config_json(const Config& base, const std::string& json_str) {
    ConfigLoadResult result;
    result.config = base;
    Config& c = result.config;
    auto& warnings = result.warnings;

    try {
        auto j = nlohmann::json::parse(json_str);
        if (!j.is_object()) {
            return Result<ConfigLoadResult>::err(
                Error(ErrorCode::VALIDATION, "config must be a JSON object"));
        }

        read_string(j, "cache_dir", c.cache_dir, warnings);
        read_unsigned(j, "max_cache_entries", c.max_cache_entries, warnings);

        std::uint64_t hours = 0;
        if (read_unsigned(j, "partial_max_age_hours", hours, warnings)) {
            c.partial_max_age = std::chrono::hours(hours);
        }

        read_string(j, "lock_dir", c.lock_dir, warnings);

        int start = c.port_start;
        int end = c.port_end;
        read_port(j, "port_start", start, warnings);
        read_port(j, "port_end", end, warnings);
        if (start <= end) {
            c.port_start = start;
            c.port_end = end;
        } else {
            warnings.push_back("port_start must not exceed port_end");
        }

        std::uint64_t ms = 0;
        if (read_unsigned(j, "ready_timeout_ms", ms, warnings)) {
            c.ready_timeout = std::chrono::milliseconds(ms);
        }
        if (read_unsigned(j, "ready_interval_ms", ms, warnings)) {
            c.ready_interval = std::chrono::milliseconds(ms);
        }

        read_string(j, "seven_zip_path", c.seven_zip_path, warnings);
        read_string(j, "user_agent", c.user_agent, warnings);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<ConfigLoadResult>::err(
            Error(ErrorCode::VALIDATION, std::string("parse error: ") + e.what()));
    }

    return Result<ConfigLoadResult>::ok(std::move(result));
}

void apply_env_overrides(Config& config, std::vector<std::string>& warnings) {
    if (auto dir = get_env("HAUL_CACHE_DIR"); dir && !dir->empty()) {
        config.cache_dir = *dir;
    }
    if (auto max = get_env("HAUL_MAX_CACHE_ENTRIES"); max && !max->empty()) {
        try {
            size_t pos = 0;
            unsigned long value = std::stoul(*max, &pos);
            if (pos != max->size()) throw std::invalid_argument(*max);
            config.max_cache_entries = value;
        } catch (const std::exception&) {
            warnings.push_back("HAUL_MAX_CACHE_ENTRIES is not a number: " + *max);
        }
    }
    if (auto dir = get_env("HAUL_LOCK_DIR"); dir && !dir->empty()) {
        config.lock_dir = *dir;
    }
    if (auto exe = get_env("HAUL_7Z"); exe && !exe->empty()) {
        config.seven_zip_path = *exe;
    }
}

Result<ConfigLoadResult> load_config(const std::optional<std::string>& explicit_path) {
    ConfigLoadResult result;
    result.config = default_config();

    std::string path = explicit_path ? *explicit_path : default_config_path();
    std::error_code ec;
    bool exists = fs::is_regular_file(path, ec);

    if (explicit_path && !exists) {
        return Result<ConfigLoadResult>::err(
            Error(ErrorCode::NOT_FOUND, "config file not found: " + path));
    }

    if (exists) {
        auto content = read_file(path);
        if (!content) {
            return Result<ConfigLoadResult>::err(Error(ErrorCode::IO_ERROR, "cannot read " + path));
        }
        auto applied = apply_config_json(result.config, *content);
        if (applied.isErr()) {
            applied.error().withContext(path);
            return applied;
        }
        result = std::move(applied.value());
        result.config.source_path = path;
    }

    apply_env_overrides(result.config, result.warnings);

    for (const auto& w : result.warnings) {
        spdlog::warn("config: {}", w);
    }
    return Result<ConfigLoadResult>::ok(std::move(result));
}

std::string serialize_config(const Config& config) {
    nlohmann::json j;
    j["cache_dir"] = config.cache_dir;
    j["max_cache_entries"] = config.max_cache_entries;
    j["partial_max_age_hours"] =
        std::chrono::duration_cast<std::chrono::hours>(config.partial_max_age).count();
    j["lock_dir"] = config.lock_dir;
    j["port_start"] = config.port_start;
    j["port_end"] = config.port_end;
    j["ready_timeout_ms"] = config.ready_timeout.count();
    j["ready_interval_ms"] = config.ready_interval.count();
    j["seven_zip_path"] = config.seven_zip_path;
    j["user_agent"] = config.user_agent;
    return j.dump(2);
}

} // namespace haul
