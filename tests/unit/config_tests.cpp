#include <doctest/doctest.h>
#include <haul/config.hpp>

#include "../support/temp_dir.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>

using namespace haul;
using haul::test::TempDir;

namespace {

inline void safe_setenv(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

inline void safe_unsetenv(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

bool has_warning(const std::vector<std::string>& warnings, const std::string& needle) {
    return std::any_of(warnings.begin(), warnings.end(), [&](const std::string& w) {
        return w.find(needle) != std::string::npos;
    });
}

} // namespace

TEST_CASE("default config carries built-in tunables") {
    Config c = default_config();
    CHECK(c.max_cache_entries == 5);
    CHECK(c.partial_max_age == std::chrono::hours(24));
    CHECK(c.port_start == 8188);
    CHECK(c.port_end == 8288);
    CHECK_FALSE(c.cache_dir.empty());
    CHECK_FALSE(c.lock_dir.empty());
    CHECK(c.user_agent.rfind("haul/", 0) == 0);
}

TEST_CASE("config JSON overrides individual fields") {
    const char* json = R"({
        "cache_dir": "/tmp/haul-cache",
        "max_cache_entries": 2,
        "partial_max_age_hours": 6,
        "port_start": 9000,
        "port_end": 9010,
        "ready_timeout_ms": 1500,
        "seven_zip_path": "/opt/7z/7zz",
        "unknown_key": true
    })";
    auto result = apply_config_json(default_config(), json);
    REQUIRE(result.isOk());

    const Config& c = result.value().config;
    CHECK(c.cache_dir == "/tmp/haul-cache");
    CHECK(c.max_cache_entries == 2);
    CHECK(c.partial_max_age == std::chrono::hours(6));
    CHECK(c.port_start == 9000);
    CHECK(c.port_end == 9010);
    CHECK(c.ready_timeout == std::chrono::milliseconds(1500));
    CHECK(c.ready_interval == std::chrono::milliseconds(500));
    CHECK(c.seven_zip_path == "/opt/7z/7zz");
    CHECK(result.value().warnings.empty());
}

TEST_CASE("config fields of the wrong type are warned about and ignored") {
    const char* json = R"({
        "max_cache_entries": "lots",
        "cache_dir": 42,
        "port_end": 70000
    })";
    Config base = default_config();
    auto result = apply_config_json(base, json);
    REQUIRE(result.isOk());

    const auto& loaded = result.value();
    CHECK(loaded.config.max_cache_entries == base.max_cache_entries);
    CHECK(loaded.config.cache_dir == base.cache_dir);
    CHECK(loaded.config.port_end == base.port_end);
    CHECK(has_warning(loaded.warnings, "max_cache_entries"));
    CHECK(has_warning(loaded.warnings, "cache_dir"));
    CHECK(has_warning(loaded.warnings, "port_end"));
}

TEST_CASE("config rejects an inverted port range") {
    auto result = apply_config_json(default_config(), R"({"port_start": 9100, "port_end": 9000})");
    REQUIRE(result.isOk());
    CHECK(result.value().config.port_start == 8188);
    CHECK(result.value().config.port_end == 8288);
    CHECK(has_warning(result.value().warnings, "port_start must not exceed port_end"));
}

TEST_CASE("config that is not an object is a validation error") {
    SUBCASE("array") {
        auto result = apply_config_json(default_config(), "[1, 2]");
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::VALIDATION);
    }
    SUBCASE("malformed") {
        auto result = apply_config_json(default_config(), "{ not json");
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::VALIDATION);
    }
}

TEST_CASE("load_config with an explicit missing path is not found") {
    TempDir tmp;
    auto result = load_config(tmp.file("nope.json"));
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::NOT_FOUND);
}

TEST_CASE("load_config reads the file then applies environment overrides") {
    TempDir tmp;
    haul::test::write_text(tmp.file("config.json"),
                           R"({"cache_dir": "/from/file", "max_cache_entries": 3})");

    safe_setenv("HAUL_CACHE_DIR", "/from/env");
    safe_setenv("HAUL_7Z", "/usr/bin/7zz");
    auto result = load_config(tmp.file("config.json"));
    safe_unsetenv("HAUL_CACHE_DIR");
    safe_unsetenv("HAUL_7Z");

    REQUIRE(result.isOk());
    const Config& c = result.value().config;
    CHECK(c.cache_dir == "/from/env");
    CHECK(c.max_cache_entries == 3);
    CHECK(c.seven_zip_path == "/usr/bin/7zz");
    CHECK(c.source_path == tmp.file("config.json"));
}

TEST_CASE("environment overrides warn on a non-numeric entry limit") {
    Config c = default_config();
    std::vector<std::string> warnings;

    safe_setenv("HAUL_MAX_CACHE_ENTRIES", "12abc");
    apply_env_overrides(c, warnings);
    safe_unsetenv("HAUL_MAX_CACHE_ENTRIES");

    CHECK(c.max_cache_entries == 5);
    CHECK(has_warning(warnings, "HAUL_MAX_CACHE_ENTRIES"));
}

TEST_CASE("serialize_config emits every tunable") {
    Config c = default_config();
    c.max_cache_entries = 7;
    auto j = nlohmann::json::parse(serialize_config(c));

    CHECK(j["max_cache_entries"] == 7);
    CHECK(j["partial_max_age_hours"] == 24);
    CHECK(j["port_start"] == 8188);
    CHECK(j["ready_timeout_ms"] == 60000);
    for (const char* key : {"cache_dir", "lock_dir", "ready_interval_ms", "seven_zip_path", "user_agent"}) {
        CHECK(j.contains(key));
    }
}
