#include <doctest/doctest.h>
#include <haul/cache.hpp>
#include <haul/transfer.hpp>

#include "../support/temp_dir.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using namespace haul;
using haul::test::TempDir;

namespace {

// Create an entry folder whose modification time is `age` in the past
void make_entry(const std::string& base, const std::string& name, std::chrono::seconds age) {
    fs::path dir = fs::path(base) / name;
    fs::create_directories(dir);
    haul::test::write_text((dir / "payload.bin").string(), name);
    fs::last_write_time(dir, fs::file_time_type::clock::now() - age);
}

void age_file(const std::string& path, std::chrono::hours age) {
    fs::last_write_time(path, fs::file_time_type::clock::now() - age);
}

} // namespace

TEST_CASE("ContentCache resolve creates the base directory only") {
    TempDir tmp;
    ContentCache cache(tmp.file("cache"));

    std::string path = cache.resolve("bundle-1");
    CHECK(path == (fs::path(tmp.file("cache")) / "bundle-1").string());
    CHECK(fs::is_directory(tmp.file("cache")));
    CHECK_FALSE(fs::exists(path));
}

TEST_CASE("ContentCache evict keeps the most recently used entries") {
    TempDir tmp;
    ContentCache cache(tmp.path(), 2);

    make_entry(tmp.path(), "a", std::chrono::seconds(300));
    make_entry(tmp.path(), "b", std::chrono::seconds(200));
    make_entry(tmp.path(), "c", std::chrono::seconds(100));

    auto removed = cache.evict();
    REQUIRE(removed.size() == 1);
    CHECK(removed[0] == "a");
    CHECK_FALSE(fs::exists(tmp.file("a")));
    CHECK(fs::exists(tmp.file("b")));
    CHECK(fs::exists(tmp.file("c")));

    auto listed = cache.list();
    REQUIRE(listed.size() == 2);
    CHECK(listed[0] == "c");
    CHECK(listed[1] == "b");
}

TEST_CASE("ContentCache touch protects an old entry from eviction") {
    TempDir tmp;
    ContentCache cache(tmp.path(), 2);

    make_entry(tmp.path(), "a", std::chrono::seconds(300));
    make_entry(tmp.path(), "b", std::chrono::seconds(200));
    make_entry(tmp.path(), "c", std::chrono::seconds(100));

    cache.touch("a");
    auto removed = cache.evict();
    REQUIRE(removed.size() == 1);
    CHECK(removed[0] == "b");
    CHECK(fs::exists(tmp.file("a")));
    CHECK(cache.list().front() == "a");
}

TEST_CASE("ContentCache evict ignores loose files and tolerates small caches") {
    TempDir tmp;
    ContentCache cache(tmp.path(), 5);

    make_entry(tmp.path(), "only", std::chrono::seconds(10));
    haul::test::write_text(tmp.file("stray.txt"), "x");

    CHECK(cache.evict().empty());
    CHECK(fs::exists(tmp.file("stray.txt")));

    SUBCASE("limit of zero empties the cache") {
        auto removed = cache.evict(0);
        CHECK(removed.size() == 1);
        CHECK(cache.list().empty());
    }
}

TEST_CASE("ContentCache touch of a missing entry is a no-op") {
    TempDir tmp;
    ContentCache cache(tmp.path());
    cache.touch("nope");
    CHECK_FALSE(fs::exists(tmp.file("nope")));
}

TEST_CASE("ContentCache cleanStalePartials removes old sidecars with their data") {
    TempDir tmp;
    ContentCache cache(tmp.path());

    fs::create_directories(tmp.file("entry"));
    std::string old_data = tmp.file("entry/old.7z");
    std::string fresh_data = tmp.file("entry/fresh.7z");
    std::string done_data = tmp.file("entry/done.7z");

    haul::test::write_text(old_data, "partial");
    haul::test::write_text(transfer_meta_path(old_data), "{\"url\":\"u\"}");
    haul::test::write_text(fresh_data, "partial");
    haul::test::write_text(transfer_meta_path(fresh_data), "{\"url\":\"u\"}");
    haul::test::write_text(done_data, "complete");

    age_file(transfer_meta_path(old_data), std::chrono::hours(48));
    age_file(done_data, std::chrono::hours(48));

    CHECK(cache.cleanStalePartials(std::chrono::hours(24)) == 1);
    CHECK_FALSE(fs::exists(old_data));
    CHECK_FALSE(fs::exists(transfer_meta_path(old_data)));

    // Fresh partials and completed files are untouched
    CHECK(fs::exists(fresh_data));
    CHECK(fs::exists(transfer_meta_path(fresh_data)));
    CHECK(fs::exists(done_data));
}

TEST_CASE("ContentCache orders entries with equal timestamps by name") {
    TempDir tmp;
    ContentCache cache(tmp.path(), 2);

    auto stamp = fs::file_time_type::clock::now() - std::chrono::seconds(60);
    for (const char* name : {"beta", "alpha", "gamma"}) {
        fs::create_directories(tmp.file(name));
        fs::last_write_time(tmp.file(name), stamp);
    }

    CHECK(cache.list() == std::vector<std::string>{"alpha", "beta", "gamma"});

    auto removed = cache.evict();
    REQUIRE(removed.size() == 1);
    CHECK(removed[0] == "gamma");
    CHECK(fs::exists(tmp.file("alpha")));
    CHECK(fs::exists(tmp.file("beta")));
}

TEST_CASE("ContentCache sweeps tolerate entries removed before the scan") {
    TempDir tmp;
    ContentCache cache(tmp.path(), 1);

    make_entry(tmp.path(), "keep", std::chrono::seconds(10));
    make_entry(tmp.path(), "drop", std::chrono::seconds(20));
    fs::remove_all(tmp.file("drop"));

    CHECK_NOTHROW(cache.evict());
    CHECK_NOTHROW(cache.cleanStalePartials(std::chrono::hours(1)));
    CHECK(cache.list() == std::vector<std::string>{"keep"});
}
