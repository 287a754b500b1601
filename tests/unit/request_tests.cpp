#include <doctest/doctest.h>
#include <haul/request.hpp>

#include "../support/temp_dir.hpp"

using namespace haul;
using haul::test::TempDir;

namespace {

void check_invalid(const std::string& json, const std::string& fragment) {
    auto result = parse_install_request(json);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::VALIDATION);
    CHECK(result.error().message().find(fragment) != std::string::npos);
}

} // namespace

TEST_CASE("filename_from_url strips query and fragment") {
    CHECK(filename_from_url("https://example.com/a/b/pack.7z?sig=abc") == "pack.7z");
    CHECK(filename_from_url("https://example.com/pack.7z#frag") == "pack.7z");
    CHECK(filename_from_url("https://example.com/") == "");
    CHECK(filename_from_url("https://example.com") == "");
    CHECK(filename_from_url("https://example.com/dir/..") == "");
}

TEST_CASE("parse_install_request accepts a split archive") {
    const char* json = R"({
        "dest": "/opt/bundle",
        "cache_key": "bundle-1.2",
        "files": [
            {"url": "https://h/b.7z.001", "filename": "b.7z.001", "size": 100,
             "sha256": "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"},
            {"url": "https://h/b.7z.002", "filename": "b.7z.002", "size": 0}
        ]
    })";
    auto result = parse_install_request(json);
    REQUIRE(result.isOk());

    const auto& r = result.value();
    CHECK(r.dest == "/opt/bundle");
    CHECK(r.cache_key == "bundle-1.2");
    REQUIRE(r.files.size() == 2);
    CHECK(r.files[0].size == std::optional<std::uint64_t>(100));
    CHECK_FALSE(r.files[0].sha256.empty());

    // Zero means the size is unknown
    CHECK_FALSE(r.files[1].size.has_value());
}

TEST_CASE("a single file takes its name from the URL") {
    auto result = parse_install_request(
        R"({"dest": "d", "cache_key": "k", "files": [{"url": "https://h/x/tool.tar.gz?t=1"}]})");
    REQUIRE(result.isOk());
    CHECK(result.value().files[0].filename == "tool.tar.gz");
    CHECK_FALSE(result.value().files[0].size.has_value());
}

TEST_CASE("parse_install_request reports what is wrong") {
    check_invalid("[]", "JSON object");
    check_invalid("{", "parse error");
    check_invalid(R"({"cache_key": "k", "files": [{"url": "u"}]})", "dest");
    check_invalid(R"({"dest": "d", "cache_key": "../up", "files": [{"url": "u"}]})", "cache_key");
    check_invalid(R"({"dest": "d", "cache_key": "k", "files": []})", "non-empty");
    check_invalid(R"({"dest": "d", "cache_key": "k", "files": [{"filename": "a"}]})", "files[0].url");

    SUBCASE("multi-file entries need explicit names") {
        check_invalid(R"({"dest": "d", "cache_key": "k",
                          "files": [{"url": "https://h/a"}, {"url": "https://h/b"}]})",
                      "files[0].filename");
    }
    SUBCASE("duplicate names") {
        check_invalid(R"({"dest": "d", "cache_key": "k",
                          "files": [{"url": "u1", "filename": "a"}, {"url": "u2", "filename": "a"}]})",
                      "duplicated");
    }
    SUBCASE("negative size") {
        check_invalid(R"({"dest": "d", "cache_key": "k",
                          "files": [{"url": "u", "filename": "a", "size": -4}]})",
                      "size");
    }
    SUBCASE("malformed digest") {
        check_invalid(R"({"dest": "d", "cache_key": "k",
                          "files": [{"url": "u", "filename": "a", "sha256": "abc"}]})",
                      "sha256");
    }
}

TEST_CASE("load_install_request reads from disk") {
    TempDir tmp;

    auto missing = load_install_request(tmp.file("none.json"));
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::NOT_FOUND);

    haul::test::write_text(tmp.file("bad.json"), R"({"dest": ""})");
    auto bad = load_install_request(tmp.file("bad.json"));
    REQUIRE(bad.isErr());
    CHECK(bad.error().message().find(tmp.file("bad.json")) == 0);

    haul::test::write_text(tmp.file("ok.json"),
                           R"({"dest": "d", "cache_key": "k", "files": [{"url": "https://h/f.zip"}]})");
    auto ok = load_install_request(tmp.file("ok.json"));
    REQUIRE(ok.isOk());
    CHECK(ok.value().files[0].filename == "f.zip");
}
