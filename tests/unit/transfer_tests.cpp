#include <doctest/doctest.h>
#include <haul/platform.hpp>
#include <haul/transfer.hpp>

#include "../support/temp_dir.hpp"
#include "../support/test_http_server.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

using namespace haul;
using haul::test::TempDir;
using haul::test::TestHttpServer;

namespace {

const std::string BODY = haul::test::make_payload(200000);

TransferOptions fast_options() {
    TransferOptions options;
    options.connect_timeout_secs = 5;
    options.stall_timeout_secs = 10;
    options.progress_interval = std::chrono::milliseconds(0);
    return options;
}

} // namespace

// ============================================================================
// Sidecar
// ============================================================================

TEST_CASE("transfer sidecar serializes with camelCase keys") {
    TransferMeta meta;
    meta.url = "https://example.com/a.7z";
    meta.expected_size = 1234;
    meta.etag = "\"abc\"";

    auto j = nlohmann::json::parse(serialize_transfer_meta(meta));
    CHECK(j["url"] == "https://example.com/a.7z");
    CHECK(j["expectedSize"] == 1234);
    CHECK(j["etag"] == "\"abc\"");
    CHECK_FALSE(j.contains("lastModified"));

    auto parsed = parse_transfer_meta(j.dump());
    REQUIRE(parsed.has_value());
    CHECK(parsed->expected_size == 1234);
    CHECK(parsed->etag == "\"abc\"");
}

TEST_CASE("transfer sidecar parse rejects garbage") {
    CHECK_FALSE(parse_transfer_meta("not json").has_value());
    CHECK_FALSE(parse_transfer_meta("[1,2]").has_value());
    CHECK_FALSE(parse_transfer_meta("{\"expectedSize\": 3}").has_value());
}

TEST_CASE("is_transfer_complete requires data and no sidecar") {
    TempDir tmp;
    std::string dest = tmp.file("a.bin");
    CHECK_FALSE(is_transfer_complete(dest));

    haul::test::write_text(dest, "abc");
    CHECK(is_transfer_complete(dest));

    haul::test::write_text(transfer_meta_path(dest), "{}");
    CHECK_FALSE(is_transfer_complete(dest));
}

// ============================================================================
// RateWindow
// ============================================================================

TEST_CASE("RateWindow measures bytes over the retained window") {
    RateWindow window(std::chrono::milliseconds(1000));
    auto t0 = RateWindow::Clock::now();

    CHECK(window.bytesPerSecond() == 0.0);
    window.add(t0, 0);
    CHECK(window.bytesPerSecond() == 0.0);

    window.add(t0 + std::chrono::milliseconds(500), 500);
    CHECK(window.bytesPerSecond() == doctest::Approx(1000.0));

    // Old samples fall out: only the last second counts
    window.add(t0 + std::chrono::milliseconds(3000), 500);
    window.add(t0 + std::chrono::milliseconds(3500), 5500);
    CHECK(window.bytesPerSecond() == doctest::Approx(10000.0));
}

// ============================================================================
// Transfer
// ============================================================================

TEST_CASE("transfer downloads a file and clears the sidecar") {
    TempDir tmp;
    TestHttpServer server;
    server.serve("/file.bin", BODY, "\"v1\"");

    std::string dest = tmp.file("sub/file.bin");
    std::vector<int> percents;
    auto result = transfer(server.url("/file.bin"), dest,
        [&](const TransferProgress& p) {
            if (p.percent) percents.push_back(*p.percent);
            CHECK(p.total_bytes.value_or(0) == BODY.size());
        },
        fast_options());

    REQUIRE(result.isOk());
    CHECK(result.value() == dest);
    CHECK(haul::test::read_text(dest) == BODY);
    CHECK_FALSE(fs::exists(transfer_meta_path(dest)));

    REQUIRE_FALSE(percents.empty());
    CHECK(percents.back() == 100);
    CHECK(std::is_sorted(percents.begin(), percents.end()));
}

TEST_CASE("transfer of a complete file makes no request") {
    TempDir tmp;
    TestHttpServer server;
    server.serve("/file.bin", BODY, "\"v1\"");
    std::string dest = tmp.file("file.bin");

    REQUIRE(transfer(server.url("/file.bin"), dest, nullptr, fast_options()).isOk());
    server.clearRequests();

    auto again = transfer(server.url("/file.bin"), dest, nullptr, fast_options());
    REQUIRE(again.isOk());
    CHECK(server.requests().empty());
    CHECK(haul::test::read_text(dest) == BODY);
}

TEST_CASE("transfer resumes after a dropped connection") {
    TempDir tmp;
    TestHttpServer server;
    server.serve("/file.bin", BODY, "\"v1\"");
    server.dropAfter(50000);

    std::string dest = tmp.file("file.bin");
    auto first = transfer(server.url("/file.bin"), dest, nullptr, fast_options());
    REQUIRE(first.isErr());
    CHECK(first.error().code() == ErrorCode::NETWORK);

    // Partial state survives a network failure
    REQUIRE(fs::exists(dest));
    REQUIRE(fs::exists(transfer_meta_path(dest)));
    auto partial_size = file_size(dest);
    REQUIRE(partial_size.has_value());
    CHECK(*partial_size == 50000);

    auto meta = read_transfer_meta(transfer_meta_path(dest));
    REQUIRE(meta.has_value());
    CHECK(meta->url == server.url("/file.bin"));
    CHECK(meta->expected_size == BODY.size());
    CHECK(meta->etag == "\"v1\"");

    server.clearRequests();
    std::vector<std::uint64_t> received;
    auto second = transfer(server.url("/file.bin"), dest,
        [&](const TransferProgress& p) { received.push_back(p.received_bytes); },
        fast_options());
    REQUIRE(second.isOk());
    CHECK(haul::test::read_text(dest) == BODY);
    CHECK_FALSE(fs::exists(transfer_meta_path(dest)));

    auto requests = server.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].range == "bytes=50000-");
    CHECK(requests[0].if_range == "\"v1\"");
    CHECK(requests[0].status == 206);

    // Resumed bytes count toward progress from the start
    REQUIRE_FALSE(received.empty());
    CHECK(received.front() >= 50000);
}

TEST_CASE("transfer restarts from zero when the validator changed") {
    TempDir tmp;
    TestHttpServer server;
    server.serve("/file.bin", BODY, "\"v1\"");
    server.dropAfter(30000);

    std::string dest = tmp.file("file.bin");
    REQUIRE(transfer(server.url("/file.bin"), dest, nullptr, fast_options()).isErr());

    std::string updated = haul::test::make_payload(120000);
    std::reverse(updated.begin(), updated.end());
    server.serve("/file.bin", updated, "\"v2\"");
    server.clearRequests();

    auto result = transfer(server.url("/file.bin"), dest, nullptr, fast_options());
    REQUIRE(result.isOk());
    CHECK(haul::test::read_text(dest) == updated);

    auto requests = server.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].if_range == "\"v1\"");
    CHECK(requests[0].status == 200);
}

TEST_CASE("transfer falls back to Last-Modified for If-Range") {
    TempDir tmp;
    TestHttpServer server;
    TestHttpServer::Resource res;
    res.body = BODY;
    res.last_modified = "Wed, 21 Oct 2015 07:28:00 GMT";
    server.serve("/file.bin", res);
    server.dropAfter(40000);

    std::string dest = tmp.file("file.bin");
    REQUIRE(transfer(server.url("/file.bin"), dest, nullptr, fast_options()).isErr());
    server.clearRequests();

    REQUIRE(transfer(server.url("/file.bin"), dest, nullptr, fast_options()).isOk());
    auto requests = server.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].if_range == "Wed, 21 Oct 2015 07:28:00 GMT");
    CHECK(requests[0].status == 206);
    CHECK(haul::test::read_text(dest) == BODY);
}

TEST_CASE("transfer without validators restarts instead of resuming") {
    TempDir tmp;
    TestHttpServer server;
    server.serve("/file.bin", BODY);
    server.dropAfter(40000);

    std::string dest = tmp.file("file.bin");
    REQUIRE(transfer(server.url("/file.bin"), dest, nullptr, fast_options()).isErr());
    server.clearRequests();

    REQUIRE(transfer(server.url("/file.bin"), dest, nullptr, fast_options()).isOk());
    auto requests = server.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].range.empty());
    CHECK(haul::test::read_text(dest) == BODY);
}

TEST_CASE("transfer rejects a caller size that disagrees with the server") {
    TempDir tmp;
    TestHttpServer server;
    server.serve("/file.bin", BODY, "\"v1\"");

    std::string dest = tmp.file("file.bin");
    auto options = fast_options();
    options.expected_size = BODY.size() + 1;

    auto result = transfer(server.url("/file.bin"), dest, nullptr, options);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::VALIDATION);
    CHECK_FALSE(fs::exists(dest));
    CHECK_FALSE(fs::exists(transfer_meta_path(dest)));
}

TEST_CASE("transfer refetches a complete file of the wrong size") {
    TempDir tmp;
    TestHttpServer server;
    server.serve("/file.bin", BODY, "\"v1\"");

    std::string dest = tmp.file("file.bin");
    auto options = fast_options();
    options.expected_size = BODY.size();

    haul::test::write_text(dest, "short");
    auto result = transfer(server.url("/file.bin"), dest, nullptr, options);
    REQUIRE(result.isOk());
    CHECK(haul::test::read_text(dest) == BODY);
}

TEST_CASE("transfer follows redirects and records the original URL") {
    TempDir tmp;
    TestHttpServer server;
    server.serve("/real.bin", BODY, "\"v1\"");
    server.redirect("/start", "/hop");
    server.redirect("/hop", server.url("/real.bin"), 301);
    server.dropAfter(10000);

    std::string dest = tmp.file("file.bin");
    auto first = transfer(server.url("/start"), dest, nullptr, fast_options());
    REQUIRE(first.isErr());

    auto meta = read_transfer_meta(transfer_meta_path(dest));
    REQUIRE(meta.has_value());
    CHECK(meta->url == server.url("/start"));

    auto second = transfer(server.url("/start"), dest, nullptr, fast_options());
    REQUIRE(second.isOk());
    CHECK(haul::test::read_text(dest) == BODY);
}

TEST_CASE("transfer gives up on redirect loops") {
    TempDir tmp;
    TestHttpServer server;
    server.redirect("/loop", "/loop");

    auto result = transfer(server.url("/loop"), tmp.file("x"), nullptr, fast_options());
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::VALIDATION);
    CHECK(server.requests().size() == 6);
}

TEST_CASE("transfer reports unexpected HTTP status as a network error") {
    TempDir tmp;
    TestHttpServer server;

    auto result = transfer(server.url("/missing"), tmp.file("x"), nullptr, fast_options());
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::NETWORK);
    CHECK(result.error().message().find("404") != std::string::npos);
}

TEST_CASE("transfer restarts once when the range is not satisfiable") {
    TempDir tmp;
    TestHttpServer server;
    server.serve("/file.bin", BODY, "\"v1\"");

    // Partial as large as the whole resource, size unknown in the sidecar
    std::string dest = tmp.file("file.bin");
    haul::test::write_text(dest, std::string(BODY.size(), 'x'));
    TransferMeta meta;
    meta.url = server.url("/file.bin");
    meta.etag = "\"v1\"";
    REQUIRE(write_transfer_meta(transfer_meta_path(dest), meta));

    auto result = transfer(server.url("/file.bin"), dest, nullptr, fast_options());
    REQUIRE(result.isOk());
    CHECK(haul::test::read_text(dest) == BODY);

    auto requests = server.requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[0].status == 416);
    CHECK(requests[1].status == 200);
}

TEST_CASE("transfer clears a sidecar whose size was already reached") {
    TempDir tmp;
    TestHttpServer server;

    std::string dest = tmp.file("file.bin");
    haul::test::write_text(dest, BODY);
    TransferMeta meta;
    meta.url = server.url("/file.bin");
    meta.expected_size = BODY.size();
    meta.etag = "\"v1\"";
    REQUIRE(write_transfer_meta(transfer_meta_path(dest), meta));

    auto result = transfer(server.url("/file.bin"), dest, nullptr, fast_options());
    REQUIRE(result.isOk());
    CHECK(server.requests().empty());
    CHECK_FALSE(fs::exists(transfer_meta_path(dest)));
}

TEST_CASE("transfer starts over when the sidecar belongs to another URL") {
    TempDir tmp;
    TestHttpServer server;
    server.serve("/file.bin", BODY, "\"v1\"");

    std::string dest = tmp.file("file.bin");
    haul::test::write_text(dest, "stale bytes");
    TransferMeta meta;
    meta.url = server.url("/other.bin");
    meta.etag = "\"v1\"";
    REQUIRE(write_transfer_meta(transfer_meta_path(dest), meta));

    REQUIRE(transfer(server.url("/file.bin"), dest, nullptr, fast_options()).isOk());
    auto requests = server.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].range.empty());
    CHECK(haul::test::read_text(dest) == BODY);
}

TEST_CASE("transfer removes a sidecar left without data") {
    TempDir tmp;
    TestHttpServer server;
    server.serve("/file.bin", BODY, "\"v1\"");

    std::string dest = tmp.file("file.bin");
    haul::test::write_text(transfer_meta_path(dest), "{\"url\":\"x\"}");

    REQUIRE(transfer(server.url("/file.bin"), dest, nullptr, fast_options()).isOk());
    CHECK(haul::test::read_text(dest) == BODY);
    CHECK_FALSE(fs::exists(transfer_meta_path(dest)));
}

TEST_CASE("transfer honours cancellation") {
    TempDir tmp;
    TestHttpServer server;
    server.serve("/file.bin", BODY, "\"v1\"");
    std::string dest = tmp.file("file.bin");

    SUBCASE("before the request") {
        auto options = fast_options();
        options.cancel.cancel();
        auto result = transfer(server.url("/file.bin"), dest, nullptr, options);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::CANCELLED);
        CHECK(server.requests().empty());
    }

    SUBCASE("mid-stream keeps the partial for a later resume") {
        server.setChunkDelay(std::chrono::milliseconds(20), 4096);
        auto options = fast_options();
        auto result = transfer(server.url("/file.bin"), dest,
            [&](const TransferProgress& p) {
                if (p.received_bytes >= 16384) options.cancel.cancel();
            },
            options);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::CANCELLED);
        CHECK(fs::exists(dest));
        CHECK(fs::exists(transfer_meta_path(dest)));

        // Cancelling again afterwards is harmless
        options.cancel.cancel();
        CHECK(options.cancel.cancelled());
    }
}

TEST_CASE("probe_url treats any HTTP status as reachable") {
    TestHttpServer server;
    auto found = probe_url(server.url("/missing"));
    REQUIRE(found.isOk());
    CHECK(found.value() == 404);
}

TEST_CASE("probe_url fails on a closed port") {
    int port = 0;
    {
        TestHttpServer server;
        port = server.port();
    }
    auto result = probe_url("http://127.0.0.1:" + std::to_string(port) + "/",
                            std::chrono::milliseconds(500));
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::NETWORK);
}
