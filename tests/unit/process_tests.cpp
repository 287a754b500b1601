#include <doctest/doctest.h>
#include <haul/port_lock.hpp>
#include <haul/process.hpp>
#include <haul/process_probe.hpp>
#include <haul/subprocess.hpp>

#include "../support/temp_dir.hpp"
#include "../support/test_http_server.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <thread>

#ifndef _WIN32
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

using namespace haul;
using haul::test::TempDir;
using haul::test::TestHttpServer;

namespace {

WaitOptions quick_wait() {
    WaitOptions wait;
    wait.timeout = std::chrono::milliseconds(400);
    wait.interval = std::chrono::milliseconds(50);
    return wait;
}

// A port nobody listens on
int closed_port() {
    auto port = find_available_port("127.0.0.1", 20000, 30000);
    REQUIRE(port.isOk());
    return port.value();
}

#ifndef _WIN32
// Listening socket on 127.0.0.1:port for the lifetime of the object
class Listener {
public:
    explicit Listener(int port) {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) return;
        int yes = 1;
        setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        bound_ = bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
                 listen(fd_, 1) == 0;
    }
    ~Listener() {
        if (fd_ >= 0) close(fd_);
    }
    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    bool bound() const { return bound_; }

private:
    int fd_ = -1;
    bool bound_ = false;
};

// First of three consecutive free ports at or above `from`
int free_window(int from) {
    for (int base = from; base + 2 <= 65535; base += 3) {
        auto found = find_available_port("127.0.0.1", base, base + 2);
        if (found.isOk() && found.value() == base &&
            find_available_port("127.0.0.1", base + 1, base + 2).isOk() &&
            find_available_port("127.0.0.1", base + 2, base + 2).isOk()) {
            return base;
        }
    }
    FAIL("no free port window");
    return 0;
}
#endif

} // namespace

// ============================================================================
// Launch command
// ============================================================================

TEST_CASE("set_port_arg replaces an existing value or appends the pair") {
    LaunchCommand cmd;
    cmd.args = {"main.py", "--port", "8000", "--listen"};
    set_port_arg(cmd, 8190);
    CHECK(cmd.args == std::vector<std::string>{"main.py", "--port", "8190", "--listen"});
    CHECK(cmd.port == 8190);

    LaunchCommand bare;
    bare.args = {"main.py"};
    set_port_arg(bare, 8191);
    CHECK(bare.args == std::vector<std::string>{"main.py", "--port", "8191"});

    // A trailing flag without a value gets a fresh pair
    LaunchCommand dangling;
    dangling.args = {"--port"};
    set_port_arg(dangling, 8192);
    CHECK(dangling.args == std::vector<std::string>{"--port", "--port", "8192"});
}

// ============================================================================
// Ports
// ============================================================================

TEST_CASE("find_available_port skips a port with a listener") {
    TestHttpServer server;
    int busy = server.port();

    auto same = find_available_port("127.0.0.1", busy, busy);
    REQUIRE(same.isErr());
    CHECK(same.error().code() == ErrorCode::NOT_FOUND);

    int end = std::min(busy + 50, 65535);
    if (end > busy) {
        auto next = find_available_port("127.0.0.1", busy, end);
        REQUIRE(next.isOk());
        CHECK(next.value() > busy);
        CHECK(next.value() <= end);
    }
}

#ifndef _WIN32
TEST_CASE("find_available_port returns the third port when the first two are bound") {
    int base = free_window(31000);
    Listener first(base);
    Listener second(base + 1);
    REQUIRE(first.bound());
    REQUIRE(second.bound());

    auto port = find_available_port("127.0.0.1", base, base + 2);
    REQUIRE(port.isOk());
    CHECK(port.value() == base + 2);
}

TEST_CASE("find_available_port fails when every port in the range is bound") {
    int base = free_window(32000);
    Listener a(base);
    Listener b(base + 1);
    Listener c(base + 2);
    REQUIRE(a.bound());
    REQUIRE(b.bound());
    REQUIRE(c.bound());

    auto port = find_available_port("127.0.0.1", base, base + 2);
    REQUIRE(port.isErr());
    CHECK(port.error().code() == ErrorCode::NOT_FOUND);
}
#endif

TEST_CASE("find_available_port rejects a bad range") {
    CHECK(find_available_port("127.0.0.1", 9000, 8999).error().code() == ErrorCode::INVALID_ARGUMENT);
    CHECK(find_available_port("127.0.0.1", 0, 10).error().code() == ErrorCode::INVALID_ARGUMENT);
    CHECK(find_available_port("127.0.0.1", 65000, 70000).error().code() == ErrorCode::INVALID_ARGUMENT);
}

// ============================================================================
// Readiness
// ============================================================================

TEST_CASE("wait_for_port succeeds against a listener") {
    TestHttpServer server;
    int polls = 0;
    WaitOptions wait = quick_wait();
    wait.on_poll = [&](const PollInfo& info) {
        polls = info.attempt;
    };
    CHECK(wait_for_port(server.port(), "127.0.0.1", wait).isOk());
    CHECK(polls == 1);
}

TEST_CASE("wait_for_port times out on a closed port") {
    int port = closed_port();
    std::vector<int> attempts;
    WaitOptions wait = quick_wait();
    wait.on_poll = [&](const PollInfo& info) { attempts.push_back(info.attempt); };

    auto result = wait_for_port(port, "127.0.0.1", wait);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::TIMEOUT);
    CHECK(attempts.size() >= 2);
    CHECK(std::is_sorted(attempts.begin(), attempts.end()));
}

TEST_CASE("wait_for_port stops on cancellation and failed preconditions") {
    int port = closed_port();

    SUBCASE("cancelled up front") {
        WaitOptions wait = quick_wait();
        wait.cancel.cancel();
        auto result = wait_for_port(port, "127.0.0.1", wait);
        REQUIRE(result.isErr());
        CHECK(result.error().isCancelled());
    }

    SUBCASE("cancelled while sleeping") {
        WaitOptions wait = quick_wait();
        wait.timeout = std::chrono::seconds(30);
        wait.interval = std::chrono::seconds(5);
        CancelToken cancel = wait.cancel;
        std::thread canceller([cancel]() mutable {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            cancel.cancel();
        });
        auto started = std::chrono::steady_clock::now();
        auto result = wait_for_port(port, "127.0.0.1", wait);
        canceller.join();
        REQUIRE(result.isErr());
        CHECK(result.error().isCancelled());
        CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
    }

    SUBCASE("precondition failure") {
        WaitOptions wait = quick_wait();
        wait.precondition = []() {
            return Result<void>::err(Error(ErrorCode::IO_ERROR, "process exited"));
        };
        auto result = wait_for_port(port, "127.0.0.1", wait);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::IO_ERROR);
    }
}

TEST_CASE("wait_for_url accepts any HTTP response") {
    TestHttpServer server;
    CHECK(wait_for_url(server.url("/missing"), quick_wait()).isOk());

    auto result = wait_for_url("http://127.0.0.1:" + std::to_string(closed_port()) + "/", quick_wait());
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::TIMEOUT);
}

// ============================================================================
// Port locks
// ============================================================================

#ifndef _WIN32

TEST_CASE("PortLockStore round-trips locks held by live processes") {
    TempDir tmp;
    PortLockStore locks(tmp.file("locks"));

    REQUIRE(locks.write(8190, getpid(), "studio"));
    REQUIRE(locks.write(8188, getpid(), "other"));

    auto lock = locks.read(8190);
    REQUIRE(lock.has_value());
    CHECK(lock->port == 8190);
    CHECK(lock->pid == getpid());
    CHECK(lock->label == "studio");
    CHECK(lock->timestamp > 0);

    auto listed = locks.list();
    REQUIRE(listed.size() == 2);
    CHECK(listed[0].port == 8188);
    CHECK(listed[1].port == 8190);

    locks.remove(8190);
    CHECK_FALSE(locks.read(8190).has_value());
    CHECK(locks.list().size() == 1);
}

TEST_CASE("PortLockStore lock file holds pid, label and timestamp") {
    TempDir tmp;
    PortLockStore locks(tmp.path());
    REQUIRE(locks.write(9001, getpid(), "x"));

    CHECK(locks.lockPath(9001) == tmp.file("port-9001.json"));
    auto j = nlohmann::json::parse(haul::test::read_text(locks.lockPath(9001)));
    CHECK(j["pid"] == getpid());
    CHECK(j["label"] == "x");
    CHECK(j.contains("timestamp"));
}

TEST_CASE("PortLockStore heals locks of dead owners on read") {
    TempDir tmp;
    PortLockStore locks(tmp.path());

    // Spawn and reap a child so its pid is known to be gone
    auto child = Subprocess::spawn({"sh", "-c", "exit 0"});
    REQUIRE(child.isOk());
    int dead_pid = child.value()->pid();
    child.value()->wait();

    REQUIRE(locks.write(9100, dead_pid, "ghost"));
    CHECK_FALSE(locks.read(9100).has_value());
    CHECK_FALSE(std::filesystem::exists(locks.lockPath(9100)));

    SUBCASE("garbage lock files are removed too") {
        haul::test::write_text(locks.lockPath(9101), "not json");
        CHECK(locks.list().empty());
    }
}

TEST_CASE("PortLockStore treats a pid beyond the int range as stale") {
    TempDir tmp;
    PortLockStore locks(tmp.path());

    // Truncated to 32 bits this would name the live test process
    std::int64_t wide_pid = static_cast<std::int64_t>(getpid()) + (std::int64_t(1) << 32);
    nlohmann::json j;
    j["pid"] = wide_pid;
    j["label"] = "wide";
    j["timestamp"] = 1;
    haul::test::write_text(locks.lockPath(9102), j.dump());

    CHECK_FALSE(locks.read(9102).has_value());
    CHECK_FALSE(std::filesystem::exists(locks.lockPath(9102)));
}

TEST_CASE("PortLockStore list ignores unrelated files") {
    TempDir tmp;
    PortLockStore locks(tmp.path());
    haul::test::write_text(tmp.file("port-abc.json"), "{}");
    haul::test::write_text(tmp.file("notes.txt"), "x");
    REQUIRE(locks.write(9200, getpid(), "a"));

    auto listed = locks.list();
    REQUIRE(listed.size() == 1);
    CHECK(listed[0].port == 9200);
}

TEST_CASE("PortLockStore tolerates a missing directory") {
    TempDir tmp;
    PortLockStore locks(tmp.file("never/created"));
    CHECK(locks.list().empty());
    CHECK_FALSE(locks.read(1234).has_value());
    locks.remove(1234);
}

// ============================================================================
// Subprocesses
// ============================================================================

TEST_CASE("run_command collects output and exit code") {
    auto result = run_command({"sh", "-c", "echo out; echo err >&2; exit 3"});
    REQUIRE(result.isOk());
    CHECK(result.value().exit_code == 3);
    CHECK(result.value().out == "out\n");
    CHECK(result.value().err == "err\n");
}

TEST_CASE("run_command kills a helper that outlives its timeout") {
    auto started = std::chrono::steady_clock::now();
    auto result = run_command({"sh", "-c", "sleep 30"}, std::chrono::milliseconds(200));
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::TIMEOUT);
    CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(10));
}

TEST_CASE("run_command reports a missing executable") {
    auto result = run_command({"haul-definitely-not-installed"});
    CHECK(result.isErr());
}

TEST_CASE("is_process_alive") {
    CHECK(is_process_alive(getpid()));
    CHECK_FALSE(is_process_alive(0));
    CHECK_FALSE(is_process_alive(-5));

    auto child = Subprocess::spawn({"sh", "-c", "exit 0"});
    REQUIRE(child.isOk());
    int pid = child.value()->pid();
    CHECK(child.value()->wait() == 0);
    CHECK_FALSE(is_process_alive(pid));
}

TEST_CASE("Subprocess delivers captured output line by line") {
    SpawnOptions options;
    options.capture_output = true;
    auto child = Subprocess::spawn({"sh", "-c", "printf '1%%\\r2%%\\rdone\\n'"}, options);
    REQUIRE(child.isOk());

    std::vector<std::string> lines;
    while (child.value()->pumpOutput(std::chrono::milliseconds(100),
                                     [&](OutputStream, const std::string& line) {
                                         lines.push_back(line);
                                     })) {
    }
    CHECK(child.value()->wait() == 0);
    CHECK(lines == std::vector<std::string>{"1%", "2%", "done"});
}

#endif // _WIN32

// ============================================================================
// Process probe
// ============================================================================

TEST_CASE("command_line_matches requires every marker") {
    std::string cmd = "/usr/bin/Python3 /opt/app/Main.py --listen 127.0.0.1";

    CHECK(command_line_matches(cmd, {"main.py"}));
    CHECK(command_line_matches(cmd, {"python3", "MAIN.PY"}));
    CHECK_FALSE(command_line_matches(cmd, {"main.py", "server.js"}));
    CHECK_FALSE(command_line_matches(cmd, {}));
    CHECK_FALSE(command_line_matches("", {"main.py"}));
}

TEST_CASE("the shared process probe is available") {
    ProcessProbe& probe = process_probe();
    CHECK(std::string(probe.name()).size() > 0);
    CHECK(&probe == &process_probe());
}
