#include "haul/process.hpp"
#include "haul/platform.hpp"
#include "haul/transfer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iterator>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#include <spdlog/spdlog.h>

namespace haul {

// ============================================================================
// Launch Command
// ============================================================================

void set_port_arg(LaunchCommand& command, int port) {
    auto it = std::find(command.args.begin(), command.args.end(), "--port");
    if (it != command.args.end() && std::next(it) != command.args.end()) {
        *std::next(it) = std::to_string(port);
    } else {
        command.args.push_back("--port");
        command.args.push_back(std::to_string(port));
    }
    command.port = port;
}

Result<std::unique_ptr<Subprocess>> spawn_process(const LaunchCommand& command,
                                                  const std::string& log_file) {
    std::vector<std::string> argv;
    argv.push_back(command.executable);
    argv.insert(argv.end(), command.args.begin(), command.args.end());

    SpawnOptions options;
    options.cwd = command.cwd;
    options.detached = true;
    options.output_file = log_file;
    options.environment = command.environment;

    auto spawned = Subprocess::spawn(argv, options);
    if (spawned.isOk()) {
        spdlog::debug("launched {} as pid {}", command.executable, spawned.value()->pid());
    }
    return spawned;
}

// ============================================================================
// Sockets
// ============================================================================

namespace {

#ifdef _WIN32
using socket_t = SOCKET;
constexpr socket_t INVALID_SOCK = INVALID_SOCKET;

void close_socket(socket_t s) { closesocket(s); }

class WinsockInit {
public:
    WinsockInit() {
        WSADATA data;
        WSAStartup(MAKEWORD(2, 2), &data);
    }
    ~WinsockInit() { WSACleanup(); }
};

void ensure_sockets() {
    static WinsockInit init;
}
#else
using socket_t = int;
constexpr socket_t INVALID_SOCK = -1;

void close_socket(socket_t s) { close(s); }

void ensure_sockets() {}
#endif

// RAII wrapper for getaddrinfo results
class AddrInfo {
public:
    AddrInfo(const std::string& host, int port, bool passive) {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        if (passive) hints.ai_flags = AI_PASSIVE;
        std::string service = std::to_string(port);
        status_ = getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &info_);
    }
    ~AddrInfo() {
        if (info_) freeaddrinfo(info_);
    }
    AddrInfo(const AddrInfo&) = delete;
    AddrInfo& operator=(const AddrInfo&) = delete;

    bool ok() const { return status_ == 0 && info_ != nullptr; }
    const struct addrinfo* get() const { return info_; }
    int status() const { return status_; }

private:
    struct addrinfo* info_ = nullptr;
    int status_ = 0;
};

// True if a listener could be bound on the first resolved address
bool try_bind(const std::string& host, int port) {
    AddrInfo addr(host, port, true);
    if (!addr.ok()) return false;

    const struct addrinfo* ai = addr.get();
    socket_t s = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (s == INVALID_SOCK) return false;

#ifndef _WIN32
    // Match a real server: TIME_WAIT leftovers do not make a port busy
    int yes = 1;
    setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
#endif

    bool bound = bind(s, ai->ai_addr, static_cast<int>(ai->ai_addrlen)) == 0 &&
                 listen(s, 1) == 0;
    close_socket(s);
    return bound;
}

// Non-blocking connect bounded by timeout
bool try_connect(const std::string& host, int port, std::chrono::milliseconds timeout) {
    AddrInfo addr(host, port, false);
    if (!addr.ok()) return false;

    for (const struct addrinfo* ai = addr.get(); ai; ai = ai->ai_next) {
        socket_t s = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (s == INVALID_SOCK) continue;

#ifdef _WIN32
        u_long nonblocking = 1;
        ioctlsocket(s, FIONBIO, &nonblocking);
        int rc = connect(s, ai->ai_addr, static_cast<int>(ai->ai_addrlen));
        bool in_progress = rc != 0 && WSAGetLastError() == WSAEWOULDBLOCK;
        WSAPOLLFD pfd = {s, POLLOUT, 0};
        auto do_poll = [&]() { return WSAPoll(&pfd, 1, static_cast<int>(timeout.count())); };
#else
        int flags = fcntl(s, F_GETFL, 0);
        fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int rc = connect(s, ai->ai_addr, ai->ai_addrlen);
        bool in_progress = rc != 0 && errno == EINPROGRESS;
        struct pollfd pfd = {s, POLLOUT, 0};
        auto do_poll = [&]() { return poll(&pfd, 1, static_cast<int>(timeout.count())); };
#endif

        bool connected = rc == 0;
        if (!connected && in_progress && do_poll() > 0) {
            int err = 0;
            socklen_t len = sizeof(err);
            getsockopt(s, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&err), &len);
            connected = err == 0;
        }
        close_socket(s);
        if (connected) return true;
    }
    return false;
}

template<typename AttemptFn>
Result<void> poll_until(const std::string& what, const WaitOptions& options, AttemptFn attempt_fn) {
    const auto start = std::chrono::steady_clock::now();
    int attempt = 0;

    while (true) {
        if (options.cancel.cancelled()) {
            return Result<void>::err(cancelled_error("launch"));
        }
        if (options.precondition) {
            auto pre = options.precondition();
            if (pre.isErr()) return pre;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (elapsed > options.timeout) {
            return Result<void>::err(Error(ErrorCode::TIMEOUT,
                "timed out waiting for " + what + " after " +
                std::to_string(elapsed.count() / 1000) + "s"));
        }

        ++attempt;
        if (options.on_poll) {
            options.on_poll({attempt, elapsed.count()});
        }

        if (attempt_fn()) {
            spdlog::debug("{} reachable after {} attempt(s)", what, attempt);
            return Result<void>::ok();
        }

        if (!sleep_interruptible(options.interval, [&]() { return options.cancel.cancelled(); })) {
            return Result<void>::err(cancelled_error("launch"));
        }
    }
}

constexpr std::chrono::milliseconds ATTEMPT_TIMEOUT(2000);

} // namespace

// ============================================================================
// Ports
// ============================================================================

Result<int> find_available_port(const std::string& host, int start, int end) {
    if (start < 1 || end > 65535 || start > end) {
        return Result<int>::err(Error(ErrorCode::INVALID_ARGUMENT,
            "invalid port range " + std::to_string(start) + "-" + std::to_string(end)));
    }
    ensure_sockets();

    for (int port = start; port <= end; ++port) {
        if (try_bind(host, port)) {
            spdlog::debug("port {} is free on {}", port, host);
            return Result<int>::ok(port);
        }
        spdlog::debug("port {} is busy on {}", port, host);
    }

    return Result<int>::err(Error(ErrorCode::NOT_FOUND,
        "no available ports found between " + std::to_string(start) + " and " + std::to_string(end)));
}

// ============================================================================
// Readiness
// ============================================================================

Result<void> wait_for_port(int port, const std::string& host, const WaitOptions& options) {
    ensure_sockets();
    return poll_until("port " + std::to_string(port), options,
                      [&]() { return try_connect(host, port, ATTEMPT_TIMEOUT); });
}

Result<void> wait_for_url(const std::string& url, const WaitOptions& options) {
    return poll_until(url, options, [&]() { return probe_url(url, ATTEMPT_TIMEOUT).isOk(); });
}

} // namespace haul
