#pragma once

#include "haul/subprocess.hpp"
#include "haul/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace haul {

// ============================================================================
// Launch Command
// ============================================================================

/**
 * @brief How to start the external process for one launch attempt.
 *
 * `port` mirrors the value of the `--port` argument once set_port_arg() ran.
 */
struct LaunchCommand {
    std::string executable;
    std::vector<std::string> args;
    int port = 0;
    std::string cwd;
    std::vector<std::string> environment;  // KEY=VALUE overrides

    // Substrings whose joint presence in a process command line marks it as
    // an instance this tool would have started.
    std::vector<std::string> instance_markers;
};

// Replace the value of an existing "--port <v>" pair, else append the pair.
void set_port_arg(LaunchCommand& command, int port);

// Start the command as a detached child that survives our exit. Output is
// appended to log_file when given, discarded otherwise.
Result<std::unique_ptr<Subprocess>> spawn_process(const LaunchCommand& command,
                                                  const std::string& log_file = "");

// ============================================================================
// Ports
// ============================================================================

// First port in [start, end] on which a throwaway listener can bind.
// NOT_FOUND when the range is exhausted, INVALID_ARGUMENT for a bad range.
Result<int> find_available_port(const std::string& host, int start, int end);

// ============================================================================
// Readiness
// ============================================================================

struct PollInfo {
    int attempt = 0;
    std::int64_t elapsed_ms = 0;
};

struct WaitOptions {
    std::chrono::milliseconds timeout = std::chrono::seconds(60);
    std::chrono::milliseconds interval = std::chrono::milliseconds(500);
    std::function<void(const PollInfo&)> on_poll;
    CancelToken cancel;

    // Extra liveness condition checked between attempts; returning an error
    // stops the wait with that error (e.g. the child exited).
    std::function<Result<void>()> precondition;
};

// Poll until a TCP connection to host:port succeeds. TIMEOUT or CANCELLED.
Result<void> wait_for_port(int port, const std::string& host = "127.0.0.1",
                           const WaitOptions& options = {});

// Poll until the URL answers with any HTTP response. TIMEOUT or CANCELLED.
Result<void> wait_for_url(const std::string& url, const WaitOptions& options = {});

} // namespace haul
