#pragma once

#include "haul/port_lock.hpp"
#include "haul/process.hpp"
#include "haul/process_probe.hpp"
#include "haul/subprocess.hpp"
#include "haul/types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace haul {

// ============================================================================
// Launcher
// ============================================================================

enum class LaunchState {
    Idle,
    PortSelection,
    Spawning,
    WaitingForReachable,
    Ready,
    Running,
    Stopped,
    Crashed
};

const char* launch_state_name(LaunchState state);

struct LaunchOptions {
    std::string host = "127.0.0.1";

    // Port to insist on. When busy, start() fails with PORT_CONFLICT.
    std::optional<int> preferred_port;
    int port_start = 8188;
    int port_end = 8288;

    // Label written into the port lock
    std::string label;

    // Readiness: any HTTP response from this URL, else a TCP connect to the port.
    // "{port}" in the URL is replaced with the selected port.
    std::string ready_url;

    // Child stdout/stderr go here when set
    std::string log_file;

    WaitOptions wait;
    CancelToken cancel;

    std::function<void(LaunchState)> on_state;
};

// Who is sitting on a port: listeners reported by the OS plus the lock owner.
PortConflict inspect_port_conflict(int port, const PortLockStore& locks, ProcessProbe& probe,
                                   const std::vector<std::string>& markers);

/**
 * @brief Start, track and stop one external process on a coordinated port.
 *
 * Idle -> PortSelection -> Spawning -> WaitingForReachable -> Ready -> Running
 * -> Stopped | Crashed. Cancellation is honoured in the first three states and
 * returns to Idle without writing a lock. The lock is written on Ready and
 * removed on Stopped / Crashed.
 */
class Launcher {
public:
    Launcher(PortLockStore& locks, ProcessProbe& probe, LaunchOptions options);

    Launcher(const Launcher&) = delete;
    Launcher& operator=(const Launcher&) = delete;

    LaunchState state() const { return state_; }
    int pid() const { return child_ ? child_->pid() : -1; }
    int port() const { return port_; }

    // Select a port, spawn the command with it and wait for reachability.
    // On TIMEOUT the child is left running in WaitingForReachable so
    // awaitReady() may be called again. Returns the port.
    Result<int> start(LaunchCommand& command);

    // Continue waiting after a TIMEOUT.
    Result<void> awaitReady();

    // Block until the child exits (Running -> Stopped on exit code 0,
    // Crashed otherwise) or `cancel` fires (CANCELLED, state unchanged).
    Result<int> waitForExit(const CancelToken& cancel);

    // Non-blocking exit check; performs the same transition as waitForExit.
    std::optional<int> poll();

    // Kill the child and its descendants, remove the lock -> Stopped.
    void stop();

private:
    void transition(LaunchState next);
    Result<int> selectPort(const LaunchCommand& command);
    void abortLaunch();
    void finish(int exit_code);

    PortLockStore& locks_;
    ProcessProbe& probe_;
    LaunchOptions options_;
    LaunchState state_ = LaunchState::Idle;
    std::unique_ptr<Subprocess> child_;
    int port_ = 0;
    bool stop_requested_ = false;
    bool lock_written_ = false;
};

} // namespace haul
