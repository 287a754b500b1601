#pragma once

#include "haul/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace haul {

// ============================================================================
// Child Processes
// ============================================================================

struct SpawnOptions {
    std::string cwd;

    // New session / process group that outlives the spawning process.
    bool detached = false;

    // Pipe stdout and stderr back to the parent (read via pumpOutput()).
    bool capture_output = false;

    // When not capturing: append stdout+stderr to this file, else discard.
    std::string output_file;

    // Extra KEY=VALUE entries layered over the inherited environment.
    std::vector<std::string> environment;
};

enum class OutputStream { Stdout, Stderr };

using OutputLineFn = std::function<void(OutputStream, const std::string&)>;

/**
 * @brief A spawned child process.
 *
 * Destroying the handle closes the pipes but never kills or reaps the child,
 * so detached children keep running.
 */
class Subprocess {
public:
    static Result<std::unique_ptr<Subprocess>> spawn(const std::vector<std::string>& argv,
                                                     const SpawnOptions& options = {});

    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    int pid() const { return pid_; }

    // Wait up to `timeout` for output and deliver complete lines. Lines end at
    // '\n', '\r' or '\b' so in-place progress counters arrive one by one.
    // Returns false once both pipes are closed (or nothing was captured).
    bool pumpOutput(std::chrono::milliseconds timeout, const OutputLineFn& on_line);

    // Exit code if the child has exited (128 + signal for signal deaths).
    std::optional<int> tryWait();

    // Block until exit.
    int wait();

    // Forcefully terminate the child and everything in its process group.
    void kill();

private:
    Subprocess() = default;

    int pid_ = -1;
    std::optional<int> exit_code_;
#ifdef _WIN32
    void* process_handle_ = nullptr;
    void* out_read_ = nullptr;
    void* err_read_ = nullptr;
#else
    int out_fd_ = -1;
    int err_fd_ = -1;
#endif
    std::string out_buf_;
    std::string err_buf_;
};

struct CommandOutput {
    int exit_code = -1;
    std::string out;
    std::string err;
};

// Run a short-lived helper to completion and collect its output.
// The child is killed if it outlives `timeout`.
Result<CommandOutput> run_command(const std::vector<std::string>& argv,
                                  std::chrono::milliseconds timeout = std::chrono::seconds(10));

// Signal 0 probe; a process we may not signal still counts as alive.
bool is_process_alive(int pid);

} // namespace haul
