#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace haul {

// ============================================================================
// Platform Detection
// ============================================================================

enum class Platform {
    Linux,
    macOS,
    Windows,
    Unknown
};

Platform get_current_platform();

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// Creates missing parent directories.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Read a whole file, nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// Size of a regular file, nullopt if it cannot be stat'ed
std::optional<std::uint64_t> file_size(const std::string& path);

// Best-effort removal. Never throws; returns true if the path is gone.
bool remove_file_quietly(const std::string& path);

// Locate an executable on PATH (or return the argument if it contains a separator)
std::optional<std::string> find_executable(const std::string& name);

// ============================================================================
// Well-known Directories
// ============================================================================

// XDG base directories on Linux, with the usual HOME fallbacks elsewhere.
// Each returns <base>/haul.
std::string user_config_dir();
std::string user_cache_dir();
std::string user_state_dir();

// ============================================================================
// Environment and Time
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Milliseconds since the Unix epoch
std::int64_t now_epoch_ms();

// Generate a UUID string
std::string generate_uuid();

// "42s", "3m 5s"; "-" for negative or non-finite input
std::string format_time(double secs);

// Sleep in slices so a cancel check can run at least every `slice`.
// Returns false if should_stop() returned true before the full duration.
template<typename StopFn>
bool sleep_interruptible(std::chrono::milliseconds total, StopFn should_stop,
                         std::chrono::milliseconds slice = std::chrono::milliseconds(50));

} // namespace haul

#include <thread>

namespace haul {

template<typename StopFn>
bool sleep_interruptible(std::chrono::milliseconds total, StopFn should_stop,
                         std::chrono::milliseconds slice) {
    auto deadline = std::chrono::steady_clock::now() + total;
    while (true) {
        if (should_stop()) return false;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(left < slice ? left : slice);
    }
}

} // namespace haul
