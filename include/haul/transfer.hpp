#pragma once

#include "haul/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>

namespace haul {

// ============================================================================
// Transfer Sidecar
// ============================================================================
//
// A sidecar file <dest><TRANSFER_META_SUFFIX> is written before the first body
// byte reaches disk and removed only after the data file is verified. Its
// presence is the one signal that <dest> is incomplete.

inline constexpr const char* TRANSFER_META_SUFFIX = ".dl-meta";

struct TransferMeta {
    std::string url;
    std::uint64_t expected_size = 0;    // 0 when unknown
    std::string etag;
    std::string last_modified;
};

std::string transfer_meta_path(const std::string& dest_path);

// Data file present and no sidecar beside it.
bool is_transfer_complete(const std::string& dest_path);

std::optional<TransferMeta> read_transfer_meta(const std::string& meta_path);
bool write_transfer_meta(const std::string& meta_path, const TransferMeta& meta);

std::string serialize_transfer_meta(const TransferMeta& meta);
std::optional<TransferMeta> parse_transfer_meta(const std::string& json_str);

// ============================================================================
// Progress
// ============================================================================

struct TransferProgress {
    std::uint64_t received_bytes = 0;       // includes resumed bytes
    std::optional<std::uint64_t> total_bytes;
    std::optional<int> percent;             // present only when total is known
    double speed_mbs = 0.0;                 // rolling window
    double elapsed_secs = 0.0;
    double eta_secs = -1.0;                 // -1 when unknown
};

using TransferProgressFn = std::function<void(const TransferProgress&)>;

/**
 * @brief Throughput estimator over a sliding time window.
 *
 * Samples older than the window are dropped, so a stall or burst is reflected
 * within `window` instead of being averaged over the whole transfer.
 */
class RateWindow {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateWindow(std::chrono::milliseconds window = std::chrono::milliseconds(5000))
        : window_(window) {}

    void add(Clock::time_point at, std::uint64_t total_bytes);

    // Bytes per second over the retained samples, 0 with fewer than two.
    double bytesPerSecond() const;

private:
    struct Sample {
        Clock::time_point at;
        std::uint64_t bytes;
    };

    std::chrono::milliseconds window_;
    std::deque<Sample> samples_;
};

// ============================================================================
// Transfer
// ============================================================================

struct TransferOptions {
    CancelToken cancel;
    std::optional<std::uint64_t> expected_size;
    int max_redirects = 5;
    std::string user_agent = "haul";
    long connect_timeout_secs = 30;
    // Abort when below 1 byte/s for this long; 0 disables.
    long stall_timeout_secs = 60;
    std::chrono::milliseconds progress_interval = std::chrono::milliseconds(100);
};

/**
 * @brief Fetch one remote resource to one local path, resuming if possible.
 *
 * - An existing partial with a sidecar for the same URL resumes with
 *   Range + If-Range; a full 200 reply restarts from zero.
 * - A caller size that disagrees with the server size fails before any byte
 *   is written (VALIDATION, partial state purged).
 * - Cancellation (CANCELLED) and stream errors (NETWORK) keep file + sidecar.
 * - A final size mismatch purges file + sidecar (VALIDATION).
 *
 * One writer per destination path is assumed, not enforced.
 *
 * @return dest_path on success
 */
Result<std::string> transfer(const std::string& url,
                             const std::string& dest_path,
                             const TransferProgressFn& on_progress,
                             const TransferOptions& options = {});

// Single GET with the body discarded. Any HTTP response, whatever its
// status, is success; connection failures and timeouts are NETWORK.
Result<long> probe_url(const std::string& url,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000),
                       const std::string& user_agent = "haul");

} // namespace haul
