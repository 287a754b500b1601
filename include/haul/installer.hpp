#pragma once

#include "haul/cache.hpp"
#include "haul/extract.hpp"
#include "haul/request.hpp"
#include "haul/transfer.hpp"
#include "haul/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace haul {

// ============================================================================
// Install Orchestrator
// ============================================================================

using TransferFn = std::function<Result<std::string>(const std::string& url,
                                                     const std::string& dest_path,
                                                     const TransferProgressFn& on_progress,
                                                     const TransferOptions& options)>;

using ExtractFn = std::function<Result<void>(const std::string& archive_path,
                                             const std::string& dest_dir,
                                             const ExtractProgressFn& on_progress,
                                             const ExtractOptions& options)>;

struct InstallerOptions {
    CancelToken cancel;
    ProgressSink on_progress;

    // Templates for the per-stage options; cancel and expected_size are
    // filled in per call.
    TransferOptions transfer;
    ExtractOptions extract;

    // Defaults to haul::transfer / haul::extract
    TransferFn transfer_fn;
    ExtractFn extract_fn;
};

/**
 * @brief Download-then-extract over a ContentCache.
 *
 * Progress goes to a single sink as ("download" | "extract", percent, status).
 * Download percent never decreases within one call, including across files of
 * a multi-file install. A failure at any stage aborts the install but leaves
 * whatever is already cached, so a retry resumes instead of re-downloading.
 */
class Installer {
public:
    Installer(ContentCache& cache, InstallerOptions options = {});

    // Cache key folder receives the file named after the URL's last segment.
    Result<void> installSingle(const std::string& url,
                               const std::string& dest_dir,
                               const std::string& cache_key,
                               std::optional<std::uint64_t> expected_size = std::nullopt,
                               const std::string& sha256 = "");

    // Files are fetched strictly in order, then one entry is extracted
    // (see select_extraction_entry()).
    Result<void> installMulti(const std::vector<InstallFile>& files,
                              const std::string& dest_dir,
                              const std::string& cache_key);

    Result<void> install(const InstallRequest& request);

private:
    Result<void> run(const std::vector<InstallFile>& files,
                     const std::string& dest_dir,
                     const std::string& cache_key);

    Result<void> verifyDigest(const InstallFile& file, const std::string& path);

    void report(const std::string& phase, int percent, const std::string& status);

    ContentCache& cache_;
    InstallerOptions options_;
    int last_download_percent_ = 0;
};

// "<recv> / <total> MB  ·  <speed> MB/s  ·  <elapsed> elapsed  ·  <eta> remaining"
std::string format_download_status(std::uint64_t received_bytes,
                                   std::optional<std::uint64_t> total_bytes,
                                   double speed_mbs, double elapsed_secs, double eta_secs);

// "<percent>%  ·  <elapsed> elapsed  ·  <eta> remaining"
std::string format_extract_status(const ExtractProgress& progress);

} // namespace haul
