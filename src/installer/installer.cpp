#include "haul/installer.hpp"
#include "haul/digest.hpp"
#include "haul/platform.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace fs = std::filesystem;

namespace haul {

namespace {

constexpr double MIB = 1048576.0;
constexpr const char* SEP = "  ·  ";

// Complete (no sidecar) and, if a size is declared, exactly that size.
bool is_cache_valid(const std::string& path, std::optional<std::uint64_t> expected_size) {
    if (!is_transfer_complete(path)) return false;
    if (!expected_size) return true;
    auto size = file_size(path);
    return size && *size == *expected_size;
}

int percent_of(std::uint64_t part, std::uint64_t whole) {
    if (whole == 0) return 0;
    if (part >= whole) return 100;
    return static_cast<int>(part * 100 / whole);
}

} // namespace

std::string format_download_status(std::uint64_t received_bytes,
                                   std::optional<std::uint64_t> total_bytes,
                                   double speed_mbs, double elapsed_secs, double eta_secs) {
    std::string total = total_bytes ? fmt::format("{:.1f}", *total_bytes / MIB) : "?";
    return fmt::format("{:.1f} / {} MB{}{:.1f} MB/s{}{} elapsed{}{} remaining",
                       received_bytes / MIB, total, SEP, speed_mbs, SEP,
                       format_time(elapsed_secs), SEP, format_time(eta_secs));
}

std::string format_extract_status(const ExtractProgress& progress) {
    return fmt::format("{}%{}{} elapsed{}{} remaining", progress.percent, SEP,
                       format_time(progress.elapsed_secs), SEP, format_time(progress.eta_secs));
}

Installer::Installer(ContentCache& cache, InstallerOptions options)
    : cache_(cache), options_(std::move(options)) {
    if (!options_.transfer_fn) options_.transfer_fn = &haul::transfer;
    if (!options_.extract_fn) options_.extract_fn = &haul::extract;
}

void Installer::report(const std::string& phase, int percent, const std::string& status) {
    percent = std::min(100, std::max(0, percent));
    if (phase == "download") {
        // Never let the bar move backwards across files or retries
        percent = std::max(percent, last_download_percent_);
        last_download_percent_ = percent;
    }
    if (options_.on_progress) {
        options_.on_progress(phase, percent, status);
    }
}

Result<void> Installer::installSingle(const std::string& url,
                                      const std::string& dest_dir,
                                      const std::string& cache_key,
                                      std::optional<std::uint64_t> expected_size,
                                      const std::string& sha256) {
    InstallFile file;
    file.url = url;
    file.filename = filename_from_url(url);
    file.size = expected_size;
    file.sha256 = sha256;

    if (file.filename.empty()) {
        return Result<void>::err(Error(ErrorCode::VALIDATION, "cannot derive a file name from " + url));
    }
    return run({file}, dest_dir, cache_key);
}

Result<void> Installer::installMulti(const std::vector<InstallFile>& files,
                                     const std::string& dest_dir,
                                     const std::string& cache_key) {
    return run(files, dest_dir, cache_key);
}

Result<void> Installer::install(const InstallRequest& request) {
    return run(request.files, request.dest, request.cache_key);
}

Result<void> Installer::verifyDigest(const InstallFile& file, const std::string& path) {
    if (file.sha256.empty()) return Result<void>::ok();

    auto verified = verify_sha256(path, file.sha256, options_.cancel);
    if (verified.isErr() && verified.error().code() == ErrorCode::VALIDATION) {
        // A corrupt artifact must not satisfy the next cache lookup
        remove_file_quietly(path);
        remove_file_quietly(transfer_meta_path(path));
    }
    return verified;
}

Result<void> Installer::run(const std::vector<InstallFile>& files,
                            const std::string& dest_dir,
                            const std::string& cache_key) {
    if (files.empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT, "nothing to install"));
    }
    last_download_percent_ = 0;

    const std::string cache_dir = cache_.resolve(cache_key);
    std::error_code ec;
    fs::create_directories(cache_dir, ec);
    if (ec) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                       "cannot create " + cache_dir + ": " + ec.message()));
    }

    // Aggregate accounting only when every file declares its size
    const bool all_sized = std::all_of(files.begin(), files.end(),
                                       [](const InstallFile& f) { return f.size.has_value(); });
    std::uint64_t total_bytes = 0;
    if (all_sized) {
        for (const auto& f : files) total_bytes += *f.size;
    }

    const size_t count = files.size();
    const auto overall_start = std::chrono::steady_clock::now();
    std::uint64_t completed_bytes = 0;
    bool all_cached = true;

    for (size_t i = 0; i < count; ++i) {
        if (options_.cancel.cancelled()) {
            return Result<void>::err(cancelled_error("install"));
        }

        const InstallFile& file = files[i];
        const std::string path = join_path(cache_dir, file.filename);
        const std::string label = count > 1 ? fmt::format("({}/{}) ", i + 1, count) : "";

        if (is_cache_valid(path, file.size)) {
            auto verified = verifyDigest(file, path);
            if (verified.isErr()) return verified;

            completed_bytes += file.size.value_or(file_size(path).value_or(0));
            int percent = total_bytes > 0 ? percent_of(completed_bytes, total_bytes)
                                          : static_cast<int>((i + 1) * 100 / count);
            spdlog::debug("cache hit: {}/{}", cache_key, file.filename);
            report("download", percent, label + "Using cached download");
            continue;
        }

        all_cached = false;
        int base_percent = total_bytes > 0 ? percent_of(completed_bytes, total_bytes)
                                           : static_cast<int>(i * 100 / count);
        report("download", base_percent, label + "Starting download");

        TransferOptions transfer_options = options_.transfer;
        transfer_options.cancel = options_.cancel;
        transfer_options.expected_size = file.size;

        auto on_progress = [&](const TransferProgress& p) {
            double elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - overall_start).count();

            if (total_bytes > 0) {
                std::uint64_t received = completed_bytes + p.received_bytes;
                std::uint64_t remaining = received >= total_bytes ? 0 : total_bytes - received;
                double eta = p.speed_mbs > 0 ? remaining / MIB / p.speed_mbs : -1;
                report("download", percent_of(received, total_bytes),
                       label + "Downloading " +
                       format_download_status(received, total_bytes, p.speed_mbs, elapsed, eta));
            } else {
                double fraction = p.percent ? *p.percent / 100.0 : 0.0;
                int percent = static_cast<int>((i + fraction) * 100 / count);
                report("download", percent,
                       label + "Downloading " +
                       format_download_status(p.received_bytes, p.total_bytes, p.speed_mbs,
                                              elapsed, p.eta_secs));
            }
        };

        auto fetched = options_.transfer_fn(file.url, path, on_progress, transfer_options);
        if (fetched.isErr()) {
            return Result<void>::err(fetched.error());
        }

        auto verified = verifyDigest(file, path);
        if (verified.isErr()) return verified;

        completed_bytes += file.size.value_or(file_size(path).value_or(0));
    }

    // Touch before evict so the entry just populated is the newest
    cache_.touch(cache_key);
    if (!all_cached) {
        cache_.evict();
    }
    report("download", 100, all_cached ? "Using cached download" : "Download complete");

    std::vector<std::string> names;
    for (const auto& f : files) names.push_back(f.filename);
    const std::string archive = join_path(cache_dir, select_extraction_entry(names));

    report("extract", 0, "Extracting");

    ExtractOptions extract_options = options_.extract;
    extract_options.cancel = options_.cancel;

    auto extracted = options_.extract_fn(
        archive, dest_dir,
        [this](const ExtractProgress& p) {
            report("extract", p.percent, "Extracting " + format_extract_status(p));
        },
        extract_options);
    if (extracted.isErr()) {
        return extracted;
    }

    report("extract", 100, "Done");
    spdlog::info("installed {} into {}", cache_key, dest_dir);
    return Result<void>::ok();
}

} // namespace haul
