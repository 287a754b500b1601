#pragma once

#include "haul/types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace haul {

// ============================================================================
// Extraction Progress
// ============================================================================

struct ExtractProgress {
    int percent = 0;
    double elapsed_secs = 0;
    double eta_secs = -1;  // -1 when unknown
};

using ExtractProgressFn = std::function<void(const ExtractProgress&)>;

struct ExtractOptions {
    CancelToken cancel;

    // 7-Zip executable; empty means search PATH for 7za, 7z, 7zz in that order.
    std::string seven_zip_path;
};

// ============================================================================
// Backends
// ============================================================================

/**
 * @brief One way of unpacking an archive into a directory.
 *
 * Backends create dest_dir, report progress as they go and stop at the next
 * chunk boundary once the cancel token fires.
 */
class ArchiveBackend {
public:
    virtual ~ArchiveBackend() = default;

    virtual const char* name() const = 0;

    virtual Result<void> extract(const std::string& archive_path,
                                 const std::string& dest_dir,
                                 const ExtractProgressFn& on_progress,
                                 const CancelToken& cancel) = 0;
};

/**
 * @brief Runs `7za x <archive> -o<dest> -y -bsp1` and follows its percent
 *        indicator. Handles 7z, zip and split `.001` archives.
 */
class SevenZipBackend : public ArchiveBackend {
public:
    explicit SevenZipBackend(std::string executable);

    const char* name() const override { return "7z"; }

    Result<void> extract(const std::string& archive_path,
                         const std::string& dest_dir,
                         const ExtractProgressFn& on_progress,
                         const CancelToken& cancel) override;

    const std::string& executable() const { return executable_; }

private:
    std::string executable_;
};

/**
 * @brief In-process gzip + ustar reader.
 *
 * Entries that would land outside dest_dir (absolute paths, `..` components,
 * symlinks pointing out of the tree) abort the extraction.
 */
class TarGzBackend : public ArchiveBackend {
public:
    const char* name() const override { return "tar.gz"; }

    Result<void> extract(const std::string& archive_path,
                         const std::string& dest_dir,
                         const ExtractProgressFn& on_progress,
                         const CancelToken& cancel) override;
};

// .tar.gz / .tgz, case-insensitive
bool is_tar_gz(const std::string& archive_path);

// TarGzBackend for tarballs, SevenZipBackend for everything else.
// Fails with NOT_FOUND when no 7-Zip executable can be located.
Result<std::unique_ptr<ArchiveBackend>> select_backend(const std::string& archive_path,
                                                       const ExtractOptions& options);

// ============================================================================
// Extraction
// ============================================================================

/**
 * @brief Unpack archive_path into dest_dir.
 *
 * For split archives any part may be passed; the lexicographically first
 * sibling part is handed to the backend. Errors are EXTRACTION (with
 * diagnostics), NOT_FOUND or CANCELLED. The archive itself is never modified.
 */
Result<void> extract(const std::string& archive_path,
                     const std::string& dest_dir,
                     const ExtractProgressFn& on_progress,
                     const ExtractOptions& options = {});

// ============================================================================
// Helpers (exposed for testing)
// ============================================================================

// Last "NN%" token in a 7-Zip progress line, clamped to 0-100.
std::optional<int> parse_percent_indicator(const std::string& line);

// True for "unsupported method" / "unsupported filter" diagnostics.
bool is_unsupported_method_line(const std::string& line);

// Numeric part suffix of a split archive name ("x.7z.003" -> 3).
std::optional<int> split_part_index(const std::string& filename);

// First sibling part for a split archive, the path itself otherwise.
std::string resolve_split_first_part(const std::string& archive_path);

// The only file; else the first name (sorted) ending in ".001"; else the first.
std::string select_extraction_entry(const std::vector<std::string>& filenames);

} // namespace haul
