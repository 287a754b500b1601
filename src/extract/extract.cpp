#include "haul/extract.hpp"
#include "haul/platform.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace haul {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Split-part suffixes are at least three digits: ".001", ".002", ...
constexpr size_t MIN_PART_DIGITS = 3;

} // namespace

// ============================================================================
// Helpers
// ============================================================================

std::optional<int> parse_percent_indicator(const std::string& line) {
    for (size_t pos = line.find('%'); pos != std::string::npos; pos = line.find('%', pos + 1)) {
        size_t start = pos;
        while (start > 0 && std::isdigit(static_cast<unsigned char>(line[start - 1]))) {
            --start;
        }
        if (start == pos || pos - start > 3) continue;

        int value = std::stoi(line.substr(start, pos - start));
        return std::min(100, std::max(0, value));
    }
    return std::nullopt;
}

bool is_unsupported_method_line(const std::string& line) {
    std::string lower = to_lower(line);
    size_t pos = lower.find("unsupported");
    if (pos == std::string::npos) return false;

    std::string rest = lower.substr(pos + 11);
    return rest.find("method") != std::string::npos || rest.find("filter") != std::string::npos;
}

bool is_tar_gz(const std::string& archive_path) {
    std::string lower = to_lower(archive_path);
    return ends_with(lower, ".tar.gz") || ends_with(lower, ".tgz");
}

std::optional<int> split_part_index(const std::string& filename) {
    size_t dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0) return std::nullopt;

    std::string digits = filename.substr(dot + 1);
    if (digits.size() < MIN_PART_DIGITS || digits.size() > 6) return std::nullopt;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    return std::stoi(digits);
}

std::string resolve_split_first_part(const std::string& archive_path) {
    fs::path path(archive_path);
    std::string name = path.filename().string();
    if (!split_part_index(name)) return archive_path;

    size_t dot = name.rfind('.');
    std::string stem = name.substr(0, dot + 1);
    size_t digits = name.size() - stem.size();

    fs::path dir = path.has_parent_path() ? path.parent_path() : fs::path(".");
    std::vector<std::string> parts;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string sibling = it->path().filename().string();
        if (sibling.size() == name.size() && sibling.compare(0, stem.size(), stem) == 0 &&
            split_part_index(sibling)) {
            parts.push_back(sibling);
        }
    }
    if (parts.empty()) return archive_path;

    std::sort(parts.begin(), parts.end());
    if (parts.front() != name) {
        spdlog::debug("split archive: using first part {} ({} digit suffix)", parts.front(), digits);
    }
    return path.has_parent_path() ? (path.parent_path() / parts.front()).string() : parts.front();
}

std::string select_extraction_entry(const std::vector<std::string>& filenames) {
    if (filenames.empty()) return "";
    if (filenames.size() == 1) return filenames.front();

    std::vector<std::string> sorted = filenames;
    std::sort(sorted.begin(), sorted.end());
    for (const auto& name : sorted) {
        if (ends_with(name, ".001")) return name;
    }
    return filenames.front();
}

// ============================================================================
// Backend Selection
// ============================================================================

Result<std::unique_ptr<ArchiveBackend>> select_backend(const std::string& archive_path,
                                                       const ExtractOptions& options) {
    using R = Result<std::unique_ptr<ArchiveBackend>>;

    if (is_tar_gz(archive_path)) {
        return R::ok(std::make_unique<TarGzBackend>());
    }

    if (!options.seven_zip_path.empty()) {
        auto exe = find_executable(options.seven_zip_path);
        if (!exe) {
            return R::err(Error(ErrorCode::NOT_FOUND,
                                "7-Zip executable not found: " + options.seven_zip_path));
        }
        return R::ok(std::make_unique<SevenZipBackend>(*exe));
    }

    for (const char* candidate : {"7za", "7z", "7zz"}) {
        if (auto exe = find_executable(candidate)) {
            return R::ok(std::make_unique<SevenZipBackend>(*exe));
        }
    }
    return R::err(Error(ErrorCode::NOT_FOUND,
                        "7-Zip executable not found on PATH (install p7zip or set HAUL_7Z)"));
}

// ============================================================================
// Extraction
// ============================================================================

Result<void> extract(const std::string& archive_path,
                     const std::string& dest_dir,
                     const ExtractProgressFn& on_progress,
                     const ExtractOptions& options) {
    if (options.cancel.cancelled()) {
        return Result<void>::err(cancelled_error("extraction"));
    }

    std::error_code ec;
    if (!fs::is_regular_file(archive_path, ec)) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "archive not found: " + archive_path));
    }

    std::string entry = resolve_split_first_part(archive_path);

    auto backend = select_backend(entry, options);
    if (backend.isErr()) {
        return Result<void>::err(backend.error());
    }

    spdlog::debug("extracting {} -> {} ({})", entry, dest_dir, backend.value()->name());
    auto result = backend.value()->extract(entry, dest_dir, on_progress, options.cancel);
    if (result.isOk()) {
        spdlog::info("extracted {} into {}", get_filename(entry), dest_dir);
    }
    return result;
}

} // namespace haul
