#include "haul/cache.hpp"
#include "haul/transfer.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace haul {

namespace {

struct Folder {
    std::string name;
    fs::path path;
    fs::file_time_type mtime;
};

std::vector<Folder> scan_folders(const std::string& base_dir) {
    std::vector<Folder> folders;
    std::error_code ec;
    fs::directory_iterator it(base_dir, ec);
    if (ec) {
        spdlog::warn("cannot list cache {}: {}", base_dir, ec.message());
        return folders;
    }

    // An entry removed mid-scan ends the walk instead of throwing
    for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec)) continue;
        auto mtime = fs::last_write_time(entry.path(), entry_ec);
        if (entry_ec) continue;
        folders.push_back({entry.path().filename().string(), entry.path(), mtime});
    }

    // Newest first. Equal timestamps order by name ascending, so the name
    // that sorts last is evicted first.
    std::sort(folders.begin(), folders.end(), [](const Folder& a, const Folder& b) {
        if (a.mtime != b.mtime) return a.mtime > b.mtime;
        return a.name < b.name;
    });
    return folders;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

ContentCache::ContentCache(std::string base_dir, std::size_t max_entries)
    : base_dir_(std::move(base_dir)), max_entries_(max_entries) {}

void ContentCache::ensureBaseDir() const {
    std::error_code ec;
    fs::create_directories(base_dir_, ec);
    if (ec) {
        spdlog::warn("cannot create cache directory {}: {}", base_dir_, ec.message());
    }
}

std::string ContentCache::resolve(const std::string& key) const {
    ensureBaseDir();
    return (fs::path(base_dir_) / key).string();
}

void ContentCache::touch(const std::string& key) const {
    fs::path folder = fs::path(base_dir_) / key;
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) return;

    fs::last_write_time(folder, fs::file_time_type::clock::now(), ec);
    if (ec) {
        spdlog::warn("cannot touch cache entry {}: {}", key, ec.message());
    }
}

std::vector<std::string> ContentCache::evict(std::size_t max_entries) const {
    ensureBaseDir();
    auto folders = scan_folders(base_dir_);

    std::vector<std::string> removed;
    while (folders.size() > max_entries) {
        Folder oldest = folders.back();
        folders.pop_back();

        std::error_code ec;
        fs::remove_all(oldest.path, ec);
        if (ec) {
            spdlog::warn("cannot evict cache entry {}: {}", oldest.name, ec.message());
            continue;
        }
        spdlog::debug("evicted cache entry {}", oldest.name);
        removed.push_back(oldest.name);
    }
    return removed;
}

std::size_t ContentCache::cleanStalePartials(std::chrono::milliseconds max_age) const {
    ensureBaseDir();
    const std::string suffix = TRANSFER_META_SUFFIX;
    const auto cutoff = fs::file_time_type::clock::now() - max_age;
    std::size_t removed = 0;

    for (const auto& folder : scan_folders(base_dir_)) {
        std::vector<fs::path> stale;
        std::error_code ec;
        fs::directory_iterator it(folder.path, ec);
        if (ec) continue;

        for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
            const auto& entry = *it;
            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec)) continue;
            if (!ends_with(entry.path().filename().string(), suffix)) continue;

            auto mtime = fs::last_write_time(entry.path(), entry_ec);
            if (entry_ec || mtime >= cutoff) continue;
            stale.push_back(entry.path());
        }

        for (const auto& meta_path : stale) {
            std::string name = meta_path.filename().string();
            fs::path data_path = meta_path.parent_path() /
                                 name.substr(0, name.size() - suffix.size());

            // Data file first: a data file without its sidecar would read as complete
            fs::remove(data_path, ec);
            if (ec) {
                spdlog::warn("cannot remove stale partial {}: {}", data_path.string(), ec.message());
                continue;
            }
            fs::remove(meta_path, ec);
            if (ec) {
                spdlog::warn("cannot remove stale sidecar {}: {}", meta_path.string(), ec.message());
                continue;
            }
            spdlog::debug("removed stale partial {}", data_path.string());
            ++removed;
        }
    }
    return removed;
}

std::vector<std::string> ContentCache::list() const {
    std::vector<std::string> names;
    for (const auto& folder : scan_folders(base_dir_)) {
        names.push_back(folder.name);
    }
    return names;
}

} // namespace haul
