#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace haul {

/**
 * @brief Bounded set of named folders under a base directory, evicted by
 *        recency (folder modification time).
 *
 * Nothing here locks: evict() is a scan followed by deletes, so a freshly
 * populated entry must be touch()ed before evict() runs. Every deletion is
 * best-effort and a failure never stops the rest of a sweep.
 */
class ContentCache {
public:
    explicit ContentCache(std::string base_dir, std::size_t max_entries = 5);

    const std::string& baseDir() const { return base_dir_; }
    std::size_t maxEntries() const { return max_entries_; }

    // Path of the entry for `key`. Creates the base directory, not the entry.
    std::string resolve(const std::string& key) const;

    // Bump the entry's modification time to now. No-op if it does not exist.
    void touch(const std::string& key) const;

    // Keep the `max_entries` most recently touched folders, delete the rest.
    // Folders with identical timestamps are ordered by name, and the name
    // that sorts last goes first. Returns the names of the removed entries.
    std::vector<std::string> evict(std::size_t max_entries) const;
    std::vector<std::string> evict() const { return evict(max_entries_); }

    // Remove transfer sidecars older than `max_age` together with the
    // partial data file each one describes. Returns the number removed.
    std::size_t cleanStalePartials(
        std::chrono::milliseconds max_age = std::chrono::hours(24)) const;

    // Entry names ordered newest first, ties by name ascending.
    std::vector<std::string> list() const;

private:
    void ensureBaseDir() const;

    std::string base_dir_;
    std::size_t max_entries_;
};

} // namespace haul
