#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace haul {

// ============================================================================
// Port Locks
// ============================================================================

struct PortLock {
    int port = 0;
    int pid = 0;
    std::string label;
    std::int64_t timestamp = 0;  // ms since epoch
};

/**
 * @brief Advisory port ownership records shared between tool instances.
 *
 * Each lock is <lock_dir>/port-<N>.json holding {pid, label, timestamp}.
 * Nothing is enforced by the OS: read() re-checks the owner pid every time
 * and deletes a lock whose owner is gone, so crashed owners heal on the next
 * read. All operations are best-effort and never throw.
 */
class PortLockStore {
public:
    explicit PortLockStore(std::string lock_dir);

    const std::string& lockDir() const { return lock_dir_; }
    std::string lockPath(int port) const;

    bool write(int port, int pid, const std::string& label) const;

    // nullopt if absent, unreadable or stale (stale locks are removed)
    std::optional<PortLock> read(int port) const;

    void remove(int port) const;

    // Every live lock in the directory, by port
    std::vector<PortLock> list() const;

private:
    std::string lock_dir_;
};

} // namespace haul
