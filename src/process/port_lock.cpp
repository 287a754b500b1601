#include "haul/port_lock.hpp"
#include "haul/platform.hpp"
#include "haul/subprocess.hpp"

#include <algorithm>
#include <filesystem>
#include <limits>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace haul {

namespace {

constexpr const char* LOCK_PREFIX = "port-";
constexpr const char* LOCK_SUFFIX = ".json";

std::optional<int> port_from_filename(const std::string& name) {
    const std::string prefix = LOCK_PREFIX;
    const std::string suffix = LOCK_SUFFIX;
    if (name.size() <= prefix.size() + suffix.size()) return std::nullopt;
    if (name.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return std::nullopt;

    std::string digits = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
    if (digits.empty() || digits.size() > 5 ||
        !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    return std::stoi(digits);
}

} // namespace

PortLockStore::PortLockStore(std::string lock_dir) : lock_dir_(std::move(lock_dir)) {}

std::string PortLockStore::lockPath(int port) const {
    return join_path(lock_dir_, LOCK_PREFIX + std::to_string(port) + LOCK_SUFFIX);
}

bool PortLockStore::write(int port, int pid, const std::string& label) const {
    nlohmann::json j;
    j["pid"] = pid;
    j["label"] = label;
    j["timestamp"] = now_epoch_ms();

    auto result = atomic_write_file(lockPath(port), j.dump());
    if (!result.ok) {
        spdlog::warn("cannot write port lock for {}: {}", port, result.error);
        return false;
    }
    spdlog::debug("port {} locked by pid {} ({})", port, pid, label);
    return true;
}

std::optional<PortLock> PortLockStore::read(int port) const {
    auto content = read_file(lockPath(port));
    if (!content) return std::nullopt;

    PortLock lock;
    lock.port = port;
    try {
        auto j = nlohmann::json::parse(*content);
        if (j.is_object()) {
            if (j.contains("pid") && j["pid"].is_number_integer()) {
                // Out-of-range pids stay 0 and the lock reads as stale
                auto pid = j["pid"].get<std::int64_t>();
                if (pid > 0 && pid <= std::numeric_limits<int>::max()) lock.pid = static_cast<int>(pid);
            }
            if (j.contains("label") && j["label"].is_string()) lock.label = j["label"].get<std::string>();
            if (j.contains("timestamp") && j["timestamp"].is_number()) {
                lock.timestamp = j["timestamp"].get<std::int64_t>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("unreadable port lock {}: {}", lockPath(port), e.what());
    }

    if (lock.pid <= 0 || !is_process_alive(lock.pid)) {
        spdlog::info("removing stale lock for port {} (pid {})", port, lock.pid);
        remove(port);
        return std::nullopt;
    }
    return lock;
}

void PortLockStore::remove(int port) const {
    remove_file_quietly(lockPath(port));
}

std::vector<PortLock> PortLockStore::list() const {
    std::vector<int> ports;
    std::error_code ec;
    for (fs::directory_iterator it(lock_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (auto port = port_from_filename(it->path().filename().string())) {
            ports.push_back(*port);
        }
    }
    std::sort(ports.begin(), ports.end());

    std::vector<PortLock> locks;
    for (int port : ports) {
        if (auto lock = read(port)) locks.push_back(*lock);
    }
    return locks;
}

} // namespace haul
