#include "haul/process_probe.hpp"
#include "haul/platform.hpp"
#include "haul/subprocess.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <functional>
#include <fstream>
#include <set>
#include <sstream>

#ifndef _WIN32
#include <signal.h>
#include <unistd.h>
#endif

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace haul {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> parts;
    std::istringstream in(s);
    std::string part;
    while (in >> part) parts.push_back(part);
    return parts;
}

std::optional<int> parse_pid(const std::string& s) {
    if (s.empty() || s.size() > 10) return std::nullopt;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    int pid = std::stoi(s);
    return pid > 0 ? std::optional<int>(pid) : std::nullopt;
}

} // namespace

// ============================================================================
// Shared behaviour
// ============================================================================

bool command_line_matches(const std::string& command_line, const std::vector<std::string>& markers) {
    if (markers.empty()) return false;
    std::string cmd = to_lower(command_line);
    return std::all_of(markers.begin(), markers.end(), [&](const std::string& marker) {
        return cmd.find(to_lower(marker)) != std::string::npos;
    });
}

std::vector<int> ProcessProbe::killByPort(int port) {
    auto pids = findPidsByPort(port);
    for (int pid : pids) {
        spdlog::info("killing pid {} listening on port {}", pid, port);
        killTree(pid);
    }
    return pids;
}

bool ProcessProbe::looksLikeKnownInstance(int pid, const std::vector<std::string>& markers) {
    auto info = getProcessInfo(pid);
    return info && command_line_matches(info->command_line, markers);
}

#ifndef _WIN32

// ============================================================================
// POSIX (lsof / ps / pgrep)
// ============================================================================

namespace {

// Children first so a parent cannot respawn them in between
void collect_descendants(int pid, const std::function<std::vector<int>(int)>& children_of,
                         std::vector<int>& out, int depth = 0) {
    if (depth > 32) return;
    for (int child : children_of(pid)) {
        collect_descendants(child, children_of, out, depth + 1);
        out.push_back(child);
    }
}

void kill_all(int pid, const std::vector<int>& descendants) {
    // Launched children lead their own process group
    ::kill(-pid, SIGKILL);
    for (int child : descendants) ::kill(child, SIGKILL);
    ::kill(pid, SIGKILL);
}

class LsofProbe : public ProcessProbe {
public:
    const char* name() const override { return "lsof"; }

    std::vector<int> findPidsByPort(int port) override {
        auto out = run_command({"lsof", "-nP", "-iTCP:" + std::to_string(port), "-sTCP:LISTEN", "-t"});
        std::set<int> pids;
        if (out.isOk()) {
            for (const auto& token : split_whitespace(out.value().out)) {
                if (auto pid = parse_pid(token)) pids.insert(*pid);
            }
        }
        return std::vector<int>(pids.begin(), pids.end());
    }

    void killTree(int pid) override {
        std::vector<int> descendants;
        collect_descendants(pid, [](int parent) {
            std::vector<int> children;
            auto out = run_command({"pgrep", "-P", std::to_string(parent)});
            if (out.isOk()) {
                for (const auto& token : split_whitespace(out.value().out)) {
                    if (auto child = parse_pid(token)) children.push_back(*child);
                }
            }
            return children;
        }, descendants);
        kill_all(pid, descendants);
    }

    std::optional<ProcessInfo> getProcessInfo(int pid) override {
        auto comm = run_command({"ps", "-p", std::to_string(pid), "-o", "comm="});
        if (comm.isErr() || comm.value().exit_code != 0) return std::nullopt;
        auto args = run_command({"ps", "-p", std::to_string(pid), "-o", "args="});

        ProcessInfo info;
        info.name = trim(comm.value().out);
        info.command_line = args.isOk() ? trim(args.value().out) : info.name;
        return info;
    }
};

// ============================================================================
// Linux (/proc)
// ============================================================================

class ProcProbe : public LsofProbe {
public:
    const char* name() const override { return "procfs"; }

    std::vector<int> findPidsByPort(int port) override {
        std::set<std::string> inodes;
        for (const char* table : {"/proc/net/tcp", "/proc/net/tcp6"}) {
            collectListeningInodes(table, port, inodes);
        }
        if (inodes.empty()) return {};

        std::set<int> pids;
        std::error_code ec;
        for (fs::directory_iterator proc("/proc", ec), end; !ec && proc != end; proc.increment(ec)) {
            auto pid = parse_pid(proc->path().filename().string());
            if (!pid) continue;

            std::error_code fd_ec;
            for (fs::directory_iterator fd(proc->path() / "fd", fd_ec), fd_end;
                 !fd_ec && fd != fd_end; fd.increment(fd_ec)) {
                std::error_code link_ec;
                auto target = fs::read_symlink(fd->path(), link_ec).string();
                if (link_ec || target.rfind("socket:[", 0) != 0) continue;

                std::string inode = target.substr(8, target.size() - 9);
                if (inodes.count(inode)) {
                    pids.insert(*pid);
                    break;
                }
            }
        }
        return std::vector<int>(pids.begin(), pids.end());
    }

    void killTree(int pid) override {
        std::vector<int> descendants;
        collect_descendants(pid, [](int parent) { return childrenOf(parent); }, descendants);
        kill_all(pid, descendants);
    }

    std::optional<ProcessInfo> getProcessInfo(int pid) override {
        std::string base = "/proc/" + std::to_string(pid);
        auto cmdline = read_file(base + "/cmdline");
        if (!cmdline) return std::nullopt;

        ProcessInfo info;
        info.name = trim(read_file(base + "/comm").value_or(""));
        info.command_line = *cmdline;
        std::replace(info.command_line.begin(), info.command_line.end(), '\0', ' ');
        info.command_line = trim(info.command_line);
        return info;
    }

private:
    // Columns: sl local_address rem_address st tx:rx tr:when retrnsmt uid timeout inode
    static void collectListeningInodes(const std::string& table, int port, std::set<std::string>& inodes) {
        std::ifstream in(table);
        std::string line;
        std::getline(in, line);  // header
        while (std::getline(in, line)) {
            auto cols = split_whitespace(line);
            if (cols.size() < 10 || cols[3] != "0A") continue;  // 0A = LISTEN

            size_t colon = cols[1].rfind(':');
            if (colon == std::string::npos) continue;
            int local_port = 0;
            try {
                local_port = std::stoi(cols[1].substr(colon + 1), nullptr, 16);
            } catch (const std::exception&) {
                continue;
            }
            if (local_port == port && cols[9] != "0") inodes.insert(cols[9]);
        }
    }

    static std::vector<int> childrenOf(int parent) {
        std::vector<int> children;
        std::error_code ec;
        for (fs::directory_iterator proc("/proc", ec), end; !ec && proc != end; proc.increment(ec)) {
            auto pid = parse_pid(proc->path().filename().string());
            if (!pid) continue;
            auto stat = read_file(proc->path().string() + "/stat");
            if (!stat) continue;

            // pid (comm) state ppid ... ; comm may contain spaces and parens
            size_t close = stat->rfind(')');
            if (close == std::string::npos) continue;
            auto fields = split_whitespace(stat->substr(close + 1));
            if (fields.size() >= 2 && parse_pid(fields[1]) == parent) {
                children.push_back(*pid);
            }
        }
        return children;
    }
};

} // namespace

#else

// ============================================================================
// Windows (netstat / taskkill / PowerShell)
// ============================================================================

namespace {

class WindowsProbe : public ProcessProbe {
public:
    const char* name() const override { return "windows"; }

    std::vector<int> findPidsByPort(int port) override {
        auto out = run_command({"netstat", "-ano", "-p", "TCP"});
        std::set<int> pids;
        if (out.isErr()) return {};

        const std::string target = ":" + std::to_string(port);
        std::istringstream in(out.value().out);
        std::string line;
        while (std::getline(in, line)) {
            // Proto  LocalAddress  ForeignAddress  State  PID
            auto parts = split_whitespace(line);
            if (parts.size() < 5 || parts[3] != "LISTENING") continue;
            const std::string& addr = parts[1];
            if (addr.size() >= target.size() &&
                addr.compare(addr.size() - target.size(), target.size(), target) == 0) {
                if (auto pid = parse_pid(parts[4])) pids.insert(*pid);
            }
        }
        return std::vector<int>(pids.begin(), pids.end());
    }

    void killTree(int pid) override {
        auto out = run_command({"taskkill", "/T", "/F", "/PID", std::to_string(pid)});
        if (out.isErr()) {
            spdlog::warn("taskkill failed for pid {}: {}", pid, out.error().message());
        }
    }

    std::optional<ProcessInfo> getProcessInfo(int pid) override {
        std::string cmd = "Get-CimInstance Win32_Process -Filter \"ProcessId=" + std::to_string(pid) +
                          "\" | Select-Object Name,CommandLine | ConvertTo-Json";
        auto out = run_command({"powershell", "-NoProfile", "-Command", cmd});
        if (out.isErr() || out.value().exit_code != 0) return std::nullopt;

        try {
            auto j = nlohmann::json::parse(out.value().out);
            if (!j.is_object()) return std::nullopt;
            ProcessInfo info;
            if (j.contains("Name") && j["Name"].is_string()) info.name = j["Name"].get<std::string>();
            if (j.contains("CommandLine") && j["CommandLine"].is_string()) {
                info.command_line = j["CommandLine"].get<std::string>();
            }
            return info;
        } catch (const nlohmann::json::exception&) {
            return std::nullopt;
        }
    }
};

} // namespace

#endif

// ============================================================================
// Selection
// ============================================================================

std::unique_ptr<ProcessProbe> create_process_probe() {
#ifdef _WIN32
    return std::make_unique<WindowsProbe>();
#else
    std::error_code ec;
    if (get_current_platform() == Platform::Linux && fs::exists("/proc/net/tcp", ec)) {
        return std::make_unique<ProcProbe>();
    }
    return std::make_unique<LsofProbe>();
#endif
}

ProcessProbe& process_probe() {
    static std::unique_ptr<ProcessProbe> probe = [] {
        auto p = create_process_probe();
        spdlog::debug("process probe: {}", p->name());
        return p;
    }();
    return *probe;
}

} // namespace haul
