#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace haul {

// ============================================================================
// Process Probe
// ============================================================================

struct ProcessInfo {
    std::string name;
    std::string command_line;
};

/**
 * @brief Platform-specific process and socket primitives.
 *
 * One implementation is chosen by create_process_probe() for the running
 * platform. Every query is best-effort: failures read as "nothing found".
 */
class ProcessProbe {
public:
    virtual ~ProcessProbe() = default;

    virtual const char* name() const = 0;

    // Pids of processes with a TCP socket listening on `port`.
    virtual std::vector<int> findPidsByPort(int port) = 0;

    // Forcefully terminate pid together with its descendants.
    virtual void killTree(int pid) = 0;

    virtual std::optional<ProcessInfo> getProcessInfo(int pid) = 0;

    // Kill every listener on `port`. Returns the pids that were targeted.
    std::vector<int> killByPort(int port);

    // True when the process command line contains every marker
    // (case-insensitive). An empty marker list never matches.
    bool looksLikeKnownInstance(int pid, const std::vector<std::string>& markers);
};

// Probe for the platform this binary runs on.
std::unique_ptr<ProcessProbe> create_process_probe();

// Shared process-wide probe, created on first use.
ProcessProbe& process_probe();

// Pure matcher behind ProcessProbe::looksLikeKnownInstance.
bool command_line_matches(const std::string& command_line, const std::vector<std::string>& markers);

} // namespace haul
