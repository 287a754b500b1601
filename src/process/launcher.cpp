#include "haul/launcher.hpp"
#include "haul/platform.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace haul {

const char* launch_state_name(LaunchState state) {
    switch (state) {
        case LaunchState::Idle: return "idle";
        case LaunchState::PortSelection: return "port-selection";
        case LaunchState::Spawning: return "spawning";
        case LaunchState::WaitingForReachable: return "waiting-for-reachable";
        case LaunchState::Ready: return "ready";
        case LaunchState::Running: return "running";
        case LaunchState::Stopped: return "stopped";
        case LaunchState::Crashed: return "crashed";
    }
    return "unknown";
}

PortConflict inspect_port_conflict(int port, const PortLockStore& locks, ProcessProbe& probe,
                                   const std::vector<std::string>& markers) {
    PortConflict conflict;
    conflict.port = port;
    conflict.pids = probe.findPidsByPort(port);

    auto lock = locks.read(port);
    if (lock && std::find(conflict.pids.begin(), conflict.pids.end(), lock->pid) == conflict.pids.end()) {
        conflict.pids.push_back(lock->pid);
    }

    // A live lock means another instance of this tool started it
    conflict.owned_by_known_instance = lock.has_value();
    for (int pid : conflict.pids) {
        if (conflict.owned_by_known_instance) break;
        conflict.owned_by_known_instance = probe.looksLikeKnownInstance(pid, markers);
    }
    return conflict;
}

Launcher::Launcher(PortLockStore& locks, ProcessProbe& probe, LaunchOptions options)
    : locks_(locks), probe_(probe), options_(std::move(options)) {}

void Launcher::transition(LaunchState next) {
    if (state_ == next) return;
    spdlog::debug("launcher: {} -> {}", launch_state_name(state_), launch_state_name(next));
    state_ = next;
    if (options_.on_state) options_.on_state(next);
}

void Launcher::abortLaunch() {
    if (child_) {
        probe_.killTree(child_->pid());
        child_->wait();
        child_.reset();
    }
    port_ = 0;
    transition(LaunchState::Idle);
}

Result<int> Launcher::selectPort(const LaunchCommand& command) {
    if (options_.preferred_port) {
        int port = *options_.preferred_port;
        auto free = find_available_port(options_.host, port, port);
        if (free.isOk()) return free;
        if (free.error().code() != ErrorCode::NOT_FOUND) return free;

        PortConflict conflict = inspect_port_conflict(port, locks_, probe_, command.instance_markers);
        std::string message = "port " + std::to_string(port) + " is in use";
        if (!conflict.pids.empty()) {
            message += " by pid";
            for (int pid : conflict.pids) message += " " + std::to_string(pid);
        }
        if (conflict.owned_by_known_instance) message += " (a known instance)";

        Error err(ErrorCode::PORT_CONFLICT, message);
        err.withConflict(conflict);
        return Result<int>::err(err);
    }

    return find_available_port(options_.host, options_.port_start, options_.port_end);
}

Result<int> Launcher::start(LaunchCommand& command) {
    if (state_ != LaunchState::Idle && state_ != LaunchState::Stopped &&
        state_ != LaunchState::Crashed) {
        return Result<int>::err(Error(ErrorCode::INVALID_ARGUMENT,
            std::string("launcher is busy (") + launch_state_name(state_) + ")"));
    }
    stop_requested_ = false;
    transition(LaunchState::Idle);

    transition(LaunchState::PortSelection);
    if (options_.cancel.cancelled()) {
        abortLaunch();
        return Result<int>::err(cancelled_error("launch"));
    }

    auto port = selectPort(command);
    if (port.isErr()) {
        transition(LaunchState::Idle);
        return port;
    }
    set_port_arg(command, port.value());
    port_ = port.value();

    transition(LaunchState::Spawning);
    if (options_.cancel.cancelled()) {
        abortLaunch();
        return Result<int>::err(cancelled_error("launch"));
    }

    auto spawned = spawn_process(command, options_.log_file);
    if (spawned.isErr()) {
        port_ = 0;
        transition(LaunchState::Idle);
        return Result<int>::err(spawned.error());
    }
    child_ = std::move(spawned.value());
    spdlog::info("started {} (pid {}) on port {}", command.executable, child_->pid(), port_);

    auto ready = awaitReady();
    if (ready.isErr()) {
        return Result<int>::err(ready.error());
    }
    return Result<int>::ok(port_);
}

Result<void> Launcher::awaitReady() {
    if (!child_) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT, "nothing launched"));
    }
    transition(LaunchState::WaitingForReachable);

    WaitOptions wait = options_.wait;
    wait.cancel = options_.cancel;
    wait.precondition = [this]() -> Result<void> {
        if (auto code = child_->tryWait()) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR,
                "process exited with code " + std::to_string(*code) + " before becoming reachable"));
        }
        return Result<void>::ok();
    };

    Result<void> reached = Result<void>::ok();
    if (!options_.ready_url.empty()) {
        std::string url = options_.ready_url;
        auto pos = url.find("{port}");
        if (pos != std::string::npos) url.replace(pos, 6, std::to_string(port_));
        reached = wait_for_url(url, wait);
    } else {
        reached = wait_for_port(port_, options_.host, wait);
    }

    if (reached.isErr()) {
        switch (reached.error().code()) {
            case ErrorCode::CANCELLED:
                abortLaunch();
                break;
            case ErrorCode::TIMEOUT:
                // The process may still come up; leave it to the caller
                break;
            default:
                finish(child_->tryWait().value_or(-1));
                break;
        }
        return reached;
    }

    transition(LaunchState::Ready);
    std::string label = options_.label.empty() ? "haul" : options_.label;
    lock_written_ = locks_.write(port_, child_->pid(), label);
    transition(LaunchState::Running);
    return Result<void>::ok();
}

void Launcher::finish(int exit_code) {
    if (lock_written_) {
        locks_.remove(port_);
        lock_written_ = false;
    }
    bool clean = stop_requested_ || exit_code == 0;
    if (clean) {
        spdlog::info("process on port {} stopped", port_);
    } else {
        spdlog::warn("process on port {} exited with code {}", port_, exit_code);
    }
    transition(clean ? LaunchState::Stopped : LaunchState::Crashed);
}

std::optional<int> Launcher::poll() {
    if (!child_ || (state_ != LaunchState::Running && state_ != LaunchState::WaitingForReachable)) {
        return std::nullopt;
    }
    auto code = child_->tryWait();
    if (code) finish(*code);
    return code;
}

Result<int> Launcher::waitForExit(const CancelToken& cancel) {
    if (!child_) {
        return Result<int>::err(Error(ErrorCode::INVALID_ARGUMENT, "nothing launched"));
    }

    while (true) {
        if (auto code = poll()) {
            return Result<int>::ok(*code);
        }
        if (state_ == LaunchState::Stopped || state_ == LaunchState::Crashed) {
            return Result<int>::ok(child_->wait());
        }
        if (!sleep_interruptible(std::chrono::milliseconds(200), [&]() { return cancel.cancelled(); })) {
            return Result<int>::err(cancelled_error("wait"));
        }
    }
}

void Launcher::stop() {
    if (!child_) return;
    if (state_ == LaunchState::Stopped || state_ == LaunchState::Crashed) return;

    stop_requested_ = true;
    probe_.killTree(child_->pid());
    int code = child_->wait();
    finish(code);
}

} // namespace haul
