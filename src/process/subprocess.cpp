#include "haul/subprocess.hpp"
#include "haul/platform.hpp"

#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#if defined(__APPLE__)
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern "C" char** environ;
#endif
#endif

#include <spdlog/spdlog.h>

namespace haul {

namespace {

bool is_line_break(char c) {
    return c == '\n' || c == '\r' || c == '\b';
}

// Move complete lines out of `buf`, keeping any unterminated tail.
void drain_lines(std::string& buf, OutputStream stream, const OutputLineFn& on_line, bool flush) {
    size_t start = 0;
    for (size_t i = 0; i < buf.size(); ++i) {
        if (!is_line_break(buf[i])) continue;
        if (i > start && on_line) on_line(stream, buf.substr(start, i - start));
        start = i + 1;
    }
    buf.erase(0, start);
    if (flush && !buf.empty()) {
        if (on_line) on_line(stream, buf);
        buf.clear();
    }
}

#ifndef _WIN32
std::vector<std::string> build_environment(const std::vector<std::string>& overrides) {
    std::vector<std::string> env;
    for (char** ep = environ; *ep; ++ep) {
        std::string entry(*ep);
        auto eq = entry.find('=');
        std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
        bool replaced = false;
        for (const auto& o : overrides) {
            if (o.rfind(key + "=", 0) == 0) {
                replaced = true;
                break;
            }
        }
        if (!replaced) env.push_back(entry);
    }
    for (const auto& o : overrides) env.push_back(o);
    return env;
}

void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    if (flags >= 0) fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}
#endif

} // namespace

// ============================================================================
// UNIX
// ============================================================================

#ifndef _WIN32

Result<std::unique_ptr<Subprocess>> Subprocess::spawn(const std::vector<std::string>& argv_in,
                                                      const SpawnOptions& options) {
    using R = Result<std::unique_ptr<Subprocess>>;

    if (argv_in.empty()) {
        return R::err(Error(ErrorCode::INVALID_ARGUMENT, "empty command line"));
    }

    auto exe = find_executable(argv_in[0]);
    if (!exe) {
        return R::err(Error(ErrorCode::NOT_FOUND, "executable not found: " + argv_in[0]));
    }

    auto argv_strings = argv_in;
    auto env_strings = build_environment(options.environment);

    std::vector<char*> argv;
    for (auto& s : argv_strings) argv.push_back(const_cast<char*>(s.c_str()));
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& s : env_strings) envp.push_back(const_cast<char*>(s.c_str()));
    envp.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (options.capture_output && (pipe(out_pipe) != 0 || pipe(err_pipe) != 0)) {
        close_all();
        return R::err(Error(ErrorCode::IO_ERROR, "pipe failed: " + std::string(strerror(errno))));
    }
    if (pipe(exec_pipe) != 0) {
        close_all();
        return R::err(Error(ErrorCode::IO_ERROR, "pipe failed: " + std::string(strerror(errno))));
    }
    set_cloexec(exec_pipe[1]);

    pid_t pid = fork();
    if (pid == -1) {
        close_all();
        return R::err(Error(ErrorCode::IO_ERROR, "fork failed: " + std::string(strerror(errno))));
    }

    if (pid == 0) {
        // Child process
        if (options.detached) {
            setsid();
        } else {
            setpgid(0, 0);
        }

        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);

        if (options.capture_output) {
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
        } else if (!options.output_file.empty()) {
            int log_fd = open(options.output_file.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            int target = log_fd >= 0 ? log_fd : devnull;
            dup2(target, STDOUT_FILENO);
            dup2(target, STDERR_FILENO);
        } else if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
        }

        if (!options.cwd.empty() && chdir(options.cwd.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        execve(exe->c_str(), argv.data(), envp.data());

        // If execve returns, it failed
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    if (!options.detached) {
        setpgid(pid, pid);
    }
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close_all();
        return R::err(Error(ErrorCode::IO_ERROR,
                            "cannot start " + argv_in[0] + ": " + strerror(child_errno)));
    }

    std::unique_ptr<Subprocess> proc(new Subprocess());
    proc->pid_ = static_cast<int>(pid);
    proc->out_fd_ = out_pipe[0];
    proc->err_fd_ = err_pipe[0];
    if (proc->out_fd_ >= 0) set_nonblocking(proc->out_fd_);
    if (proc->err_fd_ >= 0) set_nonblocking(proc->err_fd_);

    spdlog::debug("spawned {} (pid {})", argv_in[0], proc->pid_);
    return R::ok(std::move(proc));
}

Subprocess::~Subprocess() {
    close_fd(out_fd_);
    close_fd(err_fd_);
}

bool Subprocess::pumpOutput(std::chrono::milliseconds timeout, const OutputLineFn& on_line) {
    if (out_fd_ < 0 && err_fd_ < 0) {
        std::this_thread::sleep_for(timeout);
        return false;
    }

    struct pollfd fds[2];
    nfds_t count = 0;
    if (out_fd_ >= 0) fds[count++] = {out_fd_, POLLIN, 0};
    if (err_fd_ >= 0) fds[count++] = {err_fd_, POLLIN, 0};

    int ready = poll(fds, count, static_cast<int>(timeout.count()));
    if (ready < 0) {
        return errno == EINTR;
    }

    char buffer[4096];
    for (nfds_t i = 0; i < count; ++i) {
        if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        bool is_out = fds[i].fd == out_fd_;
        int& fd = is_out ? out_fd_ : err_fd_;
        std::string& buf = is_out ? out_buf_ : err_buf_;
        OutputStream stream = is_out ? OutputStream::Stdout : OutputStream::Stderr;

        while (true) {
            ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                buf.append(buffer, static_cast<size_t>(n));
                continue;
            }
            if (n == 0) {
                drain_lines(buf, stream, on_line, true);
                close_fd(fd);
            } else if (errno == EINTR) {
                continue;
            }
            break;
        }
        drain_lines(buf, stream, on_line, false);
    }

    return out_fd_ >= 0 || err_fd_ >= 0;
}

std::optional<int> Subprocess::tryWait() {
    if (exit_code_) return exit_code_;

    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == 0) return std::nullopt;
    if (r < 0) {
        // Already reaped elsewhere or not our child
        exit_code_ = -1;
        return exit_code_;
    }

    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        return std::nullopt;
    }
    return exit_code_;
}

int Subprocess::wait() {
    if (exit_code_) return *exit_code_;

    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);

    if (r < 0) {
        exit_code_ = -1;
    } else if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
    return *exit_code_;
}

void Subprocess::kill() {
    if (exit_code_ || pid_ <= 0) return;
    if (::kill(-pid_, SIGKILL) != 0) {
        ::kill(pid_, SIGKILL);
    }
}

bool is_process_alive(int pid) {
    if (pid <= 0) return false;
    if (::kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

#endif // !_WIN32

// ============================================================================
// WINDOWS
// ============================================================================

#ifdef _WIN32

namespace {

std::string quote_argument(const std::string& arg) {
    bool needs_quotes = arg.empty() || arg.find_first_of(" \t\"") != std::string::npos;
    if (!needs_quotes) return arg;
    std::string out = "\"";
    for (char c : arg) {
        if (c == '"') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

void close_handle(void*& h) {
    if (h) {
        CloseHandle(static_cast<HANDLE>(h));
        h = nullptr;
    }
}

} // namespace

Result<std::unique_ptr<Subprocess>> Subprocess::spawn(const std::vector<std::string>& argv,
                                                      const SpawnOptions& options) {
    using R = Result<std::unique_ptr<Subprocess>>;

    if (argv.empty()) {
        return R::err(Error(ErrorCode::INVALID_ARGUMENT, "empty command line"));
    }

    std::string cmd_line;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) cmd_line += ' ';
        cmd_line += quote_argument(argv[i]);
    }

    SECURITY_ATTRIBUTES sa = {sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};
    HANDLE out_read = nullptr, out_write = nullptr, err_read = nullptr, err_write = nullptr;
    HANDLE log_handle = nullptr;

    STARTUPINFOA si = {0};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;

    if (options.capture_output) {
        if (!CreatePipe(&out_read, &out_write, &sa, 0) || !CreatePipe(&err_read, &err_write, &sa, 0)) {
            return R::err(Error(ErrorCode::IO_ERROR, "CreatePipe failed"));
        }
        SetHandleInformation(out_read, HANDLE_FLAG_INHERIT, 0);
        SetHandleInformation(err_read, HANDLE_FLAG_INHERIT, 0);
        si.hStdOutput = out_write;
        si.hStdError = err_write;
    } else if (!options.output_file.empty()) {
        log_handle = CreateFileA(options.output_file.c_str(), FILE_APPEND_DATA,
                                 FILE_SHARE_READ | FILE_SHARE_WRITE, &sa, OPEN_ALWAYS,
                                 FILE_ATTRIBUTE_NORMAL, nullptr);
        si.hStdOutput = log_handle;
        si.hStdError = log_handle;
    }

    DWORD flags = CREATE_NEW_PROCESS_GROUP | CREATE_NO_WINDOW;
    if (options.detached) flags |= DETACHED_PROCESS;

    std::string env_block;
    if (!options.environment.empty()) {
        char* current = GetEnvironmentStringsA();
        for (const char* p = current; p && *p; p += std::strlen(p) + 1) {
            env_block += p;
            env_block += '\0';
        }
        if (current) FreeEnvironmentStringsA(current);
        for (const auto& e : options.environment) {
            env_block += e;
            env_block += '\0';
        }
        env_block += '\0';
    }

    PROCESS_INFORMATION pi = {0};
    BOOL success = CreateProcessA(
        nullptr,
        const_cast<char*>(cmd_line.c_str()),
        nullptr,
        nullptr,
        TRUE,
        flags,
        env_block.empty() ? nullptr : const_cast<char*>(env_block.c_str()),
        options.cwd.empty() ? nullptr : options.cwd.c_str(),
        &si,
        &pi);

    if (out_write) CloseHandle(out_write);
    if (err_write) CloseHandle(err_write);
    if (log_handle) CloseHandle(log_handle);

    if (!success) {
        if (out_read) CloseHandle(out_read);
        if (err_read) CloseHandle(err_read);
        return R::err(Error(ErrorCode::IO_ERROR,
                            "CreateProcess failed: " + std::to_string(GetLastError())));
    }

    CloseHandle(pi.hThread);

    std::unique_ptr<Subprocess> proc(new Subprocess());
    proc->pid_ = static_cast<int>(pi.dwProcessId);
    proc->process_handle_ = pi.hProcess;
    proc->out_read_ = out_read;
    proc->err_read_ = err_read;
    return R::ok(std::move(proc));
}

Subprocess::~Subprocess() {
    close_handle(out_read_);
    close_handle(err_read_);
    close_handle(process_handle_);
}

bool Subprocess::pumpOutput(std::chrono::milliseconds timeout, const OutputLineFn& on_line) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool got_data = false;

    while (!got_data && (out_read_ || err_read_)) {
        for (int i = 0; i < 2; ++i) {
            void*& h = i == 0 ? out_read_ : err_read_;
            if (!h) continue;
            std::string& buf = i == 0 ? out_buf_ : err_buf_;
            OutputStream stream = i == 0 ? OutputStream::Stdout : OutputStream::Stderr;

            DWORD available = 0;
            if (!PeekNamedPipe(static_cast<HANDLE>(h), nullptr, 0, nullptr, &available, nullptr)) {
                drain_lines(buf, stream, on_line, true);
                close_handle(h);
                continue;
            }
            if (available == 0) continue;

            char buffer[4096];
            DWORD n = 0;
            DWORD want = available < sizeof(buffer) ? available : static_cast<DWORD>(sizeof(buffer));
            if (ReadFile(static_cast<HANDLE>(h), buffer, want, &n, nullptr) && n > 0) {
                buf.append(buffer, n);
                drain_lines(buf, stream, on_line, false);
                got_data = true;
            }
        }
        if (got_data || std::chrono::steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    return out_read_ || err_read_;
}

std::optional<int> Subprocess::tryWait() {
    if (exit_code_) return exit_code_;
    if (WaitForSingleObject(static_cast<HANDLE>(process_handle_), 0) != WAIT_OBJECT_0) {
        return std::nullopt;
    }
    DWORD code = 0;
    GetExitCodeProcess(static_cast<HANDLE>(process_handle_), &code);
    exit_code_ = static_cast<int>(code);
    return exit_code_;
}

int Subprocess::wait() {
    if (exit_code_) return *exit_code_;
    WaitForSingleObject(static_cast<HANDLE>(process_handle_), INFINITE);
    DWORD code = 0;
    GetExitCodeProcess(static_cast<HANDLE>(process_handle_), &code);
    exit_code_ = static_cast<int>(code);
    return *exit_code_;
}

void Subprocess::kill() {
    if (exit_code_ || !process_handle_) return;
    auto out = run_command({"taskkill", "/T", "/F", "/PID", std::to_string(pid_)});
    if (out.isErr() || out.value().exit_code != 0) {
        TerminateProcess(static_cast<HANDLE>(process_handle_), 1);
    }
}

bool is_process_alive(int pid) {
    if (pid <= 0) return false;
    HANDLE h = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (!h) return GetLastError() == ERROR_ACCESS_DENIED;
    DWORD code = 0;
    bool alive = GetExitCodeProcess(h, &code) && code == STILL_ACTIVE;
    CloseHandle(h);
    return alive;
}

#endif // _WIN32

// ============================================================================
// CROSS-PLATFORM
// ============================================================================

Result<CommandOutput> run_command(const std::vector<std::string>& argv,
                                  std::chrono::milliseconds timeout) {
    SpawnOptions options;
    options.capture_output = true;

    auto spawned = Subprocess::spawn(argv, options);
    if (spawned.isErr()) {
        return Result<CommandOutput>::err(spawned.error());
    }
    auto& proc = spawned.value();

    CommandOutput output;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto collect = [&output](OutputStream stream, const std::string& line) {
        std::string& target = stream == OutputStream::Stdout ? output.out : output.err;
        target += line;
        target += '\n';
    };

    while (proc->pumpOutput(std::chrono::milliseconds(50), collect)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            proc->kill();
            proc->wait();
            return Result<CommandOutput>::err(
                Error(ErrorCode::TIMEOUT, argv[0] + " did not finish in time"));
        }
    }

    output.exit_code = proc->wait();
    return Result<CommandOutput>::ok(std::move(output));
}

} // namespace haul
