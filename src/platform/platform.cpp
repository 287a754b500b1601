#include "haul/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace haul {

namespace fs = std::filesystem;

Platform get_current_platform() {
#if defined(__APPLE__)
    return Platform::macOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

namespace {

#ifndef _WIN32
// fsync a file descriptor
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}
#endif

// Generate a temporary filename beside the target
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}

std::string xdg_dir(const char* env_name, const char* home_relative) {
    if (get_current_platform() == Platform::Linux) {
        auto base = get_env(env_name);
        if (base && !base->empty()) {
            return join_path(*base, "haul");
        }
    }

    auto home = get_env("HOME");
    if (!home || home->empty()) {
        home = get_env("USERPROFILE");
    }
    if (home && !home->empty()) {
        return join_path(join_path(*home, home_relative), "haul");
    }

    return ".haul";
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;

    std::string dir_path = get_parent_directory(path);
    if (!dir_path.empty()) {
        std::error_code ec;
        fs::create_directories(dir_path, ec);
        if (ec) {
            result.error = "failed to create directory " + dir_path + ": " + ec.message();
            return result;
        }
    }

    std::string temp_path = make_temp_filename(path);

#ifdef _WIN32
    {
        std::ofstream temp_file(temp_path, std::ios::binary);
        if (!temp_file) {
            result.error = "failed to create temp file";
            return result;
        }
        temp_file.write(content.data(), static_cast<std::streamsize>(content.size()));
        temp_file.flush();
        if (!temp_file) {
            temp_file.close();
            DeleteFileA(temp_path.c_str());
            result.error = "failed to write content";
            return result;
        }
    }

    if (!MoveFileExA(temp_path.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to rename temp file";
        return result;
    }

    result.ok = true;
#else
    // temp + fsync(file) + rename + fsync(dir)
    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    ssize_t written = write(fd, content.data(), content.size());
    if (written < 0 || static_cast<size_t>(written) != content.size()) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to write content";
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
#endif

    return result;
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::optional<std::uint64_t> file_size(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<std::uint64_t>(size);
}

bool remove_file_quietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    return !ec;
}

std::optional<std::string> find_executable(const std::string& name) {
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        std::error_code ec;
        if (fs::exists(name, ec)) return name;
        return std::nullopt;
    }

    auto path_env = get_env("PATH");
    if (!path_env) return std::nullopt;

#ifdef _WIN32
    const char sep = ';';
    const std::vector<std::string> suffixes = {"", ".exe", ".cmd", ".bat"};
#else
    const char sep = ':';
    const std::vector<std::string> suffixes = {""};
#endif

    std::stringstream ss(*path_env);
    std::string dir;
    while (std::getline(ss, dir, sep)) {
        if (dir.empty()) continue;
        for (const auto& suffix : suffixes) {
            fs::path candidate = fs::path(dir) / (name + suffix);
            std::error_code ec;
            if (!fs::is_regular_file(candidate, ec)) continue;
#ifndef _WIN32
            if (access(candidate.c_str(), X_OK) != 0) continue;
#endif
            return candidate.string();
        }
    }
    return std::nullopt;
}

std::string user_config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", ".config");
}

std::string user_cache_dir() {
    return xdg_dir("XDG_CACHE_HOME", ".cache");
}

std::string user_state_dir() {
    return xdg_dir("XDG_STATE_HOME", ".local/state");
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

std::int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

std::string format_time(double secs) {
    if (secs < 0 || !std::isfinite(secs)) return "-";
    long s = std::lround(secs);
    if (s < 60) return std::to_string(s) + "s";
    return std::to_string(s / 60) + "m " + std::to_string(s % 60) + "s";
}

} // namespace haul
