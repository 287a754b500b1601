#include "haul/extract.hpp"
#include "haul/subprocess.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace haul {

namespace {

// Diagnostics kept on an EXTRACTION error
constexpr size_t MAX_DIAGNOSTIC_LINES = 50;

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

} // namespace

SevenZipBackend::SevenZipBackend(std::string executable)
    : executable_(std::move(executable)) {}

Result<void> SevenZipBackend::extract(const std::string& archive_path,
                                      const std::string& dest_dir,
                                      const ExtractProgressFn& on_progress,
                                      const CancelToken& cancel) {
    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                       "cannot create " + dest_dir + ": " + ec.message()));
    }

    // x = extract with full paths, -y = assume yes, -bsp1 = progress on stdout
    std::vector<std::string> argv = {executable_, "x", archive_path, "-o" + dest_dir, "-y", "-bsp1"};

    SpawnOptions spawn_options;
    spawn_options.capture_output = true;

    auto spawned = Subprocess::spawn(argv, spawn_options);
    if (spawned.isErr()) {
        Error err(ErrorCode::EXTRACTION, spawned.error().message());
        return Result<void>::err(err);
    }
    auto& proc = spawned.value();

    const auto start = std::chrono::steady_clock::now();
    int last_percent = -1;
    std::vector<std::string> diagnostics;
    bool saw_fatal = false;
    std::string first_fatal;

    auto emit = [&](int percent) {
        if (percent == last_percent || !on_progress) return;
        last_percent = percent;
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        double eta = percent > 0 ? (elapsed / percent) * (100 - percent) : -1;
        on_progress({percent, elapsed, eta});
    };

    auto on_line = [&](OutputStream stream, const std::string& raw) {
        std::string line = trim(raw);
        if (line.empty()) return;
        if (stream == OutputStream::Stderr) {
            // Classified before the cap so a late fatal line is never missed
            if (!saw_fatal && !is_unsupported_method_line(line)) {
                saw_fatal = true;
                first_fatal = line;
            }
            if (diagnostics.size() < MAX_DIAGNOSTIC_LINES) diagnostics.push_back(line);
            return;
        }
        if (auto percent = parse_percent_indicator(line)) {
            emit(*percent);
        }
    };

    emit(0);

    while (proc->pumpOutput(std::chrono::milliseconds(100), on_line)) {
        if (cancel.cancelled()) {
            proc->kill();
            proc->wait();
            return Result<void>::err(cancelled_error("extraction"));
        }
    }

    int exit_code = proc->wait();
    if (cancel.cancelled()) {
        return Result<void>::err(cancelled_error("extraction"));
    }

    if (exit_code != 0) {
        if (saw_fatal || diagnostics.empty()) {
            std::string message = "7-Zip exited with code " + std::to_string(exit_code);
            if (!first_fatal.empty()) message += ": " + first_fatal;
            if (saw_fatal && diagnostics.size() == MAX_DIAGNOSTIC_LINES &&
                std::find(diagnostics.begin(), diagnostics.end(), first_fatal) == diagnostics.end()) {
                diagnostics.back() = first_fatal;
            }
            Error err(ErrorCode::EXTRACTION, message);
            err.withDiagnostics(diagnostics);
            return Result<void>::err(err);
        }

        for (const auto& line : diagnostics) {
            spdlog::warn("7-Zip: {}", line);
        }
    }

    emit(100);
    return Result<void>::ok();
}

} // namespace haul
