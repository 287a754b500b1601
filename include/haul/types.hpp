#pragma once

/**
 * @file types.hpp
 * @brief Error handling, cancellation and progress types shared by every
 *        haul module.
 */

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace haul {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for haul operations
 */
enum class ErrorCode {
    // Request / data faults. Partial state is purged, never retried internally.
    VALIDATION,

    // Connection drop or unexpected HTTP status. Resumable state is preserved.
    NETWORK,

    // The caller's cancel token fired.
    CANCELLED,

    // Archive backend failed. Diagnostics are attached.
    EXTRACTION,

    // A port is held by another process. Conflict details are attached.
    PORT_CONFLICT,

    // Readiness polling ran out of time.
    TIMEOUT,

    // System / IO
    IO_ERROR,
    NOT_FOUND,
    INVALID_ARGUMENT,
};

const char* error_code_name(ErrorCode code);

/**
 * @brief Details of a port held by a process we did not just start.
 */
struct PortConflict {
    int port = 0;
    std::vector<int> pids;
    bool owned_by_known_instance = false;
};

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    Error& withDiagnostics(std::vector<std::string> lines) {
        diagnostics_ = std::move(lines);
        return *this;
    }

    Error& withConflict(PortConflict conflict) {
        conflict_ = std::move(conflict);
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const { return message_; }

    bool isCancelled() const { return code_ == ErrorCode::CANCELLED; }

    // Backend output captured for EXTRACTION errors.
    const std::vector<std::string>& diagnostics() const { return diagnostics_; }

    // Present for PORT_CONFLICT errors.
    const std::optional<PortConflict>& conflict() const { return conflict_; }

private:
    ErrorCode code_;
    std::string message_;
    std::vector<std::string> diagnostics_;
    std::optional<PortConflict> conflict_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

// ============================================================================
// Cancellation
// ============================================================================

/**
 * @brief Shared cancellation flag threaded through a whole call chain.
 *
 * Copies share state. cancel() may be called from any thread, any number of
 * times, including after the operation finished.
 */
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true, std::memory_order_release); }
    bool cancelled() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

inline Error cancelled_error(const std::string& what) {
    return Error(ErrorCode::CANCELLED, what + " cancelled");
}

// ============================================================================
// Progress
// ============================================================================

/**
 * @brief Phase-level progress sink consumed by a reporting layer.
 *
 * phase is "download" or "extract"; percent is 0-100.
 */
using ProgressSink = std::function<void(const std::string& phase, int percent,
                                        const std::string& status)>;

} // namespace haul
