#include "haul/transfer.hpp"
#include "haul/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace haul {

// ============================================================================
// Sidecar
// ============================================================================

std::string transfer_meta_path(const std::string& dest_path) {
    return dest_path + TRANSFER_META_SUFFIX;
}

bool is_transfer_complete(const std::string& dest_path) {
    std::error_code ec;
    return fs::exists(dest_path, ec) && !fs::exists(transfer_meta_path(dest_path), ec);
}

std::string serialize_transfer_meta(const TransferMeta& meta) {
    nlohmann::json j;
    j["url"] = meta.url;
    j["expectedSize"] = meta.expected_size;
    if (!meta.etag.empty()) j["etag"] = meta.etag;
    if (!meta.last_modified.empty()) j["lastModified"] = meta.last_modified;
    return j.dump();
}

std::optional<TransferMeta> parse_transfer_meta(const std::string& json_str) {
    try {
        auto j = nlohmann::json::parse(json_str);
        if (!j.is_object() || !j.contains("url") || !j["url"].is_string()) {
            return std::nullopt;
        }

        TransferMeta meta;
        meta.url = j["url"].get<std::string>();
        if (j.contains("expectedSize") && j["expectedSize"].is_number_unsigned()) {
            meta.expected_size = j["expectedSize"].get<std::uint64_t>();
        }
        if (j.contains("etag") && j["etag"].is_string()) {
            meta.etag = j["etag"].get<std::string>();
        }
        if (j.contains("lastModified") && j["lastModified"].is_string()) {
            meta.last_modified = j["lastModified"].get<std::string>();
        }
        return meta;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<TransferMeta> read_transfer_meta(const std::string& meta_path) {
    auto content = read_file(meta_path);
    if (!content) return std::nullopt;
    return parse_transfer_meta(*content);
}

bool write_transfer_meta(const std::string& meta_path, const TransferMeta& meta) {
    auto result = atomic_write_file(meta_path, serialize_transfer_meta(meta));
    if (!result.ok) {
        spdlog::warn("failed to write transfer sidecar {}: {}", meta_path, result.error);
    }
    return result.ok;
}

// ============================================================================
// RateWindow
// ============================================================================

void RateWindow::add(Clock::time_point at, std::uint64_t total_bytes) {
    samples_.push_back({at, total_bytes});
    while (samples_.size() > 2 && at - samples_.front().at > window_) {
        samples_.pop_front();
    }
}

double RateWindow::bytesPerSecond() const {
    if (samples_.size() < 2) return 0.0;
    const auto& first = samples_.front();
    const auto& last = samples_.back();
    double secs = std::chrono::duration<double>(last.at - first.at).count();
    if (secs <= 0.0 || last.bytes < first.bytes) return 0.0;
    return static_cast<double>(last.bytes - first.bytes) / secs;
}

// ============================================================================
// libcurl plumbing
// ============================================================================

namespace {

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

// RAII wrapper for a request header list
class CurlHeaderList {
public:
    CurlHeaderList() = default;
    ~CurlHeaderList() { if (list_) curl_slist_free_all(list_); }

    CurlHeaderList(const CurlHeaderList&) = delete;
    CurlHeaderList& operator=(const CurlHeaderList&) = delete;

    void append(const std::string& header) {
        list_ = curl_slist_append(list_, header.c_str());
    }
    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

// Global curl initialization (thread-safe in modern libcurl)
class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::uint64_t> parse_u64(const std::string& s) {
    if (s.empty()) return std::nullopt;
    std::uint64_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return value;
}

void purge_partial(const std::string& dest_path, const std::string& meta_path) {
    remove_file_quietly(dest_path);
    remove_file_quietly(meta_path);
}

struct ResponseHead {
    long status = 0;
    std::optional<std::uint64_t> content_length;
    std::optional<std::uint64_t> range_start;
    std::optional<std::uint64_t> range_total;
    std::string etag;
    std::string last_modified;
    bool has_location = false;
};

void parse_content_range(const std::string& value, ResponseHead& head) {
    // bytes <start>-<end>/<total|*>
    auto v = trim(value);
    if (v.rfind("bytes ", 0) != 0) return;
    v = v.substr(6);
    auto dash = v.find('-');
    auto slash = v.find('/');
    if (dash == std::string::npos || slash == std::string::npos || dash > slash) return;
    head.range_start = parse_u64(v.substr(0, dash));
    head.range_total = parse_u64(v.substr(slash + 1));
}

// One HTTP exchange against one URL (no redirect following).
class Attempt {
public:
    Attempt(const std::string& dest_path, std::uint64_t resume_from,
            const TransferMeta* validator, const TransferOptions& options,
            const TransferProgressFn& on_progress)
        : dest_path_(dest_path),
          meta_path_(transfer_meta_path(dest_path)), resume_from_(resume_from),
          validator_(validator), options_(options), on_progress_(on_progress) {}

    // The caller's URL, recorded in the sidecar regardless of redirects.
    std::string sidecar_url;

    CURLcode perform(const std::string& url, std::string& curl_error) {
        CurlHandle curl;
        if (!curl) {
            curl_error = "failed to initialize CURL";
            return CURLE_FAILED_INIT;
        }

        char error_buffer[CURL_ERROR_SIZE] = {0};
        CurlHeaderList headers;
        if (resume_from_ > 0 && validator_) {
            headers.append("Range: bytes=" + std::to_string(resume_from_) + "-");
            const std::string& token = !validator_->etag.empty() ? validator_->etag
                                                                 : validator_->last_modified;
            headers.append("If-Range: " + token);
        }

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Attempt::header_callback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, this);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Attempt::write_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, this);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Attempt::xferinfo_callback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, this);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

        // Redirects are followed by the caller so depth and sidecar URL stay ours
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);

        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_secs);
        if (options_.stall_timeout_secs > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, options_.stall_timeout_secs);
        }
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());

        started_ = RateWindow::Clock::now();
        CURLcode res = curl_easy_perform(curl.get());

        if (redirect_) {
            char* target = nullptr;
            curl_easy_getinfo(curl.get(), CURLINFO_REDIRECT_URL, &target);
            if (target) redirect_url_ = target;
        }

        if (file_.is_open()) {
            file_.close();
            if (file_.fail() && !failure_) {
                fail(Error(ErrorCode::IO_ERROR, "failed to flush " + dest_path_), true);
            }
        }

        if (res != CURLE_OK) {
            curl_error = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
        }
        return res;
    }

    bool headersDone() const { return headers_done_; }
    bool isRedirect() const { return redirect_; }
    const std::string& redirectUrl() const { return redirect_url_; }
    bool rangeNotSatisfiable() const { return range_not_satisfiable_; }
    const std::optional<Error>& failure() const { return failure_; }
    bool purgeOnFailure() const { return purge_on_failure_; }
    std::uint64_t effectiveSize() const { return effective_size_; }
    std::uint64_t receivedBytes() const { return received_; }

    void emitFinal() { emit_progress(true); }

private:
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* self = static_cast<Attempt*>(userdata);
        size_t total = size * nitems;
        std::string line(buffer, total);
        return self->on_header_line(line) ? total : 0;
    }

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<Attempt*>(userdata);
        size_t total = size * nmemb;
        return self->on_body(ptr, total) ? total : 0;
    }

    static int xferinfo_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* self = static_cast<Attempt*>(clientp);
        return self->options_.cancel.cancelled() ? 1 : 0;
    }

    void fail(Error error, bool purge) {
        if (failure_) return;
        failure_ = std::move(error);
        purge_on_failure_ = purge;
    }

    bool on_header_line(const std::string& raw) {
        std::string line = trim(raw);

        if (line.rfind("HTTP/", 0) == 0) {
            // New status line (also after 1xx interim responses)
            head_ = ResponseHead{};
            auto sp = line.find(' ');
            if (sp != std::string::npos) {
                head_.status = std::strtol(line.c_str() + sp + 1, nullptr, 10);
            }
            return true;
        }

        if (line.empty()) {
            if (head_.status >= 100 && head_.status < 200) return true;
            return on_headers_complete();
        }

        auto colon = line.find(':');
        if (colon == std::string::npos) return true;
        std::string name = to_lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));

        if (name == "content-length") {
            head_.content_length = parse_u64(value);
        } else if (name == "content-range") {
            parse_content_range(value, head_);
        } else if (name == "etag") {
            head_.etag = value;
        } else if (name == "last-modified") {
            head_.last_modified = value;
        } else if (name == "location") {
            head_.has_location = !value.empty();
        }
        return true;
    }

    bool on_headers_complete() {
        headers_done_ = true;
        long status = head_.status;

        if (status >= 300 && status < 400) {
            if (!head_.has_location) {
                fail(Error(ErrorCode::VALIDATION,
                           "HTTP " + std::to_string(status) + " redirect without location"), false);
                return false;
            }
            redirect_ = true;
            return true;
        }

        if (status == 416 && resume_from_ > 0) {
            range_not_satisfiable_ = true;
            return false;
        }

        bool resumed = status == 206 && resume_from_ > 0;
        if (!resumed && status != 200) {
            fail(Error(ErrorCode::NETWORK, "HTTP " + std::to_string(status)), false);
            return false;
        }

        if (resumed && head_.range_start && *head_.range_start != resume_from_) {
            fail(Error(ErrorCode::VALIDATION,
                       "server resumed at byte " + std::to_string(*head_.range_start) +
                       ", expected " + std::to_string(resume_from_)), true);
            return false;
        }

        std::uint64_t base = resumed ? resume_from_ : 0;
        std::uint64_t size_from_headers = 0;
        if (resumed && head_.range_total) {
            size_from_headers = *head_.range_total;
        } else if (head_.content_length) {
            size_from_headers = base + *head_.content_length;
        }

        if (options_.expected_size && *options_.expected_size > 0 && size_from_headers > 0 &&
            *options_.expected_size != size_from_headers) {
            fail(Error(ErrorCode::VALIDATION,
                       "size mismatch: expected " + std::to_string(*options_.expected_size) +
                       " bytes but server reported " + std::to_string(size_from_headers)), true);
            return false;
        }

        effective_size_ = (options_.expected_size && *options_.expected_size > 0)
                              ? *options_.expected_size
                              : size_from_headers;

        TransferMeta meta;
        meta.url = sidecar_url;
        meta.expected_size = effective_size_;
        meta.etag = head_.etag;
        meta.last_modified = head_.last_modified;
        if (!write_transfer_meta(meta_path_, meta)) {
            fail(Error(ErrorCode::IO_ERROR, "cannot write sidecar " + meta_path_), false);
            return false;
        }

        if (resume_from_ > 0 && !resumed) {
            spdlog::debug("{}: server sent full content, restarting from zero", dest_path_);
        } else if (resumed) {
            spdlog::debug("{}: resuming at byte {}", dest_path_, resume_from_);
        }

        auto mode = std::ios::binary | std::ios::out | (resumed ? std::ios::app : std::ios::trunc);
        file_.open(dest_path_, mode);
        if (!file_) {
            fail(Error(ErrorCode::IO_ERROR, "cannot open " + dest_path_ + " for writing"), true);
            return false;
        }

        received_ = base;
        window_.add(RateWindow::Clock::now(), received_);
        streaming_ = true;
        return true;
    }

    bool on_body(const char* data, size_t len) {
        if (failure_) return false;
        if (!streaming_) return true;  // redirect or interim body, discarded

        file_.write(data, static_cast<std::streamsize>(len));
        if (!file_) {
            fail(Error(ErrorCode::IO_ERROR, "write failed for " + dest_path_), true);
            return false;
        }

        received_ += len;
        emit_progress(false);
        return true;
    }

    void emit_progress(bool force) {
        if (!on_progress_) return;
        auto now = RateWindow::Clock::now();
        window_.add(now, received_);
        if (!force && now - last_emit_ < options_.progress_interval) return;
        last_emit_ = now;

        TransferProgress p;
        p.received_bytes = received_;
        p.elapsed_secs = std::chrono::duration<double>(now - started_).count();
        double bps = window_.bytesPerSecond();
        p.speed_mbs = bps / 1048576.0;
        if (effective_size_ > 0) {
            p.total_bytes = effective_size_;
            double ratio = static_cast<double>(received_) / static_cast<double>(effective_size_);
            p.percent = static_cast<int>(std::min(100.0, std::round(ratio * 100.0)));
            if (bps > 0 && effective_size_ >= received_) {
                p.eta_secs = static_cast<double>(effective_size_ - received_) / bps;
            }
        }
        on_progress_(p);
    }

    const std::string& dest_path_;
    std::string meta_path_;
    std::uint64_t resume_from_;
    const TransferMeta* validator_;
    const TransferOptions& options_;
    const TransferProgressFn& on_progress_;

    ResponseHead head_;
    bool headers_done_ = false;
    bool streaming_ = false;
    bool redirect_ = false;
    std::string redirect_url_;
    bool range_not_satisfiable_ = false;
    std::optional<Error> failure_;
    bool purge_on_failure_ = false;

    std::ofstream file_;
    std::uint64_t received_ = 0;
    std::uint64_t effective_size_ = 0;
    RateWindow window_;
    RateWindow::Clock::time_point started_;
    RateWindow::Clock::time_point last_emit_;
};

} // namespace

// ============================================================================
// Transfer
// ============================================================================

Result<std::string> transfer(const std::string& url,
                             const std::string& dest_path,
                             const TransferProgressFn& on_progress,
                             const TransferOptions& options) {
    if (options.cancel.cancelled()) {
        return Result<std::string>::err(cancelled_error("transfer"));
    }

    const std::string meta_path = transfer_meta_path(dest_path);

    std::error_code ec;
    auto parent = get_parent_directory(dest_path);
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return Result<std::string>::err(
                Error(ErrorCode::IO_ERROR, "cannot create " + parent + ": " + ec.message()));
        }
    }

    bool data_exists = fs::exists(dest_path, ec);
    bool meta_exists = fs::exists(meta_path, ec);

    // Decide where to start from the on-disk state.
    std::uint64_t resume_from = 0;
    std::optional<TransferMeta> existing;
    if (data_exists && !meta_exists) {
        auto size = file_size(dest_path);
        if (!options.expected_size || (size && *size == *options.expected_size)) {
            spdlog::debug("{} already complete", dest_path);
            return Result<std::string>::ok(dest_path);
        }
        spdlog::warn("{} is complete but has the wrong size, fetching again", dest_path);
        remove_file_quietly(dest_path);
    } else if (data_exists && meta_exists) {
        existing = read_transfer_meta(meta_path);
        auto size = file_size(dest_path);
        if (!existing || existing->url != url || !size) {
            // URL mismatch, unreadable sidecar or unstat-able file: start fresh
            purge_partial(dest_path, meta_path);
            existing.reset();
        } else if (existing->expected_size > 0 && *size == existing->expected_size) {
            // Crash between final write and sidecar removal
            remove_file_quietly(meta_path);
            spdlog::debug("{} was fully written, clearing sidecar", dest_path);
            return Result<std::string>::ok(dest_path);
        } else if (existing->expected_size > 0 && *size > existing->expected_size) {
            purge_partial(dest_path, meta_path);
            existing.reset();
        } else if (existing->etag.empty() && existing->last_modified.empty()) {
            // Nothing to make a range request conditional on
            existing.reset();
        } else {
            resume_from = *size;
        }
    } else if (meta_exists) {
        remove_file_quietly(meta_path);
    }

    get_curl_init();

    std::string current_url = url;
    bool restarted = false;
    int redirects_left = options.max_redirects;

    while (true) {
        if (options.cancel.cancelled()) {
            return Result<std::string>::err(cancelled_error("transfer"));
        }

        Attempt attempt(dest_path, resume_from, resume_from > 0 ? &*existing : nullptr,
                        options, on_progress);
        attempt.sidecar_url = url;

        std::string curl_error;
        CURLcode res = attempt.perform(current_url, curl_error);

        if (attempt.failure()) {
            if (attempt.purgeOnFailure()) {
                purge_partial(dest_path, meta_path);
            }
            Error error = *attempt.failure();
            return Result<std::string>::err(error.withContext(url));
        }

        if (attempt.rangeNotSatisfiable()) {
            purge_partial(dest_path, meta_path);
            if (restarted) {
                return Result<std::string>::err(
                    Error(ErrorCode::NETWORK, "HTTP 416").withContext(url));
            }
            spdlog::debug("{}: range not satisfiable, restarting from zero", dest_path);
            resume_from = 0;
            existing.reset();
            restarted = true;
            continue;
        }

        if (res != CURLE_OK) {
            if (options.cancel.cancelled()) {
                return Result<std::string>::err(cancelled_error("transfer"));
            }
            return Result<std::string>::err(
                Error(ErrorCode::NETWORK, curl_error).withContext(url));
        }

        if (attempt.isRedirect()) {
            if (redirects_left <= 0) {
                return Result<std::string>::err(
                    Error(ErrorCode::VALIDATION, "too many redirects").withContext(url));
            }
            if (attempt.redirectUrl().empty()) {
                return Result<std::string>::err(
                    Error(ErrorCode::VALIDATION, "malformed redirect location").withContext(url));
            }
            --redirects_left;
            current_url = attempt.redirectUrl();
            spdlog::debug("redirect -> {}", current_url);
            continue;
        }

        if (!attempt.headersDone()) {
            return Result<std::string>::err(
                Error(ErrorCode::NETWORK, "connection closed before response").withContext(url));
        }

        std::uint64_t expected = attempt.effectiveSize();
        if (expected > 0) {
            auto actual = file_size(dest_path);
            if (!actual || *actual != expected) {
                purge_partial(dest_path, meta_path);
                return Result<std::string>::err(
                    Error(ErrorCode::VALIDATION,
                          "incomplete: expected " + std::to_string(expected) + " bytes but got " +
                          std::to_string(actual.value_or(0))).withContext(url));
            }
        }

        attempt.emitFinal();

        if (!remove_file_quietly(meta_path)) {
            spdlog::warn("could not remove sidecar {}", meta_path);
        }
        spdlog::info("fetched {} ({} bytes)", dest_path, attempt.receivedBytes());
        return Result<std::string>::ok(dest_path);
    }
}

// ============================================================================
// Reachability probe
// ============================================================================

namespace {

size_t discard_body(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

} // namespace

Result<long> probe_url(const std::string& url, std::chrono::milliseconds timeout,
                       const std::string& user_agent) {
    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        return Result<long>::err(Error(ErrorCode::NETWORK, "curl_easy_init failed"));
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return Result<long>::err(Error(ErrorCode::NETWORK, curl_easy_strerror(res)));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    return Result<long>::ok(status);
}

} // namespace haul
