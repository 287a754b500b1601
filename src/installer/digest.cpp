#include "haul/digest.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <vector>

#include <openssl/evp.h>

namespace haul {

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string to_hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[(data[i] >> 4) & 0x0F]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

} // namespace

HashResult compute_sha256(const std::string& file_path, const CancelToken& cancel) {
    HashResult result;

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        result.error = "cannot open " + file_path;
        return result;
    }

    EvpMdCtx ctx;
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }

    // Large bundles: read in 1 MiB chunks and honour cancellation between them
    std::vector<char> buffer(1 << 20);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) ||
           file.gcount() > 0) {
        if (cancel.cancelled()) {
            result.error = "cancelled";
            return result;
        }
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(file.gcount())) != 1) {
            result.error = "EVP_DigestUpdate failed";
            return result;
        }
    }
    if (file.bad()) {
        result.error = "read failed: " + file_path;
        return result;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }

    result.hex_digest = to_hex(hash, hash_len);
    result.ok = true;
    return result;
}

bool is_sha256_hex(const std::string& s) {
    return s.size() == 64 &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

Result<void> verify_sha256(const std::string& file_path, const std::string& expected_hex,
                           const CancelToken& cancel) {
    auto hash = compute_sha256(file_path, cancel);
    if (!hash.ok) {
        if (cancel.cancelled()) {
            return Result<void>::err(cancelled_error("verification"));
        }
        return Result<void>::err(Error(ErrorCode::IO_ERROR, hash.error));
    }

    std::string expected = expected_hex;
    std::transform(expected.begin(), expected.end(), expected.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (hash.hex_digest != expected) {
        return Result<void>::err(Error(ErrorCode::VALIDATION,
            "sha256 mismatch for " + file_path + ": expected " + expected +
            ", got " + hash.hex_digest));
    }
    return Result<void>::ok();
}

} // namespace haul
