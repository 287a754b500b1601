#pragma once

#include "haul/types.hpp"

#include <string>

namespace haul {

// ============================================================================
// SHA-256 (OpenSSL EVP)
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string hex_digest;  // lowercase
    std::string error;
};

HashResult compute_sha256(const std::string& file_path, const CancelToken& cancel = {});

// 64 hex characters, either case
bool is_sha256_hex(const std::string& s);

// VALIDATION on mismatch, IO_ERROR if the file cannot be hashed.
// The file is left in place; purging is the caller's decision.
Result<void> verify_sha256(const std::string& file_path, const std::string& expected_hex,
                           const CancelToken& cancel = {});

} // namespace haul
