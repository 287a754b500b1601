#pragma once

#include "haul/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace haul {

// ============================================================================
// Install Request
// ============================================================================

struct InstallFile {
    std::string url;
    std::string filename;                 // name inside the cache folder
    std::optional<std::uint64_t> size;    // declared size, if known
    std::string sha256;                   // optional hex digest
};

/**
 * @brief A fully specified install: which files, where to cache them and
 *        where to unpack them.
 *
 * JSON form:
 * @code
 * { "dest": "/opt/bundle", "cache_key": "bundle-1.2",
 *   "files": [ { "url": "https://...", "filename": "b.7z.001", "size": 123,
 *                "sha256": "..." } ] }
 * @endcode
 */
struct InstallRequest {
    std::string dest;
    std::string cache_key;
    std::vector<InstallFile> files;
};

// Last path segment of a URL with query and fragment stripped.
// Empty if the URL has no usable segment.
std::string filename_from_url(const std::string& url);

// Parse and validate. All failures are VALIDATION.
Result<InstallRequest> parse_install_request(const std::string& json_str);

Result<InstallRequest> load_install_request(const std::string& path);

} // namespace haul
