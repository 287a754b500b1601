#include "haul/request.hpp"
#include "haul/digest.hpp"
#include "haul/platform.hpp"

#include <nlohmann/json.hpp>

#include <set>

namespace haul {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Cache folder names and file names are used as single path components
bool is_plain_component(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

Result<InstallRequest> invalid(const std::string& message) {
    return Result<InstallRequest>::err(Error(ErrorCode::VALIDATION, message));
}

} // namespace

std::string filename_from_url(const std::string& url) {
    std::string path = url;
    size_t cut = path.find_first_of("?#");
    if (cut != std::string::npos) path = path.substr(0, cut);

    size_t scheme = path.find("://");
    if (scheme != std::string::npos) {
        size_t slash = path.find('/', scheme + 3);
        if (slash == std::string::npos) return "";
        path = path.substr(slash);
    }

    size_t last = path.rfind('/');
    std::string name = last == std::string::npos ? path : path.substr(last + 1);
    return is_plain_component(name) ? name : "";
}

Result<InstallRequest> parse_install_request(const std::string& json_str) {
    InstallRequest request;

    try {
        auto j = nlohmann::json::parse(json_str);
        if (!j.is_object()) {
            return invalid("request must be a JSON object");
        }

        auto dest = get_string(j, "dest");
        if (!dest || dest->empty()) {
            return invalid("dest missing");
        }
        request.dest = *dest;

        auto key = get_string(j, "cache_key");
        if (!key || !is_plain_component(*key)) {
            return invalid("cache_key missing or not a plain name");
        }
        request.cache_key = *key;

        if (!j.contains("files") || !j["files"].is_array() || j["files"].empty()) {
            return invalid("files must be a non-empty array");
        }

        const auto& files = j["files"];
        std::set<std::string> seen;
        for (size_t i = 0; i < files.size(); ++i) {
            const auto& f = files[i];
            std::string where = "files[" + std::to_string(i) + "]";
            if (!f.is_object()) {
                return invalid(where + " must be an object");
            }

            InstallFile file;
            auto url = get_string(f, "url");
            if (!url || url->empty()) {
                return invalid(where + ".url missing");
            }
            file.url = *url;

            if (auto name = get_string(f, "filename")) {
                file.filename = *name;
            } else if (files.size() == 1) {
                file.filename = filename_from_url(file.url);
            }
            if (!is_plain_component(file.filename)) {
                return invalid(where + ".filename missing or not a plain name");
            }
            if (!seen.insert(file.filename).second) {
                return invalid(where + ".filename duplicated: " + file.filename);
            }

            if (f.contains("size") && !f["size"].is_null()) {
                if (f["size"].is_number_unsigned()) {
                    auto size = f["size"].get<std::uint64_t>();
                    if (size > 0) file.size = size;
                } else {
                    return invalid(where + ".size must be a non-negative integer");
                }
            }

            if (auto sha = get_string(f, "sha256")) {
                if (!is_sha256_hex(*sha)) {
                    return invalid(where + ".sha256 must be 64 hex characters");
                }
                file.sha256 = *sha;
            }

            request.files.push_back(std::move(file));
        }
    } catch (const nlohmann::json::parse_error& e) {
        return invalid(std::string("parse error: ") + e.what());
    } catch (const nlohmann::json::exception& e) {
        return invalid(std::string("JSON error: ") + e.what());
    }

    return Result<InstallRequest>::ok(std::move(request));
}

Result<InstallRequest> load_install_request(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return Result<InstallRequest>::err(Error(ErrorCode::NOT_FOUND, "cannot read " + path));
    }
    auto result = parse_install_request(*content);
    if (result.isErr()) {
        result.error().withContext(path);
    }
    return result;
}

} // namespace haul
