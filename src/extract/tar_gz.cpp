#include "haul/extract.hpp"
#include "haul/platform.hpp"

#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <zlib.h>

namespace fs = std::filesystem;

namespace haul {

namespace {

// ============================================================================
// Tar Format (POSIX ustar + GNU / pax extensions)
// ============================================================================

constexpr size_t TAR_BLOCK_SIZE = 512;
constexpr size_t TAR_NAME_SIZE = 100;
constexpr size_t TAR_SIZE_SIZE = 12;
constexpr size_t TAR_MODE_SIZE = 8;
constexpr size_t TAR_CHKSUM_SIZE = 8;
constexpr size_t TAR_LINKNAME_SIZE = 100;
constexpr size_t TAR_PREFIX_SIZE = 155;

constexpr char TAR_REGTYPE = '0';
constexpr char TAR_AREGTYPE = '\0';
constexpr char TAR_LNKTYPE = '1';
constexpr char TAR_SYMTYPE = '2';
constexpr char TAR_DIRTYPE = '5';
constexpr char TAR_CONTTYPE = '7';
constexpr char TAR_GNU_LONGNAME = 'L';
constexpr char TAR_GNU_LONGLINK = 'K';
constexpr char TAR_PAX_HEADER = 'x';
constexpr char TAR_PAX_GLOBAL = 'g';

constexpr size_t COPY_CHUNK = 64 * 1024;

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];
    char mode[TAR_MODE_SIZE];
    char uid[8];
    char gid[8];
    char size[TAR_SIZE_SIZE];
    char mtime[12];
    char chksum[TAR_CHKSUM_SIZE];
    char typeflag;
    char linkname[TAR_LINKNAME_SIZE];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[TAR_PREFIX_SIZE];
    char padding[12];
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

uint64_t parse_octal(const char* data, size_t size) {
    // GNU base-256 encoding for values that overflow the octal field
    if (static_cast<unsigned char>(data[0]) & 0x80) {
        uint64_t result = static_cast<unsigned char>(data[0]) & 0x7f;
        for (size_t i = 1; i < size; ++i) {
            result = (result << 8) | static_cast<unsigned char>(data[i]);
        }
        return result;
    }

    uint64_t result = 0;
    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;
    for (; i < size && data[i] >= '0' && data[i] <= '7'; ++i) {
        result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
    }
    return result;
}

bool checksum_matches(const TarHeader& header) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(&header);
    uint32_t sum = 0;
    for (size_t i = 0; i < sizeof(TarHeader); ++i) {
        // Checksum field counts as spaces
        sum += (i >= 148 && i < 156) ? static_cast<unsigned char>(' ') : bytes[i];
    }
    return sum == parse_octal(header.chksum, TAR_CHKSUM_SIZE);
}

bool is_zero_block(const char* block) {
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i) {
        if (block[i] != 0) return false;
    }
    return true;
}

std::string field(const char* data, size_t size) {
    return std::string(data, strnlen(data, size));
}

// "<len> <key>=<value>\n" records
std::map<std::string, std::string> parse_pax_records(const std::string& data) {
    std::map<std::string, std::string> records;
    size_t pos = 0;
    while (pos < data.size()) {
        size_t space = data.find(' ', pos);
        if (space == std::string::npos) break;

        size_t len = 0;
        try {
            len = std::stoul(data.substr(pos, space - pos));
        } catch (const std::exception&) {
            break;
        }
        if (len == 0 || pos + len > data.size()) break;

        std::string record = data.substr(space + 1, len - (space - pos) - 2);
        size_t eq = record.find('=');
        if (eq != std::string::npos) {
            records[record.substr(0, eq)] = record.substr(eq + 1);
        }
        pos += len;
    }
    return records;
}

// Normalized relative path for an archive entry, or an error if it would
// land outside root.
Result<std::string> safe_entry_path(const std::string& entry_path, const std::string& root) {
    if (!entry_path.empty() && (entry_path[0] == '/' || entry_path[0] == '\\')) {
        return Result<std::string>::err(
            Error(ErrorCode::EXTRACTION, "absolute path not allowed: " + entry_path));
    }

    fs::path normalized;
    for (const auto& component : fs::path(entry_path)) {
        std::string comp = component.string();
        if (comp == "..") {
            return Result<std::string>::err(
                Error(ErrorCode::EXTRACTION, "path traversal not allowed: " + entry_path));
        }
        if (comp.size() >= 2 && comp[1] == ':') {
            return Result<std::string>::err(
                Error(ErrorCode::EXTRACTION, "drive path not allowed: " + entry_path));
        }
        if (comp != "." && !comp.empty()) {
            normalized /= comp;
        }
    }

    // Resolves symlinks already extracted, so a link to outside the tree
    // cannot be used as a directory
    std::error_code root_ec;
    std::error_code full_ec;
    fs::path canonical_root = fs::weakly_canonical(root, root_ec);
    fs::path canonical_full = fs::weakly_canonical(fs::path(root) / normalized, full_ec);
    if (root_ec || full_ec || canonical_full.string().rfind(canonical_root.string(), 0) != 0) {
        return Result<std::string>::err(
            Error(ErrorCode::EXTRACTION, "path escapes extraction root: " + entry_path));
    }

    return Result<std::string>::ok(normalized.string());
}

bool symlink_stays_inside(const std::string& entry_rel, const std::string& target) {
    if (target.empty() || target[0] == '/' || target[0] == '\\') return false;
    fs::path resolved = (fs::path(entry_rel).parent_path() / target).lexically_normal();
    auto first = resolved.begin();
    return first == resolved.end() || first->string() != "..";
}

class GzFile {
public:
    explicit GzFile(const std::string& path) : file_(gzopen(path.c_str(), "rb")) {
        if (file_) gzbuffer(file_, 128 * 1024);
    }
    ~GzFile() {
        if (file_) gzclose(file_);
    }
    GzFile(const GzFile&) = delete;
    GzFile& operator=(const GzFile&) = delete;

    bool valid() const { return file_ != nullptr; }

    // Read exactly n bytes; false on EOF or error
    bool readExact(char* buf, size_t n) {
        size_t done = 0;
        while (done < n) {
            int got = gzread(file_, buf + done, static_cast<unsigned>(n - done));
            if (got <= 0) return false;
            done += static_cast<size_t>(got);
        }
        return true;
    }

    bool skip(uint64_t n) {
        char buf[TAR_BLOCK_SIZE * 8];
        while (n > 0) {
            size_t step = n < sizeof(buf) ? static_cast<size_t>(n) : sizeof(buf);
            if (!readExact(buf, step)) return false;
            n -= step;
        }
        return true;
    }

    // End of stream reached without a decompression error
    bool cleanEof() {
        int errnum = Z_OK;
        gzerror(file_, &errnum);
        return gzeof(file_) && (errnum == Z_OK || errnum == Z_STREAM_END);
    }

    std::string errorMessage() {
        int errnum = Z_OK;
        const char* msg = gzerror(file_, &errnum);
        if (errnum == Z_OK || errnum == Z_STREAM_END) return "unexpected end of archive";
        return msg ? msg : "gzip error";
    }

    // Compressed bytes consumed so far
    uint64_t offset() const {
        z_off_t off = gzoffset(file_);
        return off < 0 ? 0 : static_cast<uint64_t>(off);
    }

private:
    gzFile file_;
};

uint64_t padding_for(uint64_t size) {
    uint64_t rem = size % TAR_BLOCK_SIZE;
    return rem == 0 ? 0 : TAR_BLOCK_SIZE - rem;
}

void apply_mode(const fs::path& path, uint64_t mode) {
    std::error_code ec;
    if ((mode & 0111) != 0) {
        fs::permissions(path, fs::perms::owner_all | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read |
                        fs::perms::others_exec, ec);
    } else {
        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write |
                        fs::perms::group_read | fs::perms::others_read, ec);
    }
}

Error tar_error(const std::string& message) {
    return Error(ErrorCode::EXTRACTION, message);
}

} // namespace

// ============================================================================
// TarGzBackend
// ============================================================================

Result<void> TarGzBackend::extract(const std::string& archive_path,
                                   const std::string& dest_dir,
                                   const ExtractProgressFn& on_progress,
                                   const CancelToken& cancel) {
    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                       "cannot create " + dest_dir + ": " + ec.message()));
    }

    GzFile gz(archive_path);
    if (!gz.valid()) {
        return Result<void>::err(tar_error("cannot open " + archive_path));
    }

    const uint64_t compressed_size = file_size(archive_path).value_or(0);
    const auto start = std::chrono::steady_clock::now();
    int last_percent = -1;

    auto emit = [&](int percent) {
        if (percent <= last_percent || !on_progress) return;
        last_percent = percent;
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        double eta = percent > 0 ? (elapsed / percent) * (100 - percent) : -1;
        on_progress({percent, elapsed, eta});
    };
    auto emit_offset = [&]() {
        if (compressed_size == 0) return;
        int percent = static_cast<int>(gz.offset() * 100 / compressed_size);
        // 100 is reserved for completion
        emit(percent > 99 ? 99 : percent);
    };

    emit(0);

    std::string long_name;
    std::string long_link;
    std::map<std::string, std::string> pax;
    std::map<std::string, std::string> pax_global;
    size_t entries = 0;

    TarHeader header;
    while (true) {
        if (cancel.cancelled()) {
            return Result<void>::err(cancelled_error("extraction"));
        }

        if (!gz.readExact(reinterpret_cast<char*>(&header), TAR_BLOCK_SIZE)) {
            // A tarball without the trailing zero blocks is tolerated only at EOF
            if (entries > 0 && gz.cleanEof()) break;
            return Result<void>::err(tar_error("truncated archive: " + gz.errorMessage()));
        }
        if (is_zero_block(reinterpret_cast<const char*>(&header))) break;

        if (!checksum_matches(header)) {
            return Result<void>::err(tar_error("corrupt tar header in " + archive_path));
        }

        char typeflag = header.typeflag;
        uint64_t size = parse_octal(header.size, TAR_SIZE_SIZE);

        // Metadata entries describe the next header
        if (typeflag == TAR_GNU_LONGNAME || typeflag == TAR_GNU_LONGLINK ||
            typeflag == TAR_PAX_HEADER || typeflag == TAR_PAX_GLOBAL) {
            if (size > 1024 * 1024) {
                return Result<void>::err(tar_error("oversized extended header"));
            }
            std::string data(static_cast<size_t>(size), '\0');
            if (!gz.readExact(&data[0], data.size()) || !gz.skip(padding_for(size))) {
                return Result<void>::err(tar_error("truncated archive: " + gz.errorMessage()));
            }
            if (typeflag == TAR_GNU_LONGNAME) {
                long_name = data.c_str();
            } else if (typeflag == TAR_GNU_LONGLINK) {
                long_link = data.c_str();
            } else if (typeflag == TAR_PAX_HEADER) {
                pax = parse_pax_records(data);
            } else {
                for (auto& kv : parse_pax_records(data)) pax_global[kv.first] = kv.second;
            }
            continue;
        }

        // Resolve name: GNU long name > pax path > ustar prefix/name
        std::string path;
        if (!long_name.empty()) {
            path = long_name;
        } else if (pax.count("path")) {
            path = pax["path"];
        } else if (pax_global.count("path")) {
            path = pax_global["path"];
        } else {
            if (std::memcmp(header.magic, "ustar", 5) == 0 && header.magic[5] == '\0' &&
                header.prefix[0] != '\0') {
                path = field(header.prefix, TAR_PREFIX_SIZE) + "/";
            }
            path += field(header.name, TAR_NAME_SIZE);
        }

        std::string link = !long_link.empty() ? long_link
                         : pax.count("linkpath") ? pax["linkpath"]
                         : field(header.linkname, TAR_LINKNAME_SIZE);

        if (pax.count("size")) {
            try {
                size = std::stoull(pax["size"]);
            } catch (const std::exception&) {
                return Result<void>::err(tar_error("bad pax size for " + path));
            }
        }

        long_name.clear();
        long_link.clear();
        pax.clear();

        while (!path.empty() && path.back() == '/') path.pop_back();
        if (path.rfind("./", 0) == 0) path = path.substr(2);

        bool has_data = typeflag == TAR_REGTYPE || typeflag == TAR_AREGTYPE ||
                        typeflag == TAR_CONTTYPE;

        if (path.empty() || path == ".") {
            if (!gz.skip(has_data ? size + padding_for(size) : 0)) {
                return Result<void>::err(tar_error("truncated archive: " + gz.errorMessage()));
            }
            continue;
        }

        auto rel = safe_entry_path(path, dest_dir);
        if (rel.isErr()) {
            return Result<void>::err(rel.error());
        }
        fs::path full = fs::path(dest_dir) / rel.value();
        uint64_t mode = parse_octal(header.mode, TAR_MODE_SIZE);

        if (!has_data && typeflag != TAR_DIRTYPE && typeflag != TAR_SYMTYPE &&
            typeflag != TAR_LNKTYPE) {
            spdlog::debug("skipping special tar entry {} (type {})", path, typeflag);
            if (!gz.skip(size + padding_for(size))) {
                return Result<void>::err(tar_error("truncated archive: " + gz.errorMessage()));
            }
            continue;
        }

        if (typeflag != TAR_DIRTYPE) {
            fs::create_directories(full.parent_path(), ec);
            if (ec) {
                return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                               "cannot create directory for " + path + ": " + ec.message()));
            }
        }

        if (typeflag == TAR_DIRTYPE) {
            fs::create_directories(full, ec);
            if (ec) {
                return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                               "cannot create directory " + path + ": " + ec.message()));
            }
        } else if (typeflag == TAR_SYMTYPE) {
            if (!symlink_stays_inside(rel.value(), link)) {
                return Result<void>::err(tar_error("symlink escapes extraction root: " + path + " -> " + link));
            }
            fs::remove(full, ec);
            fs::create_symlink(link, full, ec);
            if (ec) {
                return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                               "cannot create symlink " + path + ": " + ec.message()));
            }
        } else if (typeflag == TAR_LNKTYPE) {
            auto target = safe_entry_path(link, dest_dir);
            if (target.isErr()) {
                return Result<void>::err(target.error());
            }
            fs::path target_full = fs::path(dest_dir) / target.value();
            fs::remove(full, ec);
            fs::create_hard_link(target_full, full, ec);
            if (ec) {
                ec.clear();
                fs::copy_file(target_full, full, fs::copy_options::overwrite_existing, ec);
            }
            if (ec) {
                return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                               "cannot link " + path + ": " + ec.message()));
            }
        } else {
            std::ofstream out(full, std::ios::binary | std::ios::trunc);
            if (!out) {
                return Result<void>::err(Error(ErrorCode::IO_ERROR, "cannot create file " + path));
            }

            std::vector<char> buf(COPY_CHUNK);
            uint64_t remaining = size;
            while (remaining > 0) {
                if (cancel.cancelled()) {
                    return Result<void>::err(cancelled_error("extraction"));
                }
                size_t step = remaining < buf.size() ? static_cast<size_t>(remaining) : buf.size();
                if (!gz.readExact(buf.data(), step)) {
                    return Result<void>::err(tar_error("truncated archive at " + path + ": " + gz.errorMessage()));
                }
                out.write(buf.data(), static_cast<std::streamsize>(step));
                if (!out) {
                    return Result<void>::err(Error(ErrorCode::IO_ERROR, "write failed for " + path));
                }
                remaining -= step;
                emit_offset();
            }
            out.close();
            if (!gz.skip(padding_for(size))) {
                return Result<void>::err(tar_error("truncated archive: " + gz.errorMessage()));
            }
            apply_mode(full, mode);
        }

        ++entries;
        emit_offset();
    }

    spdlog::debug("unpacked {} tar entries from {}", entries, archive_path);
    emit(100);
    return Result<void>::ok();
}

} // namespace haul
