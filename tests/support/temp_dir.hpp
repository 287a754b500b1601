#pragma once

#include <haul/platform.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace haul::test {

// Scratch directory removed with everything in it on destruction
class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() / ("haul_test_" + generate_uuid());
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline void write_text(const std::string& path, const std::string& content) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_text(const std::string& path) {
    return read_file(path).value_or("");
}

// Deterministic non-repeating-looking payload of `size` bytes
inline std::string make_payload(std::size_t size) {
    std::string data(size, '\0');
    std::uint32_t x = 2463534242u;
    for (std::size_t i = 0; i < size; ++i) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        data[i] = static_cast<char>(x & 0xFF);
    }
    return data;
}

} // namespace haul::test
