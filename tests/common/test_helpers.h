// Shared helpers for the unit tests
#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

#include <unistd.h>

namespace rangefetch::tests {

inline std::filesystem::path make_temp_dir(const std::string& prefix = "rangefetch_test_") {
    auto base = std::filesystem::temp_directory_path();
    std::random_device rd;
    std::uniform_int_distribution<unsigned> dist(0, 999999);
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" + std::to_string(dist(rd)));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

inline std::filesystem::path write_file(const std::filesystem::path& p, const std::string& data) {
    if (p.has_parent_path())
        std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
    ofs << data;
    return p;
}

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

// Deterministic pseudo-random payload
inline std::string random_bytes(std::size_t size, std::uint64_t seed = 42) {
    std::mt19937_64 gen(seed);
    std::string out(size, '\0');
    std::size_t i = 0;
    while (i < size) {
        auto v = gen();
        for (int b = 0; b < 8 && i < size; ++b, ++i)
            out[i] = static_cast<char>((v >> (b * 8)) & 0xff);
    }
    return out;
}

} // namespace rangefetch::tests
