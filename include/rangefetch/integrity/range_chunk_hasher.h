#pragma once

#include <rangefetch/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace rangefetch::integrity {

/**
 * Digest of a file computed by hashing disjoint byte ranges independently.
 *
 * The file is split with partitionRange(size, chunks); each range is hashed with MD5, the raw
 * 16-byte range digests are concatenated in range order and the MD5 of that concatenation is
 * the result. The value depends on `chunks`: the same bytes digested with different chunk
 * counts give different results, so a reference digest is only comparable when it was produced
 * with the same chunk count (see DigestSpec).
 */
class IRangeHasher {
public:
    virtual ~IRangeHasher() = default;

    virtual Result<Hash> digest(const std::filesystem::path& path, std::size_t chunks) = 0;
};

/**
 * Configuration for the parallel range hasher
 */
struct RangeHasherConfig {
    std::size_t readBufferBytes = DEFAULT_HASH_READ_SIZE; // sequential read size per range
    std::size_t poolSize = 0;                              // worker threads; 0 = one per chunk
};

/**
 * Tree-hash combiner over a bounded Boost.Asio thread pool.
 */
class RangeChunkHasher final : public IRangeHasher {
public:
    explicit RangeChunkHasher(RangeHasherConfig config = {});

    Result<Hash> digest(const std::filesystem::path& path, std::size_t chunks) override;

    const RangeHasherConfig& config() const { return config_; }

private:
    RangeHasherConfig config_;
};

} // namespace rangefetch::integrity
