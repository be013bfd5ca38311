/*
 * rangefetch/src/integrity/range_chunk_hasher.cpp
 *
 * Parallel tree-hash over disjoint byte ranges of a file.
 * - Ranges come from partitionRange(size, chunks); the last range absorbs the remainder.
 * - Each range is hashed on a Boost.Asio thread pool with sequential buffered reads.
 * - Range digests are combined strictly in range order, whatever order the tasks finish in.
 */

#include <rangefetch/core/byte_range.h>
#include <rangefetch/crypto/hasher.h>
#include <rangefetch/integrity/range_chunk_hasher.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <optional>
#include <vector>

namespace rangefetch::integrity {

namespace fs = std::filesystem;

using RangeDigest = Result<std::vector<std::uint8_t>>;

RangeChunkHasher::RangeChunkHasher(RangeHasherConfig config) : config_(config) {
    if (config_.readBufferBytes == 0)
        config_.readBufferBytes = DEFAULT_HASH_READ_SIZE;
}

Result<Hash> RangeChunkHasher::digest(const fs::path& path, std::size_t chunks) {
    if (chunks == 0) {
        return Error{ErrorCode::InvalidArgument, "digest: chunk count must be at least 1"};
    }

    std::error_code ec;
    const auto fileSize = fs::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::FileNotFound,
                     "digest: cannot stat " + path.string() + ": " + ec.message()};
    }

    const auto started = std::chrono::steady_clock::now();
    const auto ranges = partitionRange(static_cast<std::uint64_t>(fileSize), chunks);
    std::vector<std::optional<RangeDigest>> digests(ranges.size());

    const std::size_t threads = config_.poolSize > 0 ? std::min(config_.poolSize, chunks) : chunks;
    {
        boost::asio::thread_pool pool(threads);
        for (std::size_t i = 0; i < ranges.size(); ++i) {
            boost::asio::post(pool, [&, i]() {
                try {
                    crypto::MD5Hasher hasher;
                    digests[i] = hasher.hashRange(path, ranges[i].offset, ranges[i].length,
                                                  config_.readBufferBytes);
                } catch (const std::exception& e) {
                    digests[i] = RangeDigest{Error{ErrorCode::InternalError, e.what()}};
                }
            });
        }
        pool.join();
    }

    crypto::MD5Hasher combiner;
    for (std::size_t i = 0; i < digests.size(); ++i) {
        const auto& d = digests[i];
        if (!d) {
            return Error{ErrorCode::InternalError,
                         "digest: range " + std::to_string(i) + " produced no result"};
        }
        if (!*d) {
            return d->error();
        }
        const auto& raw = d->value();
        combiner.update(std::as_bytes(std::span{raw.data(), raw.size()}));
    }
    auto hex = combiner.finalize();

    spdlog::debug("digest: {} ({} bytes, {} chunks) = {} in {} ms", path.string(), fileSize,
                  chunks, hex,
                  std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - started)
                      .count());
    return hex;
}

} // namespace rangefetch::integrity
