#pragma once

#include <rangefetch/core/types.h>
#include <rangefetch/integrity/range_chunk_hasher.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace rangefetch::integrity {

/**
 * Reference tree-hash digest together with the chunk count it was produced with.
 */
struct DigestSpec {
    std::string hex;       // MD5 tree-hash, hex (case-insensitive)
    std::size_t chunks{4}; // hashing scheme parameter
};

/**
 * Outcome of a size/digest check on one file
 */
struct VerificationResult {
    bool ok = false;
    ErrorCode code = ErrorCode::Success; // FileNotFound, SizeMismatch, DigestMismatch, ...
    std::string reason;
    std::uint64_t actualSize = 0;
    std::optional<Hash> actualDigest;
    bool unchecked = false; // passed only because no reference values were given

    Error toError() const { return Error{code, reason}; }
};

/**
 * Compares a local file against expected size and digest.
 *
 * The size check runs first and a mismatch returns before any hashing, so a truncated
 * multi-gigabyte file is rejected without reading it.
 */
class IntegrityVerifier {
public:
    explicit IntegrityVerifier(std::shared_ptr<IRangeHasher> hasher = nullptr);

    VerificationResult verify(const std::filesystem::path& path,
                              std::optional<std::uint64_t> expectedSize,
                              const std::optional<DigestSpec>& expectedDigest) const;

private:
    std::shared_ptr<IRangeHasher> hasher_;
};

// Case-insensitive comparison of hex digests
bool digestEquals(std::string_view a, std::string_view b);

} // namespace rangefetch::integrity
