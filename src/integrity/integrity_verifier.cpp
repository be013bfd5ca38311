/*
 * rangefetch/src/integrity/integrity_verifier.cpp
 *
 * Size + tree-hash verification of finished artifacts.
 * Order of checks: existence, size (cheap), digest (reads the whole file).
 */

#include <rangefetch/integrity/integrity_verifier.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cctype>

namespace rangefetch::integrity {

namespace fs = std::filesystem;

namespace {

double toMiB(std::uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

} // namespace

bool digestEquals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

IntegrityVerifier::IntegrityVerifier(std::shared_ptr<IRangeHasher> hasher)
    : hasher_(std::move(hasher)) {
    if (!hasher_)
        hasher_ = std::make_shared<RangeChunkHasher>();
}

VerificationResult IntegrityVerifier::verify(const fs::path& path,
                                             std::optional<std::uint64_t> expectedSize,
                                             const std::optional<DigestSpec>& expectedDigest) const {
    VerificationResult result;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        result.code = ErrorCode::FileNotFound;
        result.reason = "absent";
        return result;
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        result.code = ErrorCode::IoError;
        result.reason = fmt::format("cannot read size of {}: {}", path.string(), ec.message());
        return result;
    }
    result.actualSize = static_cast<std::uint64_t>(size);

    if (expectedSize && result.actualSize != *expectedSize) {
        result.code = ErrorCode::SizeMismatch;
        result.reason = fmt::format("size mismatch: expected {} bytes ({:.2f} MiB), actual {} "
                                    "bytes ({:.2f} MiB)",
                                    *expectedSize, toMiB(*expectedSize), result.actualSize,
                                    toMiB(result.actualSize));
        return result;
    }

    if (expectedDigest) {
        spdlog::info("Computing {}-chunk digest of {}", expectedDigest->chunks, path.string());
        auto actual = hasher_->digest(path, expectedDigest->chunks);
        if (!actual) {
            result.code = actual.error().code;
            result.reason = "digest failed: " + actual.error().message;
            return result;
        }
        result.actualDigest = actual.value();
        if (!digestEquals(actual.value(), expectedDigest->hex)) {
            result.code = ErrorCode::DigestMismatch;
            result.reason = fmt::format("digest mismatch: expected {}, actual {}",
                                        expectedDigest->hex, actual.value());
            return result;
        }
    }

    result.ok = true;
    if (!expectedSize && !expectedDigest) {
        result.unchecked = true;
        result.reason = fmt::format("no reference values; accepted {} bytes on disk unchecked",
                                    result.actualSize);
    } else {
        result.reason = "complete";
    }
    return result;
}

} // namespace rangefetch::integrity
