#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>
#include <rangefetch/core/types.h>

namespace rangefetch::crypto {

// Interface for content hashers
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    // Stream-based hashing
    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;

    // Raw fixed-width digest bytes; resets the hasher for reuse.
    virtual std::vector<std::uint8_t> finalizeRaw() = 0;

    // Lower-case hex digest; resets the hasher for reuse.
    virtual std::string finalize() = 0;

    // Hash `length` bytes of `path` starting at `offset`, reading `readSize` bytes at a time.
    // A file shorter than offset + length is reported as TruncatedTransfer.
    virtual Result<std::vector<std::uint8_t>> hashRange(const std::filesystem::path& path,
                                                        std::uint64_t offset,
                                                        std::uint64_t length,
                                                        std::size_t readSize) = 0;

    // Convenience method for hashing whole files
    virtual Result<std::string> hashFile(const std::filesystem::path& path) = 0;

    // Progress callback support (bytes processed, bytes requested)
    using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;
    virtual void setProgressCallback(ProgressCallback callback) = 0;
};

// MD5 implementation (OpenSSL EVP)
class MD5Hasher : public IContentHasher {
public:
    MD5Hasher();
    ~MD5Hasher() override;

    // Disable copy, enable move
    MD5Hasher(const MD5Hasher&) = delete;
    MD5Hasher& operator=(const MD5Hasher&) = delete;
    MD5Hasher(MD5Hasher&&) noexcept;
    MD5Hasher& operator=(MD5Hasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::vector<std::uint8_t> finalizeRaw() override;
    std::string finalize() override;

    Result<std::vector<std::uint8_t>> hashRange(const std::filesystem::path& path,
                                                std::uint64_t offset, std::uint64_t length,
                                                std::size_t readSize) override;

    Result<std::string> hashFile(const std::filesystem::path& path) override;

    void setProgressCallback(ProgressCallback callback) override;

    // Static utility for one-shot hashing
    static std::string hash(std::span<const std::byte> data);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// Lower-case hex encoding of raw digest bytes
std::string toHex(std::span<const std::uint8_t> bytes);

// Factory function
std::unique_ptr<IContentHasher> createMD5Hasher();

} // namespace rangefetch::crypto
