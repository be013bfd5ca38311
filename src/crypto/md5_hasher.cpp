/*
 * rangefetch/src/crypto/md5_hasher.cpp
 *
 * Streaming MD5 over OpenSSL EVP.
 */

#include <rangefetch/crypto/hasher.h>
#include <openssl/evp.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <array>
#include <fstream>

namespace rangefetch::crypto {

struct MD5Hasher::Impl {
    EVP_MD_CTX* ctx = nullptr;
    ProgressCallback progressCallback;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

MD5Hasher::MD5Hasher() : pImpl(std::make_unique<Impl>()) {
    init();
}

MD5Hasher::~MD5Hasher() = default;

MD5Hasher::MD5Hasher(MD5Hasher&&) noexcept = default;
MD5Hasher& MD5Hasher::operator=(MD5Hasher&&) noexcept = default;

void MD5Hasher::init() {
    if (EVP_DigestInit_ex(pImpl->ctx, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize MD5");
    }
}

void MD5Hasher::update(std::span<const std::byte> data) {
    if (data.empty())
        return;
    if (EVP_DigestUpdate(pImpl->ctx, data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update MD5");
    }
}

std::vector<std::uint8_t> MD5Hasher::finalizeRaw() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;

    if (EVP_DigestFinal_ex(pImpl->ctx, digest.data(), &digestLen) != 1) {
        throw std::runtime_error("Failed to finalize MD5");
    }

    // Reset for potential reuse
    init();

    return std::vector<std::uint8_t>(digest.begin(), digest.begin() + digestLen);
}

std::string MD5Hasher::finalize() {
    auto raw = finalizeRaw();
    return toHex(raw);
}

Result<std::vector<std::uint8_t>> MD5Hasher::hashRange(const std::filesystem::path& path,
                                                       std::uint64_t offset,
                                                       std::uint64_t length,
                                                       std::size_t readSize) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::FileNotFound, fmt::format("Failed to open file: {}", path.string())};
    }
    if (readSize == 0)
        readSize = DEFAULT_HASH_READ_SIZE;

    init();

    file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!file) {
        return Error{ErrorCode::IoError,
                     fmt::format("seek to {} failed on {}", offset, path.string())};
    }

    std::vector<std::byte> buffer(readSize);
    std::uint64_t remaining = length;
    std::uint64_t processed = 0;

    while (remaining > 0) {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, readSize));
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        const auto got = file.gcount();
        if (got <= 0) {
            break;
        }
        try {
            update(std::span{buffer.data(), static_cast<std::size_t>(got)});
        } catch (const std::exception& e) {
            return Error{ErrorCode::InternalError, e.what()};
        }
        remaining -= static_cast<std::uint64_t>(got);
        processed += static_cast<std::uint64_t>(got);

        if (pImpl->progressCallback) {
            pImpl->progressCallback(processed, length);
        }
    }

    if (remaining > 0) {
        init();
        return Error{ErrorCode::TruncatedTransfer,
                     fmt::format("{} ended {} bytes before range [{}, {})", path.string(),
                                 remaining, offset, offset + length)};
    }

    try {
        return finalizeRaw();
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }
}

Result<std::string> MD5Hasher::hashFile(const std::filesystem::path& path) {
    std::error_code ec;
    auto fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::FileNotFound,
                     fmt::format("Failed to stat {}: {}", path.string(), ec.message())};
    }
    auto raw = hashRange(path, 0, static_cast<std::uint64_t>(fileSize), DEFAULT_HASH_READ_SIZE);
    if (!raw) {
        return raw.error();
    }
    return toHex(raw.value());
}

void MD5Hasher::setProgressCallback(ProgressCallback callback) {
    pImpl->progressCallback = std::move(callback);
}

std::string MD5Hasher::hash(std::span<const std::byte> data) {
    MD5Hasher hasher;
    hasher.update(data);
    return hasher.finalize();
}

std::string toHex(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

std::unique_ptr<IContentHasher> createMD5Hasher() {
    return std::make_unique<MD5Hasher>();
}

} // namespace rangefetch::crypto
