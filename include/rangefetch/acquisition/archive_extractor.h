#pragma once

#include <rangefetch/core/types.h>

#include <filesystem>
#include <memory>

namespace rangefetch::acquisition {

/**
 * Unpacks a verified archive into a directory and deletes the archive on success.
 */
class IArchiveExtractor {
public:
    virtual ~IArchiveExtractor() = default;

    // Returns the number of entries written.
    virtual Result<std::size_t> extract(const std::filesystem::path& archive,
                                        const std::filesystem::path& destDir) = 0;
};

/**
 * libarchive-backed extractor (zip, tar and every other format libarchive reads).
 * Entries with absolute paths or ".." components are refused.
 */
class LibArchiveExtractor final : public IArchiveExtractor {
public:
    Result<std::size_t> extract(const std::filesystem::path& archive,
                                const std::filesystem::path& destDir) override;
};

std::shared_ptr<IArchiveExtractor> makeLibArchiveExtractor();

} // namespace rangefetch::acquisition
