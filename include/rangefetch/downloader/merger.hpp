#pragma once

#include <rangefetch/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace rangefetch::downloader {

/**
 * Concatenates partial files, in the given order, into `finalPath` (created or truncated).
 *
 * Each partial is copied through a buffer of `bufferBytes`. The output file is fsync'ed
 * before any partial is touched. Only after every partial has been copied are the partials,
 * the workspace's plan.json and the (then empty) workspace directory removed. On failure the
 * partials are left in place and the half-written output is the caller's to remove.
 *
 * Returns the number of bytes written.
 */
class PartialMerger {
public:
    explicit PartialMerger(std::size_t bufferBytes = DEFAULT_MERGE_BUFFER_SIZE);

    Result<std::uint64_t> merge(const std::filesystem::path& finalPath,
                                const std::vector<std::filesystem::path>& orderedPartials,
                                const std::filesystem::path& workspace) const;

private:
    std::size_t bufferBytes_;
};

} // namespace rangefetch::downloader
