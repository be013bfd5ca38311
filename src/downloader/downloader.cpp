/*
 * rangefetch/src/downloader/downloader.cpp
 *
 * Planning helpers shared by the coordinator and the tests.
 */

#include <rangefetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace rangefetch::downloader {

namespace fs = std::filesystem;

std::vector<ByteRange> TransferPlan::ranges() const {
    std::vector<ByteRange> out;
    out.reserve(segments.size());
    for (const auto& s : segments)
        out.push_back(s.range);
    return out;
}

std::vector<fs::path> TransferPlan::partialPaths() const {
    std::vector<fs::path> out;
    out.reserve(segments.size());
    for (const auto& s : segments)
        out.push_back(s.partialPath);
    return out;
}

fs::path defaultWorkspaceFor(const fs::path& destination) {
    auto parent = destination.parent_path();
    return parent / (destination.filename().string() + ".parts");
}

fs::path partialPathFor(const fs::path& workspace, const fs::path& destination,
                        std::size_t index) {
    return workspace / (destination.filename().string() + ".part" + std::to_string(index));
}

TransferPlan planTransfer(const Resource& resource, std::uint64_t totalBytes,
                          std::size_t workerCount) {
    TransferPlan plan;
    plan.url = resource.url;
    plan.totalBytes = totalBytes;
    plan.workspace = resource.workspace ? *resource.workspace
                                        : defaultWorkspaceFor(resource.destination);
    if (totalBytes == 0) {
        return plan;
    }

    // Fewer bytes than workers would leave empty leading segments.
    const auto count = std::min<std::uint64_t>(std::max<std::size_t>(workerCount, 1), totalBytes);
    const auto ranges = partitionRange(totalBytes, count);

    plan.segments.reserve(ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        Segment seg;
        seg.index = i;
        seg.range = ranges[i];
        seg.partialPath = partialPathFor(plan.workspace, resource.destination, i);
        plan.segments.push_back(std::move(seg));
    }
    if (count < workerCount) {
        spdlog::debug("plan: {} bytes split into {} segment(s) instead of {}", totalBytes, count,
                      workerCount);
    }
    return plan;
}

} // namespace rangefetch::downloader
