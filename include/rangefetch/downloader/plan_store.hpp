#pragma once

#include <rangefetch/downloader/downloader.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rangefetch::downloader {

/**
 * Persisted description of the partition that produced the partial files in a workspace.
 *
 * File layout (<workspace>/plan.json):
 * {
 *   "url": "http://images.cocodataset.org/zips/val2017.zip",
 *   "total_bytes": 815585330,
 *   "worker_count": 4,
 *   "segments": [[0, 203896332], [203896332, 203896332], ...]
 * }
 */
struct PlanRecord {
    std::string url;
    std::uint64_t totalBytes{0};
    std::size_t workerCount{0};
    std::vector<ByteRange> segments;

    static PlanRecord fromPlan(const TransferPlan& plan, std::size_t workerCount);

    // Same URL, size, worker count and partition.
    bool matches(const PlanRecord& other) const;
};

class PlanStore {
public:
    static constexpr const char* kFileName = "plan.json";

    explicit PlanStore(std::filesystem::path workspace);

    const std::filesystem::path& path() const noexcept { return path_; }

    // nullopt when no plan has been written. A corrupt file also reads as nullopt.
    Result<std::optional<PlanRecord>> load() const;
    Result<void> save(const PlanRecord& record) const;
    void remove() const noexcept;

private:
    std::filesystem::path path_;
};

/**
 * Make the workspace safe to resume from for `plan`:
 * - creates the workspace directory
 * - when the stored plan differs from `plan` (or partial files exist with no stored plan),
 *   every partial file in the workspace is deleted
 * - a partial file larger than its segment is deleted on its own
 * - the current plan is then written
 * Returns the number of partial files discarded.
 */
Result<std::size_t> reconcileWorkspace(const TransferPlan& plan, std::size_t workerCount);

} // namespace rangefetch::downloader
