/*
 * rangefetch/src/downloader/transfer_coordinator.cpp
 *
 * Segmented transfer of one resource:
 * - HEAD probe for the total size
 * - Partition into worker-count segments; reconcile the workspace against the stored plan
 * - One SegmentFetcher task per segment on a bounded thread pool, join barrier
 * - Merge in segment order, then size + tree-hash verification
 *
 * Failure handling:
 * - Segment failures are collected after the join; partial files always survive
 * - A failed merge or verification deletes the final file
 */

#include <rangefetch/downloader/merger.hpp>
#include <rangefetch/downloader/plan_store.hpp>
#include <rangefetch/downloader/segment_fetcher.hpp>
#include <rangefetch/downloader/transfer_coordinator.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <optional>
#include <vector>

namespace rangefetch::downloader {

namespace fs = std::filesystem;

const char* stageToString(TransferStage stage) {
    switch (stage) {
        case TransferStage::Probing:
            return "probing";
        case TransferStage::Downloading:
            return "downloading";
        case TransferStage::Merging:
            return "merging";
        case TransferStage::Verifying:
            return "verifying";
    }
    return "unknown";
}

namespace {

void removeQuietly(const fs::path& p) {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec)
        spdlog::warn("failed to remove {}: {}", p.string(), ec.message());
}

} // namespace

TransferCoordinator::TransferCoordinator(DownloaderConfig config,
                                         std::shared_ptr<IHttpAdapter> http,
                                         std::shared_ptr<integrity::IRangeHasher> hasher,
                                         std::size_t channelCapacity)
    : config_(std::move(config)), http_(std::move(http)), hasher_(std::move(hasher)),
      channel_(channelCapacity) {
    if (config_.workerCount == 0)
        config_.workerCount = 1;
    if (!http_)
        http_ = makeCurlHttpAdapter(config_);
    if (!hasher_) {
        integrity::RangeHasherConfig hc;
        hc.readBufferBytes = config_.hashReadBytes;
        hc.poolSize = config_.workerCount;
        hasher_ = std::make_shared<integrity::RangeChunkHasher>(hc);
    }
}

void TransferCoordinator::enter(TransferStage stage, const std::string& resource) {
    spdlog::debug("{}: {}", resource, stageToString(stage));
    if (onStage_)
        onStage_(stage);
}

Result<TransferOutcome> TransferCoordinator::fetch(const Resource& resource) {
    return fetch(resource, config_.workerCount);
}

Result<TransferOutcome> TransferCoordinator::fetch(const Resource& resource,
                                                   std::size_t workerCount) {
    if (workerCount == 0) {
        return Error{ErrorCode::InvalidArgument, "worker count must be at least 1"};
    }
    if (resource.url.empty() || resource.destination.empty()) {
        return Error{ErrorCode::InvalidArgument, "resource needs a url and a destination"};
    }
    if (cancel_.cancelled()) {
        return Error{ErrorCode::OperationCancelled, "transfer cancelled before start"};
    }

    const auto name = resource.destination.filename().string();
    const auto started = std::chrono::steady_clock::now();

    // Probe
    enter(TransferStage::Probing, name);
    auto probed = http_->probe(resource.url);
    if (!probed) {
        return Error{probed.error().code,
                     fmt::format("{}: size probe failed: {}", name, probed.error().message)};
    }
    const auto totalBytes = probed.value().contentLength;
    if (resource.expectedSize && *resource.expectedSize != totalBytes) {
        spdlog::warn("{}: server reports {} bytes, reference size is {}", name, totalBytes,
                     *resource.expectedSize);
    }

    // Plan
    auto plan = planTransfer(resource, totalBytes, workerCount);
    auto reconciled = reconcileWorkspace(plan, workerCount);
    if (!reconciled) {
        return reconciled.error();
    }

    TransferOutcome outcome;
    outcome.totalBytes = totalBytes;
    outcome.segments = plan.segments.size();
    outcome.discardedPartials = reconciled.value();

    spdlog::info("{}: {} bytes in {} segment(s), workspace {}", name, totalBytes,
                 plan.segments.size(), plan.workspace.string());

    // Dispatch
    enter(TransferStage::Downloading, name);
    std::vector<std::uint64_t> totals;
    totals.reserve(plan.segments.size());
    for (const auto& s : plan.segments)
        totals.push_back(s.range.length);
    TransferProgress progress(channel_, name, totals);

    std::vector<std::optional<Result<SegmentResult>>> results(plan.segments.size());
    if (!plan.segments.empty()) {
        boost::asio::thread_pool pool(std::min(workerCount, plan.segments.size()));
        for (std::size_t i = 0; i < plan.segments.size(); ++i) {
            boost::asio::post(pool, [&, i]() {
                try {
                    SegmentFetcher fetcher(http_, config_, &progress, cancel_);
                    results[i] = fetcher.fetch(plan.url, plan.segments[i]);
                } catch (const std::exception& e) {
                    results[i] = Result<SegmentResult>{Error{ErrorCode::InternalError, e.what()}};
                }
            });
        }
        pool.join();
    }

    // Join: every segment has settled.
    std::vector<std::string> failures;
    std::optional<ErrorCode> firstCode;
    bool anyCancelled = false;
    for (std::size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        if (!r) {
            failures.push_back(fmt::format("segment {}: no result", i));
            firstCode = firstCode.value_or(ErrorCode::InternalError);
            continue;
        }
        if (!*r) {
            const auto& err = r->error();
            anyCancelled = anyCancelled || err.code == ErrorCode::OperationCancelled;
            failures.push_back(err.message);
            firstCode = firstCode.value_or(err.code);
            continue;
        }
        outcome.resumedBytes += r->value().resumedBytes;
        outcome.fetchedBytes += r->value().fetchedBytes;
    }
    if (anyCancelled) {
        spdlog::info("{}: cancelled; partial files kept in {}", name, plan.workspace.string());
        return Error{ErrorCode::OperationCancelled, fmt::format("{}: transfer cancelled", name)};
    }
    if (!failures.empty()) {
        std::string joined;
        for (const auto& f : failures) {
            if (!joined.empty())
                joined += "; ";
            joined += f;
        }
        spdlog::error("{}: {} of {} segment(s) failed; partial files kept for resume", name,
                      failures.size(), plan.segments.size());
        return Error{*firstCode, fmt::format("{}: {} segment(s) failed: {}", name,
                                             failures.size(), joined)};
    }

    // Merge
    enter(TransferStage::Merging, name);
    progress.status("merging");
    PartialMerger merger(config_.mergeBufferBytes);
    auto merged = merger.merge(resource.destination, plan.partialPaths(), plan.workspace);
    if (!merged) {
        removeQuietly(resource.destination);
        return Error{merged.error().code,
                     fmt::format("{}: merge failed: {}", name, merged.error().message)};
    }
    if (merged.value() != totalBytes) {
        removeQuietly(resource.destination);
        return Error{ErrorCode::SizeMismatch,
                     fmt::format("{}: merged {} bytes, expected {}", name, merged.value(),
                                 totalBytes)};
    }

    // Verify
    enter(TransferStage::Verifying, name);
    progress.status("verifying");
    integrity::IntegrityVerifier verifier(hasher_);
    outcome.verification =
        verifier.verify(resource.destination, resource.expectedSize, resource.expectedDigest);
    if (!outcome.verification.ok) {
        spdlog::error("{}: verification failed: {}", name, outcome.verification.reason);
        removeQuietly(resource.destination);
        return outcome.verification.toError();
    }
    if (outcome.verification.unchecked) {
        spdlog::warn("{}: no reference size or digest; accepted {} bytes unchecked", name,
                     outcome.verification.actualSize);
    }

    outcome.path = resource.destination;
    spdlog::info("{}: complete ({} bytes, {} resumed, {} fetched) in {} ms", name, totalBytes,
                 outcome.resumedBytes, outcome.fetchedBytes,
                 std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - started)
                     .count());
    return outcome;
}

} // namespace rangefetch::downloader
