#pragma once

#include <rangefetch/downloader/downloader.hpp>
#include <rangefetch/downloader/progress_channel.hpp>
#include <rangefetch/integrity/integrity_verifier.h>
#include <rangefetch/integrity/range_chunk_hasher.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>

namespace rangefetch::downloader {

enum class TransferStage { Probing, Downloading, Merging, Verifying };

const char* stageToString(TransferStage stage);

using StageCallback = std::function<void(TransferStage)>;

/**
 * Result of a successful transfer: the verified final file and what it took to get there.
 */
struct TransferOutcome {
    std::filesystem::path path;
    std::uint64_t totalBytes{0};
    std::size_t segments{0};
    std::uint64_t resumedBytes{0};    // found in partial files from an earlier run
    std::uint64_t fetchedBytes{0};    // downloaded by this run
    std::size_t discardedPartials{0}; // stale partial files thrown away before dispatch
    integrity::VerificationResult verification;
};

/**
 * Drives one resource through probe -> plan -> parallel segment fetch -> merge -> verify.
 *
 * Segments run on a bounded Boost.Asio pool sized to the worker count. A failing segment never
 * stops its siblings; the coordinator waits for every segment to settle and then fails the
 * attempt if any segment failed, leaving all partial files in place for the next run.
 *
 * The coordinator owns the progress channel. Observers drain progress(); segment tasks publish
 * into it through a per-transfer TransferProgress.
 */
class TransferCoordinator {
public:
    explicit TransferCoordinator(DownloaderConfig config,
                                 std::shared_ptr<IHttpAdapter> http = nullptr,
                                 std::shared_ptr<integrity::IRangeHasher> hasher = nullptr,
                                 std::size_t channelCapacity = 4096);

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    // Uses config().workerCount.
    Result<TransferOutcome> fetch(const Resource& resource);
    Result<TransferOutcome> fetch(const Resource& resource, std::size_t workerCount);

    // Stops every in-flight segment; partial files are kept.
    void cancel() noexcept { cancel_.cancel(); }
    bool cancelled() const noexcept { return cancel_.cancelled(); }
    CancellationToken cancellationToken() const { return cancel_; }

    ProgressChannel& progress() noexcept { return channel_; }
    void setStageCallback(StageCallback cb) { onStage_ = std::move(cb); }

    const DownloaderConfig& config() const noexcept { return config_; }
    std::shared_ptr<integrity::IRangeHasher> hasher() const { return hasher_; }

private:
    void enter(TransferStage stage, const std::string& resource);

    DownloaderConfig config_;
    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<integrity::IRangeHasher> hasher_;
    ProgressChannel channel_;
    CancellationToken cancel_;
    StageCallback onStage_;
};

} // namespace rangefetch::downloader
