#pragma once

#include <rangefetch/downloader/downloader.hpp>
#include <rangefetch/downloader/progress_channel.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>

namespace rangefetch::downloader {

/**
 * Outcome of one segment after all attempts.
 */
struct SegmentResult {
    std::size_t index{0};
    std::uint64_t resumedBytes{0}; // already on disk before this run touched the segment
    std::uint64_t fetchedBytes{0}; // written by this run
    int attempts{0};               // HTTP requests issued
    bool alreadyComplete{false};   // partial file covered the range; no request issued
};

/**
 * Downloads one byte range into its own partial file.
 *
 * Resume rule: a partial file of size S is the prefix of the range, so the request starts at
 * range.offset + S and bytes are appended. S == range.length means nothing is requested.
 * Retryable failures (5xx, transport errors, short bodies) are retried with exponential backoff
 * up to RetryPolicy::maxAttempts; every retry re-reads S from disk. 4xx and range violations
 * are terminal. Bytes are buffered up to writeBufferBytes, appended and flushed, then reported.
 */
class SegmentFetcher {
public:
    SegmentFetcher(std::shared_ptr<IHttpAdapter> http, DownloaderConfig config,
                   TransferProgress* progress = nullptr, CancellationToken cancel = {});

    Result<SegmentResult> fetch(std::string_view url, const Segment& segment);

    // Single-range form: fetch bytes [start, end] (inclusive) into partialPath and return
    // the number of bytes written by this call.
    Result<std::uint64_t> fetchRange(std::string_view url, std::uint64_t start, std::uint64_t end,
                                     const std::filesystem::path& partialPath);

private:
    Result<std::uint64_t> attempt(std::string_view url, const Segment& segment,
                                  std::uint64_t onDisk);
    bool sleepBackoff(int retry) const;
    void report(std::size_t index, std::uint64_t bytesOnDisk) const;

    std::shared_ptr<IHttpAdapter> http_;
    DownloaderConfig config_;
    TransferProgress* progress_;
    CancellationToken cancel_;
};

// Size of an existing partial file, 0 when it does not exist.
std::uint64_t partialSize(const std::filesystem::path& partialPath);

} // namespace rangefetch::downloader
