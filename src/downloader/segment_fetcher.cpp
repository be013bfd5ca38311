/*
 * rangefetch/src/downloader/segment_fetcher.cpp
 *
 * Resumable single-range transfer into a dedicated partial file.
 * - Existing bytes in the partial file are the prefix of the range; only the rest is requested
 * - Body bytes are staged in a fixed buffer and appended + flushed when it fills, so a crash
 *   never loses more than one buffer and progress advances per flush
 * - Retry with exponential backoff for retryable errors; backoff waits honor cancellation
 */

#include <rangefetch/downloader/segment_fetcher.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstring>
#include <fstream>
#include <thread>
#include <vector>

namespace rangefetch::downloader {

namespace fs = std::filesystem;

std::chrono::milliseconds RetryPolicy::backoffFor(int retry) const {
    if (retry < 1)
        retry = 1;
    const double base = static_cast<double>(initialBackoff.count());
    const double scaled = base * std::pow(multiplier, static_cast<double>(retry - 1));
    const double capped = std::min(scaled, static_cast<double>(maxBackoff.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::max(0.0, capped)));
}

std::uint64_t partialSize(const fs::path& partialPath) {
    std::error_code ec;
    if (!fs::exists(partialPath, ec))
        return 0;
    auto sz = fs::file_size(partialPath, ec);
    return ec ? 0 : static_cast<std::uint64_t>(sz);
}

namespace {

Error writeError(const fs::path& p, int err) {
    switch (err) {
        case ENOSPC:
            return Error{ErrorCode::StorageFull, "disk full while writing " + p.string()};
        case EACCES:
        case EPERM:
            return Error{ErrorCode::PermissionDenied, "permission denied writing " + p.string()};
        default:
            return Error{ErrorCode::IoError, "write failed on " + p.string() +
                                                 (err ? std::string(": ") + std::strerror(err)
                                                      : std::string{})};
    }
}

// Append-only writer that stages bytes and flushes in fixed-size blocks.
class PartialFileWriter {
public:
    PartialFileWriter(const fs::path& path, std::size_t bufferBytes)
        : path_(path), capacity_(std::max<std::size_t>(bufferBytes, 64 * 1024)) {
        buffer_.reserve(capacity_);
    }

    Result<void> open() {
        errno = 0;
        out_.open(path_, std::ios::binary | std::ios::out | std::ios::app);
        if (!out_.is_open()) {
            return writeError(path_, errno);
        }
        return {};
    }

    // Stage bytes; returns true when the caller should flush.
    bool stage(std::span<const std::byte> data) {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
        return buffer_.size() >= capacity_;
    }

    Result<std::uint64_t> flush() {
        if (buffer_.empty())
            return std::uint64_t{0};
        errno = 0;
        out_.write(reinterpret_cast<const char*>(buffer_.data()),
                   static_cast<std::streamsize>(buffer_.size()));
        out_.flush();
        if (!out_.good()) {
            return writeError(path_, errno);
        }
        const auto n = static_cast<std::uint64_t>(buffer_.size());
        buffer_.clear();
        return n;
    }

private:
    fs::path path_;
    std::size_t capacity_;
    std::vector<std::byte> buffer_;
    std::ofstream out_;
};

} // namespace

SegmentFetcher::SegmentFetcher(std::shared_ptr<IHttpAdapter> http, DownloaderConfig config,
                               TransferProgress* progress, CancellationToken cancel)
    : http_(std::move(http)), config_(std::move(config)), progress_(progress),
      cancel_(std::move(cancel)) {}

void SegmentFetcher::report(std::size_t index, std::uint64_t bytesOnDisk) const {
    if (progress_)
        progress_->update(index, bytesOnDisk);
}

bool SegmentFetcher::sleepBackoff(int retry) const {
    const auto deadline = std::chrono::steady_clock::now() + config_.retry.backoffFor(retry);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cancel_.cancelled())
            return false;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(50)));
    }
    return !cancel_.cancelled();
}

Result<std::uint64_t> SegmentFetcher::attempt(std::string_view url, const Segment& segment,
                                              std::uint64_t onDisk) {
    const ByteRange remaining{segment.range.offset + onDisk, segment.range.length - onDisk};

    PartialFileWriter writer(segment.partialPath, config_.writeBufferBytes);
    if (auto r = writer.open(); !r) {
        return r.error();
    }

    std::uint64_t received = 0; // accepted from the body
    std::uint64_t written = 0;  // appended to disk
    std::optional<Error> sinkError;

    BodySink sink = [&](std::span<const std::byte> data) -> Result<void> {
        if (received + data.size() > remaining.length) {
            sinkError = Error{ErrorCode::RangeNotSupported,
                              fmt::format("segment {}: server sent more than the {} requested "
                                          "bytes",
                                          segment.index, remaining.length)};
            return *sinkError;
        }
        received += data.size();
        if (writer.stage(data)) {
            auto f = writer.flush();
            if (!f) {
                sinkError = f.error();
                return f.error();
            }
            written += f.value();
            report(segment.index, onDisk + written);
        }
        return {};
    };

    spdlog::debug("segment {}: GET bytes={}-{} ({} bytes, {} already on disk)", segment.index,
                  remaining.offset, remaining.last(), remaining.length, onDisk);

    auto fetched =
        http_->fetchRange(url, remaining, sink, [this]() { return cancel_.cancelled(); });

    // Whatever reached the sink is a valid prefix of the range; keep it for the next attempt.
    auto tail = writer.flush();
    if (!tail) {
        return tail.error();
    }
    written += tail.value();
    if (written > 0)
        report(segment.index, onDisk + written);

    if (sinkError) {
        return *sinkError;
    }
    if (!fetched) {
        return fetched.error();
    }
    if (written < remaining.length) {
        return Error{ErrorCode::TruncatedTransfer,
                     fmt::format("segment {}: server closed after {} of {} bytes", segment.index,
                                 written, remaining.length)};
    }
    return written;
}

Result<SegmentResult> SegmentFetcher::fetch(std::string_view url, const Segment& segment) {
    SegmentResult result;
    result.index = segment.index;

    const auto rangeLen = segment.range.length;
    const auto initial = partialSize(segment.partialPath);
    if (initial > rangeLen) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("segment {}: partial file {} holds {} bytes, range is {}",
                                 segment.index, segment.partialPath.string(), initial, rangeLen)};
    }
    result.resumedBytes = initial;
    report(segment.index, initial);

    if (initial == rangeLen) {
        result.alreadyComplete = true;
        spdlog::debug("segment {}: already complete ({} bytes)", segment.index, rangeLen);
        return result;
    }
    if (initial > 0) {
        spdlog::info("segment {}: resuming at byte {} ({} of {} bytes on disk)", segment.index,
                     segment.range.offset + initial, initial, rangeLen);
    }

    const int maxAttempts = std::max(1, config_.retry.maxAttempts);
    Error lastError{ErrorCode::Unknown, "no attempt made"};

    for (int attemptNo = 1; attemptNo <= maxAttempts; ++attemptNo) {
        if (cancel_.cancelled()) {
            return Error{ErrorCode::OperationCancelled,
                         fmt::format("segment {} cancelled", segment.index)};
        }

        const auto onDisk = partialSize(segment.partialPath);
        if (onDisk == rangeLen) {
            break;
        }

        ++result.attempts;
        auto r = attempt(url, segment, onDisk);
        result.fetchedBytes = partialSize(segment.partialPath) - initial;

        if (r) {
            spdlog::debug("segment {}: complete after {} attempt(s)", segment.index, attemptNo);
            return result;
        }

        lastError = r.error();
        if (cancel_.cancelled() || lastError.code == ErrorCode::OperationCancelled) {
            return Error{ErrorCode::OperationCancelled,
                         fmt::format("segment {} cancelled", segment.index)};
        }
        if (!isRetryable(lastError.code)) {
            spdlog::error("segment {}: {} (not retryable)", segment.index, lastError.message);
            return lastError;
        }
        if (attemptNo == maxAttempts) {
            break;
        }

        const auto delay = config_.retry.backoffFor(attemptNo);
        spdlog::warn("segment {}: attempt {}/{} failed: {}; retrying in {} ms", segment.index,
                     attemptNo, maxAttempts, lastError.message, delay.count());
        if (!sleepBackoff(attemptNo)) {
            return Error{ErrorCode::OperationCancelled,
                         fmt::format("segment {} cancelled", segment.index)};
        }
    }

    if (partialSize(segment.partialPath) == rangeLen) {
        return result;
    }
    return Error{lastError.code, fmt::format("segment {}: giving up after {} attempt(s): {}",
                                             segment.index, result.attempts, lastError.message)};
}

Result<std::uint64_t> SegmentFetcher::fetchRange(std::string_view url, std::uint64_t start,
                                                 std::uint64_t end,
                                                 const fs::path& partialPath) {
    if (end < start) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("invalid range {}-{}", start, end)};
    }
    Segment segment;
    segment.index = 0;
    segment.range = ByteRange{start, end - start + 1};
    segment.partialPath = partialPath;

    auto r = fetch(url, segment);
    if (!r) {
        return r.error();
    }
    return r.value().fetchedBytes;
}

} // namespace rangefetch::downloader
