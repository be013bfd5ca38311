#pragma once

/*
 * rangefetch downloader - public types and service interfaces (C++20)
 *
 * This header defines the data types shared by the segmented download engine and the
 * abstract HTTP adapter it drives. Implementations live in src/downloader.
 *
 * Design principles:
 * - One resource is split into N contiguous byte ranges, each fetched into its own partial file
 * - Partial files are named deterministically (<basename>.part<i>) so an interrupted run resumes
 * - Segments fail independently; the coordinator only joins and decides
 * - Progress flows through an explicit channel, never through global state
 */

#include <rangefetch/core/byte_range.h>
#include <rangefetch/core/types.h>
#include <rangefetch/integrity/integrity_verifier.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rangefetch::downloader {

// ===================
// Configuration
// ===================

/**
 * Retry/backoff policy for retryable segment failures (5xx, transport errors, short bodies).
 */
struct RetryPolicy {
    int maxAttempts{5};
    std::chrono::milliseconds initialBackoff{100};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};

    // Delay before retry number `retry` (1-based).
    std::chrono::milliseconds backoffFor(int retry) const;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Downloader configuration. The worker count is the size of the segment pool and the
 * number of byte ranges a resource is split into.
 */
struct DownloaderConfig {
    std::size_t workerCount{DEFAULT_WORKER_COUNT};
    std::chrono::milliseconds timeout{60000}; // connect + stall timeout per request
    RetryPolicy retry{};
    std::size_t writeBufferBytes{DEFAULT_WRITE_BUFFER_SIZE};
    std::size_t mergeBufferBytes{DEFAULT_MERGE_BUFFER_SIZE};
    std::size_t hashReadBytes{DEFAULT_HASH_READ_SIZE};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    std::string userAgent{"rangefetch/1.0"};
    bool followRedirects{true};
};

// ===================
// Data model
// ===================

/**
 * A remote file and where it should end up. Identity is the destination path.
 */
struct Resource {
    std::string url;
    std::filesystem::path destination;
    std::optional<std::uint64_t> expectedSize;
    std::optional<integrity::DigestSpec> expectedDigest;
    std::optional<std::filesystem::path> workspace; // default: <destination>.parts beside it
};

/**
 * One contiguous byte range of a resource and the partial file that buffers it.
 */
struct Segment {
    std::size_t index{0};
    ByteRange range;
    std::filesystem::path partialPath;
};

/**
 * Ordered, contiguous, non-overlapping segments covering [0, totalBytes).
 */
struct TransferPlan {
    std::string url;
    std::uint64_t totalBytes{0};
    std::filesystem::path workspace;
    std::vector<Segment> segments;

    std::vector<ByteRange> ranges() const;
    std::vector<std::filesystem::path> partialPaths() const;
};

/**
 * Progress/status event. Segment events carry the segment index; aggregate events carry
 * kAggregate. Percent is 0-100.
 */
struct ProgressEvent {
    static constexpr int kAggregate = -1;

    enum class Kind { Segment, Aggregate, Status };

    Kind kind{Kind::Segment};
    std::string resource; // destination file name
    int segment{kAggregate};
    double percent{0.0};
    std::uint64_t bytesDone{0};
    std::uint64_t bytesTotal{0};
    std::string message; // Status events only
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
};

/**
 * Cooperative cancellation flag shared between the caller and all in-flight segment tasks.
 * Copies observe the same flag.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }
    bool cancelled() const noexcept { return flag_->load(std::memory_order_acquire); }
    void reset() noexcept { flag_->store(false, std::memory_order_release); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// ===================
// HTTP adapter
// ===================

/**
 * Result of the header-only probe.
 */
struct ProbeResult {
    std::uint64_t contentLength{0};
    bool acceptRanges{false};
    long httpStatus{0};
};

/**
 * Summary of one ranged GET.
 */
struct FetchSummary {
    long httpStatus{0};
    std::uint64_t bytesReceived{0};
};

using BodySink = std::function<Result<void>(std::span<const std::byte>)>;
using ShouldCancel = std::function<bool()>;

/**
 * HTTP adapter abstraction (libcurl implementation in http_adapter_curl.cpp).
 * Implementations must be safe for concurrent use by all segment workers.
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * HEAD the resource and read its Content-Length.
     */
    virtual Result<ProbeResult> probe(std::string_view url) = 0;

    /**
     * GET `range` (Range: bytes=<first>-<last>) and stream the body into `sink`.
     * 206 is accepted. 200 is accepted only for a request that starts at byte 0 and whose
     * response length equals the requested length; any other 200 is RangeNotSupported.
     * 4xx -> ClientError, 5xx -> ServerError, transport -> NetworkError/Timeout.
     * A sink error or cancellation aborts the transfer and is returned as-is.
     */
    virtual Result<FetchSummary> fetchRange(std::string_view url, const ByteRange& range,
                                            const BodySink& sink,
                                            const ShouldCancel& shouldCancel) = 0;
};

/**
 * Decision on the status line of a ranged GET, taken before any body byte is consumed.
 * Returns true when the body is resource data, false when it is an error page (status >= 400,
 * reported from the status after the transfer). 200 is accepted only when `requested` starts
 * at byte 0 and `contentLength` equals its length; otherwise RangeNotSupported. Any other
 * status is InvalidData.
 */
Result<bool> classifyRangeResponse(long status, std::optional<std::uint64_t> contentLength,
                                   const ByteRange& requested, std::string_view url);

// Strict Content-Length header value: surrounding whitespace allowed, digits only.
std::optional<std::uint64_t> parseContentLength(std::string_view value);

/**
 * Factory for the libcurl adapter. All handles share one connection pool.
 */
std::shared_ptr<IHttpAdapter> makeCurlHttpAdapter(const DownloaderConfig& config);

// ======================
// Planning helpers
// ======================

/**
 * Workspace used for a destination when the resource does not name one:
 * <parent>/<filename>.parts
 */
std::filesystem::path defaultWorkspaceFor(const std::filesystem::path& destination);

/**
 * Deterministic partial file path: <workspace>/<filename>.part<index>
 */
std::filesystem::path partialPathFor(const std::filesystem::path& workspace,
                                     const std::filesystem::path& destination, std::size_t index);

/**
 * Partition a resource of `totalBytes` into at most `workerCount` segments. The count is
 * clamped so no segment is empty; totalBytes == 0 yields no segments.
 */
TransferPlan planTransfer(const Resource& resource, std::uint64_t totalBytes,
                          std::size_t workerCount);

} // namespace rangefetch::downloader
