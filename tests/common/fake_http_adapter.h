// In-memory IHttpAdapter for downloader tests
#pragma once

#include <rangefetch/downloader/downloader.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace rangefetch::tests {

/**
 * Serves a fixed payload. Every ranged GET is recorded; scripted failures are consumed one
 * per request, in order, by the next requests (for any segment) or by requests whose range
 * starts at a given offset.
 */
class FakeHttpAdapter final : public downloader::IHttpAdapter {
public:
    enum class Fault {
        ServerError,  // 503 before any byte
        ClientError,  // 404
        Transport,    // connection reset
        ShortBody,    // sends `shortBytes` bytes and closes cleanly
        IgnoresRange  // 200 with the whole entity for a non-zero offset
    };

    struct Script {
        Fault fault;
        std::optional<std::uint64_t> offset; // only for requests starting here
        std::uint64_t shortBytes{0};
    };

    explicit FakeHttpAdapter(std::string payload) : payload_(std::move(payload)) {}

    void failNext(Fault fault, std::uint64_t shortBytes = 0) {
        std::lock_guard<std::mutex> lk(mu_);
        scripts_.push_back(Script{fault, std::nullopt, shortBytes});
    }

    void failAt(std::uint64_t offset, Fault fault, std::uint64_t shortBytes = 0) {
        std::lock_guard<std::mutex> lk(mu_);
        scripts_.push_back(Script{fault, offset, shortBytes});
    }

    void setProbeLength(std::optional<std::uint64_t> len) { probeLength_ = len; }
    void setProbeError(std::optional<Error> err) { probeError_ = std::move(err); }
    void setChunkDelay(std::chrono::milliseconds d) { chunkDelay_ = d; }
    void setChunkSize(std::size_t n) { chunkSize_ = std::max<std::size_t>(n, 1); }

    std::vector<ByteRange> requests() const {
        std::lock_guard<std::mutex> lk(mu_);
        return requests_;
    }

    std::uint64_t bytesServed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return served_;
    }

    int probes() const {
        std::lock_guard<std::mutex> lk(mu_);
        return probes_;
    }

    Result<downloader::ProbeResult> probe(std::string_view) override {
        std::lock_guard<std::mutex> lk(mu_);
        ++probes_;
        if (probeError_)
            return *probeError_;
        downloader::ProbeResult r;
        r.contentLength = probeLength_.value_or(payload_.size());
        r.acceptRanges = true;
        r.httpStatus = 200;
        return r;
    }

    Result<downloader::FetchSummary> fetchRange(std::string_view, const ByteRange& range,
                                                const downloader::BodySink& sink,
                                                const downloader::ShouldCancel& shouldCancel)
        override {
        std::optional<Script> script;
        {
            std::lock_guard<std::mutex> lk(mu_);
            requests_.push_back(range);
            auto it = std::find_if(scripts_.begin(), scripts_.end(), [&](const Script& s) {
                return !s.offset || *s.offset == range.offset;
            });
            if (it != scripts_.end()) {
                script = *it;
                scripts_.erase(it);
            }
        }

        std::uint64_t limit = range.length;
        if (script) {
            switch (script->fault) {
                case Fault::ServerError:
                    return Error{ErrorCode::ServerError, "HTTP 503"};
                case Fault::ClientError:
                    return Error{ErrorCode::ClientError, "HTTP 404"};
                case Fault::Transport:
                    return Error{ErrorCode::NetworkError, "connection reset by peer"};
                case Fault::IgnoresRange:
                    if (range.offset != 0 || range.length != payload_.size())
                        return Error{ErrorCode::RangeNotSupported,
                                     "HTTP 200 for a ranged request"};
                    break;
                case Fault::ShortBody:
                    limit = std::min(limit, script->shortBytes);
                    break;
            }
        }
        if (range.offset + range.length > payload_.size()) {
            return Error{ErrorCode::ClientError, "HTTP 416"};
        }

        std::uint64_t sent = 0;
        while (sent < limit) {
            if (shouldCancel && shouldCancel())
                return Error{ErrorCode::OperationCancelled, "transfer cancelled"};
            const auto n = std::min<std::uint64_t>(chunkSize_, limit - sent);
            const auto* p =
                reinterpret_cast<const std::byte*>(payload_.data() + range.offset + sent);
            if (auto r = sink(std::span<const std::byte>(p, static_cast<std::size_t>(n))); !r)
                return r.error();
            sent += n;
            {
                std::lock_guard<std::mutex> lk(mu_);
                served_ += n;
            }
            if (chunkDelay_.count() > 0)
                std::this_thread::sleep_for(chunkDelay_);
        }
        return downloader::FetchSummary{206, sent};
    }

private:
    const std::string payload_;
    mutable std::mutex mu_;
    std::deque<Script> scripts_;
    std::vector<ByteRange> requests_;
    std::uint64_t served_{0};
    int probes_{0};
    std::optional<std::uint64_t> probeLength_;
    std::optional<Error> probeError_;
    std::chrono::milliseconds chunkDelay_{0};
    std::size_t chunkSize_{64 * 1024};
};

// Small timeouts and backoff so retry paths run in milliseconds.
inline downloader::DownloaderConfig fastConfig(std::size_t workers = 4) {
    downloader::DownloaderConfig cfg;
    cfg.workerCount = workers;
    cfg.timeout = std::chrono::milliseconds(1000);
    cfg.retry.maxAttempts = 3;
    cfg.retry.initialBackoff = std::chrono::milliseconds(1);
    cfg.retry.maxBackoff = std::chrono::milliseconds(5);
    cfg.writeBufferBytes = 64 * 1024;
    cfg.mergeBufferBytes = 64 * 1024;
    cfg.hashReadBytes = 64 * 1024;
    return cfg;
}

} // namespace rangefetch::tests
