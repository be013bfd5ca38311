#pragma once

#include <rangefetch/downloader/downloader.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rangefetch::downloader {

// Bounded multi-producer/multi-consumer ring buffer used as a message-passing channel.
// A full channel drops its oldest element; producers never block.
// Capacity must be > 0 (not required to be power-of-two).
template <typename T> class Channel {
public:
    explicit Channel(std::size_t capacity = 4096)
        : buf_(capacity ? capacity + 1 : 2), cap_(capacity ? capacity + 1 : 2) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Returns false once the channel is closed.
    bool push(T v) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_)
                return false;
            auto next = inc(head_);
            if (next == tail_) {
                tail_ = inc(tail_);
                dropped_.fetch_add(1, std::memory_order_relaxed);
            }
            buf_[head_] = std::move(v);
            head_ = next;
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lk(mu_);
        return popLocked();
    }

    // Waits up to `timeout` for an element. Returns nullopt on timeout or when the channel is
    // closed and drained.
    std::optional<T> waitPop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait_for(lk, timeout, [this] { return head_ != tail_ || closed_; });
        return popLocked();
    }

    std::vector<T> drain() {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<T> out;
        while (auto v = popLocked())
            out.push_back(std::move(*v));
        return out;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lk(mu_);
        return head_ == tail_;
    }

    std::size_t capacity() const noexcept { return cap_ - 1; }
    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

private:
    std::optional<T> popLocked() {
        if (head_ == tail_)
            return std::nullopt;
        std::optional<T> out{std::move(buf_[tail_])};
        tail_ = inc(tail_);
        return out;
    }

    std::size_t inc(std::size_t i) const noexcept { return (++i == cap_) ? 0 : i; }

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::vector<T> buf_;
    const std::size_t cap_;
    std::size_t head_{0};
    std::size_t tail_{0};
    bool closed_{false};
    std::atomic<std::uint64_t> dropped_{0};
};

using ProgressChannel = Channel<ProgressEvent>;

/**
 * Per-transfer progress publisher. Each segment task owns exactly one byte counter and is its
 * only writer; aggregate progress is the sum of all counters read without locking. Every
 * update emits one Segment event and one Aggregate event into the channel.
 */
class TransferProgress {
public:
    TransferProgress(ProgressChannel& channel, std::string resource,
                     const std::vector<std::uint64_t>& segmentTotals);

    TransferProgress(const TransferProgress&) = delete;
    TransferProgress& operator=(const TransferProgress&) = delete;

    // Record that `segment` now has `bytesOnDisk` bytes of its range.
    void update(std::size_t segment, std::uint64_t bytesOnDisk);

    void status(std::string message);

    std::uint64_t aggregateBytes() const;
    double aggregatePercent() const;
    std::uint64_t totalBytes() const noexcept { return total_; }
    std::size_t segmentCount() const noexcept { return totals_.size(); }

    ProgressChannel& channel() noexcept { return channel_; }
    const std::string& resource() const noexcept { return resource_; }

private:
    ProgressChannel& channel_;
    std::string resource_;
    std::vector<std::uint64_t> totals_;
    std::unique_ptr<std::atomic<std::uint64_t>[]> done_;
    std::uint64_t total_{0};
};

// Percent of `done` over `total`, clamped to [0, 100]; an empty total counts as complete.
double percentOf(std::uint64_t done, std::uint64_t total);

} // namespace rangefetch::downloader
