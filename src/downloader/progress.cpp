/*
 * rangefetch/src/downloader/progress.cpp
 *
 * Per-segment byte counters and the aggregate progress events built from them.
 */

#include <rangefetch/downloader/progress_channel.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace rangefetch::downloader {

double percentOf(std::uint64_t done, std::uint64_t total) {
    if (total == 0)
        return 100.0;
    const auto pct = static_cast<double>((static_cast<long double>(done) * 100.0L) /
                                         static_cast<long double>(total));
    return std::clamp(pct, 0.0, 100.0);
}

TransferProgress::TransferProgress(ProgressChannel& channel, std::string resource,
                                   const std::vector<std::uint64_t>& segmentTotals)
    : channel_(channel), resource_(std::move(resource)), totals_(segmentTotals),
      done_(std::make_unique<std::atomic<std::uint64_t>[]>(segmentTotals.size())) {
    for (std::size_t i = 0; i < totals_.size(); ++i) {
        done_[i].store(0, std::memory_order_relaxed);
        total_ += totals_[i];
    }
}

void TransferProgress::update(std::size_t segment, std::uint64_t bytesOnDisk) {
    if (segment >= totals_.size()) {
        spdlog::debug("progress: ignoring update for unknown segment {}", segment);
        return;
    }
    done_[segment].store(bytesOnDisk, std::memory_order_relaxed);

    ProgressEvent ev;
    ev.kind = ProgressEvent::Kind::Segment;
    ev.resource = resource_;
    ev.segment = static_cast<int>(segment);
    ev.bytesDone = bytesOnDisk;
    ev.bytesTotal = totals_[segment];
    ev.percent = percentOf(bytesOnDisk, totals_[segment]);
    channel_.push(std::move(ev));

    ProgressEvent agg;
    agg.kind = ProgressEvent::Kind::Aggregate;
    agg.resource = resource_;
    agg.segment = ProgressEvent::kAggregate;
    agg.bytesDone = aggregateBytes();
    agg.bytesTotal = total_;
    agg.percent = percentOf(agg.bytesDone, total_);
    channel_.push(std::move(agg));
}

void TransferProgress::status(std::string message) {
    ProgressEvent ev;
    ev.kind = ProgressEvent::Kind::Status;
    ev.resource = resource_;
    ev.message = std::move(message);
    channel_.push(std::move(ev));
}

std::uint64_t TransferProgress::aggregateBytes() const {
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < totals_.size(); ++i)
        sum += done_[i].load(std::memory_order_relaxed);
    return sum;
}

double TransferProgress::aggregatePercent() const {
    return percentOf(aggregateBytes(), total_);
}

} // namespace rangefetch::downloader
