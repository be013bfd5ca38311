#include <gtest/gtest.h>
#include <rangefetch/downloader/segment_fetcher.hpp>

#include "../../common/fake_http_adapter.h"
#include "../../common/test_helpers.h"

using namespace rangefetch;
using namespace rangefetch::downloader;
using rangefetch::tests::FakeHttpAdapter;
namespace fs = std::filesystem;

class SegmentFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = tests::make_temp_dir("rangefetch_segment_");
        payload_ = tests::random_bytes(1 << 20, 9);
        http_ = std::make_shared<FakeHttpAdapter>(payload_);
        http_->setChunkSize(16 * 1024);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    Segment segment(std::uint64_t offset, std::uint64_t length, std::size_t index = 1) const {
        return Segment{index, ByteRange{offset, length}, dir_ / ("f.part" + std::to_string(index))};
    }

    fs::path dir_;
    std::string payload_;
    std::shared_ptr<FakeHttpAdapter> http_;
};

TEST_F(SegmentFetcherTest, FetchesWholeRange) {
    SegmentFetcher fetcher(http_, tests::fastConfig());
    auto seg = segment(100000, 300000);
    auto r = fetcher.fetch("http://x/f", seg);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().fetchedBytes, 300000u);
    EXPECT_EQ(r.value().resumedBytes, 0u);
    EXPECT_EQ(r.value().attempts, 1);
    EXPECT_EQ(tests::read_file(seg.partialPath), payload_.substr(100000, 300000));

    auto reqs = http_->requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0], (ByteRange{100000, 300000}));
}

TEST_F(SegmentFetcherTest, ResumesFromExistingPrefix) {
    auto seg = segment(200000, 400000);
    tests::write_file(seg.partialPath, payload_.substr(200000, 150000));

    SegmentFetcher fetcher(http_, tests::fastConfig());
    auto r = fetcher.fetch("http://x/f", seg);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().resumedBytes, 150000u);
    EXPECT_EQ(r.value().fetchedBytes, 250000u);

    auto reqs = http_->requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0], (ByteRange{350000, 250000}));
    EXPECT_EQ(tests::read_file(seg.partialPath), payload_.substr(200000, 400000));
}

TEST_F(SegmentFetcherTest, CompletePartialIssuesNoRequest) {
    auto seg = segment(0, 5000, 0);
    tests::write_file(seg.partialPath, payload_.substr(0, 5000));

    SegmentFetcher fetcher(http_, tests::fastConfig());
    auto r = fetcher.fetch("http://x/f", seg);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().alreadyComplete);
    EXPECT_EQ(r.value().attempts, 0);
    EXPECT_TRUE(http_->requests().empty());
}

TEST_F(SegmentFetcherTest, OversizedPartialIsRejected) {
    auto seg = segment(0, 100, 0);
    tests::write_file(seg.partialPath, std::string(101, 'z'));

    SegmentFetcher fetcher(http_, tests::fastConfig());
    auto r = fetcher.fetch("http://x/f", seg);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidData);
    EXPECT_TRUE(http_->requests().empty());
}

TEST_F(SegmentFetcherTest, ServerErrorIsRetried) {
    http_->failNext(FakeHttpAdapter::Fault::ServerError);
    http_->failNext(FakeHttpAdapter::Fault::Transport);

    SegmentFetcher fetcher(http_, tests::fastConfig());
    auto seg = segment(0, 50000, 0);
    auto r = fetcher.fetch("http://x/f", seg);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().attempts, 3);
    EXPECT_EQ(http_->requests().size(), 3u);
    EXPECT_EQ(tests::read_file(seg.partialPath), payload_.substr(0, 50000));
}

TEST_F(SegmentFetcherTest, ClientErrorIsTerminal) {
    http_->failNext(FakeHttpAdapter::Fault::ClientError);

    SegmentFetcher fetcher(http_, tests::fastConfig());
    auto r = fetcher.fetch("http://x/f", segment(0, 50000, 0));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ClientError);
    EXPECT_EQ(http_->requests().size(), 1u);
}

TEST_F(SegmentFetcherTest, ShortBodyKeepsPrefixAndResumes) {
    http_->failNext(FakeHttpAdapter::Fault::ShortBody, 20000);

    SegmentFetcher fetcher(http_, tests::fastConfig());
    auto seg = segment(300000, 100000);
    auto r = fetcher.fetch("http://x/f", seg);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().attempts, 2);

    auto reqs = http_->requests();
    ASSERT_EQ(reqs.size(), 2u);
    EXPECT_EQ(reqs[0], (ByteRange{300000, 100000}));
    EXPECT_EQ(reqs[1], (ByteRange{320000, 80000}));
    EXPECT_EQ(tests::read_file(seg.partialPath), payload_.substr(300000, 100000));
}

TEST_F(SegmentFetcherTest, GivesUpAfterMaxAttempts) {
    for (int i = 0; i < 5; ++i)
        http_->failNext(FakeHttpAdapter::Fault::ServerError);

    auto cfg = tests::fastConfig();
    cfg.retry.maxAttempts = 3;
    SegmentFetcher fetcher(http_, cfg);
    auto r = fetcher.fetch("http://x/f", segment(0, 1000, 0));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ServerError);
    EXPECT_NE(r.error().message.find("3 attempt"), std::string::npos);
    EXPECT_EQ(http_->requests().size(), 3u);
}

TEST_F(SegmentFetcherTest, RangeIgnoredIsTerminal) {
    http_->failNext(FakeHttpAdapter::Fault::IgnoresRange);

    SegmentFetcher fetcher(http_, tests::fastConfig());
    auto r = fetcher.fetch("http://x/f", segment(4096, 4096));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::RangeNotSupported);
    EXPECT_EQ(http_->requests().size(), 1u);
}

TEST_F(SegmentFetcherTest, CancelledBeforeStart) {
    CancellationToken token;
    token.cancel();
    SegmentFetcher fetcher(http_, tests::fastConfig(), nullptr, token);
    auto r = fetcher.fetch("http://x/f", segment(0, 1000, 0));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
    EXPECT_TRUE(http_->requests().empty());
}

TEST_F(SegmentFetcherTest, ReportsProgressInBytesOnDisk) {
    ProgressChannel channel(1024);
    TransferProgress progress(channel, "f", {0, 200000});
    SegmentFetcher fetcher(http_, tests::fastConfig(), &progress);
    ASSERT_TRUE(fetcher.fetch("http://x/f", segment(0, 200000, 1)));

    EXPECT_EQ(progress.aggregateBytes(), 200000u);
    bool sawSegment = false;
    for (const auto& ev : channel.drain()) {
        if (ev.kind == ProgressEvent::Kind::Segment) {
            sawSegment = true;
            EXPECT_EQ(ev.segment, 1);
            EXPECT_LE(ev.bytesDone, 200000u);
        }
    }
    EXPECT_TRUE(sawSegment);
}

TEST_F(SegmentFetcherTest, FetchRangeInclusiveBounds) {
    SegmentFetcher fetcher(http_, tests::fastConfig());
    auto path = dir_ / "single.part";
    auto r = fetcher.fetchRange("http://x/f", 10, 19, path);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), 10u);
    EXPECT_EQ(tests::read_file(path), payload_.substr(10, 10));

    auto bad = fetcher.fetchRange("http://x/f", 20, 19, path);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
}

TEST(RetryPolicyTest, ExponentialBackoffIsCapped) {
    RetryPolicy p;
    p.initialBackoff = std::chrono::milliseconds(100);
    p.multiplier = 2.0;
    p.maxBackoff = std::chrono::milliseconds(1000);
    EXPECT_EQ(p.backoffFor(1).count(), 100);
    EXPECT_EQ(p.backoffFor(2).count(), 200);
    EXPECT_EQ(p.backoffFor(3).count(), 400);
    EXPECT_EQ(p.backoffFor(5).count(), 1000);
    EXPECT_EQ(p.backoffFor(0).count(), 100);
}
