#include <gtest/gtest.h>
#include <rangefetch/core/byte_range.h>
#include <rangefetch/core/types.h>

#include <cstdint>
#include <numeric>

using namespace rangefetch;

namespace {

void expectCovers(const std::vector<ByteRange>& ranges, std::uint64_t total) {
    std::uint64_t cursor = 0;
    for (const auto& r : ranges) {
        EXPECT_EQ(r.offset, cursor);
        cursor += r.length;
    }
    EXPECT_EQ(cursor, total);
}

} // namespace

TEST(PartitionRangeTest, EvenSplit) {
    auto ranges = partitionRange(100, 4);
    ASSERT_EQ(ranges.size(), 4u);
    for (const auto& r : ranges)
        EXPECT_EQ(r.length, 25u);
    expectCovers(ranges, 100);
}

TEST(PartitionRangeTest, LastRangeAbsorbsRemainder) {
    auto ranges = partitionRange(103, 4);
    ASSERT_EQ(ranges.size(), 4u);
    EXPECT_EQ(ranges[0].length, 25u);
    EXPECT_EQ(ranges[1].length, 25u);
    EXPECT_EQ(ranges[2].length, 25u);
    EXPECT_EQ(ranges[3].length, 28u);
    EXPECT_EQ(ranges[3].last(), 102u);
    expectCovers(ranges, 103);
}

TEST(PartitionRangeTest, CoversEveryByteForAwkwardSizes) {
    for (std::uint64_t total : {1ull, 7ull, 4096ull, 1000003ull, 18000000000ull}) {
        for (std::uint64_t parts : {1ull, 2ull, 3ull, 4ull, 7ull, 64ull}) {
            auto ranges = partitionRange(total, parts);
            ASSERT_EQ(ranges.size(), parts);
            expectCovers(ranges, total);
        }
    }
}

TEST(PartitionRangeTest, FewerBytesThanPartsLeavesLeadingRangesEmpty) {
    auto ranges = partitionRange(3, 4);
    ASSERT_EQ(ranges.size(), 4u);
    EXPECT_TRUE(ranges[0].empty());
    EXPECT_TRUE(ranges[2].empty());
    EXPECT_EQ(ranges[3].length, 3u);
    expectCovers(ranges, 3);
}

TEST(PartitionRangeTest, ZeroPartsTreatedAsOne) {
    auto ranges = partitionRange(10, 0);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0], (ByteRange{0, 10}));
}

TEST(ByteRangeTest, InclusiveLastAndExclusiveEnd) {
    ByteRange r{50, 25};
    EXPECT_EQ(r.last(), 74u);
    EXPECT_EQ(r.end(), 75u);
    EXPECT_FALSE(r.empty());
}

TEST(ResultTest, ValueAndError) {
    Result<int> ok(7);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 7);
    EXPECT_THROW((void)ok.error(), std::runtime_error);

    Result<int> bad(Error{ErrorCode::Timeout, "slow"});
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::Timeout);
    EXPECT_EQ(bad.error().message, "slow");
    EXPECT_THROW((void)bad.value(), std::runtime_error);

    Result<void> done;
    EXPECT_TRUE(done);
    Result<void> failed(ErrorCode::IoError);
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().message, "I/O error");
}

TEST(ErrorCodeTest, RetryableClassification) {
    EXPECT_TRUE(isRetryable(ErrorCode::NetworkError));
    EXPECT_TRUE(isRetryable(ErrorCode::Timeout));
    EXPECT_TRUE(isRetryable(ErrorCode::ServerError));
    EXPECT_TRUE(isRetryable(ErrorCode::TruncatedTransfer));

    EXPECT_FALSE(isRetryable(ErrorCode::ClientError));
    EXPECT_FALSE(isRetryable(ErrorCode::RangeNotSupported));
    EXPECT_FALSE(isRetryable(ErrorCode::StorageFull));
    EXPECT_FALSE(isRetryable(ErrorCode::DigestMismatch));
    EXPECT_FALSE(isRetryable(ErrorCode::OperationCancelled));
}
