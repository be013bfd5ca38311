#include <gtest/gtest.h>
#include <rangefetch/downloader/downloader.hpp>

using namespace rangefetch;
using namespace rangefetch::downloader;

namespace {
constexpr const char* kUrl = "http://example.org/val2017.zip";
}

TEST(RangeResponseTest, PartialContentIsAccepted) {
    auto r = classifyRangeResponse(206, 15u, ByteRange{60, 15}, kUrl);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value());
}

TEST(RangeResponseTest, FullBodyAcceptedOnlyForWholeResourceRequest) {
    auto whole = classifyRangeResponse(200, 100u, ByteRange{0, 100}, kUrl);
    ASSERT_TRUE(whole);
    EXPECT_TRUE(whole.value());

    // Server ignored Range on a later segment
    auto later = classifyRangeResponse(200, 100u, ByteRange{25, 25}, kUrl);
    ASSERT_FALSE(later);
    EXPECT_EQ(later.error().code, ErrorCode::RangeNotSupported);
    EXPECT_FALSE(isRetryable(later.error().code));

    // First segment, but the server sent the whole resource
    auto first = classifyRangeResponse(200, 100u, ByteRange{0, 25}, kUrl);
    ASSERT_FALSE(first);
    EXPECT_EQ(first.error().code, ErrorCode::RangeNotSupported);

    auto unknownLength = classifyRangeResponse(200, std::nullopt, ByteRange{0, 100}, kUrl);
    ASSERT_FALSE(unknownLength);
    EXPECT_EQ(unknownLength.error().code, ErrorCode::RangeNotSupported);
}

TEST(RangeResponseTest, ErrorStatusBodyIsDiscarded) {
    for (long status : {404L, 416L, 500L, 503L}) {
        auto r = classifyRangeResponse(status, 42u, ByteRange{0, 10}, kUrl);
        ASSERT_TRUE(r) << status;
        EXPECT_FALSE(r.value()) << status;
    }
}

TEST(RangeResponseTest, OtherStatusesAreInvalid) {
    for (long status : {0L, 204L, 301L, 304L}) {
        auto r = classifyRangeResponse(status, 10u, ByteRange{0, 10}, kUrl);
        ASSERT_FALSE(r) << status;
        EXPECT_EQ(r.error().code, ErrorCode::InvalidData) << status;
    }
}

TEST(ContentLengthTest, ParsesStrictDecimal) {
    EXPECT_EQ(parseContentLength("815585330").value_or(0), 815585330u);
    EXPECT_EQ(parseContentLength("  19336861798 ").value_or(0), 19336861798ull);
    EXPECT_EQ(parseContentLength("0").value_or(1), 0u);
    EXPECT_FALSE(parseContentLength(""));
    EXPECT_FALSE(parseContentLength("   "));
    EXPECT_FALSE(parseContentLength("12abc"));
    EXPECT_FALSE(parseContentLength("-5"));
    EXPECT_FALSE(parseContentLength("99999999999999999999999"));
}
