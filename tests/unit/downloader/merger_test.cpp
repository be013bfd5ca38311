#include <gtest/gtest.h>
#include <rangefetch/downloader/merger.hpp>
#include <rangefetch/downloader/plan_store.hpp>

#include "../../common/test_helpers.h"

using namespace rangefetch;
using namespace rangefetch::downloader;
namespace fs = std::filesystem;

class PartialMergerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = tests::make_temp_dir("rangefetch_merge_");
        ws_ = dir_ / "out.bin.parts";
        fs::create_directories(ws_);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    fs::path ws_;
};

TEST_F(PartialMergerTest, ConcatenatesInGivenOrderAndCleansUp) {
    const auto data = tests::random_bytes(300000, 21);
    std::vector<fs::path> parts;
    const std::size_t cuts[] = {0, 70000, 140000, 210000, 300000};
    for (std::size_t i = 0; i < 4; ++i) {
        parts.push_back(tests::write_file(ws_ / ("out.bin.part" + std::to_string(i)),
                                          data.substr(cuts[i], cuts[i + 1] - cuts[i])));
    }
    tests::write_file(ws_ / PlanStore::kFileName, "{}");

    PartialMerger merger(64 * 1024);
    auto r = merger.merge(dir_ / "out.bin", parts, ws_);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value(), data.size());
    EXPECT_EQ(tests::read_file(dir_ / "out.bin"), data);

    for (const auto& p : parts)
        EXPECT_FALSE(fs::exists(p));
    EXPECT_FALSE(fs::exists(ws_));
}

TEST_F(PartialMergerTest, TruncatesExistingOutput) {
    tests::write_file(dir_ / "out.bin", std::string(1000, 'z'));
    auto p0 = tests::write_file(ws_ / "out.bin.part0", "hello ");
    auto p1 = tests::write_file(ws_ / "out.bin.part1", "world");

    auto r = PartialMerger().merge(dir_ / "out.bin", {p0, p1}, ws_);
    ASSERT_TRUE(r);
    EXPECT_EQ(tests::read_file(dir_ / "out.bin"), "hello world");
}

TEST_F(PartialMergerTest, MissingPartialLeavesEverythingInPlace) {
    auto p0 = tests::write_file(ws_ / "out.bin.part0", "abc");
    auto missing = ws_ / "out.bin.part1";

    auto r = PartialMerger().merge(dir_ / "out.bin", {p0, missing}, ws_);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::FileNotFound);
    EXPECT_TRUE(fs::exists(p0));
    EXPECT_FALSE(fs::exists(dir_ / "out.bin"));
}

TEST_F(PartialMergerTest, NoPartialsProducesEmptyFile) {
    auto r = PartialMerger().merge(dir_ / "empty.bin", {}, ws_);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), 0u);
    ASSERT_TRUE(fs::exists(dir_ / "empty.bin"));
    EXPECT_EQ(fs::file_size(dir_ / "empty.bin"), 0u);
}
