#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <rangefetch/downloader/plan_store.hpp>

#include "../../common/test_helpers.h"

#include <fstream>

using namespace rangefetch;
using namespace rangefetch::downloader;
namespace fs = std::filesystem;
using json = nlohmann::json;

class PlanTransferTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = tests::make_temp_dir("rangefetch_plan_"); }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    Resource resource(const std::string& url = "http://example.org/val2017.zip") const {
        Resource r;
        r.url = url;
        r.destination = dir_ / "val2017.zip";
        return r;
    }

    fs::path dir_;
};

TEST_F(PlanTransferTest, DeterministicPartialNames) {
    auto plan = planTransfer(resource(), 100, 4);
    EXPECT_EQ(plan.workspace, dir_ / "val2017.zip.parts");
    ASSERT_EQ(plan.segments.size(), 4u);
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(plan.segments[i].index, i);
        EXPECT_EQ(plan.segments[i].partialPath,
                  dir_ / "val2017.zip.parts" / ("val2017.zip.part" + std::to_string(i)));
        EXPECT_EQ(plan.segments[i].range.length, 25u);
    }
}

TEST_F(PlanTransferTest, ExplicitWorkspace) {
    auto r = resource();
    r.workspace = dir_ / "scratch";
    auto plan = planTransfer(r, 10, 2);
    EXPECT_EQ(plan.workspace, dir_ / "scratch");
    EXPECT_EQ(plan.segments[1].partialPath, dir_ / "scratch" / "val2017.zip.part1");
}

TEST_F(PlanTransferTest, SegmentCountClampedToSize) {
    auto plan = planTransfer(resource(), 3, 8);
    ASSERT_EQ(plan.segments.size(), 3u);
    for (const auto& s : plan.segments)
        EXPECT_EQ(s.range.length, 1u);
}

TEST_F(PlanTransferTest, EmptyResourceHasNoSegments) {
    auto plan = planTransfer(resource(), 0, 4);
    EXPECT_TRUE(plan.segments.empty());
    EXPECT_EQ(plan.totalBytes, 0u);
}

TEST_F(PlanTransferTest, ZeroWorkersMeansOne) {
    auto plan = planTransfer(resource(), 10, 0);
    ASSERT_EQ(plan.segments.size(), 1u);
    EXPECT_EQ(plan.segments[0].range, (ByteRange{0, 10}));
}

TEST_F(PlanTransferTest, StoreRoundTripAndLayout) {
    auto plan = planTransfer(resource(), 103, 4);
    PlanStore store(plan.workspace);
    ASSERT_TRUE(store.save(PlanRecord::fromPlan(plan, 4)));

    std::ifstream in(store.path());
    json j;
    in >> j;
    EXPECT_EQ(j["url"].get<std::string>(), "http://example.org/val2017.zip");
    EXPECT_EQ(j["total_bytes"].get<std::uint64_t>(), 103u);
    EXPECT_EQ(j["worker_count"].get<std::size_t>(), 4u);
    ASSERT_EQ(j["segments"].size(), 4u);
    EXPECT_EQ(j["segments"][3][0].get<std::uint64_t>(), 75u);
    EXPECT_EQ(j["segments"][3][1].get<std::uint64_t>(), 28u);

    auto loaded = store.load();
    ASSERT_TRUE(loaded);
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_TRUE(loaded.value()->matches(PlanRecord::fromPlan(plan, 4)));
}

TEST_F(PlanTransferTest, CorruptStoreReadsAsAbsent) {
    auto ws = dir_ / "ws";
    tests::write_file(ws / PlanStore::kFileName, "{not json");
    auto loaded = PlanStore(ws).load();
    ASSERT_TRUE(loaded);
    EXPECT_FALSE(loaded.value().has_value());
}

TEST_F(PlanTransferTest, ReconcileKeepsPartialsForSamePlan) {
    auto plan = planTransfer(resource(), 100, 4);
    ASSERT_TRUE(reconcileWorkspace(plan, 4));
    tests::write_file(plan.segments[2].partialPath, std::string(10, 'a'));

    auto again = reconcileWorkspace(plan, 4);
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value(), 0u);
    EXPECT_TRUE(fs::exists(plan.segments[2].partialPath));
}

TEST_F(PlanTransferTest, ReconcileDiscardsPartialsWhenWorkerCountChanges) {
    auto four = planTransfer(resource(), 100, 4);
    ASSERT_TRUE(reconcileWorkspace(four, 4));
    tests::write_file(four.segments[0].partialPath, std::string(25, 'a'));
    tests::write_file(four.segments[1].partialPath, std::string(5, 'b'));

    auto two = planTransfer(resource(), 100, 2);
    auto r = reconcileWorkspace(two, 2);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), 2u);
    EXPECT_FALSE(fs::exists(four.segments[0].partialPath));
    EXPECT_FALSE(fs::exists(four.segments[1].partialPath));

    auto stored = PlanStore(two.workspace).load();
    ASSERT_TRUE(stored && stored.value());
    EXPECT_EQ(stored.value()->workerCount, 2u);
}

TEST_F(PlanTransferTest, ReconcileDiscardsPartialsWhenSizeChanges) {
    auto before = planTransfer(resource(), 100, 4);
    ASSERT_TRUE(reconcileWorkspace(before, 4));
    tests::write_file(before.segments[3].partialPath, std::string(20, 'x'));

    auto after = planTransfer(resource(), 120, 4);
    auto r = reconcileWorkspace(after, 4);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), 1u);
    EXPECT_FALSE(fs::exists(before.segments[3].partialPath));
}

TEST_F(PlanTransferTest, ReconcileDiscardsPartialsWithoutPlan) {
    auto plan = planTransfer(resource(), 100, 4);
    tests::write_file(plan.segments[1].partialPath, std::string(3, 'x'));
    auto r = reconcileWorkspace(plan, 4);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), 1u);
    EXPECT_TRUE(fs::exists(PlanStore(plan.workspace).path()));
}

TEST_F(PlanTransferTest, ReconcileDiscardsOversizedPartial) {
    auto plan = planTransfer(resource(), 100, 4);
    ASSERT_TRUE(reconcileWorkspace(plan, 4));
    tests::write_file(plan.segments[0].partialPath, std::string(26, 'x'));
    tests::write_file(plan.segments[1].partialPath, std::string(25, 'y'));

    auto r = reconcileWorkspace(plan, 4);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), 1u);
    EXPECT_FALSE(fs::exists(plan.segments[0].partialPath));
    EXPECT_TRUE(fs::exists(plan.segments[1].partialPath));
}
