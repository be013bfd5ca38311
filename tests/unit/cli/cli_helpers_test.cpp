#include <gtest/gtest.h>
#include <rangefetch/cli/progress_renderer.h>
#include <rangefetch/cli/rangefetch_cli.h>
#include <rangefetch/cli/ui_helpers.hpp>

#include <atomic>
#include <thread>

using namespace rangefetch;
using namespace rangefetch::cli;

TEST(ParseLogLevelTest, KnownAndUnknownNames) {
    EXPECT_EQ(parseLogLevel("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(parseLogLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("off"), spdlog::level::off);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

TEST(UiHelpersTest, ProgressBarAndBytes) {
    EXPECT_EQ(ui::progress_bar(0.5, 10), "[#####-----]");
    EXPECT_EQ(ui::progress_bar(2.0, 4), "[####]");
    EXPECT_EQ(ui::format_bytes(0), "0 B");
    EXPECT_EQ(ui::format_bytes(512), "512 B");
    EXPECT_EQ(ui::format_bytes(1536), "1.5 KB");
    EXPECT_EQ(ui::format_bytes(815ull * 1024 * 1024), "815.0 MB");
}

TEST(ProgressRendererTest, TracksLatestAggregateAndRunsTick) {
    downloader::ProgressChannel channel(64);
    ProgressRenderer renderer(channel, ProgressRenderer::Style::Percentage);
    std::atomic<int> ticks{0};
    renderer.setTickCallback([&ticks]() { ++ticks; });
    renderer.start();

    downloader::TransferProgress progress(channel, "val2017.zip", {100, 100});
    progress.update(0, 100);
    progress.update(1, 50);
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    renderer.stop();

    EXPECT_GE(ticks.load(), 1);
    auto it = renderer.latest().find("val2017.zip");
    ASSERT_NE(it, renderer.latest().end());
    EXPECT_EQ(it->second.bytesDone, 150u);
    EXPECT_TRUE(channel.empty());
}

TEST(InterruptTest, FlagStartsClear) {
    EXPECT_FALSE(interruptRequested());
}
