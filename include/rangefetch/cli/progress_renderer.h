#pragma once

#include <rangefetch/downloader/progress_channel.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <thread>

namespace rangefetch::cli {

/**
 * @brief Terminal observer for a ProgressChannel
 *
 * Runs a thread that drains the channel. On a TTY the aggregate percentage is drawn as a
 * single redrawn bar on stderr; otherwise a percentage line is written every
 * `lineInterval`. Status events are logged at info level.
 */
class ProgressRenderer {
public:
    enum class Style {
        Bar,       // [##########----------]  48.2%  392.1 MB / 815.6 MB  val2017.zip
        Percentage // [ 48%] val2017.zip (392.1 MB / 815.6 MB)
    };

    explicit ProgressRenderer(downloader::ProgressChannel& channel, Style style = Style::Bar);
    ~ProgressRenderer();

    ProgressRenderer(const ProgressRenderer&) = delete;
    ProgressRenderer& operator=(const ProgressRenderer&) = delete;

    void start();
    void stop();

    // Called from the render thread on every poll; used to forward SIGINT to the coordinator.
    void setTickCallback(std::function<void()> cb) { onTick_ = std::move(cb); }

    void setLineInterval(std::chrono::milliseconds ms) { lineInterval_ = ms; }

    // Latest aggregate event per resource (exposed for tests)
    const std::map<std::string, downloader::ProgressEvent>& latest() const { return latest_; }

private:
    void loop();
    void handle(const downloader::ProgressEvent& ev);
    void render(const downloader::ProgressEvent& ev);
    void clearLine();

    downloader::ProgressChannel& channel_;
    Style style_;
    std::atomic<bool> running_{false};
    std::thread worker_;
    std::function<void()> onTick_;
    std::map<std::string, downloader::ProgressEvent> latest_;
    std::chrono::milliseconds lineInterval_{std::chrono::seconds(5)};
    std::chrono::steady_clock::time_point lastLine_{};
    bool lineDirty_{false};
};

} // namespace rangefetch::cli
