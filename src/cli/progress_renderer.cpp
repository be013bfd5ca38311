/*
 * rangefetch/src/cli/progress_renderer.cpp
 *
 * Terminal rendering of the progress channel on stderr.
 */

#include <iomanip>
#include <iostream>
#include <sstream>
#include <rangefetch/cli/progress_renderer.h>
#include <rangefetch/cli/ui_helpers.hpp>
#include <spdlog/spdlog.h>

namespace rangefetch::cli {

using downloader::ProgressEvent;

ProgressRenderer::ProgressRenderer(downloader::ProgressChannel& channel, Style style)
    : channel_(channel), style_(style) {}

ProgressRenderer::~ProgressRenderer() {
    stop();
}

void ProgressRenderer::start() {
    if (running_.exchange(true))
        return;
    worker_ = std::thread([this]() { loop(); });
}

void ProgressRenderer::stop() {
    if (!running_.exchange(false))
        return;
    if (worker_.joinable())
        worker_.join();
    for (const auto& ev : channel_.drain())
        handle(ev);
    clearLine();
}

void ProgressRenderer::loop() {
    while (running_.load()) {
        if (onTick_)
            onTick_();
        if (auto ev = channel_.waitPop(std::chrono::milliseconds(100))) {
            handle(*ev);
            // Bursts: consume everything queued and draw once.
            for (const auto& more : channel_.drain())
                handle(more);
        }
    }
}

void ProgressRenderer::handle(const ProgressEvent& ev) {
    switch (ev.kind) {
        case ProgressEvent::Kind::Status:
            clearLine();
            spdlog::info("{}: {}", ev.resource, ev.message);
            break;
        case ProgressEvent::Kind::Aggregate:
            latest_[ev.resource] = ev;
            render(ev);
            break;
        case ProgressEvent::Kind::Segment:
            break;
    }
}

void ProgressRenderer::render(const ProgressEvent& ev) {
    std::ostringstream oss;
    const auto now = std::chrono::steady_clock::now();

    if (style_ == Style::Bar && ui::stderr_is_tty()) {
        oss << "\r\033[K" << ui::progress_bar(ev.percent / 100.0, 30) << " " << std::fixed
            << std::setprecision(1) << std::setw(5) << ev.percent << "%  "
            << ui::format_bytes(ev.bytesDone) << " / " << ui::format_bytes(ev.bytesTotal) << "  "
            << ev.resource;
        std::cerr << oss.str() << std::flush;
        lineDirty_ = true;
        return;
    }

    if (now - lastLine_ < lineInterval_ && ev.percent < 100.0)
        return;
    lastLine_ = now;
    oss << "[" << std::setw(3) << static_cast<int>(ev.percent) << "%] " << ev.resource << " ("
        << ui::format_bytes(ev.bytesDone) << " / " << ui::format_bytes(ev.bytesTotal) << ")\n";
    std::cerr << oss.str() << std::flush;
}

void ProgressRenderer::clearLine() {
    if (!lineDirty_)
        return;
    std::cerr << "\r\033[K" << std::flush;
    lineDirty_ = false;
}

} // namespace rangefetch::cli
