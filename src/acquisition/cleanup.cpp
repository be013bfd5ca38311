/*
 * rangefetch/src/acquisition/cleanup.cpp
 *
 * Full reset of a dataset directory: archives, partial workspaces, extracted trees and the
 * sample image. Nothing outside the dataset directory is ever removed.
 */

#include <rangefetch/acquisition/dataset_flow.h>
#include <rangefetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <set>

namespace rangefetch::acquisition {

namespace fs = std::filesystem;

namespace {

// Written by the dataset consumer when it renders an example image.
constexpr const char* kSampleImage = "coco_sample_image.jpg";

bool isStrictlyUnder(const fs::path& dir, const fs::path& target) {
    const auto rel = target.lexically_normal().lexically_relative(dir.lexically_normal());
    if (rel.empty() || rel == ".")
        return false;
    return *rel.begin() != "..";
}

} // namespace

std::vector<fs::path> cleanDatasetDirectory(const fs::path& dir,
                                            const std::vector<ResourceSpec>& resources) {
    std::set<fs::path> targets;
    for (const auto& r : resources) {
        if (!r.archive.empty()) {
            if (isContainedRelativePath(r.archive)) {
                const auto archive = dir / r.archive;
                targets.insert(archive);
                targets.insert(downloader::defaultWorkspaceFor(archive));
            } else {
                spdlog::warn("clean: {}: archive path '{}' escapes {}; skipped", r.name,
                             r.archive.string(), dir.string());
            }
        }
        if (!r.marker.empty()) {
            if (isContainedRelativePath(r.marker)) {
                // Remove the top-level extracted directory, not just the marker file.
                targets.insert(dir / *r.marker.begin());
            } else {
                spdlog::warn("clean: {}: marker path '{}' escapes {}; skipped", r.name,
                             r.marker.string(), dir.string());
            }
        }
    }
    targets.insert(dir / kSampleImage);

    std::vector<fs::path> removed;
    for (const auto& t : targets) {
        if (!isStrictlyUnder(dir, t)) {
            spdlog::warn("clean: refusing to remove {} outside {}", t.string(), dir.string());
            continue;
        }
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(t, ec)))
            continue;
        const auto n = fs::remove_all(t, ec);
        if (ec) {
            spdlog::warn("clean: failed to remove {}: {}", t.string(), ec.message());
            continue;
        }
        if (n > 0) {
            spdlog::info("clean: removed {}", t.string());
            removed.push_back(t);
        }
    }
    if (removed.empty())
        spdlog::info("clean: nothing to remove under {}", dir.string());
    return removed;
}

} // namespace rangefetch::acquisition
