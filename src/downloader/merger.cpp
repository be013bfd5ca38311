/*
 * rangefetch/src/downloader/merger.cpp
 *
 * Partial file concatenation:
 * - Sequential copy of each partial into the final file through one bounded buffer
 * - fsync of the output before the inputs are deleted
 * - Workspace cleanup (partials, plan.json, directory) only after a complete merge
 */

#include <rangefetch/downloader/merger.hpp>
#include <rangefetch/downloader/plan_store.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace rangefetch::downloader {

namespace fs = std::filesystem;

namespace {

Result<void> fsync_file(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
    ::close(fd);
    return {};
}

Error outputError(const fs::path& p) {
    if (errno == ENOSPC)
        return Error{ErrorCode::StorageFull, "disk full while merging into " + p.string()};
    return Error{ErrorCode::IoError, fmt::format("write failed on {}: {}", p.string(),
                                                 errno ? std::strerror(errno) : "stream error")};
}

} // namespace

PartialMerger::PartialMerger(std::size_t bufferBytes)
    : bufferBytes_(std::max<std::size_t>(bufferBytes, 64 * 1024)) {}

Result<std::uint64_t> PartialMerger::merge(const fs::path& finalPath,
                                           const std::vector<fs::path>& orderedPartials,
                                           const fs::path& workspace) const {
    std::error_code ec;
    for (const auto& p : orderedPartials) {
        if (!fs::exists(p, ec)) {
            return Error{ErrorCode::FileNotFound, "partial file missing: " + p.string()};
        }
    }
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
    }

    std::uint64_t total = 0;
    {
        errno = 0;
        std::ofstream out(finalPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IoError, "cannot open " + finalPath.string() + " for writing"};
        }

        std::vector<char> buffer(bufferBytes_);
        for (const auto& p : orderedPartials) {
            std::ifstream in(p, std::ios::binary);
            if (!in) {
                return Error{ErrorCode::IoError, "cannot open partial file " + p.string()};
            }
            std::uint64_t copied = 0;
            while (in) {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto n = in.gcount();
                if (n <= 0)
                    break;
                errno = 0;
                out.write(buffer.data(), n);
                if (!out) {
                    return outputError(finalPath);
                }
                copied += static_cast<std::uint64_t>(n);
            }
            if (in.bad()) {
                return Error{ErrorCode::IoError, "read failed on partial file " + p.string()};
            }
            spdlog::debug("merge: appended {} ({} bytes)", p.filename().string(), copied);
            total += copied;
        }

        errno = 0;
        out.flush();
        if (!out) {
            return outputError(finalPath);
        }
    }

    if (auto r = fsync_file(finalPath); !r) {
        return r.error();
    }

    for (const auto& p : orderedPartials) {
        std::error_code rmEc;
        fs::remove(p, rmEc);
        if (rmEc)
            spdlog::warn("merge: failed to remove {}: {}", p.string(), rmEc.message());
    }
    if (!workspace.empty()) {
        PlanStore(workspace).remove();
        std::error_code rmEc;
        // Leaves the directory in place if anything foreign remains in it.
        fs::remove(workspace, rmEc);
    }

    spdlog::debug("merge: {} partial(s) -> {} ({} bytes)", orderedPartials.size(),
                  finalPath.string(), total);
    return total;
}

} // namespace rangefetch::downloader
