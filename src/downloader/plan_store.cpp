/*
 * rangefetch/src/downloader/plan_store.cpp
 *
 * JSON sidecar recording the partition behind a workspace's partial files. Partial files are
 * only trusted when the stored partition equals the one about to be used.
 */

#include <rangefetch/downloader/plan_store.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

namespace rangefetch::downloader {

namespace fs = std::filesystem;
using nlohmann::json;

PlanRecord PlanRecord::fromPlan(const TransferPlan& plan, std::size_t workerCount) {
    PlanRecord r;
    r.url = plan.url;
    r.totalBytes = plan.totalBytes;
    r.workerCount = workerCount;
    r.segments = plan.ranges();
    return r;
}

bool PlanRecord::matches(const PlanRecord& other) const {
    return url == other.url && totalBytes == other.totalBytes &&
           workerCount == other.workerCount && segments == other.segments;
}

PlanStore::PlanStore(fs::path workspace) : path_(std::move(workspace) / kFileName) {}

Result<std::optional<PlanRecord>> PlanStore::load() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return std::optional<PlanRecord>{std::nullopt};
    }
    std::ifstream in(path_);
    if (!in) {
        return Error{ErrorCode::IoError, "failed to open " + path_.string()};
    }

    json root;
    try {
        in >> root;
    } catch (const json::exception& e) {
        spdlog::warn("plan store: {} is unreadable ({}); treating as absent", path_.string(),
                     e.what());
        return std::optional<PlanRecord>{std::nullopt};
    }
    if (!root.is_object()) {
        return std::optional<PlanRecord>{std::nullopt};
    }

    PlanRecord r;
    if (root.contains("url") && root["url"].is_string())
        r.url = root["url"].get<std::string>();
    if (root.contains("total_bytes") && root["total_bytes"].is_number_unsigned())
        r.totalBytes = root["total_bytes"].get<std::uint64_t>();
    if (root.contains("worker_count") && root["worker_count"].is_number_unsigned())
        r.workerCount = root["worker_count"].get<std::size_t>();
    if (root.contains("segments") && root["segments"].is_array()) {
        for (const auto& s : root["segments"]) {
            if (s.is_array() && s.size() == 2 && s[0].is_number_unsigned() &&
                s[1].is_number_unsigned()) {
                r.segments.push_back(
                    ByteRange{s[0].get<std::uint64_t>(), s[1].get<std::uint64_t>()});
            }
        }
    }
    return std::optional<PlanRecord>{std::move(r)};
}

Result<void> PlanStore::save(const PlanRecord& record) const {
    json root;
    root["url"] = record.url;
    root["total_bytes"] = record.totalBytes;
    root["worker_count"] = record.workerCount;
    root["segments"] = json::array();
    for (const auto& s : record.segments) {
        root["segments"].push_back(json::array({s.offset, s.length}));
    }

    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IoError, "failed to open " + path_.string() + " for write"};
    }
    out << root.dump(2);
    if (!out.good()) {
        return Error{ErrorCode::IoError, "failed to write " + path_.string()};
    }
    return {};
}

void PlanStore::remove() const noexcept {
    std::error_code ec;
    fs::remove(path_, ec);
}

namespace {

bool isPartialFile(const fs::path& p) {
    return p.filename().string().find(".part") != std::string::npos &&
           p.filename() != PlanStore::kFileName;
}

std::size_t discardAllPartials(const fs::path& workspace) {
    std::size_t removed = 0;
    std::error_code ec;
    for (fs::directory_iterator it(workspace, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file() || !isPartialFile(it->path()))
            continue;
        std::error_code rmEc;
        if (fs::remove(it->path(), rmEc))
            ++removed;
        else if (rmEc)
            spdlog::warn("plan store: failed to remove {}: {}", it->path().string(),
                         rmEc.message());
    }
    return removed;
}

} // namespace

Result<std::size_t> reconcileWorkspace(const TransferPlan& plan, std::size_t workerCount) {
    std::error_code ec;
    fs::create_directories(plan.workspace, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "failed to create workspace " + plan.workspace.string() + ": " +
                         ec.message()};
    }

    PlanStore store(plan.workspace);
    const auto current = PlanRecord::fromPlan(plan, workerCount);

    auto loaded = store.load();
    if (!loaded) {
        return loaded.error();
    }
    const auto& stored = loaded.value();

    std::size_t discarded = 0;
    if (!stored) {
        discarded = discardAllPartials(plan.workspace);
        if (discarded > 0)
            spdlog::warn("workspace {}: {} partial file(s) without a plan discarded",
                         plan.workspace.string(), discarded);
    } else if (!stored->matches(current)) {
        discarded = discardAllPartials(plan.workspace);
        spdlog::warn("workspace {}: stored plan ({} bytes, {} workers) does not match current "
                     "({} bytes, {} workers); {} partial file(s) discarded",
                     plan.workspace.string(), stored->totalBytes, stored->workerCount,
                     current.totalBytes, current.workerCount, discarded);
    }

    for (const auto& seg : plan.segments) {
        std::error_code sizeEc;
        if (!fs::exists(seg.partialPath, sizeEc))
            continue;
        const auto size = fs::file_size(seg.partialPath, sizeEc);
        if (!sizeEc && size > seg.range.length) {
            spdlog::warn("segment {}: partial file holds {} bytes for a {}-byte range; discarded",
                         seg.index, size, seg.range.length);
            fs::remove(seg.partialPath, sizeEc);
            ++discarded;
        }
    }

    if (auto r = store.save(current); !r) {
        return r.error();
    }
    return discarded;
}

} // namespace rangefetch::downloader
