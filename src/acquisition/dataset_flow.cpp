/*
 * rangefetch/src/acquisition/dataset_flow.cpp
 *
 * Dataset acquisition sequencing. Resources are independent: each one is walked through
 * its own state machine and a failure is recorded in the report, never propagated.
 *
 *   Absent -> Downloading -> Merging -> Verifying -> Extracted
 *                 \______________\___________\_____> Failed
 *
 * An archive left by an earlier run (merged but not extracted) is verified and reused, or
 * deleted and downloaded again when it does not match.
 */

#include <rangefetch/acquisition/dataset_flow.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace rangefetch::acquisition {

namespace fs = std::filesystem;

const char* stateToString(AcquisitionState state) {
    switch (state) {
        case AcquisitionState::Absent:
            return "absent";
        case AcquisitionState::Downloading:
            return "downloading";
        case AcquisitionState::Merging:
            return "merging";
        case AcquisitionState::Verifying:
            return "verifying";
        case AcquisitionState::Extracted:
            return "extracted";
        case AcquisitionState::Failed:
            return "failed";
    }
    return "unknown";
}

bool AcquisitionReport::allExtracted() const {
    return std::all_of(outcomes.begin(), outcomes.end(), [](const ResourceOutcome& o) {
        return o.state == AcquisitionState::Extracted;
    });
}

std::size_t AcquisitionReport::failedCount() const {
    return static_cast<std::size_t>(
        std::count_if(outcomes.begin(), outcomes.end(), [](const ResourceOutcome& o) {
            return o.state != AcquisitionState::Extracted;
        }));
}

std::vector<ResourceSpec> selectResources(const std::vector<ResourceSpec>& resources,
                                          Selection selection) {
    if (selection == Selection::All)
        return resources;

    const auto wanted = selection == Selection::TrainOnly ? ResourceGroup::Train
                                                          : ResourceGroup::Val;
    std::vector<ResourceSpec> out;
    for (const auto& r : resources) {
        if (r.group == ResourceGroup::Annotations || r.group == wanted)
            out.push_back(r);
    }
    return out;
}

DatasetAcquisitionFlow::DatasetAcquisitionFlow(DatasetConfig config,
                                               downloader::TransferCoordinator& coordinator,
                                               std::shared_ptr<IArchiveExtractor> extractor)
    : config_(std::move(config)), coordinator_(coordinator), extractor_(std::move(extractor)) {
    if (!extractor_)
        extractor_ = makeLibArchiveExtractor();
}

void DatasetAcquisitionFlow::status(const std::string& resource, std::string message) {
    downloader::ProgressEvent ev;
    ev.kind = downloader::ProgressEvent::Kind::Status;
    ev.resource = resource;
    ev.message = std::move(message);
    coordinator_.progress().push(std::move(ev));
}

void DatasetAcquisitionFlow::transition(ResourceOutcome& outcome, AcquisitionState next) {
    if (outcome.state == next)
        return;
    spdlog::debug("{}: {} -> {}", outcome.name, stateToString(outcome.state),
                  stateToString(next));
    outcome.state = next;
    status(outcome.name, stateToString(next));
    if (onState_)
        onState_(outcome.name, next);
}

void DatasetAcquisitionFlow::fail(ResourceOutcome& outcome, Error error) {
    spdlog::error("{}: failed while {}: {}", outcome.name, stateToString(outcome.state),
                  error.message);
    outcome.error = std::move(error);
    transition(outcome, AcquisitionState::Failed);
}

AcquisitionReport DatasetAcquisitionFlow::run(Selection selection) {
    AcquisitionReport report;
    const auto selected = selectResources(config_.resources, selection);

    std::error_code ec;
    fs::create_directories(config_.dir, ec);
    if (ec) {
        for (const auto& spec : selected) {
            ResourceOutcome o;
            o.name = spec.name;
            fail(o, Error{ErrorCode::IoError, fmt::format("cannot create {}: {}",
                                                          config_.dir.string(), ec.message())});
            report.outcomes.push_back(std::move(o));
        }
        return report;
    }

    spdlog::info("dataset directory {} ({} resource(s))", config_.dir.string(), selected.size());
    for (const auto& spec : selected) {
        report.outcomes.push_back(acquire(spec));
    }

    const auto failed = report.failedCount();
    if (failed == 0) {
        spdlog::info("all {} resource(s) ready", report.outcomes.size());
    } else {
        spdlog::error("{} of {} resource(s) did not finish", failed, report.outcomes.size());
    }
    return report;
}

ResourceOutcome DatasetAcquisitionFlow::acquire(const ResourceSpec& spec) {
    ResourceOutcome outcome;
    outcome.name = spec.name;

    const fs::path archivePath = config_.dir / spec.archive;
    const fs::path markerPath = config_.dir / spec.marker;

    std::error_code ec;
    if (!spec.marker.empty() && fs::exists(markerPath, ec)) {
        spdlog::info("{}: already extracted ({}), skipping", spec.name, markerPath.string());
        outcome.skipped = true;
        transition(outcome, AcquisitionState::Extracted);
        return outcome;
    }
    if (coordinator_.cancelled()) {
        fail(outcome, Error{ErrorCode::OperationCancelled, "cancelled"});
        return outcome;
    }

    bool haveArchive = false;
    if (fs::exists(archivePath, ec)) {
        spdlog::info("{}: found {} from an earlier run, verifying", spec.name,
                     archivePath.filename().string());
        transition(outcome, AcquisitionState::Verifying);
        integrity::IntegrityVerifier verifier(coordinator_.hasher());
        auto vr = verifier.verify(archivePath, spec.expectedSize, spec.expectedDigest);
        if (vr.ok) {
            haveArchive = true;
            outcome.reusedArchive = true;
        } else {
            spdlog::warn("{}: existing archive rejected ({}); downloading again", spec.name,
                         vr.reason);
            fs::remove(archivePath, ec);
            if (ec) {
                fail(outcome, Error{ErrorCode::IoError,
                                    fmt::format("cannot remove invalid {}: {}",
                                                archivePath.string(), ec.message())});
                return outcome;
            }
        }
    }

    if (!haveArchive) {
        transition(outcome, AcquisitionState::Downloading);

        downloader::Resource resource;
        resource.url = spec.url;
        resource.destination = archivePath;
        resource.expectedSize = spec.expectedSize;
        resource.expectedDigest = spec.expectedDigest;

        coordinator_.setStageCallback([this, &outcome](downloader::TransferStage stage) {
            if (stage == downloader::TransferStage::Merging)
                transition(outcome, AcquisitionState::Merging);
            else if (stage == downloader::TransferStage::Verifying)
                transition(outcome, AcquisitionState::Verifying);
        });
        auto fetched = coordinator_.fetch(resource);
        coordinator_.setStageCallback(nullptr);

        if (!fetched) {
            fail(outcome, fetched.error());
            return outcome;
        }
    }

    auto extracted = extractor_->extract(archivePath, config_.dir);
    if (!extracted) {
        fail(outcome, extracted.error());
        return outcome;
    }
    if (!spec.marker.empty() && !fs::exists(markerPath, ec)) {
        fail(outcome, Error{ErrorCode::ExtractionFailed,
                            fmt::format("{} missing after extraction", markerPath.string())});
        return outcome;
    }

    transition(outcome, AcquisitionState::Extracted);
    spdlog::info("{}: ready", spec.name);
    return outcome;
}

} // namespace rangefetch::acquisition
