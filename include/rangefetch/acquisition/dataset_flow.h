#pragma once

#include <rangefetch/acquisition/archive_extractor.h>
#include <rangefetch/acquisition/resource_spec.h>
#include <rangefetch/core/types.h>
#include <rangefetch/downloader/transfer_coordinator.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rangefetch::acquisition {

// Per-resource lifecycle. Extracted and Failed are terminal.
enum class AcquisitionState { Absent, Downloading, Merging, Verifying, Extracted, Failed };

const char* stateToString(AcquisitionState state);

struct ResourceOutcome {
    std::string name;
    AcquisitionState state{AcquisitionState::Absent};
    std::optional<Error> error;
    bool skipped{false};         // marker was already present
    bool reusedArchive{false};   // a verified archive from an earlier run was extracted
};

struct AcquisitionReport {
    std::vector<ResourceOutcome> outcomes;

    bool allExtracted() const;
    std::size_t failedCount() const;
};

enum class Selection { All, TrainOnly, ValOnly };

// Annotations are part of every selection.
std::vector<ResourceSpec> selectResources(const std::vector<ResourceSpec>& resources,
                                          Selection selection);

using StateCallback = std::function<void(const std::string& resource, AcquisitionState)>;

/**
 * Sequences independent dataset resources through
 * download -> merge -> verify -> extract, skipping resources whose marker already exists.
 * A failure ends that resource in Failed and the next resource is still processed.
 */
class DatasetAcquisitionFlow {
public:
    DatasetAcquisitionFlow(DatasetConfig config, downloader::TransferCoordinator& coordinator,
                           std::shared_ptr<IArchiveExtractor> extractor = nullptr);

    AcquisitionReport run(Selection selection = Selection::All);

    void setStateCallback(StateCallback cb) { onState_ = std::move(cb); }

    const DatasetConfig& config() const noexcept { return config_; }

private:
    ResourceOutcome acquire(const ResourceSpec& spec);
    void transition(ResourceOutcome& outcome, AcquisitionState next);
    void fail(ResourceOutcome& outcome, Error error);
    void status(const std::string& resource, std::string message);

    DatasetConfig config_;
    downloader::TransferCoordinator& coordinator_;
    std::shared_ptr<IArchiveExtractor> extractor_;
    StateCallback onState_;
};

/**
 * Full reset: removes every resource's archive, extracted marker root and partial-file
 * workspace under `dir`, plus the sample image written by the dataset consumer.
 * Missing items are ignored. Returns the removed paths.
 */
std::vector<std::filesystem::path> cleanDatasetDirectory(const std::filesystem::path& dir,
                                                         const std::vector<ResourceSpec>& resources);

} // namespace rangefetch::acquisition
