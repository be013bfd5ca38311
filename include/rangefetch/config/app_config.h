#pragma once

#include <rangefetch/acquisition/resource_spec.h>
#include <rangefetch/config/config_helpers.h>
#include <rangefetch/core/types.h>
#include <rangefetch/downloader/downloader.hpp>

#include <filesystem>

namespace rangefetch::config {

inline constexpr std::size_t kMaxWorkers = 64;

// Default dataset directory: ~/Downloads/coco
std::filesystem::path default_dataset_dir();

/**
 * [downloader] section over built-in defaults. Unknown keys are ignored; a present but
 * malformed value is an InvalidArgument error naming the key.
 */
Result<downloader::DownloaderConfig> loadDownloaderConfig(const ConfigFile& file);

/**
 * [dataset] dir and [resource.<name>] sections. With no resource sections the built-in COCO
 * 2017 table is used. A resource section without url or archive is an error.
 */
Result<acquisition::DatasetConfig> loadDatasetConfig(const ConfigFile& file);

} // namespace rangefetch::config
