#pragma once

#include <rangefetch/integrity/integrity_verifier.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rangefetch::acquisition {

// Which part of the dataset a resource belongs to; drives --train-only / --val-only.
enum class ResourceGroup { Annotations, Train, Val, Other };

const char* groupToString(ResourceGroup group);
ResourceGroup groupFromString(std::string_view s);

/**
 * One named downloadable archive of a dataset and its reference data.
 * `archive` and `marker` are relative to the dataset directory.
 */
struct ResourceSpec {
    std::string name;
    ResourceGroup group{ResourceGroup::Other};
    std::string url;
    std::filesystem::path archive;
    std::filesystem::path marker; // present once the archive has been extracted
    std::optional<std::uint64_t> expectedSize;
    std::optional<integrity::DigestSpec> expectedDigest;
};

struct DatasetConfig {
    std::filesystem::path dir;
    std::vector<ResourceSpec> resources;
};

// True for a non-empty relative path without root or ".." components, i.e. one that stays
// inside whatever directory it is joined to.
bool isContainedRelativePath(const std::filesystem::path& p);

// COCO 2017 annotations, train and val archives.
std::vector<ResourceSpec> builtinCocoResources();

} // namespace rangefetch::acquisition
