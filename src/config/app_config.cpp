/*
 * rangefetch/src/config/app_config.cpp
 *
 * Downloader and dataset settings resolved from a parsed config file.
 */

#include <rangefetch/config/app_config.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace rangefetch::config {

namespace {

constexpr const char* kDownloader = "downloader";
constexpr const char* kDataset = "dataset";
constexpr std::string_view kResourcePrefix = "resource.";

Error badValue(const std::string& section, const std::string& key, const std::string& value) {
    return Error{ErrorCode::InvalidArgument,
                 fmt::format("config: [{}] {} = '{}' is not valid", section, key, value)};
}

// Reads an unsigned integer key into `out` when present.
Result<void> readU64(const ConfigFile& f, const std::string& section, const std::string& key,
                     std::uint64_t& out) {
    if (auto raw = f.get(section, key)) {
        auto v = parse_u64(*raw);
        if (!v)
            return badValue(section, key, *raw);
        out = *v;
    }
    return {};
}

} // namespace

std::filesystem::path default_dataset_dir() {
    return expand_tilde("~/Downloads/coco");
}

Result<downloader::DownloaderConfig> loadDownloaderConfig(const ConfigFile& file) {
    downloader::DownloaderConfig cfg;
    const std::string s = kDownloader;

    std::uint64_t workers = cfg.workerCount;
    std::uint64_t timeoutMs = static_cast<std::uint64_t>(cfg.timeout.count());
    std::uint64_t maxAttempts = static_cast<std::uint64_t>(cfg.retry.maxAttempts);
    std::uint64_t initialMs = static_cast<std::uint64_t>(cfg.retry.initialBackoff.count());
    std::uint64_t maxMs = static_cast<std::uint64_t>(cfg.retry.maxBackoff.count());
    std::uint64_t writeBuf = cfg.writeBufferBytes;
    std::uint64_t mergeBuf = cfg.mergeBufferBytes;
    std::uint64_t hashBuf = cfg.hashReadBytes;

    for (auto [key, target] : {std::pair{"workers", &workers},
                               std::pair{"timeout_ms", &timeoutMs},
                               std::pair{"max_attempts", &maxAttempts},
                               std::pair{"initial_backoff_ms", &initialMs},
                               std::pair{"max_backoff_ms", &maxMs},
                               std::pair{"write_buffer_bytes", &writeBuf},
                               std::pair{"merge_buffer_bytes", &mergeBuf},
                               std::pair{"hash_read_bytes", &hashBuf}}) {
        if (auto r = readU64(file, s, key, *target); !r)
            return r.error();
    }
    if (workers < 1 || workers > kMaxWorkers) {
        return badValue(s, "workers", std::to_string(workers));
    }
    if (maxAttempts < 1) {
        return badValue(s, "max_attempts", std::to_string(maxAttempts));
    }

    cfg.workerCount = static_cast<std::size_t>(workers);
    cfg.timeout = std::chrono::milliseconds(timeoutMs);
    cfg.retry.maxAttempts = static_cast<int>(std::min<std::uint64_t>(maxAttempts, 100));
    cfg.retry.initialBackoff = std::chrono::milliseconds(initialMs);
    cfg.retry.maxBackoff = std::chrono::milliseconds(maxMs);
    cfg.writeBufferBytes = static_cast<std::size_t>(writeBuf);
    cfg.mergeBufferBytes = static_cast<std::size_t>(mergeBuf);
    cfg.hashReadBytes = static_cast<std::size_t>(hashBuf);

    if (auto raw = file.get(s, "backoff_multiplier")) {
        auto v = parse_double(*raw);
        if (!v || *v < 1.0)
            return badValue(s, "backoff_multiplier", *raw);
        cfg.retry.multiplier = *v;
    }
    if (auto raw = file.get(s, "tls_insecure")) {
        auto v = parse_bool(*raw);
        if (!v)
            return badValue(s, "tls_insecure", *raw);
        cfg.tls.insecure = *v;
    }
    if (auto raw = file.get(s, "ca_path"); raw && !raw->empty())
        cfg.tls.caPath = expand_tilde(*raw).string();
    if (auto raw = file.get(s, "proxy"); raw && !raw->empty())
        cfg.proxy = *raw;
    if (auto raw = file.get(s, "user_agent"); raw && !raw->empty())
        cfg.userAgent = *raw;

    if (cfg.tls.insecure)
        spdlog::warn("config: TLS certificate verification is disabled");
    return cfg;
}

Result<acquisition::DatasetConfig> loadDatasetConfig(const ConfigFile& file) {
    acquisition::DatasetConfig ds;
    ds.dir = default_dataset_dir();
    if (auto raw = file.get(kDataset, "dir"); raw && !raw->empty())
        ds.dir = expand_tilde(*raw);

    for (const auto& section : file.order) {
        if (section.rfind(kResourcePrefix, 0) != 0)
            continue;

        acquisition::ResourceSpec r;
        r.name = section.substr(kResourcePrefix.size());
        const auto& kv = file.sections.at(section);
        auto get = [&](const char* key) -> std::string {
            auto it = kv.find(key);
            return it == kv.end() ? std::string{} : it->second;
        };

        r.url = get("url");
        r.archive = get("archive");
        if (r.name.empty() || r.url.empty() || r.archive.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("config: [{}] needs url and archive", section)};
        }
        r.marker = get("marker");
        if (!acquisition::isContainedRelativePath(r.archive))
            return badValue(section, "archive", r.archive.string());
        if (!r.marker.empty() && !acquisition::isContainedRelativePath(r.marker))
            return badValue(section, "marker", r.marker.string());
        r.group = acquisition::groupFromString(get("group"));

        if (auto raw = get("size"); !raw.empty()) {
            auto v = parse_u64(raw);
            if (!v)
                return badValue(section, "size", raw);
            r.expectedSize = *v;
        }
        if (auto raw = get("md5"); !raw.empty()) {
            if (raw.size() != MD5_STRING_SIZE ||
                raw.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
                return badValue(section, "md5", raw);
            }
            integrity::DigestSpec d;
            d.hex = raw;
            if (auto chunks = get("digest_chunks"); !chunks.empty()) {
                auto v = parse_u64(chunks);
                if (!v || *v < 1 || *v > kMaxWorkers)
                    return badValue(section, "digest_chunks", chunks);
                d.chunks = static_cast<std::size_t>(*v);
            }
            r.expectedDigest = d;
        }
        ds.resources.push_back(std::move(r));
    }

    if (ds.resources.empty()) {
        ds.resources = acquisition::builtinCocoResources();
    }
    return ds;
}

} // namespace rangefetch::config
