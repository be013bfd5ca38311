/*
 * rangefetch/src/cli/rangefetch_cli.cpp
 *
 * Subcommands
 * - fetch    single-resource segmented download + verification
 * - dataset  COCO-style acquisition flow (download, verify, extract) with --train-only/--val-only
 * - verify   size + tree-hash check of a local file
 * - hash     print the tree-hash digest of a local file
 * - clean    remove archives, extracted data and partial workspaces
 *
 * Precedence for settings: CLI flag > config file > built-in default.
 */

#include <rangefetch/cli/progress_renderer.h>
#include <rangefetch/cli/rangefetch_cli.h>
#include <rangefetch/integrity/integrity_verifier.h>
#include <rangefetch/integrity/range_chunk_hasher.h>

#include <CLI/CLI.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstdint>
#include <optional>
#include <string>

namespace rangefetch::cli {

namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void onInterrupt(int) {
    g_interrupted.store(true);
}

std::string validateMd5(std::string& s) {
    if (s.size() != MD5_STRING_SIZE ||
        s.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
        return "expected a 32-character hex MD5 digest";
    }
    return {};
}

} // namespace

void installInterruptHandler() {
    std::signal(SIGINT, onInterrupt);
    std::signal(SIGTERM, onInterrupt);
}

bool interruptRequested() noexcept {
    return g_interrupted.load();
}

struct RangefetchCLI::Options {
    // Global
    std::string configPath;
    bool verbose{false};
    std::string logFile;

    // Shared by several subcommands
    std::optional<std::size_t> workers;
    std::optional<std::uint64_t> size;
    std::optional<std::string> md5;
    std::size_t digestChunks{4};
    std::optional<std::string> datasetDir;

    // fetch
    std::string url;
    std::string output;
    std::optional<std::string> workspace;

    // dataset
    bool trainOnly{false};
    bool valOnly{false};
    bool clean{false};

    // verify / hash
    std::string path;

    CLI::App* fetch{nullptr};
    CLI::App* dataset{nullptr};
    CLI::App* verify{nullptr};
    CLI::App* hash{nullptr};
    CLI::App* cleanCmd{nullptr};
};

RangefetchCLI::RangefetchCLI() : opts_(std::make_unique<Options>()) {}

RangefetchCLI::~RangefetchCLI() = default;

void RangefetchCLI::registerFetchCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("fetch", "Download one URL in parallel byte ranges, resuming "
                                            "partial files, and verify the result.");
    sub->add_option("url", opts_->url, "Source URL")->required()->check(CLI::NonEmpty());
    sub->add_option("-o,--output", opts_->output, "Destination file")->required();
    sub->add_option("-w,--workers", opts_->workers, "Parallel segments (default from config, 4)")
        ->check(CLI::Range(std::size_t{1}, config::kMaxWorkers));
    sub->add_option("--size", opts_->size, "Expected size in bytes");
    sub->add_option("--md5", opts_->md5, "Expected MD5 tree-hash (hex)")
        ->check(CLI::Validator(validateMd5, "MD5"));
    sub->add_option("--digest-chunks", opts_->digestChunks,
                    "Chunk count the reference digest was computed with")
        ->check(CLI::Range(std::size_t{1}, config::kMaxWorkers));
    sub->add_option("--workspace", opts_->workspace,
                    "Directory for partial files (default <output>.parts)");
    opts_->fetch = sub;
}

void RangefetchCLI::registerDatasetCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("dataset", "Download, verify and extract the configured "
                                              "dataset archives (COCO 2017 by default).");
    sub->add_option("--dir", opts_->datasetDir, "Dataset directory (default ~/Downloads/coco)");
    auto* train = sub->add_flag("--train-only", opts_->trainOnly, "Annotations + training set");
    auto* val = sub->add_flag("--val-only", opts_->valOnly, "Annotations + validation set");
    train->excludes(val);
    sub->add_flag("--clean", opts_->clean, "Remove all earlier artifacts first (full reset)");
    sub->add_option("-w,--workers", opts_->workers, "Parallel segments per archive")
        ->check(CLI::Range(std::size_t{1}, config::kMaxWorkers));
    opts_->dataset = sub;
}

void RangefetchCLI::registerVerifyCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("verify", "Check a file's size and MD5 tree-hash.");
    sub->add_option("path", opts_->path, "File to verify")->required();
    sub->add_option("--size", opts_->size, "Expected size in bytes");
    sub->add_option("--md5", opts_->md5, "Expected MD5 tree-hash (hex)")
        ->check(CLI::Validator(validateMd5, "MD5"));
    sub->add_option("--digest-chunks", opts_->digestChunks, "Tree-hash chunk count (default 4)")
        ->check(CLI::Range(std::size_t{1}, config::kMaxWorkers));
    opts_->verify = sub;
}

void RangefetchCLI::registerHashCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("hash", "Print the MD5 tree-hash of a file.");
    sub->add_option("path", opts_->path, "File to hash")->required()->check(CLI::ExistingFile);
    sub->add_option("--chunks", opts_->digestChunks, "Tree-hash chunk count (default 4)")
        ->check(CLI::Range(std::size_t{1}, config::kMaxWorkers));
    opts_->hash = sub;
}

void RangefetchCLI::registerCleanCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("clean", "Remove archives, extracted data and partial files.");
    sub->add_option("--dir", opts_->datasetDir, "Dataset directory (default ~/Downloads/coco)");
    opts_->cleanCmd = sub;
}

int RangefetchCLI::run(int argc, char* argv[]) {
    CLI::App app{"rangefetch - segmented, resumable downloads with tree-hash verification"};
    app.require_subcommand(1);
    app.add_option("--config", opts_->configPath,
                   "Config file (default $XDG_CONFIG_HOME/rangefetch/config.toml)");
    app.add_flag("-v,--verbose", opts_->verbose, "Debug logging");
    app.add_option("--log-file", opts_->logFile, "Also log to this file (rotating)");

    registerFetchCommand(app);
    registerDatasetCommand(app);
    registerVerifyCommand(app);
    registerHashCommand(app);
    registerCleanCommand(app);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    setupLogging(opts_->verbose, opts_->logFile);
    installInterruptHandler();

    if (opts_->fetch->parsed())
        return runFetch();
    if (opts_->dataset->parsed())
        return runDataset();
    if (opts_->verify->parsed())
        return runVerify();
    if (opts_->hash->parsed())
        return runHash();
    if (opts_->cleanCmd->parsed())
        return runClean();
    return kExitUsage;
}

Result<downloader::DownloaderConfig> RangefetchCLI::downloaderConfig() const {
    const auto path = config::get_config_path(opts_->configPath);
    if (!opts_->configPath.empty() && !fs::exists(path)) {
        return Error{ErrorCode::FileNotFound, "config file not found: " + path.string()};
    }
    auto cfg = config::loadDownloaderConfig(config::parse_config_file(path));
    if (!cfg) {
        return cfg.error();
    }
    auto out = cfg.value();
    if (opts_->workers)
        out.workerCount = *opts_->workers;
    return out;
}

Result<acquisition::DatasetConfig> RangefetchCLI::datasetConfig() const {
    const auto path = config::get_config_path(opts_->configPath);
    if (!opts_->configPath.empty() && !fs::exists(path)) {
        return Error{ErrorCode::FileNotFound, "config file not found: " + path.string()};
    }
    auto ds = config::loadDatasetConfig(config::parse_config_file(path));
    if (!ds) {
        return ds.error();
    }
    auto out = ds.value();
    if (opts_->datasetDir)
        out.dir = config::expand_tilde(*opts_->datasetDir);
    return out;
}

int RangefetchCLI::runFetch() {
    auto cfg = downloaderConfig();
    if (!cfg) {
        spdlog::error("{}", cfg.error().message);
        return kExitUsage;
    }

    downloader::Resource resource;
    resource.url = opts_->url;
    resource.destination = config::expand_tilde(opts_->output);
    resource.expectedSize = opts_->size;
    if (opts_->md5)
        resource.expectedDigest = integrity::DigestSpec{*opts_->md5, opts_->digestChunks};
    if (opts_->workspace)
        resource.workspace = config::expand_tilde(*opts_->workspace);

    downloader::TransferCoordinator coordinator(cfg.value());
    ProgressRenderer renderer(coordinator.progress());
    renderer.setTickCallback([&coordinator]() {
        if (interruptRequested() && !coordinator.cancelled()) {
            spdlog::warn("interrupted; stopping segments (partial files are kept)");
            coordinator.cancel();
        }
    });
    renderer.start();
    auto result = coordinator.fetch(resource);
    renderer.stop();

    if (!result) {
        if (result.error().code == ErrorCode::OperationCancelled)
            return kExitInterrupted;
        spdlog::error("{}", result.error().message);
        return kExitFailure;
    }
    fmt::print("{}\n", result.value().path.string());
    return kExitOk;
}

int RangefetchCLI::runDataset() {
    auto cfg = downloaderConfig();
    if (!cfg) {
        spdlog::error("{}", cfg.error().message);
        return kExitUsage;
    }
    auto ds = datasetConfig();
    if (!ds) {
        spdlog::error("{}", ds.error().message);
        return kExitUsage;
    }
    const auto& dataset = ds.value();

    if (opts_->clean) {
        auto removed = acquisition::cleanDatasetDirectory(dataset.dir, dataset.resources);
        spdlog::info("clean: {} item(s) removed", removed.size());
    }

    const auto selection = opts_->trainOnly ? acquisition::Selection::TrainOnly
                           : opts_->valOnly ? acquisition::Selection::ValOnly
                                            : acquisition::Selection::All;

    downloader::TransferCoordinator coordinator(cfg.value());
    acquisition::DatasetAcquisitionFlow flow(dataset, coordinator);

    ProgressRenderer renderer(coordinator.progress());
    renderer.setTickCallback([&coordinator]() {
        if (interruptRequested() && !coordinator.cancelled()) {
            spdlog::warn("interrupted; stopping segments (partial files are kept)");
            coordinator.cancel();
        }
    });
    renderer.start();
    auto report = flow.run(selection);
    renderer.stop();

    for (const auto& o : report.outcomes) {
        std::string detail;
        if (o.skipped)
            detail = " (already present)";
        else if (o.reusedArchive)
            detail = " (reused verified archive)";
        else if (o.error)
            detail = " (" + o.error->message + ")";
        fmt::print("{:<14} {}{}\n", o.name, acquisition::stateToString(o.state), detail);
    }
    if (report.allExtracted())
        return kExitOk;
    return interruptRequested() ? kExitInterrupted : kExitFailure;
}

int RangefetchCLI::runVerify() {
    auto cfg = downloaderConfig();
    if (!cfg) {
        spdlog::error("{}", cfg.error().message);
        return kExitUsage;
    }
    integrity::RangeHasherConfig hc;
    hc.readBufferBytes = cfg.value().hashReadBytes;
    integrity::IntegrityVerifier verifier(std::make_shared<integrity::RangeChunkHasher>(hc));

    std::optional<integrity::DigestSpec> digest;
    if (opts_->md5)
        digest = integrity::DigestSpec{*opts_->md5, opts_->digestChunks};

    auto vr = verifier.verify(opts_->path, opts_->size, digest);
    fmt::print("{} {}: {}\n", vr.ok ? "OK" : "FAILED", opts_->path, vr.reason);
    return vr.ok ? kExitOk : kExitFailure;
}

int RangefetchCLI::runHash() {
    auto cfg = downloaderConfig();
    if (!cfg) {
        spdlog::error("{}", cfg.error().message);
        return kExitUsage;
    }
    integrity::RangeHasherConfig hc;
    hc.readBufferBytes = cfg.value().hashReadBytes;
    integrity::RangeChunkHasher hasher(hc);

    auto digest = hasher.digest(opts_->path, opts_->digestChunks);
    if (!digest) {
        spdlog::error("{}", digest.error().message);
        return kExitFailure;
    }
    fmt::print("{}  {}\n", digest.value(), opts_->path);
    return kExitOk;
}

int RangefetchCLI::runClean() {
    auto ds = datasetConfig();
    if (!ds) {
        spdlog::error("{}", ds.error().message);
        return kExitUsage;
    }
    const auto removed = acquisition::cleanDatasetDirectory(ds.value().dir, ds.value().resources);
    for (const auto& p : removed)
        fmt::print("removed {}\n", p.string());
    fmt::print("{} item(s) removed from {}\n", removed.size(), ds.value().dir.string());
    return kExitOk;
}

} // namespace rangefetch::cli
