#pragma once

#include <rangefetch/acquisition/dataset_flow.h>
#include <rangefetch/config/app_config.h>

#include <spdlog/common.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace CLI {
class App;
}

namespace rangefetch::cli {

// Process exit codes
inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitInterrupted = 130;

// Parses trace|debug|info|warn|error|critical|off (case-insensitive).
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& s);

/**
 * Installs the default logger: colored stderr sink plus an optional rotating file sink.
 * Level precedence: RANGEFETCH_LOG_LEVEL > verbose (debug) > info.
 */
void setupLogging(bool verbose, const std::string& logFile);

// SIGINT/SIGTERM set a process-wide flag; the render thread forwards it to the coordinator.
void installInterruptHandler();
bool interruptRequested() noexcept;

/**
 * rangefetch command-line front end: fetch, dataset, verify, hash, clean.
 */
class RangefetchCLI {
public:
    RangefetchCLI();
    ~RangefetchCLI();

    int run(int argc, char* argv[]);

private:
    struct Options;

    void registerFetchCommand(CLI::App& app);
    void registerDatasetCommand(CLI::App& app);
    void registerVerifyCommand(CLI::App& app);
    void registerHashCommand(CLI::App& app);
    void registerCleanCommand(CLI::App& app);

    int runFetch();
    int runDataset();
    int runVerify();
    int runHash();
    int runClean();

    // Config file + CLI overrides
    Result<downloader::DownloaderConfig> downloaderConfig() const;
    Result<acquisition::DatasetConfig> datasetConfig() const;

    std::unique_ptr<Options> opts_;
};

} // namespace rangefetch::cli
