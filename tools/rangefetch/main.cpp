/*
 * rangefetch/tools/rangefetch/main.cpp
 *
 * Entry point of the rangefetch command-line tool.
 */

#include <spdlog/spdlog.h>
#include <rangefetch/cli/rangefetch_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Conservative default until RangefetchCLI::run() applies flags
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        rangefetch::cli::RangefetchCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return rangefetch::cli::kExitFailure;
    }
}
