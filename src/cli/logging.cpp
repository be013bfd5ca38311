/*
 * rangefetch/src/cli/logging.cpp
 *
 * Default spdlog logger for the command-line tool.
 */

#include <rangefetch/cli/rangefetch_cli.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <vector>

namespace rangefetch::cli {

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

void setupLogging(bool verbose, const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!logFile.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, 5 * 1024 * 1024, 3));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Failed to open log file " << logFile << ": " << e.what() << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("rangefetch", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    // Precedence: env RANGEFETCH_LOG_LEVEL > --verbose > info
    if (const char* envLvl = std::getenv("RANGEFETCH_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLogLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("ignoring unknown RANGEFETCH_LOG_LEVEL '{}'", envLvl);
    }
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

} // namespace rangefetch::cli
