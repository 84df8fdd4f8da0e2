/**
 * Implementation file for logging.h
 */
#include <memory>
#include <vector>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include "logging.h"

namespace {
    const char *const LOG_PATTERN = "[%H:%M:%S] [%^%l%$] %v";
}

void recsvc::initLogging(const std::string &level, const std::string &logFile) {
    spdlog::level::level_enum lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        throw std::runtime_error("Unknown log level '" + level + "'");
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!logFile.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile));
        } catch (const spdlog::spdlog_ex &e) {
            throw std::runtime_error("Failed to open log file " + logFile + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("recsvc", sinks.begin(), sinks.end());
    logger->set_pattern(LOG_PATTERN);
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}
