/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging.hpp"

#include <filesystem>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace helium::logging {

auto SinkFactory::createConsoleSink(spdlog::level::level_enum level,
                                    const std::string& pattern)
    -> spdlog::sink_ptr {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createRotatingFileSink(const std::string& filePath,
                                         size_t maxSize, size_t maxFiles,
                                         spdlog::level::level_enum level,
                                         const std::string& pattern)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(filePath);
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        filePath, maxSize, maxFiles);
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

void SinkFactory::ensureDirectoryExists(const std::string& filePath) {
    std::filesystem::path path(filePath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
}

auto levelFromString(const std::string& name) -> spdlog::level::level_enum {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

void initialize(const config::LoggingConfig& config) {
    auto level = levelFromString(config.level);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(SinkFactory::createConsoleSink(level, config.pattern));

    if (config.enableFile) {
        try {
            sinks.push_back(SinkFactory::createRotatingFileSink(
                config.filePath, config.maxFileSize, config.maxFiles, level,
                config.pattern));
        } catch (const std::exception& e) {
            spdlog::warn("Failed to open log file '{}': {}", config.filePath,
                         e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(DEFAULT_LOGGER_NAME,
                                                   sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::debug("Logging initialized at level {}", config.level);
}

void shutdown() {
    spdlog::shutdown();
}

}  // namespace helium::logging
