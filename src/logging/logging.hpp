/**
 * @file logging.hpp
 * @brief Logging bootstrap for the helium dispatch engine.
 *
 * Installs a default spdlog logger with a colored console sink and an
 * optional rotating file sink. Every module logs through the global
 * spdlog functions afterwards.
 *
 * @par Usage Example:
 * @code
 * helium::config::LoggingConfig cfg;
 * cfg.level = "debug";
 * helium::logging::initialize(cfg);
 * spdlog::info("engine starting");
 * @endcode
 *
 * @date 2025-01
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef HELIUM_LOGGING_LOGGING_HPP
#define HELIUM_LOGGING_LOGGING_HPP

#include <string>

#include <spdlog/spdlog.h>

#include "config/engine_config.hpp"

namespace helium::logging {

inline constexpr const char* DEFAULT_LOGGER_NAME = "helium";

/**
 * @brief Factory for the sink types the engine uses
 */
class SinkFactory {
public:
    static auto createConsoleSink(spdlog::level::level_enum level,
                                  const std::string& pattern)
        -> spdlog::sink_ptr;

    static auto createRotatingFileSink(const std::string& filePath,
                                       size_t maxSize, size_t maxFiles,
                                       spdlog::level::level_enum level,
                                       const std::string& pattern)
        -> spdlog::sink_ptr;

private:
    static void ensureDirectoryExists(const std::string& filePath);
};

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error",
 * "critical", "off"), falling back to info.
 */
[[nodiscard]] auto levelFromString(const std::string& name)
    -> spdlog::level::level_enum;

/**
 * @brief Build the sinks described by @p config and make the resulting
 * logger the spdlog default.
 *
 * A file sink that cannot be opened is skipped with a warning.
 */
void initialize(const config::LoggingConfig& config);

/**
 * @brief Flush and drop all registered loggers
 */
void shutdown();

}  // namespace helium::logging

#endif  // HELIUM_LOGGING_LOGGING_HPP
