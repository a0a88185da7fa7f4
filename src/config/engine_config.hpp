/*
 * engine_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Dispatch engine configuration sections

**************************************************/

#ifndef HELIUM_CONFIG_ENGINE_CONFIG_HPP
#define HELIUM_CONFIG_ENGINE_CONFIG_HPP

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dispatch/common/dispatch_result.hpp"

namespace helium::config {

using json = nlohmann::json;

/**
 * @brief Bridge executable location and invocation limits
 */
struct TransportConfig {
    std::string bridgePath{"adb"};         ///< Executable name or path
    std::vector<std::string> searchPaths{  ///< Probed in order after bridgePath
        "/usr/local/bin/adb", "/opt/android-sdk/platform-tools/adb",
        "~/Android/Sdk/platform-tools/adb",
        "~/Library/Android/sdk/platform-tools/adb"};
    size_t defaultTimeoutMs{30000};  ///< Per-attempt timeout for commands
    size_t listTimeoutMs{10000};     ///< Timeout of `devices -l`
    size_t probeTimeoutMs{5000};     ///< Timeout of `version`

    [[nodiscard]] json toJson() const {
        return {{"bridgePath", bridgePath},
                {"searchPaths", searchPaths},
                {"defaultTimeoutMs", defaultTimeoutMs},
                {"listTimeoutMs", listTimeoutMs},
                {"probeTimeoutMs", probeTimeoutMs}};
    }

    [[nodiscard]] static TransportConfig fromJson(const json& j) {
        TransportConfig cfg;
        cfg.bridgePath = j.value("bridgePath", cfg.bridgePath);
        cfg.searchPaths = j.value("searchPaths", cfg.searchPaths);
        cfg.defaultTimeoutMs = j.value("defaultTimeoutMs", cfg.defaultTimeoutMs);
        cfg.listTimeoutMs = j.value("listTimeoutMs", cfg.listTimeoutMs);
        cfg.probeTimeoutMs = j.value("probeTimeoutMs", cfg.probeTimeoutMs);
        return cfg;
    }
};

/**
 * @brief Exponential backoff between attempts
 */
struct RetryConfig {
    size_t initialDelayMs{1000};  ///< Delay after the first failed attempt
    double multiplier{2.0};       ///< Growth factor per attempt
    size_t maxDelayMs{5000};      ///< Ceiling for a single delay

    [[nodiscard]] json toJson() const {
        return {{"initialDelayMs", initialDelayMs},
                {"multiplier", multiplier},
                {"maxDelayMs", maxDelayMs}};
    }

    [[nodiscard]] static RetryConfig fromJson(const json& j) {
        RetryConfig cfg;
        cfg.initialDelayMs = j.value("initialDelayMs", cfg.initialDelayMs);
        cfg.multiplier = j.value("multiplier", cfg.multiplier);
        cfg.maxDelayMs = j.value("maxDelayMs", cfg.maxDelayMs);
        return cfg;
    }
};

struct WorkerPoolConfig {
    size_t workerCount{4};
    size_t queueCapacity{1000};
    size_t enqueueWaitMs{0};  ///< 0 rejects immediately when full
    size_t pollIntervalMs{100};
    size_t maxConnectionsPerDevice{3};
    size_t resultRetention{10000};  ///< Finished results kept for awaitResult
    RetryConfig retry;

    [[nodiscard]] json toJson() const {
        return {{"workerCount", workerCount},
                {"queueCapacity", queueCapacity},
                {"enqueueWaitMs", enqueueWaitMs},
                {"pollIntervalMs", pollIntervalMs},
                {"maxConnectionsPerDevice", maxConnectionsPerDevice},
                {"resultRetention", resultRetention},
                {"retry", retry.toJson()}};
    }

    [[nodiscard]] static WorkerPoolConfig fromJson(const json& j) {
        WorkerPoolConfig cfg;
        cfg.workerCount = j.value("workerCount", cfg.workerCount);
        cfg.queueCapacity = j.value("queueCapacity", cfg.queueCapacity);
        cfg.enqueueWaitMs = j.value("enqueueWaitMs", cfg.enqueueWaitMs);
        cfg.pollIntervalMs = j.value("pollIntervalMs", cfg.pollIntervalMs);
        cfg.maxConnectionsPerDevice =
            j.value("maxConnectionsPerDevice", cfg.maxConnectionsPerDevice);
        cfg.resultRetention = j.value("resultRetention", cfg.resultRetention);
        if (j.contains("retry")) {
            cfg.retry = RetryConfig::fromJson(j["retry"]);
        }
        return cfg;
    }
};

struct ScannerConfig {
    size_t intervalMs{10000};
    size_t staleFactor{3};  ///< Devices unseen for staleFactor * interval are dropped
    bool rejectUnknownDevices{false};

    [[nodiscard]] json toJson() const {
        return {{"intervalMs", intervalMs},
                {"staleFactor", staleFactor},
                {"rejectUnknownDevices", rejectUnknownDevices}};
    }

    [[nodiscard]] static ScannerConfig fromJson(const json& j) {
        ScannerConfig cfg;
        cfg.intervalMs = j.value("intervalMs", cfg.intervalMs);
        cfg.staleFactor = j.value("staleFactor", cfg.staleFactor);
        cfg.rejectUnknownDevices =
            j.value("rejectUnknownDevices", cfg.rejectUnknownDevices);
        return cfg;
    }
};

struct CacheConfig {
    size_t maxEntries{10000};
    size_t defaultTtlSeconds{300};
    size_t maxTtlMs{0};  ///< Upper bound on any entry's TTL, 0 for none
    size_t sweepIntervalMs{60000};
    double evictFraction{0.1};

    [[nodiscard]] json toJson() const {
        return {{"maxEntries", maxEntries},
                {"defaultTtlSeconds", defaultTtlSeconds},
                {"maxTtlMs", maxTtlMs},
                {"sweepIntervalMs", sweepIntervalMs},
                {"evictFraction", evictFraction}};
    }

    [[nodiscard]] static CacheConfig fromJson(const json& j) {
        CacheConfig cfg;
        cfg.maxEntries = j.value("maxEntries", cfg.maxEntries);
        cfg.defaultTtlSeconds = j.value("defaultTtlSeconds", cfg.defaultTtlSeconds);
        cfg.maxTtlMs = j.value("maxTtlMs", cfg.maxTtlMs);
        cfg.sweepIntervalMs = j.value("sweepIntervalMs", cfg.sweepIntervalMs);
        cfg.evictFraction = j.value("evictFraction", cfg.evictFraction);
        return cfg;
    }
};

struct AnalyzerConfig {
    size_t historyCapacity{10000};
    size_t minOccurrences{10};
    double slowCommandSeconds{1.0};
    size_t highFrequency{50};
    size_t topPatterns{10};

    [[nodiscard]] json toJson() const {
        return {{"historyCapacity", historyCapacity},
                {"minOccurrences", minOccurrences},
                {"slowCommandSeconds", slowCommandSeconds},
                {"highFrequency", highFrequency},
                {"topPatterns", topPatterns}};
    }

    [[nodiscard]] static AnalyzerConfig fromJson(const json& j) {
        AnalyzerConfig cfg;
        cfg.historyCapacity = j.value("historyCapacity", cfg.historyCapacity);
        cfg.minOccurrences = j.value("minOccurrences", cfg.minOccurrences);
        cfg.slowCommandSeconds =
            j.value("slowCommandSeconds", cfg.slowCommandSeconds);
        cfg.highFrequency = j.value("highFrequency", cfg.highFrequency);
        cfg.topPatterns = j.value("topPatterns", cfg.topPatterns);
        return cfg;
    }
};

struct ProfilerConfig {
    size_t burstSize{10};
    size_t latencySamples{5};
    std::vector<size_t> concurrencyLevels{1, 2, 4, 8};
    size_t commandsPerWorker{5};
    std::vector<std::string> probeArgs{"shell", "echo", "test"};
    std::vector<std::string> loadArgs{"shell", "sleep", "0.1"};
    size_t probeTimeoutMs{10000};
    size_t defaultConcurrency{2};
    size_t defaultLatencyMs{100};
    double defaultThroughput{1.0};

    [[nodiscard]] json toJson() const {
        return {{"burstSize", burstSize},
                {"latencySamples", latencySamples},
                {"concurrencyLevels", concurrencyLevels},
                {"commandsPerWorker", commandsPerWorker},
                {"probeArgs", probeArgs},
                {"loadArgs", loadArgs},
                {"probeTimeoutMs", probeTimeoutMs},
                {"defaultConcurrency", defaultConcurrency},
                {"defaultLatencyMs", defaultLatencyMs},
                {"defaultThroughput", defaultThroughput}};
    }

    [[nodiscard]] static ProfilerConfig fromJson(const json& j) {
        ProfilerConfig cfg;
        cfg.burstSize = j.value("burstSize", cfg.burstSize);
        cfg.latencySamples = j.value("latencySamples", cfg.latencySamples);
        cfg.concurrencyLevels =
            j.value("concurrencyLevels", cfg.concurrencyLevels);
        cfg.commandsPerWorker =
            j.value("commandsPerWorker", cfg.commandsPerWorker);
        cfg.probeArgs = j.value("probeArgs", cfg.probeArgs);
        cfg.loadArgs = j.value("loadArgs", cfg.loadArgs);
        cfg.probeTimeoutMs = j.value("probeTimeoutMs", cfg.probeTimeoutMs);
        cfg.defaultConcurrency =
            j.value("defaultConcurrency", cfg.defaultConcurrency);
        cfg.defaultLatencyMs = j.value("defaultLatencyMs", cfg.defaultLatencyMs);
        cfg.defaultThroughput =
            j.value("defaultThroughput", cfg.defaultThroughput);
        return cfg;
    }
};

/**
 * @brief Thresholds for profile-driven command adjustments
 */
struct CoordinatorConfig {
    size_t highLatencyMs{500};
    double highThroughput{10.0};
    double slowScale{2.0};
    double fastScale{0.7};
    double lowQuality{0.8};
    int retryBoost{2};
    int maxRetries{5};
    size_t maxFusionBatch{10};

    [[nodiscard]] json toJson() const {
        return {{"highLatencyMs", highLatencyMs},
                {"highThroughput", highThroughput},
                {"slowScale", slowScale},
                {"fastScale", fastScale},
                {"lowQuality", lowQuality},
                {"retryBoost", retryBoost},
                {"maxRetries", maxRetries},
                {"maxFusionBatch", maxFusionBatch}};
    }

    [[nodiscard]] static CoordinatorConfig fromJson(const json& j) {
        CoordinatorConfig cfg;
        cfg.highLatencyMs = j.value("highLatencyMs", cfg.highLatencyMs);
        cfg.highThroughput = j.value("highThroughput", cfg.highThroughput);
        cfg.slowScale = j.value("slowScale", cfg.slowScale);
        cfg.fastScale = j.value("fastScale", cfg.fastScale);
        cfg.lowQuality = j.value("lowQuality", cfg.lowQuality);
        cfg.retryBoost = j.value("retryBoost", cfg.retryBoost);
        cfg.maxRetries = j.value("maxRetries", cfg.maxRetries);
        cfg.maxFusionBatch = j.value("maxFusionBatch", cfg.maxFusionBatch);
        return cfg;
    }
};

struct LoggingConfig {
    std::string level{"info"};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v"};
    bool enableFile{false};
    std::string filePath{"logs/helium.log"};
    size_t maxFileSize{10 * 1024 * 1024};
    size_t maxFiles{5};

    [[nodiscard]] json toJson() const {
        return {{"level", level},
                {"pattern", pattern},
                {"enableFile", enableFile},
                {"filePath", filePath},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles}};
    }

    [[nodiscard]] static LoggingConfig fromJson(const json& j) {
        LoggingConfig cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.pattern = j.value("pattern", cfg.pattern);
        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.filePath = j.value("filePath", cfg.filePath);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        return cfg;
    }
};

/**
 * @brief Complete engine configuration
 *
 * @example
 * ```yaml
 * transport:
 *   bridgePath: /usr/bin/adb
 * workerPool:
 *   workerCount: 8
 *   retry:
 *     maxDelayMs: 5000
 * cache:
 *   maxEntries: 5000
 * ```
 */
struct EngineConfig {
    TransportConfig transport;
    WorkerPoolConfig workerPool;
    ScannerConfig scanner;
    CacheConfig cache;
    AnalyzerConfig analyzer;
    ProfilerConfig profiler;
    CoordinatorConfig coordinator;
    LoggingConfig logging;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static EngineConfig fromJson(const json& j);
};

/**
 * @brief Load configuration from a .json, .yaml or .yml file
 *
 * Missing keys keep their defaults.
 */
[[nodiscard]] auto loadConfig(const std::filesystem::path& path)
    -> dispatch::DispatchResult<EngineConfig>;

}  // namespace helium::config

#endif  // HELIUM_CONFIG_ENGINE_CONFIG_HPP
