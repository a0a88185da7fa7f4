/*
 * optimizing_coordinator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Caller facing command API combining cache, profiles, analysis
and fusion

**************************************************/

#ifndef HELIUM_COORDINATOR_OPTIMIZING_COORDINATOR_HPP
#define HELIUM_COORDINATOR_OPTIMIZING_COORDINATOR_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "analysis/pattern_analyzer.hpp"
#include "cache/result_cache.hpp"
#include "config/engine_config.hpp"
#include "device/device_registry.hpp"
#include "dispatch/common/dispatch_result.hpp"
#include "dispatch/worker_pool.hpp"
#include "fusion_strategy.hpp"
#include "profiler/device_profiler.hpp"

namespace helium::coordinator {

using json = nlohmann::json;

struct CoordinatorStatistics {
    uint64_t totalCommands{0};
    uint64_t cacheHits{0};
    uint64_t cacheMisses{0};
    uint64_t optimizedCommands{0};
    uint64_t fusedCommands{0};
    double timeSaved{0.0};  ///< Seconds of execution avoided by cache hits

    [[nodiscard]] auto cacheHitRate() const -> double {
        auto lookups = cacheHits + cacheMisses;
        return lookups == 0 ? 0.0
                            : static_cast<double>(cacheHits) /
                                  static_cast<double>(lookups);
    }

    [[nodiscard]] auto optimizationRate() const -> double {
        return totalCommands == 0 ? 0.0
                                  : static_cast<double>(optimizedCommands) /
                                        static_cast<double>(totalCommands);
    }

    [[nodiscard]] auto toJson() const -> json {
        return {{"total_commands", totalCommands},
                {"cache_hits", cacheHits},
                {"cache_misses", cacheMisses},
                {"optimized_commands", optimizedCommands},
                {"fused_commands", fusedCommands},
                {"time_saved", timeSaved}};
    }
};

enum class HealthStatus { Good, Degraded, Critical };

[[nodiscard]] inline auto healthStatusToString(HealthStatus status)
    -> std::string {
    switch (status) {
        case HealthStatus::Good:
            return "good";
        case HealthStatus::Degraded:
            return "degraded";
        case HealthStatus::Critical:
            return "critical";
    }
    return "unknown";
}

struct HealthReport {
    HealthStatus status{HealthStatus::Good};
    std::vector<std::string> issues;
    std::vector<std::string> recommendations;

    [[nodiscard]] auto toJson() const -> json {
        return {{"overall_health", healthStatusToString(status)},
                {"issues", issues},
                {"recommendations", recommendations}};
    }
};

/**
 * @brief Device view returned by getDevice()
 */
struct DeviceSnapshot {
    device::Device device;
    std::optional<profiler::DeviceProfile> profile;

    [[nodiscard]] auto toJson() const -> json {
        json j = device.toJson();
        j["profile"] = profile ? profile->toJson() : json(nullptr);
        return j;
    }
};

/**
 * @brief Single entry point for submitting bridge commands
 *
 * Cache hits return without touching the queue. Misses are adjusted with the
 * device profile, executed by the worker pool, fed to the pattern analyzer
 * and cached when successful and read-only.
 */
class OptimizingCoordinator {
public:
    OptimizingCoordinator(std::shared_ptr<dispatch::WorkerPool> workers,
                          std::shared_ptr<cache::ResultCache> cache,
                          std::shared_ptr<analysis::PatternAnalyzer> analyzer,
                          std::shared_ptr<profiler::DeviceProfiler> profiler,
                          std::shared_ptr<device::DeviceRegistry> registry,
                          config::CoordinatorConfig config = {},
                          bool rejectUnknownDevices = false);
    ~OptimizingCoordinator();

    OptimizingCoordinator(const OptimizingCoordinator&) = delete;
    OptimizingCoordinator& operator=(const OptimizingCoordinator&) = delete;

    /**
     * @brief Execute and wait for the final result
     *
     * A failed command is a result with success == false, not an error.
     * Errors are reserved for rejected submissions.
     */
    auto execute(dispatch::Command command)
        -> dispatch::DispatchResult<dispatch::CommandResult>;

    auto submitAsync(dispatch::Command command)
        -> dispatch::DispatchResult<dispatch::CommandId>;

    auto awaitResult(dispatch::CommandId id, std::chrono::milliseconds timeout)
        -> dispatch::DispatchResult<dispatch::CommandResult>;

    /**
     * @brief Execute many commands, fusing compatible reads per device
     * @param maxConcurrent Upper bound on invocations in flight
     * @return One result per input command, in input order
     */
    auto batch(std::vector<dispatch::Command> commands, size_t maxConcurrent)
        -> std::vector<dispatch::CommandResult>;

    /**
     * @brief Scale timeout and retry budget from the device profile and
     * connection quality
     * @return True if anything changed
     */
    auto applyDeviceOptimizations(dispatch::Command& command) const -> bool;

    /// Replace the fusion strategy used for one command kind
    void registerFusion(dispatch::CommandKind kind,
                        std::shared_ptr<const FusionStrategy> strategy);

    auto getDevice(const std::string& serial)
        -> dispatch::DispatchResult<DeviceSnapshot>;

    [[nodiscard]] auto statistics() const -> CoordinatorStatistics;
    [[nodiscard]] auto performanceReport() -> json;
    [[nodiscard]] auto healthCheck(std::chrono::milliseconds probeTimeout =
                                       std::chrono::milliseconds{5000})
        -> HealthReport;

    /**
     * @brief Write patterns, device profiles and statistics as JSON
     */
    auto saveOptimizationData(const std::filesystem::path& path)
        -> dispatch::DispatchVoidResult;

    auto loadOptimizationData(const std::filesystem::path& path)
        -> dispatch::DispatchVoidResult;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

}  // namespace helium::coordinator

#endif  // HELIUM_COORDINATOR_OPTIMIZING_COORDINATOR_HPP
