/*
 * optimizing_coordinator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Optimizing coordinator implementation

**************************************************/

#include "optimizing_coordinator.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "cache_policy.hpp"

namespace helium::coordinator {

using dispatch::Command;
using dispatch::CommandId;
using dispatch::CommandResult;
using dispatch::DispatchErrorCode;

namespace {

void invokeCallback(const CommandResult& result) {
    if (!result.command || !result.command->callback) {
        return;
    }
    try {
        result.command->callback(result);
    } catch (const std::exception& e) {
        spdlog::error("Completion callback failed for '{}': {}",
                      result.command->joined(), e.what());
    }
}

auto rejectedResult(const Command& command, const dispatch::DispatchError& error)
    -> CommandResult {
    return dispatch::makeFailedResult(std::make_shared<const Command>(command),
                                      error.toString(), 0,
                                      std::chrono::milliseconds{0});
}

}  // namespace

class OptimizingCoordinator::Impl {
public:
    std::shared_ptr<dispatch::WorkerPool> workers_;
    std::shared_ptr<cache::ResultCache> cache_;
    std::shared_ptr<analysis::PatternAnalyzer> analyzer_;
    std::shared_ptr<profiler::DeviceProfiler> profiler_;
    std::shared_ptr<device::DeviceRegistry> registry_;
    config::CoordinatorConfig config_;
    bool rejectUnknownDevices_;

    std::unordered_map<dispatch::CommandKind,
                       std::shared_ptr<const FusionStrategy>>
        fusions_;
    mutable std::shared_mutex fusionMutex_;

    CoordinatorStatistics stats_;
    mutable std::mutex statsMutex_;

    Impl(std::shared_ptr<dispatch::WorkerPool> workers,
         std::shared_ptr<cache::ResultCache> cache,
         std::shared_ptr<analysis::PatternAnalyzer> analyzer,
         std::shared_ptr<profiler::DeviceProfiler> profiler,
         std::shared_ptr<device::DeviceRegistry> registry,
         config::CoordinatorConfig config, bool rejectUnknownDevices)
        : workers_(std::move(workers)),
          cache_(std::move(cache)),
          analyzer_(std::move(analyzer)),
          profiler_(std::move(profiler)),
          registry_(std::move(registry)),
          config_(config),
          rejectUnknownDevices_(rejectUnknownDevices) {
        auto property = std::make_shared<PropertyFusion>();
        fusions_[dispatch::CommandKind::Shell] = property;
        fusions_[dispatch::CommandKind::Property] = property;
    }

    auto checkDevice(const Command& command) const
        -> dispatch::DispatchVoidResult {
        if (!rejectUnknownDevices_ || !command.deviceSerial || !registry_) {
            return dispatch::success();
        }
        if (!registry_->contains(*command.deviceSerial)) {
            return std::unexpected(dispatch::DispatchError(
                DispatchErrorCode::DeviceNotFound,
                "Command targets an unknown device", *command.deviceSerial));
        }
        return dispatch::success();
    }

    auto lookupCache(const Command& command) -> std::optional<CommandResult> {
        auto cached = cache_->get(command);
        std::lock_guard lock(statsMutex_);
        stats_.totalCommands++;
        if (cached) {
            stats_.cacheHits++;
            stats_.timeSaved += cached->executionSeconds();
            spdlog::debug("Cache hit for '{}', saved {}ms", command.joined(),
                          cached->executionTime.count());
        } else {
            stats_.cacheMisses++;
        }
        return cached;
    }

    auto applyDeviceOptimizations(Command& command) const -> bool {
        if (!command.deviceSerial) {
            return false;
        }
        bool changed = false;

        if (profiler_) {
            if (auto profile = profiler_->getProfile(*command.deviceSerial)) {
                auto highLatency =
                    static_cast<double>(config_.highLatencyMs) / 1000.0;
                if (profile->networkLatency > highLatency) {
                    command.timeout = std::chrono::milliseconds(
                        static_cast<int64_t>(static_cast<double>(command.timeout.count()) *
                                             config_.slowScale));
                    changed = true;
                } else if (profile->commandThroughput >
                           config_.highThroughput) {
                    command.timeout = std::chrono::milliseconds(
                        static_cast<int64_t>(static_cast<double>(command.timeout.count()) *
                                             config_.fastScale));
                    changed = true;
                }
            }
        }

        if (registry_) {
            auto device = registry_->find(*command.deviceSerial);
            if (device && device->connectionQuality < config_.lowQuality) {
                auto boosted = std::min(config_.maxRetries,
                                        command.retryCount + config_.retryBoost);
                if (boosted != command.retryCount) {
                    command.retryCount = boosted;
                    changed = true;
                }
            }
        }
        return changed;
    }

    auto dispatchMiss(Command command) -> dispatch::DispatchResult<CommandId> {
        if (applyDeviceOptimizations(command)) {
            spdlog::debug("Adjusted '{}': timeout {}ms, retries {}",
                          command.joined(), command.timeout.count(),
                          command.retryCount);
        }

        bool cacheable = CachePolicy::isCacheable(command);
        auto ttl = CachePolicy::ttlFor(command);
        auto hook = [analyzer = analyzer_, cache = cache_, cacheable,
                     ttl](const CommandResult& result) {
            analyzer->record(result);
            if (cacheable && result.success) {
                cache->put(*result.command, result, ttl);
            }
        };

        auto id = workers_->submit(std::move(command), std::move(hook));
        if (id) {
            std::lock_guard lock(statsMutex_);
            stats_.optimizedCommands++;
        }
        return id;
    }

    auto submitAsync(Command command) -> dispatch::DispatchResult<CommandId> {
        if (auto valid = checkDevice(command); !valid) {
            return std::unexpected(valid.error());
        }

        if (auto cached = lookupCache(command)) {
            invokeCallback(*cached);
            return workers_->registerCompleted(std::move(*cached));
        }
        return dispatchMiss(std::move(command));
    }

    auto fusionFor(const Command& command) const
        -> std::shared_ptr<const FusionStrategy> {
        std::shared_lock lock(fusionMutex_);
        auto it = fusions_.find(command.kind);
        if (it == fusions_.end() || !it->second->canFuse(command)) {
            return nullptr;
        }
        return it->second;
    }

    struct Job {
        std::vector<size_t> indices;
        std::shared_ptr<const FusionStrategy> fusion;
    };

    auto batch(std::vector<Command> commands, size_t maxConcurrent)
        -> std::vector<CommandResult> {
        const auto n = commands.size();
        std::vector<std::optional<CommandResult>> results(n);
        if (n == 0) {
            return {};
        }
        maxConcurrent = std::max<size_t>(1, maxConcurrent);
        spdlog::info("Optimizing batch of {} commands", n);

        // Group cache misses by device, keeping first-seen device order
        std::vector<std::string> deviceOrder;
        std::unordered_map<std::string, std::vector<size_t>> groups;
        for (size_t i = 0; i < n; ++i) {
            if (auto valid = checkDevice(commands[i]); !valid) {
                results[i] = rejectedResult(commands[i], valid.error());
                continue;
            }
            if (auto cached = lookupCache(commands[i])) {
                invokeCallback(*cached);
                results[i] = std::move(*cached);
                continue;
            }
            auto key = commands[i].deviceKey();
            auto [it, inserted] = groups.try_emplace(key);
            if (inserted) {
                deviceOrder.push_back(key);
            }
            it->second.push_back(i);
        }

        std::vector<Job> jobs;
        for (const auto& key : deviceOrder) {
            std::vector<std::pair<std::shared_ptr<const FusionStrategy>,
                                  std::vector<size_t>>>
                fusable;
            for (auto index : groups[key]) {
                auto strategy = fusionFor(commands[index]);
                if (!strategy) {
                    jobs.push_back(Job{{index}, nullptr});
                    continue;
                }
                auto slot = std::find_if(
                    fusable.begin(), fusable.end(),
                    [&strategy](const auto& entry) {
                        return entry.first == strategy;
                    });
                if (slot == fusable.end()) {
                    fusable.emplace_back(strategy, std::vector<size_t>{});
                    slot = std::prev(fusable.end());
                }
                slot->second.push_back(index);
            }

            auto chunkSize = std::max<size_t>(1, config_.maxFusionBatch);
            for (auto& [strategy, indices] : fusable) {
                for (size_t start = 0; start < indices.size();
                     start += chunkSize) {
                    auto end = std::min(indices.size(), start + chunkSize);
                    if (end - start == 1) {
                        jobs.push_back(Job{{indices[start]}, nullptr});
                        continue;
                    }
                    jobs.push_back(
                        Job{std::vector<size_t>(indices.begin() + start,
                                                indices.begin() + end),
                            strategy});
                }
            }
        }

        auto fallback = runJobs(commands, jobs, results, maxConcurrent);
        if (!fallback.empty()) {
            spdlog::debug("Running {} fused command(s) individually",
                          fallback.size());
            std::vector<Job> single;
            single.reserve(fallback.size());
            for (auto index : fallback) {
                single.push_back(Job{{index}, nullptr});
            }
            runJobs(commands, single, results, maxConcurrent);
        }

        std::vector<CommandResult> ordered;
        ordered.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            if (!results[i]) {
                results[i] = rejectedResult(
                    commands[i],
                    dispatch::DispatchError(DispatchErrorCode::Unknown,
                                            "Command produced no result"));
            }
            ordered.push_back(std::move(*results[i]));
        }
        return ordered;
    }

    /**
     * @brief Execute jobs, at most maxConcurrent in flight
     * @return Indices of fused commands that still need their own run
     */
    auto runJobs(const std::vector<Command>& commands,
                 const std::vector<Job>& jobs,
                 std::vector<std::optional<CommandResult>>& results,
                 size_t maxConcurrent) -> std::vector<size_t> {
        std::vector<size_t> fallback;

        for (size_t start = 0; start < jobs.size(); start += maxConcurrent) {
            auto end = std::min(jobs.size(), start + maxConcurrent);
            std::vector<std::pair<const Job*, dispatch::DispatchResult<CommandId>>>
                inFlight;
            inFlight.reserve(end - start);

            for (size_t j = start; j < end; ++j) {
                const auto& job = jobs[j];
                if (!job.fusion) {
                    inFlight.emplace_back(&job,
                                          dispatchMiss(commands[job.indices[0]]));
                    continue;
                }
                std::vector<std::shared_ptr<const Command>> originals;
                for (auto index : job.indices) {
                    originals.push_back(
                        std::make_shared<const Command>(commands[index]));
                }
                auto fused = job.fusion->fuse(originals);
                applyDeviceOptimizations(fused);
                inFlight.emplace_back(&job, workers_->submit(std::move(fused)));
            }

            for (auto& [job, id] : inFlight) {
                if (!id) {
                    for (auto index : job->indices) {
                        results[index] = rejectedResult(commands[index], id.error());
                    }
                    continue;
                }
                auto result = workers_->awaitResult(*id);
                if (!result) {
                    for (auto index : job->indices) {
                        results[index] =
                            rejectedResult(commands[index], result.error());
                    }
                    continue;
                }
                if (!job->fusion) {
                    results[job->indices[0]] = std::move(*result);
                    continue;
                }
                absorbFused(commands, *job, *result, results, fallback);
            }
        }
        return fallback;
    }

    void absorbFused(const std::vector<Command>& commands, const Job& job,
                     const CommandResult& fused,
                     std::vector<std::optional<CommandResult>>& results,
                     std::vector<size_t>& fallback) {
        std::vector<std::shared_ptr<const Command>> originals;
        originals.reserve(job.indices.size());
        for (auto index : job.indices) {
            originals.push_back(std::make_shared<const Command>(commands[index]));
        }

        auto parts = job.fusion->split(fused, originals);
        size_t answered = 0;
        for (size_t k = 0; k < job.indices.size(); ++k) {
            auto index = job.indices[k];
            if (k >= parts.size() || !parts[k]) {
                fallback.push_back(index);
                continue;
            }
            auto& part = *parts[k];
            analyzer_->record(part);
            if (CachePolicy::isCacheable(*part.command)) {
                cache_->put(*part.command, part,
                            CachePolicy::ttlFor(*part.command));
            }
            invokeCallback(part);
            results[index] = std::move(part);
            answered++;
        }

        std::lock_guard lock(statsMutex_);
        stats_.fusedCommands += answered;
        stats_.optimizedCommands += answered;
        spdlog::debug("Fused {} of {} command(s) with {}", answered,
                      job.indices.size(), job.fusion->name());
    }

    auto performanceReport() -> json {
        auto stats = statistics();
        json statsJson = stats.toJson();
        statsJson["cache_hit_rate"] = stats.cacheHitRate();
        statsJson["optimization_rate"] = stats.optimizationRate();

        json suggestions = json::array();
        for (const auto& s : analyzer_->suggestions()) {
            suggestions.push_back(s.toJson());
        }

        json profiles = json::object();
        if (profiler_) {
            for (const auto& p : profiler_->profiles()) {
                profiles[p.serial] = {
                    {"throughput", p.commandThroughput},
                    {"latency", p.networkLatency},
                    {"concurrency", p.optimalConcurrency},
                    {"last_profiled",
                     std::chrono::duration<double>(
                         p.lastProfiled.time_since_epoch())
                         .count()}};
            }
        }

        return {{"statistics", statsJson},
                {"optimization_suggestions", suggestions},
                {"device_profiles", profiles},
                {"cache_status", cache_->statistics().toJson()},
                {"worker_pool", workers_->statistics().toJson()}};
    }

    auto statistics() const -> CoordinatorStatistics {
        std::lock_guard lock(statsMutex_);
        return stats_;
    }

    auto healthCheck(std::chrono::milliseconds probeTimeout) -> HealthReport {
        HealthReport report;

        auto transport = workers_->executor()->bridge();
        auto version = transport->probe(probeTimeout);
        if (!version) {
            report.issues.push_back("Bridge executable not found or not working: " +
                                    version.error().message);
            report.recommendations.push_back(
                "Check the bridge path in the transport configuration");
            report.status = HealthStatus::Critical;
        }

        if (registry_ && registry_->connectedDevices().empty()) {
            report.issues.push_back("No devices connected");
            report.recommendations.push_back(
                "Connect at least one device via USB or WiFi");
        }

        auto poolStats = workers_->statistics();
        auto successRate = poolStats.successRate() * 100.0;
        if (successRate < 95.0) {
            report.issues.push_back(
                fmt::format("Low command success rate: {:.1f}%", successRate));
            if (report.status == HealthStatus::Good) {
                report.status = HealthStatus::Degraded;
            }
        }

        if (poolStats.pending > 50) {
            report.issues.push_back(fmt::format(
                "High pending command count: {}", poolStats.pending));
            report.recommendations.push_back(
                "Consider increasing worker threads");
        }

        if (report.status != HealthStatus::Good) {
            spdlog::warn("Health check: {} ({} issue(s))",
                         healthStatusToString(report.status),
                         report.issues.size());
        }
        return report;
    }

    auto save(const std::filesystem::path& path) -> dispatch::DispatchVoidResult {
        json data = {{"patterns", analyzer_->toJson()},
                     {"device_profiles",
                      profiler_ ? profiler_->toJson() : json::object()},
                     {"statistics", statistics().toJson()}};

        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            return dispatch::failure(DispatchErrorCode::IoError,
                                     "Cannot open " + path.string() +
                                         " for writing");
        }
        file << data.dump(2);
        if (!file) {
            return dispatch::failure(DispatchErrorCode::IoError,
                                     "Failed to write " + path.string());
        }
        spdlog::info("Optimization data saved to {}", path.string());
        return dispatch::success();
    }

    auto load(const std::filesystem::path& path) -> dispatch::DispatchVoidResult {
        std::ifstream file(path);
        if (!file.is_open()) {
            return dispatch::failure(DispatchErrorCode::IoError,
                                     "Cannot open " + path.string());
        }

        try {
            json data = json::parse(file);
            if (!data.is_object()) {
                return dispatch::failure(DispatchErrorCode::InvalidArgument,
                                         "Optimization data must be an object");
            }

            auto patterns = analyzer_->loadJson(data.value("patterns", json::object()));
            size_t profiles = 0;
            if (profiler_) {
                profiles = profiler_->loadJson(
                    data.value("device_profiles", json::object()));
            }

            auto saved = data.value("statistics", json::object());
            {
                std::lock_guard lock(statsMutex_);
                stats_.totalCommands =
                    saved.value("total_commands", stats_.totalCommands);
                stats_.cacheHits = saved.value("cache_hits", stats_.cacheHits);
                stats_.cacheMisses =
                    saved.value("cache_misses", stats_.cacheMisses);
                stats_.optimizedCommands =
                    saved.value("optimized_commands", stats_.optimizedCommands);
                stats_.fusedCommands =
                    saved.value("fused_commands", stats_.fusedCommands);
                stats_.timeSaved = saved.value("time_saved", stats_.timeSaved);
            }

            spdlog::info("Optimization data loaded from {} ({} patterns, {} "
                         "profiles)",
                         path.string(), patterns, profiles);
            return dispatch::success();
        } catch (const json::exception& e) {
            return dispatch::failure(DispatchErrorCode::InvalidArgument,
                                     std::string("Invalid optimization data: ") +
                                         e.what());
        }
    }
};

OptimizingCoordinator::OptimizingCoordinator(
    std::shared_ptr<dispatch::WorkerPool> workers,
    std::shared_ptr<cache::ResultCache> cache,
    std::shared_ptr<analysis::PatternAnalyzer> analyzer,
    std::shared_ptr<profiler::DeviceProfiler> profiler,
    std::shared_ptr<device::DeviceRegistry> registry,
    config::CoordinatorConfig config, bool rejectUnknownDevices)
    : pimpl_(std::make_unique<Impl>(std::move(workers), std::move(cache),
                                    std::move(analyzer), std::move(profiler),
                                    std::move(registry), config,
                                    rejectUnknownDevices)) {}

OptimizingCoordinator::~OptimizingCoordinator() = default;

auto OptimizingCoordinator::execute(Command command)
    -> dispatch::DispatchResult<CommandResult> {
    auto id = pimpl_->submitAsync(std::move(command));
    if (!id) {
        return std::unexpected(id.error());
    }
    return pimpl_->workers_->awaitResult(*id);
}

auto OptimizingCoordinator::submitAsync(Command command)
    -> dispatch::DispatchResult<CommandId> {
    return pimpl_->submitAsync(std::move(command));
}

auto OptimizingCoordinator::awaitResult(CommandId id,
                                        std::chrono::milliseconds timeout)
    -> dispatch::DispatchResult<CommandResult> {
    return pimpl_->workers_->awaitResult(id, timeout);
}

auto OptimizingCoordinator::batch(std::vector<Command> commands,
                                  size_t maxConcurrent)
    -> std::vector<CommandResult> {
    return pimpl_->batch(std::move(commands), maxConcurrent);
}

auto OptimizingCoordinator::applyDeviceOptimizations(Command& command) const
    -> bool {
    return pimpl_->applyDeviceOptimizations(command);
}

void OptimizingCoordinator::registerFusion(
    dispatch::CommandKind kind, std::shared_ptr<const FusionStrategy> strategy) {
    std::unique_lock lock(pimpl_->fusionMutex_);
    if (strategy) {
        pimpl_->fusions_[kind] = std::move(strategy);
    } else {
        pimpl_->fusions_.erase(kind);
    }
}

auto OptimizingCoordinator::getDevice(const std::string& serial)
    -> dispatch::DispatchResult<DeviceSnapshot> {
    std::optional<device::Device> device;
    if (pimpl_->registry_) {
        device = pimpl_->registry_->find(serial);
    }
    if (!device) {
        return std::unexpected(dispatch::DispatchError(
            DispatchErrorCode::DeviceNotFound, "Unknown device", serial));
    }
    DeviceSnapshot snapshot{*device, std::nullopt};
    if (pimpl_->profiler_) {
        snapshot.profile = pimpl_->profiler_->getProfile(serial);
    }
    return snapshot;
}

auto OptimizingCoordinator::statistics() const -> CoordinatorStatistics {
    return pimpl_->statistics();
}

auto OptimizingCoordinator::performanceReport() -> json {
    return pimpl_->performanceReport();
}

auto OptimizingCoordinator::healthCheck(std::chrono::milliseconds probeTimeout)
    -> HealthReport {
    return pimpl_->healthCheck(probeTimeout);
}

auto OptimizingCoordinator::saveOptimizationData(
    const std::filesystem::path& path) -> dispatch::DispatchVoidResult {
    return pimpl_->save(path);
}

auto OptimizingCoordinator::loadOptimizationData(
    const std::filesystem::path& path) -> dispatch::DispatchVoidResult {
    return pimpl_->load(path);
}

}  // namespace helium::coordinator
