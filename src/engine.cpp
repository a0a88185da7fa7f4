/*
 * engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "engine.hpp"

#include <future>

#include <spdlog/spdlog.h>

#include "transport/process_bridge.hpp"

namespace helium {

Engine::Engine(config::EngineConfig config,
               std::shared_ptr<transport::BridgeTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
    if (!transport_) {
        auto path = transport::locateBridge(config_.transport)
                        .value_or(config_.transport.bridgePath);
        transport_ = std::make_shared<transport::ProcessBridge>(path);
    }

    connectionPool_ = std::make_shared<device::ConnectionPool>(
        config_.workerPool.maxConnectionsPerDevice);
    registry_ = std::make_shared<device::DeviceRegistry>(
        transport_, connectionPool_, config_.scanner,
        std::chrono::milliseconds(config_.transport.listTimeoutMs));
    executor_ = std::make_shared<dispatch::CommandExecutor>(
        transport_, config_.workerPool.retry, registry_, connectionPool_);
    workers_ =
        std::make_shared<dispatch::WorkerPool>(executor_, config_.workerPool);
    cache_ = std::make_shared<cache::ResultCache>(config_.cache);
    analyzer_ = std::make_shared<analysis::PatternAnalyzer>(config_.analyzer);
    profiler_ = std::make_shared<profiler::DeviceProfiler>(
        executor_, config_.profiler, registry_);
    coordinator_ = std::make_shared<coordinator::OptimizingCoordinator>(
        workers_, cache_, analyzer_, profiler_, registry_, config_.coordinator,
        config_.scanner.rejectUnknownDevices);

    spdlog::debug("Engine created with bridge '{}'", transport_->executable());
}

Engine::~Engine() { stop(); }

auto Engine::start() -> dispatch::DispatchVoidResult {
    if (running_) {
        return dispatch::success();
    }

    auto version = transport_->probe(
        std::chrono::milliseconds(config_.transport.probeTimeoutMs));

    workers_->start();
    registry_->start();
    cache_->startSweeper();
    running_ = true;
    spdlog::info("Dispatch engine started");

    if (!version) {
        spdlog::error("Bridge '{}' is unavailable: {}", transport_->executable(),
                      version.error().message);
        return dispatch::failure(dispatch::DispatchErrorCode::TransportUnavailable,
                                 "Bridge '" + transport_->executable() +
                                     "' is unavailable: " +
                                     version.error().message);
    }
    spdlog::info("Using bridge {} ({})", transport_->executable(), *version);
    return dispatch::success();
}

void Engine::stop() {
    if (!running_) {
        return;
    }
    registry_->stop();
    cache_->stopSweeper();
    workers_->stop();
    running_ = false;
    spdlog::info("Dispatch engine stopped");
}

auto Engine::profileAllDevices() -> std::vector<profiler::DeviceProfile> {
    auto devices = registry_->connectedDevices();
    spdlog::info("Profiling {} device(s)", devices.size());

    std::vector<std::future<dispatch::DispatchResult<profiler::DeviceProfile>>>
        tasks;
    tasks.reserve(devices.size());
    for (const auto& device : devices) {
        tasks.push_back(std::async(std::launch::async,
                                   [this, serial = device.serial] {
                                       return profiler_->profile(serial);
                                   }));
    }

    std::vector<profiler::DeviceProfile> profiles;
    for (auto& task : tasks) {
        auto result = task.get();
        if (result) {
            profiles.push_back(std::move(*result));
        } else {
            spdlog::warn("Device profiling failed: {}",
                         result.error().toString());
        }
    }
    spdlog::info("Device profiling completed ({} profile(s))", profiles.size());
    return profiles;
}

}  // namespace helium
