/*
 * engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Owner of every dispatch engine component and their lifecycle

**************************************************/

#ifndef HELIUM_ENGINE_HPP
#define HELIUM_ENGINE_HPP

#include <memory>
#include <vector>

#include "analysis/pattern_analyzer.hpp"
#include "cache/result_cache.hpp"
#include "config/engine_config.hpp"
#include "coordinator/optimizing_coordinator.hpp"
#include "device/device_connection_pool.hpp"
#include "device/device_registry.hpp"
#include "dispatch/command_executor.hpp"
#include "dispatch/common/dispatch_result.hpp"
#include "dispatch/worker_pool.hpp"
#include "profiler/device_profiler.hpp"
#include "transport/bridge_transport.hpp"

namespace helium {

/**
 * @brief Wires the components together from one configuration
 *
 * Nothing runs until start(). stop() signals and joins the scanner, the
 * cache sweeper and the workers; the destructor calls it.
 *
 * @par Usage Example:
 * @code
 * helium::Engine engine(config);
 * engine.start();
 * auto result = engine.commandCoordinator()->execute(
 *     dispatch::Command({"shell", "getprop", "ro.product.model"}, serial));
 * @endcode
 */
class Engine {
public:
    /**
     * @param transport Bridge to use; a ProcessBridge on the located
     * executable when null
     */
    explicit Engine(config::EngineConfig config = {},
                    std::shared_ptr<transport::BridgeTransport> transport =
                        nullptr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * @brief Start background work
     *
     * Returns TransportUnavailable when the bridge does not answer its
     * version probe; the engine is started regardless and commands complete
     * as failed results.
     */
    auto start() -> dispatch::DispatchVoidResult;
    void stop();
    [[nodiscard]] auto isRunning() const -> bool { return running_; }

    /**
     * @brief Profile every connected device concurrently
     * @return The profiles that completed
     */
    auto profileAllDevices() -> std::vector<profiler::DeviceProfile>;

    [[nodiscard]] auto engineConfig() const -> const config::EngineConfig& {
        return config_;
    }
    [[nodiscard]] auto bridge() const
        -> std::shared_ptr<transport::BridgeTransport> {
        return transport_;
    }
    [[nodiscard]] auto connectionPool() const
        -> std::shared_ptr<device::ConnectionPool> {
        return connectionPool_;
    }
    [[nodiscard]] auto registry() const
        -> std::shared_ptr<device::DeviceRegistry> {
        return registry_;
    }
    [[nodiscard]] auto workerPool() const
        -> std::shared_ptr<dispatch::WorkerPool> {
        return workers_;
    }
    [[nodiscard]] auto resultCache() const -> std::shared_ptr<cache::ResultCache> {
        return cache_;
    }
    [[nodiscard]] auto patternAnalyzer() const
        -> std::shared_ptr<analysis::PatternAnalyzer> {
        return analyzer_;
    }
    [[nodiscard]] auto deviceProfiler() const
        -> std::shared_ptr<profiler::DeviceProfiler> {
        return profiler_;
    }
    [[nodiscard]] auto commandCoordinator() const
        -> std::shared_ptr<coordinator::OptimizingCoordinator> {
        return coordinator_;
    }

private:
    config::EngineConfig config_;
    std::shared_ptr<transport::BridgeTransport> transport_;
    std::shared_ptr<device::ConnectionPool> connectionPool_;
    std::shared_ptr<device::DeviceRegistry> registry_;
    std::shared_ptr<dispatch::CommandExecutor> executor_;
    std::shared_ptr<dispatch::WorkerPool> workers_;
    std::shared_ptr<cache::ResultCache> cache_;
    std::shared_ptr<analysis::PatternAnalyzer> analyzer_;
    std::shared_ptr<profiler::DeviceProfiler> profiler_;
    std::shared_ptr<coordinator::OptimizingCoordinator> coordinator_;
    bool running_{false};
};

}  // namespace helium

#endif  // HELIUM_ENGINE_HPP
