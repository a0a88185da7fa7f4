/*
 * device_profiler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Active benchmarking of device throughput, latency and
concurrency

*************************************************/

#ifndef HELIUM_PROFILER_DEVICE_PROFILER_HPP
#define HELIUM_PROFILER_DEVICE_PROFILER_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/engine_config.hpp"
#include "device/device_registry.hpp"
#include "dispatch/command_executor.hpp"
#include "dispatch/common/dispatch_result.hpp"

namespace helium::profiler {

using json = nlohmann::json;

// Measured capacity of one device
struct DeviceProfile {
    std::string serial;
    json cpuInfo = json::object();
    json memoryInfo = json::object();
    double networkLatency{0.0};     // seconds
    double commandThroughput{0.0};  // commands per second
    size_t optimalConcurrency{1};
    std::chrono::system_clock::time_point lastProfiled{
        std::chrono::system_clock::now()};

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j) -> DeviceProfile;
};

/**
 * @brief Benchmarks devices through the retrying executor
 *
 * A measurement that fails falls back to the configured default instead of
 * failing the profile. A new profile replaces the previous one whole.
 */
class DeviceProfiler {
public:
    DeviceProfiler(std::shared_ptr<dispatch::CommandExecutor> executor,
                   config::ProfilerConfig config = {},
                   std::shared_ptr<device::DeviceRegistry> registry = nullptr);

    /**
     * @brief Profile a device
     * @return DeviceNotFound if a registry is attached and does not know the
     * serial
     */
    auto profile(const std::string& serial)
        -> dispatch::DispatchResult<DeviceProfile>;

    [[nodiscard]] auto getProfile(const std::string& serial) const
        -> std::optional<DeviceProfile>;
    [[nodiscard]] auto profiles() const -> std::vector<DeviceProfile>;
    void setProfile(DeviceProfile profile);

    [[nodiscard]] auto toJson() const -> json;
    auto loadJson(const json& j) -> size_t;

    [[nodiscard]] static auto parseCpuInfo(std::string_view text) -> json;
    [[nodiscard]] static auto parseMemoryInfo(std::string_view text) -> json;

    /**
     * @brief Level with the highest throughput; the lowest level wins ties
     */
    [[nodiscard]] static auto selectOptimalConcurrency(
        const std::vector<size_t>& levels,
        const std::vector<double>& throughputs) -> size_t;

private:
    auto makeCommand(const std::string& serial,
                     std::vector<std::string> argv) const
        -> std::shared_ptr<const dispatch::Command>;
    auto measureThroughput(const std::string& serial) -> std::optional<double>;
    auto measureLatency(const std::string& serial) -> std::optional<double>;
    auto measureConcurrency(const std::string& serial)
        -> std::optional<size_t>;

    std::shared_ptr<dispatch::CommandExecutor> executor_;
    config::ProfilerConfig config_;
    std::shared_ptr<device::DeviceRegistry> registry_;

    std::unordered_map<std::string, DeviceProfile> profiles_;
    mutable std::shared_mutex profilesMutex_;
};

}  // namespace helium::profiler

#endif  // HELIUM_PROFILER_DEVICE_PROFILER_HPP
