/*
 * device_registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Thread-safe device registry with a periodic bridge scanner

**************************************************/

#ifndef HELIUM_DEVICE_DEVICE_REGISTRY_HPP
#define HELIUM_DEVICE_DEVICE_REGISTRY_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/engine_config.hpp"
#include "device_connection_pool.hpp"
#include "device_info.hpp"
#include "dispatch/common/dispatch_result.hpp"
#include "transport/bridge_transport.hpp"

namespace helium::device {

/**
 * @brief Authoritative view of the devices the bridge reports
 *
 * The scanner loop calls scan() every interval. A failed scan keeps the last
 * known devices; devices unseen for staleFactor intervals are removed and
 * their pooled connections released.
 */
class DeviceRegistry {
public:
    DeviceRegistry(std::shared_ptr<transport::BridgeTransport> transport,
                   std::shared_ptr<ConnectionPool> pool,
                   config::ScannerConfig config = {},
                   std::chrono::milliseconds listTimeout =
                       std::chrono::milliseconds{10000});
    ~DeviceRegistry();

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Scanner lifecycle
    void start();
    void stop();
    [[nodiscard]] auto isRunning() const -> bool;

    /**
     * @brief List devices through the bridge and reconcile
     * @return Number of devices parsed, or the transport error
     */
    auto scan() -> dispatch::DispatchResult<size_t>;

    /**
     * @brief Parse `devices -l` output
     *
     * Skips the header, blank lines, daemon notices and malformed lines.
     */
    [[nodiscard]] static auto parseListing(std::string_view text)
        -> std::vector<DeviceListing>;

    /**
     * @brief Merge listings seen at @p now and drop stale devices
     */
    void applyScan(const std::vector<DeviceListing>& listings,
                   std::chrono::system_clock::time_point now);

    /**
     * @brief Update counters, latency and connection quality of a device
     */
    void recordOutcome(const std::string& serial, bool success,
                       std::chrono::duration<double> latency);

    [[nodiscard]] auto find(const std::string& serial) const
        -> std::optional<Device>;
    [[nodiscard]] auto contains(const std::string& serial) const -> bool;
    [[nodiscard]] auto snapshot() const -> std::vector<Device>;
    [[nodiscard]] auto connectedDevices() const -> std::vector<Device>;
    [[nodiscard]] auto size() const -> size_t;

    /// Smoothing factor of the latency and quality averages
    static constexpr double EMA_ALPHA = 0.1;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

}  // namespace helium::device

#endif  // HELIUM_DEVICE_DEVICE_REGISTRY_HPP
