/*
 * device_info.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Device record kept by the registry

**************************************************/

#ifndef HELIUM_DEVICE_DEVICE_INFO_HPP
#define HELIUM_DEVICE_DEVICE_INFO_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace helium::device {

using json = nlohmann::json;

/**
 * @brief Connection state as reported by the bridge device listing
 */
enum class DeviceState {
    Unknown,
    Connected,
    Disconnected,
    Unauthorized,
    Offline,
    Recovery,
    Bootloader
};

[[nodiscard]] inline auto deviceStateToString(DeviceState state)
    -> std::string {
    switch (state) {
        case DeviceState::Connected:
            return "connected";
        case DeviceState::Disconnected:
            return "disconnected";
        case DeviceState::Unauthorized:
            return "unauthorized";
        case DeviceState::Offline:
            return "offline";
        case DeviceState::Recovery:
            return "recovery";
        case DeviceState::Bootloader:
            return "bootloader";
        default:
            return "unknown";
    }
}

/// Maps listing state words; "device" means connected
[[nodiscard]] inline auto deviceStateFromString(const std::string& str)
    -> DeviceState {
    if (str == "device" || str == "connected")
        return DeviceState::Connected;
    if (str == "disconnected")
        return DeviceState::Disconnected;
    if (str == "unauthorized")
        return DeviceState::Unauthorized;
    if (str == "offline")
        return DeviceState::Offline;
    if (str == "recovery")
        return DeviceState::Recovery;
    if (str == "bootloader")
        return DeviceState::Bootloader;
    return DeviceState::Unknown;
}

/**
 * @brief One line of the device listing
 */
struct DeviceListing {
    std::string serial;
    DeviceState state{DeviceState::Unknown};
    std::unordered_map<std::string, std::string> properties;
};

/**
 * @brief Registry view of a device
 *
 * connectionQuality and averageLatency are exponential moving averages over
 * recent command outcomes.
 */
struct Device {
    std::string serial;
    DeviceState state{DeviceState::Unknown};
    std::optional<std::string> product;
    std::optional<std::string> model;
    std::optional<std::string> deviceName;
    std::optional<std::string> transportId;
    std::chrono::system_clock::time_point lastSeen{};
    double connectionQuality{1.0};
    std::chrono::duration<double> averageLatency{0.0};
    uint64_t successCount{0};
    uint64_t failureCount{0};

    [[nodiscard]] auto isConnected() const noexcept -> bool {
        return state == DeviceState::Connected;
    }

    [[nodiscard]] auto toJson() const -> json {
        json j = {{"serial", serial},
                  {"state", deviceStateToString(state)},
                  {"last_seen",
                   std::chrono::duration_cast<std::chrono::seconds>(
                       lastSeen.time_since_epoch())
                       .count()},
                  {"connection_quality", connectionQuality},
                  {"average_latency", averageLatency.count()},
                  {"success_count", successCount},
                  {"failure_count", failureCount}};
        if (product)
            j["product"] = *product;
        if (model)
            j["model"] = *model;
        if (deviceName)
            j["device"] = *deviceName;
        if (transportId)
            j["transport_id"] = *transportId;
        return j;
    }
};

}  // namespace helium::device

#endif  // HELIUM_DEVICE_DEVICE_INFO_HPP
