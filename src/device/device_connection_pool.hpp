/*
 * device_connection_pool.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef HELIUM_DEVICE_DEVICE_CONNECTION_POOL_HPP
#define HELIUM_DEVICE_DEVICE_CONNECTION_POOL_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace helium::device {

// Connection statistics structure
struct ConnectionStatistics {
    size_t devices{0};
    size_t totalConnections{0};
    size_t activeConnections{0};
    uint64_t connectionsCreated{0};
    uint64_t leasesGranted{0};
    uint64_t leaseMisses{0};
    uint64_t devicesReleased{0};

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"devices", devices},
                {"total_connections", totalConnections},
                {"active_connections", activeConnections},
                {"connections_created", connectionsCreated},
                {"leases_granted", leasesGranted},
                {"lease_misses", leaseMisses},
                {"devices_released", devicesReleased}};
    }
};

class ConnectionPool;

/**
 * @brief Scoped hold on one pooled connection slot
 *
 * Returns the slot to the pool on destruction. A lease that outlives its
 * pool, or whose device was released, is dropped silently.
 */
class ConnectionLease {
public:
    ConnectionLease() = default;
    ~ConnectionLease();

    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;
    ConnectionLease(ConnectionLease&& other) noexcept;
    ConnectionLease& operator=(ConnectionLease&& other) noexcept;

    [[nodiscard]] auto serial() const -> const std::string& { return serial_; }
    [[nodiscard]] auto connectionId() const -> const std::string& {
        return connectionId_;
    }

private:
    friend class ConnectionPool;
    struct State;

    ConnectionLease(std::weak_ptr<State> pool, std::string serial,
                    std::string connectionId);
    void release() noexcept;

    std::weak_ptr<State> pool_;
    std::string serial_;
    std::string connectionId_;
};

/**
 * @brief Per-device connection slots
 *
 * Commands are still executed as independent bridge invocations; the pool
 * bounds and accounts for how many run against one device at a time. It
 * never blocks: when all slots are taken acquire() returns nothing and the
 * miss is counted.
 */
class ConnectionPool {
public:
    explicit ConnectionPool(size_t maxPerDevice = 3);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    [[nodiscard]] auto acquire(const std::string& serial)
        -> std::optional<ConnectionLease>;

    /// Forget every slot of a device, e.g. once it has gone stale
    void releaseDevice(const std::string& serial);

    [[nodiscard]] auto activeConnections(const std::string& serial) const
        -> size_t;

    [[nodiscard]] auto statistics() const -> ConnectionStatistics;

    [[nodiscard]] auto maxPerDevice() const noexcept -> size_t;

private:
    std::shared_ptr<ConnectionLease::State> state_;
};

}  // namespace helium::device

#endif  // HELIUM_DEVICE_DEVICE_CONNECTION_POOL_HPP
