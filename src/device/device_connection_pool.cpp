/*
 * device_connection_pool.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device_connection_pool.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace helium::device {

namespace {

struct PoolConnection {
    std::string connectionId;
    bool active{false};
    std::chrono::steady_clock::time_point createdAt;
    std::chrono::steady_clock::time_point lastUsed;
    uint64_t usageCount{0};
};

}  // namespace

struct ConnectionLease::State {
    size_t maxPerDevice;
    std::unordered_map<std::string, std::vector<PoolConnection>> devicePools;
    mutable std::shared_mutex poolsMutex;

    uint64_t nextId{1};
    uint64_t connectionsCreated{0};
    uint64_t leasesGranted{0};
    uint64_t leaseMisses{0};
    uint64_t devicesReleased{0};

    explicit State(size_t max) : maxPerDevice(max) {}

    void release(const std::string& serial, const std::string& connectionId) {
        std::unique_lock lock(poolsMutex);
        auto it = devicePools.find(serial);
        if (it == devicePools.end()) {
            return;
        }
        for (auto& conn : it->second) {
            if (conn.connectionId == connectionId && conn.active) {
                conn.active = false;
                conn.lastUsed = std::chrono::steady_clock::now();
                spdlog::debug("Released connection {} for device {}",
                              connectionId, serial);
                return;
            }
        }
    }
};

ConnectionLease::ConnectionLease(std::weak_ptr<State> pool, std::string serial,
                                 std::string connectionId)
    : pool_(std::move(pool)),
      serial_(std::move(serial)),
      connectionId_(std::move(connectionId)) {}

ConnectionLease::~ConnectionLease() { release(); }

ConnectionLease::ConnectionLease(ConnectionLease&& other) noexcept
    : pool_(std::move(other.pool_)),
      serial_(std::move(other.serial_)),
      connectionId_(std::move(other.connectionId_)) {
    other.pool_.reset();
}

ConnectionLease& ConnectionLease::operator=(ConnectionLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::move(other.pool_);
        serial_ = std::move(other.serial_);
        connectionId_ = std::move(other.connectionId_);
        other.pool_.reset();
    }
    return *this;
}

void ConnectionLease::release() noexcept {
    if (auto pool = pool_.lock()) {
        try {
            pool->release(serial_, connectionId_);
        } catch (const std::exception& e) {
            spdlog::error("Failed to release connection {}: {}", connectionId_,
                          e.what());
        }
    }
    pool_.reset();
}

ConnectionPool::ConnectionPool(size_t maxPerDevice)
    : state_(std::make_shared<ConnectionLease::State>(
          std::max<size_t>(1, maxPerDevice))) {
    spdlog::debug("Connection pool initialized with max {} connections per device",
                  state_->maxPerDevice);
}

ConnectionPool::~ConnectionPool() = default;

auto ConnectionPool::acquire(const std::string& serial)
    -> std::optional<ConnectionLease> {
    std::unique_lock lock(state_->poolsMutex);
    auto& pool = state_->devicePools[serial];
    auto now = std::chrono::steady_clock::now();

    auto idle = std::find_if(pool.begin(), pool.end(),
                             [](const PoolConnection& c) { return !c.active; });
    if (idle != pool.end()) {
        idle->active = true;
        idle->lastUsed = now;
        idle->usageCount++;
        state_->leasesGranted++;
        return ConnectionLease(state_, serial, idle->connectionId);
    }

    if (pool.size() < state_->maxPerDevice) {
        PoolConnection conn;
        conn.connectionId = serial + "#" + std::to_string(state_->nextId++);
        conn.active = true;
        conn.createdAt = now;
        conn.lastUsed = now;
        conn.usageCount = 1;
        pool.push_back(conn);
        state_->connectionsCreated++;
        state_->leasesGranted++;
        spdlog::debug("Created connection {} for device {}", conn.connectionId,
                      serial);
        return ConnectionLease(state_, serial, conn.connectionId);
    }

    state_->leaseMisses++;
    spdlog::debug("No free connection for device {}, running unpooled", serial);
    return std::nullopt;
}

void ConnectionPool::releaseDevice(const std::string& serial) {
    std::unique_lock lock(state_->poolsMutex);
    if (state_->devicePools.erase(serial) > 0) {
        state_->devicesReleased++;
        spdlog::debug("Released pooled connections of device {}", serial);
    }
}

auto ConnectionPool::activeConnections(const std::string& serial) const
    -> size_t {
    std::shared_lock lock(state_->poolsMutex);
    auto it = state_->devicePools.find(serial);
    if (it == state_->devicePools.end()) {
        return 0;
    }
    return static_cast<size_t>(
        std::count_if(it->second.begin(), it->second.end(),
                      [](const PoolConnection& c) { return c.active; }));
}

auto ConnectionPool::statistics() const -> ConnectionStatistics {
    std::shared_lock lock(state_->poolsMutex);
    ConnectionStatistics stats;
    stats.devices = state_->devicePools.size();
    for (const auto& [serial, pool] : state_->devicePools) {
        stats.totalConnections += pool.size();
        for (const auto& conn : pool) {
            if (conn.active) {
                stats.activeConnections++;
            }
        }
    }
    stats.connectionsCreated = state_->connectionsCreated;
    stats.leasesGranted = state_->leasesGranted;
    stats.leaseMisses = state_->leaseMisses;
    stats.devicesReleased = state_->devicesReleased;
    return stats;
}

auto ConnectionPool::maxPerDevice() const noexcept -> size_t {
    return state_->maxPerDevice;
}

}  // namespace helium::device
