/*
 * device_registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device_registry.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace helium::device {

class DeviceRegistry::Impl {
public:
    std::shared_ptr<transport::BridgeTransport> transport_;
    std::shared_ptr<ConnectionPool> pool_;
    config::ScannerConfig config_;
    std::chrono::milliseconds listTimeout_;

    std::unordered_map<std::string, Device> devices_;
    mutable std::shared_mutex devicesMutex_;

    std::atomic<bool> running_{false};
    std::thread scannerThread_;
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;

    Impl(std::shared_ptr<transport::BridgeTransport> transport,
         std::shared_ptr<ConnectionPool> pool, config::ScannerConfig config,
         std::chrono::milliseconds listTimeout)
        : transport_(std::move(transport)),
          pool_(std::move(pool)),
          config_(config),
          listTimeout_(listTimeout) {}

    ~Impl() { stop(); }

    void start() {
        if (running_.exchange(true)) {
            return;
        }
        scannerThread_ = std::thread(&Impl::scanLoop, this);
        spdlog::info("Device scanner started (interval {}ms)",
                     config_.intervalMs);
    }

    void stop() {
        {
            // Under wakeMutex_ so the scanner cannot miss the notification
            std::lock_guard lock(wakeMutex_);
            if (!running_.exchange(false)) {
                return;
            }
        }
        wakeCv_.notify_all();
        if (scannerThread_.joinable()) {
            scannerThread_.join();
        }
        spdlog::info("Device scanner stopped");
    }

    void scanLoop() {
        while (running_) {
            try {
                auto result = scan();
                if (!result) {
                    spdlog::error("Device scan failed: {}",
                                  result.error().toString());
                }
            } catch (const std::exception& e) {
                spdlog::error("Error in device scan loop: {}", e.what());
            }

            std::unique_lock lock(wakeMutex_);
            wakeCv_.wait_for(lock,
                             std::chrono::milliseconds(config_.intervalMs),
                             [this] { return !running_.load(); });
        }
    }

    auto scan() -> dispatch::DispatchResult<size_t> {
        auto output = transport_->run({"devices", "-l"}, listTimeout_);
        if (!output) {
            return std::unexpected(output.error());
        }
        if (!output->success()) {
            return dispatch::failure<size_t>(
                dispatch::DispatchErrorCode::CommandFailed,
                "Device listing exited with code " +
                    std::to_string(output->exitCode) + ": " + output->stdErr);
        }

        auto listings = parseListing(output->stdOut);
        applyScan(listings, std::chrono::system_clock::now());
        spdlog::debug("Device scan found {} device(s)", listings.size());
        return listings.size();
    }

    void applyScan(const std::vector<DeviceListing>& listings,
                   std::chrono::system_clock::time_point now) {
        std::vector<std::string> stale;
        {
            std::unique_lock lock(devicesMutex_);
            std::unordered_set<std::string> seen;

            for (const auto& listing : listings) {
                seen.insert(listing.serial);
                auto [it, inserted] = devices_.try_emplace(listing.serial);
                auto& device = it->second;
                if (inserted) {
                    device.serial = listing.serial;
                    spdlog::info("New device detected: {} ({})", listing.serial,
                                 deviceStateToString(listing.state));
                } else if (device.state != listing.state) {
                    spdlog::info("Device {} state changed: {} -> {}",
                                 listing.serial,
                                 deviceStateToString(device.state),
                                 deviceStateToString(listing.state));
                }
                device.state = listing.state;
                device.lastSeen = now;
                applyProperties(device, listing.properties);
            }

            auto staleAfter = std::chrono::milliseconds(config_.intervalMs *
                                                        config_.staleFactor);
            for (auto it = devices_.begin(); it != devices_.end();) {
                if (seen.contains(it->first)) {
                    ++it;
                    continue;
                }
                if (now - it->second.lastSeen > staleAfter) {
                    stale.push_back(it->first);
                    it = devices_.erase(it);
                    continue;
                }
                it->second.state = DeviceState::Disconnected;
                ++it;
            }
        }

        for (const auto& serial : stale) {
            spdlog::info("Removing stale device {}", serial);
            if (pool_) {
                pool_->releaseDevice(serial);
            }
        }
    }

    static void applyProperties(
        Device& device,
        const std::unordered_map<std::string, std::string>& props) {
        auto assign = [&props](const char* key,
                               std::optional<std::string>& field) {
            if (auto it = props.find(key); it != props.end()) {
                field = it->second;
            }
        };
        assign("product", device.product);
        assign("model", device.model);
        assign("device", device.deviceName);
        assign("transport_id", device.transportId);
    }

    void recordOutcome(const std::string& serial, bool success,
                       std::chrono::duration<double> latency) {
        std::unique_lock lock(devicesMutex_);
        auto it = devices_.find(serial);
        if (it == devices_.end()) {
            return;
        }
        auto& device = it->second;
        bool firstSample = device.successCount + device.failureCount == 0;

        if (success) {
            device.successCount++;
        } else {
            device.failureCount++;
        }

        double target = success ? 1.0 : 0.0;
        device.connectionQuality =
            (1.0 - EMA_ALPHA) * device.connectionQuality + EMA_ALPHA * target;

        if (firstSample) {
            device.averageLatency = latency;
        } else {
            device.averageLatency = (1.0 - EMA_ALPHA) * device.averageLatency +
                                    EMA_ALPHA * latency;
        }
    }
};

DeviceRegistry::DeviceRegistry(
    std::shared_ptr<transport::BridgeTransport> transport,
    std::shared_ptr<ConnectionPool> pool, config::ScannerConfig config,
    std::chrono::milliseconds listTimeout)
    : pimpl_(std::make_unique<Impl>(std::move(transport), std::move(pool),
                                    config, listTimeout)) {}

DeviceRegistry::~DeviceRegistry() = default;

void DeviceRegistry::start() { pimpl_->start(); }

void DeviceRegistry::stop() { pimpl_->stop(); }

auto DeviceRegistry::isRunning() const -> bool { return pimpl_->running_; }

auto DeviceRegistry::scan() -> dispatch::DispatchResult<size_t> {
    return pimpl_->scan();
}

auto DeviceRegistry::parseListing(std::string_view text)
    -> std::vector<DeviceListing> {
    std::vector<DeviceListing> listings;
    std::istringstream stream{std::string(text)};
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        std::string_view trimmed(line);
        trimmed.remove_prefix(first);
        if (trimmed.starts_with("List of devices") ||
            trimmed.starts_with("*")) {
            continue;
        }

        std::istringstream fields{std::string(trimmed)};
        std::string serial;
        std::string state;
        if (!(fields >> serial >> state)) {
            spdlog::warn("Skipping malformed device line: '{}'", line);
            continue;
        }

        DeviceListing listing;
        listing.serial = serial;
        listing.state = deviceStateFromString(state);

        std::string token;
        while (fields >> token) {
            auto colon = token.find(':');
            if (colon == std::string::npos || colon == 0) {
                continue;
            }
            listing.properties[token.substr(0, colon)] =
                token.substr(colon + 1);
        }
        listings.push_back(std::move(listing));
    }
    return listings;
}

void DeviceRegistry::applyScan(const std::vector<DeviceListing>& listings,
                               std::chrono::system_clock::time_point now) {
    pimpl_->applyScan(listings, now);
}

void DeviceRegistry::recordOutcome(const std::string& serial, bool success,
                                   std::chrono::duration<double> latency) {
    pimpl_->recordOutcome(serial, success, latency);
}

auto DeviceRegistry::find(const std::string& serial) const
    -> std::optional<Device> {
    std::shared_lock lock(pimpl_->devicesMutex_);
    auto it = pimpl_->devices_.find(serial);
    if (it == pimpl_->devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto DeviceRegistry::contains(const std::string& serial) const -> bool {
    std::shared_lock lock(pimpl_->devicesMutex_);
    return pimpl_->devices_.contains(serial);
}

auto DeviceRegistry::snapshot() const -> std::vector<Device> {
    std::shared_lock lock(pimpl_->devicesMutex_);
    std::vector<Device> result;
    result.reserve(pimpl_->devices_.size());
    for (const auto& [serial, device] : pimpl_->devices_) {
        result.push_back(device);
    }
    return result;
}

auto DeviceRegistry::connectedDevices() const -> std::vector<Device> {
    std::shared_lock lock(pimpl_->devicesMutex_);
    std::vector<Device> result;
    for (const auto& [serial, device] : pimpl_->devices_) {
        if (device.isConnected()) {
            result.push_back(device);
        }
    }
    return result;
}

auto DeviceRegistry::size() const -> size_t {
    std::shared_lock lock(pimpl_->devicesMutex_);
    return pimpl_->devices_.size();
}

}  // namespace helium::device
