/*
 * device_profiler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Device profiler implementation

*************************************************/

#include "device_profiler.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <future>
#include <mutex>
#include <sstream>

#include <spdlog/spdlog.h>

namespace helium::profiler {

namespace {

auto trim(std::string_view s) -> std::string {
    auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r");
    return std::string(s.substr(begin, end - begin + 1));
}

auto toLower(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

template <typename T>
auto parseNumber(const std::string& s) -> std::optional<T> {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

auto secondsSince(std::chrono::steady_clock::time_point start) -> double {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                         start)
        .count();
}

}  // namespace

auto DeviceProfile::toJson() const -> json {
    return {{"serial", serial},
            {"cpu_info", cpuInfo},
            {"memory_info", memoryInfo},
            {"network_latency", networkLatency},
            {"command_throughput", commandThroughput},
            {"optimal_concurrency", optimalConcurrency},
            {"last_profiled",
             std::chrono::duration<double>(lastProfiled.time_since_epoch())
                 .count()}};
}

auto DeviceProfile::fromJson(const json& j) -> DeviceProfile {
    DeviceProfile p;
    p.serial = j.value("serial", p.serial);
    p.cpuInfo = j.value("cpu_info", json::object());
    p.memoryInfo = j.value("memory_info", json::object());
    p.networkLatency = j.value("network_latency", p.networkLatency);
    p.commandThroughput = j.value("command_throughput", p.commandThroughput);
    p.optimalConcurrency = j.value("optimal_concurrency", p.optimalConcurrency);
    if (j.contains("last_profiled")) {
        auto seconds = j["last_profiled"].get<double>();
        p.lastProfiled = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::duration<double>(seconds)));
    }
    return p;
}

DeviceProfiler::DeviceProfiler(
    std::shared_ptr<dispatch::CommandExecutor> executor,
    config::ProfilerConfig config,
    std::shared_ptr<device::DeviceRegistry> registry)
    : executor_(std::move(executor)),
      config_(std::move(config)),
      registry_(std::move(registry)) {}

auto DeviceProfiler::profile(const std::string& serial)
    -> dispatch::DispatchResult<DeviceProfile> {
    if (registry_ && !registry_->contains(serial)) {
        return std::unexpected(dispatch::DispatchError(
            dispatch::DispatchErrorCode::DeviceNotFound,
            "Cannot profile unknown device", serial));
    }

    spdlog::info("Profiling device {}", serial);
    DeviceProfile profile;
    profile.serial = serial;

    auto cpu = executor_->execute(makeCommand(serial, {"shell", "cat /proc/cpuinfo"}));
    if (cpu.success) {
        profile.cpuInfo = parseCpuInfo(cpu.stdOut);
    } else {
        spdlog::warn("CPU info query failed for {}", serial);
    }

    auto mem = executor_->execute(makeCommand(serial, {"shell", "cat /proc/meminfo"}));
    if (mem.success) {
        profile.memoryInfo = parseMemoryInfo(mem.stdOut);
    } else {
        spdlog::warn("Memory info query failed for {}", serial);
    }

    profile.commandThroughput =
        measureThroughput(serial).value_or(config_.defaultThroughput);
    profile.networkLatency = measureLatency(serial).value_or(
        static_cast<double>(config_.defaultLatencyMs) / 1000.0);
    profile.optimalConcurrency =
        measureConcurrency(serial).value_or(config_.defaultConcurrency);
    profile.lastProfiled = std::chrono::system_clock::now();

    spdlog::info(
        "Device {} profiled: throughput {:.2f} cmd/s, latency {:.1f}ms, "
        "concurrency {}",
        serial, profile.commandThroughput, profile.networkLatency * 1000.0,
        profile.optimalConcurrency);

    setProfile(profile);
    return profile;
}

auto DeviceProfiler::makeCommand(const std::string& serial,
                                 std::vector<std::string> argv) const
    -> std::shared_ptr<const dispatch::Command> {
    auto command = std::make_shared<dispatch::Command>(
        std::move(argv), serial, dispatch::CommandKind::Shell);
    command->timeout = std::chrono::milliseconds(config_.probeTimeoutMs);
    command->retryCount = 1;
    return command;
}

auto DeviceProfiler::measureThroughput(const std::string& serial)
    -> std::optional<double> {
    auto count = std::max<size_t>(1, config_.burstSize);
    auto start = std::chrono::steady_clock::now();

    std::vector<std::future<dispatch::CommandResult>> futures;
    futures.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        futures.push_back(std::async(std::launch::async,
                                     &dispatch::CommandExecutor::execute,
                                     executor_.get(),
                                     makeCommand(serial, config_.probeArgs)));
    }

    size_t succeeded = 0;
    for (auto& f : futures) {
        if (f.get().success) {
            succeeded++;
        }
    }

    auto elapsed = secondsSince(start);
    if (succeeded == 0 || elapsed <= 0.0) {
        spdlog::warn("Throughput test failed for {}", serial);
        return std::nullopt;
    }
    double throughput = static_cast<double>(count) / elapsed;
    spdlog::debug("Device {} throughput: {:.2f} cmd/s", serial, throughput);
    return throughput;
}

auto DeviceProfiler::measureLatency(const std::string& serial)
    -> std::optional<double> {
    std::vector<double> latencies;
    for (size_t i = 0; i < config_.latencySamples; ++i) {
        auto start = std::chrono::steady_clock::now();
        auto result = executor_->execute(makeCommand(serial, config_.probeArgs));
        if (result.success) {
            latencies.push_back(secondsSince(start));
        }
    }

    if (latencies.empty()) {
        spdlog::warn("Latency test failed for {}", serial);
        return std::nullopt;
    }
    double sum = 0.0;
    for (double l : latencies) {
        sum += l;
    }
    double average = sum / static_cast<double>(latencies.size());
    spdlog::debug("Device {} latency: {:.1f}ms", serial, average * 1000.0);
    return average;
}

auto DeviceProfiler::measureConcurrency(const std::string& serial)
    -> std::optional<size_t> {
    if (config_.concurrencyLevels.empty()) {
        return std::nullopt;
    }

    std::vector<double> throughputs;
    for (auto level : config_.concurrencyLevels) {
        level = std::max<size_t>(1, level);
        auto start = std::chrono::steady_clock::now();

        std::vector<std::future<size_t>> workers;
        workers.reserve(level);
        for (size_t w = 0; w < level; ++w) {
            workers.push_back(std::async(std::launch::async, [this, &serial] {
                size_t ok = 0;
                for (size_t i = 0; i < config_.commandsPerWorker; ++i) {
                    if (executor_->execute(makeCommand(serial, config_.loadArgs))
                            .success) {
                        ok++;
                    }
                }
                return ok;
            }));
        }

        size_t succeeded = 0;
        for (auto& w : workers) {
            succeeded += w.get();
        }
        if (succeeded == 0) {
            spdlog::warn("Concurrency test failed for {} at level {}", serial,
                         level);
            return std::nullopt;
        }

        double throughput =
            static_cast<double>(level * config_.commandsPerWorker) /
            secondsSince(start);
        spdlog::debug("Concurrency {}: {:.2f} cmd/s", level, throughput);
        throughputs.push_back(throughput);
    }

    return selectOptimalConcurrency(config_.concurrencyLevels, throughputs);
}

auto DeviceProfiler::selectOptimalConcurrency(
    const std::vector<size_t>& levels, const std::vector<double>& throughputs)
    -> size_t {
    size_t best = levels.empty() ? 1 : levels.front();
    double bestThroughput = -1.0;
    auto n = std::min(levels.size(), throughputs.size());
    for (size_t i = 0; i < n; ++i) {
        if (throughputs[i] > bestThroughput ||
            (throughputs[i] == bestThroughput && levels[i] < best)) {
            bestThroughput = throughputs[i];
            best = levels[i];
        }
    }
    return best;
}

auto DeviceProfiler::parseCpuInfo(std::string_view text) -> json {
    json info = json::object();
    std::istringstream stream{std::string(text)};
    std::string line;
    while (std::getline(stream, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        auto key = toLower(trim(std::string_view(line).substr(0, colon)));
        std::replace(key.begin(), key.end(), ' ', '_');
        auto value = trim(std::string_view(line).substr(colon + 1));
        if (key.empty()) {
            continue;
        }

        if (key == "processor" || key == "cpu_cores" || key == "siblings") {
            if (auto n = parseNumber<int64_t>(value)) {
                info[key] = *n;
                continue;
            }
        } else if (key == "bogomips" || key == "cpu_mhz") {
            if (auto n = parseNumber<double>(value)) {
                info[key] = *n;
                continue;
            }
        }
        info[key] = value;
    }
    return info;
}

auto DeviceProfiler::parseMemoryInfo(std::string_view text) -> json {
    json info = json::object();
    std::istringstream stream{std::string(text)};
    std::string line;
    while (std::getline(stream, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        auto key = toLower(trim(std::string_view(line).substr(0, colon)));
        auto value = trim(std::string_view(line).substr(colon + 1));
        if (key.empty() || value.empty()) {
            continue;
        }

        std::istringstream parts(value);
        std::string number;
        std::string unit;
        parts >> number >> unit;
        auto parsed = parseNumber<int64_t>(number);
        if (!parsed) {
            info[key] = value;
            continue;
        }
        auto bytes = *parsed;
        unit = toLower(unit);
        if (unit == "kb") {
            bytes *= 1024;
        } else if (unit == "mb") {
            bytes *= 1024 * 1024;
        }
        info[key] = bytes;
    }
    return info;
}

auto DeviceProfiler::getProfile(const std::string& serial) const
    -> std::optional<DeviceProfile> {
    std::shared_lock lock(profilesMutex_);
    auto it = profiles_.find(serial);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto DeviceProfiler::profiles() const -> std::vector<DeviceProfile> {
    std::shared_lock lock(profilesMutex_);
    std::vector<DeviceProfile> result;
    result.reserve(profiles_.size());
    for (const auto& [serial, p] : profiles_) {
        result.push_back(p);
    }
    return result;
}

void DeviceProfiler::setProfile(DeviceProfile profile) {
    std::unique_lock lock(profilesMutex_);
    auto serial = profile.serial;
    profiles_.insert_or_assign(serial, std::move(profile));
}

auto DeviceProfiler::toJson() const -> json {
    std::shared_lock lock(profilesMutex_);
    json j = json::object();
    for (const auto& [serial, p] : profiles_) {
        j[serial] = p.toJson();
    }
    return j;
}

auto DeviceProfiler::loadJson(const json& j) -> size_t {
    if (!j.is_object()) {
        return 0;
    }
    std::unordered_map<std::string, DeviceProfile> loaded;
    for (const auto& [serial, value] : j.items()) {
        auto p = DeviceProfile::fromJson(value);
        if (p.serial.empty()) {
            p.serial = serial;
        }
        loaded.insert_or_assign(serial, std::move(p));
    }

    std::unique_lock lock(profilesMutex_);
    profiles_ = std::move(loaded);
    return profiles_.size();
}

}  // namespace helium::profiler
