// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Helium - Device command dispatch engine
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef HELIUM_CACHE_RESULT_CACHE_HPP
#define HELIUM_CACHE_RESULT_CACHE_HPP

#include "cache_entry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "config/engine_config.hpp"

namespace helium::cache {

/**
 * @brief Cache counters reported in the performance report.
 */
struct CacheStatistics {
    size_t size{0};
    size_t maxSize{0};
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t evictions{0};
    uint64_t expirations{0};

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"size", size},         {"max_size", maxSize},
                {"hits", hits},         {"misses", misses},
                {"evictions", evictions}, {"expirations", expirations}};
    }
};

/**
 * @brief Thread-safe TTL cache of command results.
 *
 * Entries are keyed by the command fingerprint. Only successful results are
 * stored. When the cache is full the least recently accessed tenth of the
 * entries is evicted before inserting. A background thread, started with
 * startSweeper(), purges expired entries periodically.
 */
class ResultCache {
public:
    explicit ResultCache(config::CacheConfig config = {});

    /**
     * @brief Destructor that stops the sweeper thread.
     */
    ~ResultCache();

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    /**
     * @brief Stable cache key of a command.
     *
     * FNV-1a over the command kind, the argv with whitespace collapsed and
     * the device serial ("default" when absent). Timeout, retry budget and
     * priority are not part of the key.
     *
     * @return 16 lowercase hex digits.
     */
    [[nodiscard]] static auto fingerprint(const dispatch::Command& command)
        -> std::string;

    /**
     * @brief Gets the cached result of a command.
     *
     * @return The stored result while fresh; an expired entry is removed and
     * reported as a miss.
     */
    auto get(const dispatch::Command& command)
        -> std::optional<dispatch::CommandResult>;

    /**
     * @brief Stores a result.
     *
     * @param ttl Freshness window; the configured default when absent.
     * @return False if the result was not stored because it failed.
     */
    auto put(const dispatch::Command& command,
             const dispatch::CommandResult& result,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt)
        -> bool;

    auto remove(const dispatch::Command& command) -> bool;

    [[nodiscard]] auto contains(const dispatch::Command& command) const
        -> bool;

    void clear();

    /**
     * @brief Removes every expired entry.
     *
     * @return Number of entries removed.
     */
    auto purgeExpired() -> size_t;

    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto maxSize() const noexcept -> size_t {
        return config_.maxEntries;
    }
    [[nodiscard]] auto statistics() const -> CacheStatistics;

    void startSweeper();
    void stopSweeper();

private:
    void evictLeastRecentlyUsed();
    void sweepPeriodically();

    config::CacheConfig config_;

    mutable std::shared_mutex cacheMutex_;
    std::unordered_map<std::string, CacheEntry> cache_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> expirations_{0};

    std::thread sweepThread_;
    std::atomic<bool> sweeping_{false};
    std::mutex stopMutex_;
    std::condition_variable stopCond_;
};

}  // namespace helium::cache

#endif  // HELIUM_CACHE_RESULT_CACHE_HPP
