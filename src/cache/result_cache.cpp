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

#include "result_cache.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace helium::cache {

namespace {

constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

void fnvMix(uint64_t& hash, std::string_view data) {
    for (unsigned char c : data) {
        hash ^= c;
        hash *= FNV_PRIME;
    }
}

auto collapseWhitespace(const std::string& arg) -> std::string {
    std::string out;
    out.reserve(arg.size());
    bool pendingSpace = false;
    for (char c : arg) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out += ' ';
            pendingSpace = false;
        }
        out += c;
    }
    return out;
}

}  // namespace

//------------------------------------------------------------------------------
// ResultCache Implementation
//------------------------------------------------------------------------------

ResultCache::ResultCache(config::CacheConfig config) : config_(config) {
    if (config_.maxEntries == 0) {
        config_.maxEntries = 1;
    }
}

ResultCache::~ResultCache() { stopSweeper(); }

auto ResultCache::fingerprint(const dispatch::Command& command)
    -> std::string {
    uint64_t hash = FNV_OFFSET_BASIS;
    fnvMix(hash, dispatch::commandKindToString(command.kind));
    fnvMix(hash, "|");
    bool first = true;
    for (const auto& arg : command.argv) {
        auto normalized = collapseWhitespace(arg);
        if (normalized.empty()) {
            continue;
        }
        if (!first) {
            fnvMix(hash, " ");
        }
        fnvMix(hash, normalized);
        first = false;
    }
    fnvMix(hash, "|");
    fnvMix(hash, command.deviceKey());

    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx",
                  static_cast<unsigned long long>(hash));
    return buffer;
}

auto ResultCache::get(const dispatch::Command& command)
    -> std::optional<dispatch::CommandResult> {
    auto key = fingerprint(command);
    auto now = std::chrono::steady_clock::now();

    std::unique_lock<std::shared_mutex> lock(cacheMutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        misses_++;
        return std::nullopt;
    }

    if (it->second.isExpired(now)) {
        cache_.erase(it);
        expirations_++;
        misses_++;
        spdlog::debug("Cache entry {} expired", key);
        return std::nullopt;
    }

    it->second.accessCount++;
    it->second.lastAccess = now;
    hits_++;
    return it->second.result;
}

auto ResultCache::put(const dispatch::Command& command,
                      const dispatch::CommandResult& result,
                      std::optional<std::chrono::milliseconds> ttl) -> bool {
    if (!result.success) {
        return false;
    }

    auto key = fingerprint(command);
    auto now = std::chrono::steady_clock::now();
    std::chrono::milliseconds effectiveTtl =
        ttl.value_or(std::chrono::seconds(config_.defaultTtlSeconds));
    if (config_.maxTtlMs > 0) {
        effectiveTtl = std::min(effectiveTtl,
                                std::chrono::milliseconds(config_.maxTtlMs));
    }

    std::unique_lock<std::shared_mutex> lock(cacheMutex_);
    if (!cache_.contains(key) && cache_.size() >= config_.maxEntries) {
        evictLeastRecentlyUsed();
    }
    cache_[key] = CacheEntry{result, now, effectiveTtl, 0, now};
    spdlog::debug("Cached result of '{}' for {}ms", command.joined(),
                  effectiveTtl.count());
    return true;
}

auto ResultCache::remove(const dispatch::Command& command) -> bool {
    std::unique_lock<std::shared_mutex> lock(cacheMutex_);
    return cache_.erase(fingerprint(command)) > 0;
}

auto ResultCache::contains(const dispatch::Command& command) const -> bool {
    std::shared_lock<std::shared_mutex> lock(cacheMutex_);
    return cache_.contains(fingerprint(command));
}

void ResultCache::clear() {
    std::unique_lock<std::shared_mutex> lock(cacheMutex_);
    cache_.clear();
}

auto ResultCache::purgeExpired() -> size_t {
    const auto now = std::chrono::steady_clock::now();
    size_t removedCount = 0;

    std::unique_lock<std::shared_mutex> lock(cacheMutex_);
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (it->second.isExpired(now)) {
            it = cache_.erase(it);
            removedCount++;
        } else {
            ++it;
        }
    }
    expirations_ += removedCount;
    return removedCount;
}

// Caller holds the unique lock
void ResultCache::evictLeastRecentlyUsed() {
    auto count = static_cast<size_t>(static_cast<double>(cache_.size()) *
                                     config_.evictFraction);
    count = std::clamp<size_t>(count, 1, cache_.size());

    std::vector<std::pair<std::chrono::steady_clock::time_point, std::string>>
        byAccess;
    byAccess.reserve(cache_.size());
    for (const auto& [key, entry] : cache_) {
        byAccess.emplace_back(entry.lastAccess, key);
    }
    std::nth_element(byAccess.begin(), byAccess.begin() + (count - 1),
                     byAccess.end());
    for (size_t i = 0; i < count; ++i) {
        cache_.erase(byAccess[i].second);
    }
    evictions_ += count;
    spdlog::debug("Cache full, evicted {} least recently used entries", count);
}

auto ResultCache::size() const -> size_t {
    std::shared_lock<std::shared_mutex> lock(cacheMutex_);
    return cache_.size();
}

auto ResultCache::statistics() const -> CacheStatistics {
    CacheStatistics stats;
    stats.size = size();
    stats.maxSize = config_.maxEntries;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    stats.expirations = expirations_;
    return stats;
}

void ResultCache::startSweeper() {
    if (sweeping_.exchange(true)) {
        return;
    }
    sweepThread_ = std::thread(&ResultCache::sweepPeriodically, this);
}

void ResultCache::stopSweeper() {
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        if (!sweeping_.exchange(false)) {
            return;
        }
    }
    stopCond_.notify_one();

    if (sweepThread_.joinable()) {
        sweepThread_.join();
    }
}

void ResultCache::sweepPeriodically() {
    auto interval = std::chrono::milliseconds(config_.sweepIntervalMs);

    while (true) {
        std::unique_lock<std::mutex> lock(stopMutex_);
        if (stopCond_.wait_for(lock, interval,
                               [this] { return !sweeping_.load(); })) {
            break;
        }

        lock.unlock();
        try {
            size_t removed = purgeExpired();
            if (removed > 0) {
                spdlog::info("Cache sweep: removed {} expired entries",
                             removed);
            }
        } catch (const std::exception& e) {
            spdlog::error("Exception in cache sweep thread: {}", e.what());
        }
    }
}

}  // namespace helium::cache
