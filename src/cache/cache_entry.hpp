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

#ifndef HELIUM_CACHE_CACHE_ENTRY_HPP
#define HELIUM_CACHE_CACHE_ENTRY_HPP

#include <chrono>
#include <cstdint>

#include "dispatch/command.hpp"

namespace helium::cache {

/**
 * @brief Represents a cached command result with its freshness window.
 */
struct CacheEntry {
    dispatch::CommandResult result;  ///< The cached result.
    std::chrono::steady_clock::time_point createdAt;  ///< Insertion time.
    std::chrono::milliseconds ttl{0};                 ///< Time-to-live.
    uint64_t accessCount{0};  ///< Number of hits served.
    std::chrono::steady_clock::time_point lastAccess;  ///< Last hit or insert.

    /// Fresh while now - createdAt <= ttl
    [[nodiscard]] auto isExpired(
        std::chrono::steady_clock::time_point now) const -> bool {
        return now - createdAt > ttl;
    }
};

}  // namespace helium::cache

#endif  // HELIUM_CACHE_CACHE_ENTRY_HPP
