/*
 * cache_policy.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef HELIUM_COORDINATOR_CACHE_POLICY_HPP
#define HELIUM_COORDINATOR_CACHE_POLICY_HPP

#include <chrono>
#include <string>
#include <vector>

#include "dispatch/command.hpp"

namespace helium::coordinator {

/**
 * @brief Decides which results may be cached and for how long
 *
 * Words are matched against the argv tokens, split on whitespace and shell
 * separators. A token matches a word when it equals it, ends with "/word",
 * or starts with "word-". State-changing words always win over read-only
 * ones.
 */
class CachePolicy {
public:
    static constexpr std::chrono::seconds VOLATILE_TTL{30};
    static constexpr std::chrono::seconds DEFAULT_TTL{60};
    static constexpr std::chrono::seconds SEMI_STATIC_TTL{300};
    static constexpr std::chrono::seconds STATIC_TTL{3600};

    [[nodiscard]] static auto isCacheable(const dispatch::Command& command)
        -> bool;

    [[nodiscard]] static auto ttlFor(const dispatch::Command& command)
        -> std::chrono::milliseconds;

    [[nodiscard]] static auto tokenize(const dispatch::Command& command)
        -> std::vector<std::string>;

    [[nodiscard]] static auto matchesWord(const std::string& token,
                                          const std::string& word) -> bool;
};

}  // namespace helium::coordinator

#endif  // HELIUM_COORDINATOR_CACHE_POLICY_HPP
