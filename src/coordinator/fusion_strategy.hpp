/*
 * fusion_strategy.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Kind-specific fusion of read-only commands into one invocation

**************************************************/

#ifndef HELIUM_COORDINATOR_FUSION_STRATEGY_HPP
#define HELIUM_COORDINATOR_FUSION_STRATEGY_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "dispatch/command.hpp"

namespace helium::coordinator {

/**
 * @brief Combines compatible commands targeting one device
 *
 * split() maps the fused result back onto the originals, in order. An
 * original it cannot answer is left empty and gets executed on its own.
 */
class FusionStrategy {
public:
    virtual ~FusionStrategy() = default;

    [[nodiscard]] virtual auto name() const -> std::string = 0;

    [[nodiscard]] virtual auto canFuse(const dispatch::Command& command) const
        -> bool = 0;

    [[nodiscard]] virtual auto fuse(
        const std::vector<std::shared_ptr<const dispatch::Command>>& commands)
        const -> dispatch::Command = 0;

    [[nodiscard]] virtual auto split(
        const dispatch::CommandResult& fused,
        const std::vector<std::shared_ptr<const dispatch::Command>>& commands)
        const -> std::vector<std::optional<dispatch::CommandResult>> = 0;
};

/**
 * @brief Turns `shell getprop <key>` reads into one `shell getprop` listing
 *
 * The listing prints `[key]: [value]` per property; each original receives
 * its value followed by a newline, exactly as a single read prints it.
 */
class PropertyFusion : public FusionStrategy {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "property_batch";
    }

    [[nodiscard]] auto canFuse(const dispatch::Command& command) const
        -> bool override;

    [[nodiscard]] auto fuse(
        const std::vector<std::shared_ptr<const dispatch::Command>>& commands)
        const -> dispatch::Command override;

    [[nodiscard]] auto split(
        const dispatch::CommandResult& fused,
        const std::vector<std::shared_ptr<const dispatch::Command>>& commands)
        const -> std::vector<std::optional<dispatch::CommandResult>> override;

    /// Property key of a fusable read
    [[nodiscard]] static auto propertyKey(const dispatch::Command& command)
        -> std::optional<std::string>;
};

}  // namespace helium::coordinator

#endif  // HELIUM_COORDINATOR_FUSION_STRATEGY_HPP
