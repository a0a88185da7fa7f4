/*
 * command_executor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Runs one command through the bridge with retry and backoff

**************************************************/

#ifndef HELIUM_DISPATCH_COMMAND_EXECUTOR_HPP
#define HELIUM_DISPATCH_COMMAND_EXECUTOR_HPP

#include <chrono>
#include <memory>

#include "command.hpp"
#include "config/engine_config.hpp"
#include "device/device_connection_pool.hpp"
#include "device/device_registry.hpp"
#include "transport/bridge_transport.hpp"

namespace helium::dispatch {

/**
 * @brief Blocking, retrying command runner
 *
 * A spawn failure, an expired attempt or a non-zero exit status counts as
 * a failed attempt. Each attempt is bounded by the command timeout; between
 * attempts the executor sleeps for the backoff delay. The result of the
 * last attempt is returned with the number of attempts made.
 */
class CommandExecutor {
public:
    CommandExecutor(std::shared_ptr<transport::BridgeTransport> transport,
                    config::RetryConfig retry,
                    std::shared_ptr<device::DeviceRegistry> registry = nullptr,
                    std::shared_ptr<device::ConnectionPool> pool = nullptr);

    [[nodiscard]] auto execute(std::shared_ptr<const Command> command)
        -> CommandResult;

    /// Delay before attempt @p attempt + 1, for attempt >= 1
    [[nodiscard]] auto backoffDelay(int attempt) const
        -> std::chrono::milliseconds;

    [[nodiscard]] auto bridge() const
        -> std::shared_ptr<transport::BridgeTransport> {
        return transport_;
    }

private:
    std::shared_ptr<transport::BridgeTransport> transport_;
    config::RetryConfig retry_;
    std::shared_ptr<device::DeviceRegistry> registry_;
    std::shared_ptr<device::ConnectionPool> pool_;
};

}  // namespace helium::dispatch

#endif  // HELIUM_DISPATCH_COMMAND_EXECUTOR_HPP
