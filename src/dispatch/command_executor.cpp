/*
 * command_executor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command_executor.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

#include <spdlog/spdlog.h>

namespace helium::dispatch {

CommandExecutor::CommandExecutor(
    std::shared_ptr<transport::BridgeTransport> transport,
    config::RetryConfig retry, std::shared_ptr<device::DeviceRegistry> registry,
    std::shared_ptr<device::ConnectionPool> pool)
    : transport_(std::move(transport)),
      retry_(retry),
      registry_(std::move(registry)),
      pool_(std::move(pool)) {}

auto CommandExecutor::backoffDelay(int attempt) const
    -> std::chrono::milliseconds {
    double delay = static_cast<double>(retry_.initialDelayMs) *
                   std::pow(retry_.multiplier, std::max(0, attempt - 1));
    delay = std::min(delay, static_cast<double>(retry_.maxDelayMs));
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

auto CommandExecutor::execute(std::shared_ptr<const Command> command)
    -> CommandResult {
    const int maxAttempts = std::max(1, command->retryCount);
    auto args = transport::bridgeArguments(*command);

    std::optional<device::ConnectionLease> lease;
    if (pool_ && command->deviceSerial) {
        lease = pool_->acquire(*command->deviceSerial);
    }

    CommandResult result;
    result.command = command;

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        auto attemptStart = std::chrono::steady_clock::now();
        auto output = transport_->run(args, command->timeout);

        if (output) {
            result.returnCode = output->exitCode;
            result.stdOut = std::move(output->stdOut);
            result.stdErr = std::move(output->stdErr);
            result.executionTime = output->duration;
            result.success = output->exitCode == 0;
        } else {
            result.returnCode = -1;
            result.stdOut.clear();
            result.stdErr = output.error().message;
            result.executionTime =
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - attemptStart);
            result.success = false;
        }
        result.attemptCount = attempt;

        if (result.success) {
            break;
        }

        if (attempt < maxAttempts) {
            auto delay = backoffDelay(attempt);
            spdlog::warn("Command '{}' failed (attempt {}/{}): {}; retrying in {}ms",
                         command->joined(), attempt, maxAttempts,
                         output ? "exit code " + std::to_string(result.returnCode)
                                : output.error().toString(),
                         delay.count());
            std::this_thread::sleep_for(delay);
        }
    }

    if (!result.success) {
        spdlog::warn("Command '{}' failed after {} attempt(s)", command->joined(),
                     result.attemptCount);
    } else {
        spdlog::debug("Command '{}' succeeded in {}ms (attempt {})",
                      command->joined(), result.executionTime.count(),
                      result.attemptCount);
    }

    if (registry_ && command->deviceSerial) {
        registry_->recordOutcome(*command->deviceSerial, result.success,
                                 result.executionTime);
    }
    return result;
}

}  // namespace helium::dispatch
