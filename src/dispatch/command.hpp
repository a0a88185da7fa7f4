/*
 * command.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Bridge command and result types

**************************************************/

#ifndef HELIUM_DISPATCH_COMMAND_HPP
#define HELIUM_DISPATCH_COMMAND_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace helium::dispatch {

using CommandId = std::uint64_t;

/**
 * @brief Command kinds used for optimization decisions
 *
 * Other covers anything the bridge accepts that has no dedicated kind.
 */
enum class CommandKind {
    Shell,
    Push,
    Pull,
    Install,
    Uninstall,
    Screenshot,
    Input,
    Property,
    Other
};

[[nodiscard]] auto commandKindToString(CommandKind kind) -> std::string;
[[nodiscard]] auto commandKindFromString(const std::string& str) -> CommandKind;

/// Smaller value means more urgent.
namespace CommandPriority {
inline constexpr int CRITICAL = 0;
inline constexpr int HIGH = 1;
inline constexpr int NORMAL = 2;
inline constexpr int LOW = 3;
inline constexpr int BACKGROUND = 4;
}  // namespace CommandPriority

struct CommandResult;

using CompletionCallback = std::function<void(const CommandResult&)>;

/**
 * @brief A single bridge invocation request
 *
 * Only timeout and retryCount may be adjusted after construction, and only
 * by the coordinator before dispatch.
 */
struct Command {
    std::vector<std::string> argv;
    std::optional<std::string> deviceSerial;
    CommandKind kind{CommandKind::Shell};
    std::chrono::milliseconds timeout{30000};
    int retryCount{3};
    int priority{CommandPriority::NORMAL};
    std::chrono::steady_clock::time_point createdAt{
        std::chrono::steady_clock::now()};
    CompletionCallback callback;

    Command() = default;

    Command(std::vector<std::string> args,
            std::optional<std::string> serial = std::nullopt,
            CommandKind commandKind = CommandKind::Shell)
        : argv(std::move(args)),
          deviceSerial(std::move(serial)),
          kind(commandKind) {}

    /// argv joined with single spaces
    [[nodiscard]] auto joined() const -> std::string;

    /// Serial or "default" when no device is targeted
    [[nodiscard]] auto deviceKey() const -> std::string;
};

/**
 * @brief Outcome of the final attempt of a command
 */
struct CommandResult {
    std::shared_ptr<const Command> command;
    int returnCode{-1};
    std::string stdOut;
    std::string stdErr;
    std::chrono::milliseconds executionTime{0};
    bool success{false};
    int attemptCount{1};

    [[nodiscard]] auto executionSeconds() const -> double {
        return std::chrono::duration<double>(executionTime).count();
    }
};

[[nodiscard]] auto makeFailedResult(std::shared_ptr<const Command> command,
                                    std::string reason, int attempts,
                                    std::chrono::milliseconds elapsed)
    -> CommandResult;

}  // namespace helium::dispatch

#endif  // HELIUM_DISPATCH_COMMAND_HPP
