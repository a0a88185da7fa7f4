/*
 * command_queue.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Bounded priority queue of pending bridge commands

**************************************************/

#ifndef HELIUM_DISPATCH_COMMAND_QUEUE_HPP
#define HELIUM_DISPATCH_COMMAND_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "command.hpp"
#include "common/dispatch_result.hpp"

namespace helium::dispatch {

/// Runs on the worker after the final attempt, before the result is published
using CompletionHook = std::function<void(const CommandResult&)>;

/**
 * @brief A command waiting for a worker
 */
struct QueuedCommand {
    CommandId id{0};
    std::shared_ptr<const Command> command;
    std::shared_ptr<std::promise<CommandResult>> promise;
    CompletionHook hook;
    uint64_t sequence{0};
};

/**
 * @brief Thread-safe bounded priority queue
 *
 * pop() returns the command with the smallest priority value; equal
 * priorities leave in creation order, then submission order.
 */
class CommandQueue {
public:
    explicit CommandQueue(size_t capacity);

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    /**
     * @brief Add a command
     * @param wait How long to wait for space; zero fails fast
     * @return QueueFull when no space became available, NotRunning once
     * closed
     */
    auto push(QueuedCommand item,
              std::chrono::milliseconds wait = std::chrono::milliseconds{0})
        -> DispatchVoidResult;

    /**
     * @brief Take the most urgent command, waiting up to @p wait
     */
    auto pop(std::chrono::milliseconds wait) -> std::optional<QueuedCommand>;

    /// Reject further pushes and wake every waiter
    void close();

    /// Accept pushes again after close()
    void reopen();

    /// Remove and return everything still queued
    auto drain() -> std::vector<QueuedCommand>;

    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto empty() const -> bool;
    [[nodiscard]] auto capacity() const noexcept -> size_t { return capacity_; }
    [[nodiscard]] auto isClosed() const -> bool;

private:
    struct LessUrgent {
        auto operator()(const QueuedCommand& a, const QueuedCommand& b) const
            -> bool {
            if (a.command->priority != b.command->priority) {
                return a.command->priority > b.command->priority;
            }
            if (a.command->createdAt != b.command->createdAt) {
                return a.command->createdAt > b.command->createdAt;
            }
            return a.sequence > b.sequence;
        }
    };

    size_t capacity_;
    uint64_t nextSequence_{0};
    bool closed_{false};
    std::vector<QueuedCommand> heap_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
};

}  // namespace helium::dispatch

#endif  // HELIUM_DISPATCH_COMMAND_QUEUE_HPP
