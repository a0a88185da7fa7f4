/*
 * worker_pool.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: Fixed-size worker pool executing queued bridge commands

**************************************************/

#ifndef HELIUM_DISPATCH_WORKER_POOL_HPP
#define HELIUM_DISPATCH_WORKER_POOL_HPP

#include <chrono>
#include <memory>

#include <nlohmann/json.hpp>

#include "command.hpp"
#include "command_executor.hpp"
#include "command_queue.hpp"
#include "common/dispatch_result.hpp"
#include "config/engine_config.hpp"

namespace helium::dispatch {

/**
 * @brief Worker pool counters
 */
struct WorkerPoolStatistics {
    uint64_t submitted{0};
    uint64_t rejected{0};
    uint64_t executed{0};
    uint64_t failed{0};
    std::chrono::milliseconds totalExecutionTime{0};
    size_t pending{0};
    size_t workers{0};
    bool running{false};

    [[nodiscard]] auto averageExecutionSeconds() const -> double {
        if (executed == 0) {
            return 0.0;
        }
        return std::chrono::duration<double>(totalExecutionTime).count() /
               static_cast<double>(executed);
    }

    [[nodiscard]] auto successRate() const -> double {
        if (executed == 0) {
            return 1.0;
        }
        return static_cast<double>(executed - failed) /
               static_cast<double>(executed);
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"submitted", submitted},
                {"rejected", rejected},
                {"executed", executed},
                {"failed", failed},
                {"total_execution_time",
                 std::chrono::duration<double>(totalExecutionTime).count()},
                {"average_execution_time", averageExecutionSeconds()},
                {"success_rate", successRate()},
                {"pending", pending},
                {"workers", workers},
                {"running", running}};
    }
};

/**
 * @brief Executes commands from a bounded priority queue on N threads
 *
 * Results are published through a future per command id and stay available
 * until awaitResult() hands them out. Commands still queued when the pool
 * stops complete with a failed result.
 */
class WorkerPool {
public:
    WorkerPool(std::shared_ptr<CommandExecutor> executor,
               config::WorkerPoolConfig config = {});
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();
    void stop();
    [[nodiscard]] auto isRunning() const -> bool;

    /**
     * @brief Queue a command
     * @param hook Runs on the worker once the final result is known
     * @return The command id, or QueueFull / NotRunning
     */
    auto submit(Command command, CompletionHook hook = {})
        -> DispatchResult<CommandId>;

    /**
     * @brief Wait for the result of a submitted command
     * @return CommandTimeout if it is not done in time, UnknownCommand for an
     * id that was never issued or was already collected
     */
    auto awaitResult(CommandId id, std::chrono::milliseconds timeout)
        -> DispatchResult<CommandResult>;

    /// Blocks until the command completes; every queued command does
    auto awaitResult(CommandId id) -> DispatchResult<CommandResult>;

    /**
     * @brief Publish a result that needs no execution, e.g. a cache hit
     * @return A fresh id redeemable through awaitResult()
     */
    auto registerCompleted(CommandResult result) -> CommandId;

    [[nodiscard]] auto isComplete(CommandId id) const -> bool;

    [[nodiscard]] auto pendingCount() const -> size_t;
    [[nodiscard]] auto statistics() const -> WorkerPoolStatistics;
    [[nodiscard]] auto executor() const -> std::shared_ptr<CommandExecutor>;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

}  // namespace helium::dispatch

#endif  // HELIUM_DISPATCH_WORKER_POOL_HPP
