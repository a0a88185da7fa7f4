/*
 * worker_pool.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <thread>
#include <map>
#include <vector>

#include <spdlog/spdlog.h>

namespace helium::dispatch {

class WorkerPool::Impl {
public:
    std::shared_ptr<CommandExecutor> executor_;
    config::WorkerPoolConfig config_;
    CommandQueue queue_;

    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    std::atomic<CommandId> nextId_{1};

    // Ordered by id so the oldest finished results are pruned first
    std::map<CommandId, std::shared_future<CommandResult>> results_;
    mutable std::mutex resultsMutex_;

    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> executed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<int64_t> totalExecutionMs_{0};

    Impl(std::shared_ptr<CommandExecutor> executor,
         config::WorkerPoolConfig config)
        : executor_(std::move(executor)),
          config_(config),
          queue_(config.queueCapacity) {}

    ~Impl() { stop(); }

    void start() {
        if (running_.exchange(true)) {
            return;
        }
        queue_.reopen();
        auto count = std::max<size_t>(1, config_.workerCount);
        workers_.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            workers_.emplace_back(&Impl::workerLoop, this, i);
        }
        spdlog::info("Worker pool started with {} worker(s)", count);
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        queue_.close();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();

        auto abandoned = queue_.drain();
        for (auto& item : abandoned) {
            auto result = makeFailedResult(item.command, "Worker pool stopped",
                                           0, std::chrono::milliseconds{0});
            item.promise->set_value(std::move(result));
        }
        if (!abandoned.empty()) {
            spdlog::warn("Worker pool stopped with {} queued command(s)",
                         abandoned.size());
        }
        spdlog::info("Worker pool stopped");
    }

    void workerLoop(size_t index) {
        spdlog::debug("Worker {} started", index);
        auto poll = std::chrono::milliseconds(
            std::max<size_t>(1, config_.pollIntervalMs));

        while (running_) {
            auto item = queue_.pop(poll);
            if (!item) {
                continue;
            }
            process(*item);
        }
        spdlog::debug("Worker {} stopped", index);
    }

    void process(QueuedCommand& item) {
        CommandResult result;
        try {
            result = executor_->execute(item.command);
        } catch (const std::exception& e) {
            spdlog::error("Unexpected error executing '{}': {}",
                          item.command->joined(), e.what());
            result = makeFailedResult(item.command, e.what(), 1,
                                      std::chrono::milliseconds{0});
        }

        executed_++;
        if (!result.success) {
            failed_++;
        }
        totalExecutionMs_ += result.executionTime.count();

        if (item.hook) {
            try {
                item.hook(result);
            } catch (const std::exception& e) {
                spdlog::error("Completion hook failed for command {}: {}",
                              item.id, e.what());
            }
        }

        if (item.command->callback) {
            try {
                item.command->callback(result);
            } catch (const std::exception& e) {
                spdlog::error("Completion callback failed for command {}: {}",
                              item.id, e.what());
            }
        }

        item.promise->set_value(std::move(result));
    }

    auto submit(Command command, CompletionHook hook)
        -> DispatchResult<CommandId> {
        if (!running_) {
            return failure<CommandId>(DispatchErrorCode::NotRunning,
                                      "Worker pool is not running");
        }

        QueuedCommand item;
        item.id = nextId_++;
        item.command = std::make_shared<const Command>(std::move(command));
        item.promise = std::make_shared<std::promise<CommandResult>>();
        item.hook = std::move(hook);

        auto id = item.id;
        auto future = item.promise->get_future().share();
        {
            std::lock_guard lock(resultsMutex_);
            results_.emplace(id, future);
            pruneFinishedLocked();
        }

        auto pushed = queue_.push(
            std::move(item), std::chrono::milliseconds(config_.enqueueWaitMs));
        if (!pushed) {
            {
                std::lock_guard lock(resultsMutex_);
                results_.erase(id);
            }
            rejected_++;
            return std::unexpected(pushed.error());
        }

        submitted_++;
        spdlog::debug("Command {} queued ({} pending)", id, queue_.size());
        return id;
    }

    auto findFuture(CommandId id)
        -> std::optional<std::shared_future<CommandResult>> {
        std::lock_guard lock(resultsMutex_);
        auto it = results_.find(id);
        if (it == results_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto awaitResult(CommandId id,
                     std::optional<std::chrono::milliseconds> timeout)
        -> DispatchResult<CommandResult> {
        auto future = findFuture(id);
        if (!future) {
            return failure<CommandResult>(
                DispatchErrorCode::UnknownCommand,
                "No pending result for command " + std::to_string(id));
        }

        if (!timeout) {
            future->wait();
        } else if (future->wait_for(*timeout) != std::future_status::ready) {
            return failure<CommandResult>(
                DispatchErrorCode::CommandTimeout,
                "Timed out waiting for command " + std::to_string(id));
        }

        {
            std::lock_guard lock(resultsMutex_);
            results_.erase(id);
        }
        return future->get();
    }

    auto registerCompleted(CommandResult result) -> CommandId {
        auto id = nextId_++;
        std::promise<CommandResult> promise;
        promise.set_value(std::move(result));
        std::lock_guard lock(resultsMutex_);
        results_.emplace(id, promise.get_future().share());
        pruneFinishedLocked();
        return id;
    }

    /// Drops the oldest finished results nobody awaited once the map
    /// outgrows resultRetention. Pending entries are never dropped.
    void pruneFinishedLocked() {
        auto limit = std::max<size_t>(1, config_.resultRetention);
        for (auto it = results_.begin();
             results_.size() > limit && it != results_.end();) {
            if (it->second.wait_for(std::chrono::seconds(0)) ==
                std::future_status::ready) {
                it = results_.erase(it);
            } else {
                ++it;
            }
        }
    }
};

WorkerPool::WorkerPool(std::shared_ptr<CommandExecutor> executor,
                       config::WorkerPoolConfig config)
    : pimpl_(std::make_unique<Impl>(std::move(executor), config)) {}

WorkerPool::~WorkerPool() = default;

void WorkerPool::start() { pimpl_->start(); }

void WorkerPool::stop() { pimpl_->stop(); }

auto WorkerPool::isRunning() const -> bool { return pimpl_->running_; }

auto WorkerPool::submit(Command command, CompletionHook hook)
    -> DispatchResult<CommandId> {
    return pimpl_->submit(std::move(command), std::move(hook));
}

auto WorkerPool::awaitResult(CommandId id, std::chrono::milliseconds timeout)
    -> DispatchResult<CommandResult> {
    return pimpl_->awaitResult(id, timeout);
}

auto WorkerPool::awaitResult(CommandId id) -> DispatchResult<CommandResult> {
    return pimpl_->awaitResult(id, std::nullopt);
}

auto WorkerPool::registerCompleted(CommandResult result) -> CommandId {
    return pimpl_->registerCompleted(std::move(result));
}

auto WorkerPool::isComplete(CommandId id) const -> bool {
    std::lock_guard lock(pimpl_->resultsMutex_);
    auto it = pimpl_->results_.find(id);
    return it != pimpl_->results_.end() &&
           it->second.wait_for(std::chrono::seconds(0)) ==
               std::future_status::ready;
}

auto WorkerPool::pendingCount() const -> size_t {
    return pimpl_->queue_.size();
}

auto WorkerPool::statistics() const -> WorkerPoolStatistics {
    WorkerPoolStatistics stats;
    stats.submitted = pimpl_->submitted_;
    stats.rejected = pimpl_->rejected_;
    stats.executed = pimpl_->executed_;
    stats.failed = pimpl_->failed_;
    stats.totalExecutionTime =
        std::chrono::milliseconds(pimpl_->totalExecutionMs_.load());
    stats.pending = pimpl_->queue_.size();
    stats.running = pimpl_->running_;
    stats.workers =
        stats.running ? std::max<size_t>(1, pimpl_->config_.workerCount) : 0;
    return stats;
}

auto WorkerPool::executor() const -> std::shared_ptr<CommandExecutor> {
    return pimpl_->executor_;
}

}  // namespace helium::dispatch
