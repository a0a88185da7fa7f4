/*
 * command_queue.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command_queue.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace helium::dispatch {

CommandQueue::CommandQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

auto CommandQueue::push(QueuedCommand item, std::chrono::milliseconds wait)
    -> DispatchVoidResult {
    std::unique_lock lock(mutex_);

    if (closed_) {
        return failure(DispatchErrorCode::NotRunning, "Command queue is closed");
    }

    if (heap_.size() >= capacity_) {
        if (wait.count() <= 0 ||
            !notFull_.wait_for(lock, wait, [this] {
                return closed_ || heap_.size() < capacity_;
            })) {
            spdlog::warn("Command queue full ({} pending), rejecting command",
                         heap_.size());
            return failure(DispatchErrorCode::QueueFull,
                           "Command queue is full (capacity " +
                               std::to_string(capacity_) + ")");
        }
        if (closed_) {
            return failure(DispatchErrorCode::NotRunning,
                           "Command queue is closed");
        }
    }

    item.sequence = nextSequence_++;
    heap_.push_back(std::move(item));
    std::push_heap(heap_.begin(), heap_.end(), LessUrgent{});
    lock.unlock();
    notEmpty_.notify_one();
    return success();
}

auto CommandQueue::pop(std::chrono::milliseconds wait)
    -> std::optional<QueuedCommand> {
    std::unique_lock lock(mutex_);
    if (!notEmpty_.wait_for(lock, wait,
                            [this] { return closed_ || !heap_.empty(); })) {
        return std::nullopt;
    }
    if (heap_.empty()) {
        return std::nullopt;
    }

    std::pop_heap(heap_.begin(), heap_.end(), LessUrgent{});
    auto item = std::move(heap_.back());
    heap_.pop_back();
    lock.unlock();
    notFull_.notify_one();
    return item;
}

void CommandQueue::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    notEmpty_.notify_all();
    notFull_.notify_all();
}

void CommandQueue::reopen() {
    std::lock_guard lock(mutex_);
    closed_ = false;
}

auto CommandQueue::drain() -> std::vector<QueuedCommand> {
    std::vector<QueuedCommand> items;
    {
        std::lock_guard lock(mutex_);
        std::sort_heap(heap_.begin(), heap_.end(), LessUrgent{});
        // sort_heap leaves the most urgent last
        items.assign(std::make_move_iterator(heap_.rbegin()),
                     std::make_move_iterator(heap_.rend()));
        heap_.clear();
    }
    notFull_.notify_all();
    return items;
}

auto CommandQueue::size() const -> size_t {
    std::lock_guard lock(mutex_);
    return heap_.size();
}

auto CommandQueue::empty() const -> bool {
    std::lock_guard lock(mutex_);
    return heap_.empty();
}

auto CommandQueue::isClosed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
}

}  // namespace helium::dispatch
