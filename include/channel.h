// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file channel.h
 * @brief Thread-safe FIFO used to hand work between the UI thread and pipeline workers
 *
 * Producers push, consumers either block (workers, pop_wait) or poll without blocking
 * (UI thread, try_pop / drain). The UI side never waits on the channel mutex for longer than
 * a swap of a few elements.
 *
 * A capacity of 0 means unbounded. A bounded channel rejects pushes when full instead of
 * blocking the producer.
 *
 * close() wakes every waiter; after close, pushes are rejected and pop_wait returns false
 * once the remaining elements are consumed.
 */

#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace thumbgrid {

template <typename T> class Channel {
  public:
    explicit Channel(size_t capacity = 0) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// @return false if the channel is closed or full
    bool try_push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || (capacity_ > 0 && items_.size() >= capacity_)) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /// Non-blocking pop
    bool try_pop(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return false;
        }
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    /**
     * @brief Block until an item is available or the channel is closed and empty
     * @return false only when closed and drained
     */
    bool pop_wait(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return false;
        }
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    /**
     * @brief Pop at most max_items and hand each to fn, outside the lock
     * @return Number of items handed to fn
     */
    template <typename Fn> size_t drain(size_t max_items, Fn&& fn) {
        std::deque<T> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t n = std::min(max_items, items_.size());
            for (size_t i = 0; i < n; ++i) {
                batch.push_back(std::move(items_.front()));
                items_.pop_front();
            }
        }
        for (auto& item : batch) {
            fn(std::move(item));
        }
        return batch.size();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /// Drop everything still queued
    size_t clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = items_.size();
        items_.clear();
        return n;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] size_t capacity() const {
        return capacity_;
    }

  private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace thumbgrid
