// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <list>
#include <unordered_map>
#include <utility>

/**
 * @file lru_cache.h
 * @brief Bounded least-recently-used map
 *
 * Used for the in-memory thumbnail tier and for memoized label text. Not thread-safe:
 * every instance is owned and touched by the UI thread only.
 *
 * Recency order is a std::list (front = most recently used) with an index map pointing at the
 * list nodes, so get/put/evict are all O(1).
 */

namespace thumbgrid {

template <typename Key, typename Value, typename Hash = std::hash<Key>> class LruCache {
  public:
    explicit LruCache(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

    /**
     * @brief Look up a key and promote it to most-recently-used
     *
     * @return Pointer to the stored value, or nullptr on miss. The pointer is valid until the
     *         next mutating call.
     */
    const Value* get(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return nullptr;
        }
        entries_.splice(entries_.begin(), entries_, it->second);
        return &it->second->second;
    }

    /// Insert or overwrite, promote, then evict from the cold end while over capacity
    void put(const Key& key, Value value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }
        entries_.emplace_front(key, std::move(value));
        index_.emplace(key, entries_.begin());
        evict_overflow();
    }

    /// Membership test that does not change recency
    [[nodiscard]] bool contains(const Key& key) const {
        return index_.find(key) != index_.end();
    }

    bool erase(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        entries_.erase(it->second);
        index_.erase(it);
        return true;
    }

    void clear() {
        index_.clear();
        entries_.clear();
    }

    [[nodiscard]] size_t size() const {
        return index_.size();
    }
    [[nodiscard]] size_t capacity() const {
        return capacity_;
    }

    /// Shrinking evicts immediately
    void set_capacity(size_t capacity) {
        capacity_ = std::max<size_t>(capacity, 1);
        evict_overflow();
    }

    /// Key of the least-recently-used entry. Requires size() > 0.
    [[nodiscard]] const Key& oldest_key() const {
        return entries_.back().first;
    }

  private:
    using Entry = std::pair<Key, Value>;

    void evict_overflow() {
        while (index_.size() > capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
        }
    }

    size_t capacity_;
    std::list<Entry> entries_;
    std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;
};

} // namespace thumbgrid
