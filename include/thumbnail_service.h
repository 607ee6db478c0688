// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "lru_cache.h"
#include "thumbnail_types.h"

#include <cstddef>
#include <cstdint>
#include <unordered_set>

/**
 * @file thumbnail_service.h
 * @brief UI-thread front of the thumbnail tiers: memory cache, inflight set, completions
 *
 * Resolution order for a result item is memory cache, then (inside the pipeline) disk cache,
 * then generation. This class owns the parts that must only be touched from the UI thread:
 *
 * - the bounded LRU memory cache
 * - the inflight set: a key is a member from the moment its request is queued until
 *   poll_completions() consumes its result, so a key has at most one outstanding job
 * - the set of keys whose generation failed since the last visibility change
 *
 * It is not thread-safe. Cross-thread traffic goes only through ThumbnailPipeline's channels.
 */

namespace thumbgrid {

class ThumbnailPipeline;

using MemoryCache = LruCache<CacheKey, ThumbnailData, CacheKeyHash>;

enum class RequestOutcome {
    Cached,          ///< Already in the memory cache, nothing queued
    AlreadyInflight, ///< Deduplicated against an outstanding job
    Failed,          ///< Generation failed earlier; not retried until clear_failures()
    Queued,          ///< New job submitted to the pipeline
    Rejected         ///< Pipeline queue full or shut down
};

struct ThumbnailStats {
    uint64_t memory_hits = 0;
    uint64_t memory_misses = 0;
    uint64_t requests_queued = 0;
    uint64_t requests_deduplicated = 0;
    uint64_t requests_rejected = 0;
    uint64_t completions_delivered = 0;
    uint64_t completions_failed = 0;
};

class ThumbnailService {
  public:
    static constexpr size_t DEFAULT_MEMORY_CAPACITY = 350;
    static constexpr size_t DEFAULT_POLL_BATCH = 40;

    ThumbnailService(ThumbnailPipeline& pipeline, size_t memory_capacity);

    /// Cache key for an item at the pipeline's target size
    [[nodiscard]] CacheKey key_for(const ResultItem& item) const;

    /// Memory tier lookup; promotes on hit. nullptr on miss.
    ThumbnailData lookup(const CacheKey& key);

    /**
     * @brief Queue generation for an item unless it is cached, inflight, or failed
     *
     * Does not promote cached entries, so prefetching never disturbs LRU order.
     */
    RequestOutcome request(const ResultItem& item);

    /**
     * @brief Merge finished jobs into the memory cache (UI thread, non-blocking)
     *
     * Removes each consumed key from the inflight set. Present results go into the memory
     * cache; absent ones mark the key as failed.
     *
     * @return Number of results consumed (0 means nothing on screen can have changed)
     */
    size_t poll_completions(size_t max_items = DEFAULT_POLL_BATCH);

    /// Make failed keys eligible for generation again
    void clear_failures();

    [[nodiscard]] bool is_inflight(const CacheKey& key) const {
        return inflight_.count(key) > 0;
    }
    [[nodiscard]] bool has_failed(const CacheKey& key) const {
        return failed_.count(key) > 0;
    }
    [[nodiscard]] bool is_cached(const CacheKey& key) const {
        return memory_.contains(key);
    }
    [[nodiscard]] size_t inflight_count() const {
        return inflight_.size();
    }
    [[nodiscard]] const ThumbnailStats& stats() const {
        return stats_;
    }
    [[nodiscard]] MemoryCache& memory_cache() {
        return memory_;
    }

  private:
    ThumbnailPipeline& pipeline_;
    MemoryCache memory_;
    std::unordered_set<CacheKey, CacheKeyHash> inflight_;
    std::unordered_set<CacheKey, CacheKeyHash> failed_;
    ThumbnailStats stats_;
};

} // namespace thumbgrid
