// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "channel.h"
#include "thumbnail_processor.h"
#include "thumbnail_types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>

// Forward declarations
class HThreadPool;

/**
 * @file thumbnail_pipeline.h
 * @brief Background generation of thumbnails on cache misses
 *
 * The UI thread submits PendingRequests. Worker threads take them from the request channel
 * and resolve each one:
 *
 * 1. Disk tier hit: the stored bytes are the result.
 * 2. Otherwise fetch source bytes from the ThumbnailSource. Unavailable: absent result.
 * 3. Otherwise cover-crop render, write through the disk tier, and return the new bytes.
 *
 * Every result, including absent ones, is pushed to the completion channel, which the UI
 * thread drains without blocking (drain_completed). A failure anywhere in a job turns into
 * an absent result; nothing is retried here.
 *
 * The pipeline does not deduplicate: ThumbnailService owns the inflight set and only submits
 * keys that are not already queued or running.
 *
 * Jobs are never cancelled. A job that was already dequeued runs to completion even if the
 * result set changed in the meantime.
 */

namespace thumbgrid {

class DiskThumbnailCache;
class ThumbnailSource;

struct PipelineConfig {
    int worker_count = 1;           ///< 1 keeps completion order equal to request order
    size_t request_queue_limit = 0; ///< 0 = unbounded
    int target_size = 200;          ///< CacheKey size component
    ThumbnailTarget target = ThumbnailTarget::for_size(200, 16, 9);
};

class ThumbnailPipeline {
  public:
    static constexpr int MIN_WORKER_THREADS = 1;
    static constexpr int MAX_WORKER_THREADS = 4;

    ThumbnailPipeline(DiskThumbnailCache& disk, ThumbnailSource& source, PipelineConfig config);
    ~ThumbnailPipeline();

    // Non-copyable
    ThumbnailPipeline(const ThumbnailPipeline&) = delete;
    ThumbnailPipeline& operator=(const ThumbnailPipeline&) = delete;

    /// Spawn the workers. Requests submitted before start() wait in the channel.
    void start();

    /**
     * @brief Close the request channel and join workers
     *
     * Queued requests that no worker has picked up are discarded; running jobs finish.
     * Safe to call more than once. Does not log (may run during static destruction).
     */
    void shutdown();

    /// @return false if the queue is full or the pipeline is shut down
    bool submit(PendingRequest request);

    /**
     * @brief Non-blocking drain of finished jobs (UI thread)
     * @return Number of results handed to fn
     */
    size_t drain_completed(size_t max_items, const std::function<void(CompletedResult&&)>& fn);

    /**
     * @brief Resolve one request synchronously
     *
     * This is the worker job body; exposed so tests can exercise it without threads.
     * Never throws.
     */
    CompletedResult process(const PendingRequest& request);

    /// Block until every submitted request has a completion waiting (tests, shutdown paths)
    bool wait_for_idle(std::chrono::milliseconds timeout);

    [[nodiscard]] size_t queued_requests() const {
        return requests_.size();
    }
    [[nodiscard]] size_t outstanding() const;
    [[nodiscard]] int target_size() const {
        return config_.target_size;
    }
    [[nodiscard]] int worker_count() const {
        return config_.worker_count;
    }

  private:
    void worker_loop();
    void finish_one(CompletedResult&& result);

    DiskThumbnailCache& disk_;
    ThumbnailSource& source_;
    PipelineConfig config_;

    Channel<PendingRequest> requests_;
    Channel<CompletedResult> completions_;

    std::unique_ptr<HThreadPool> thread_pool_;
    bool started_ = false;
    std::atomic<bool> shutdown_{false};

    // Submitted but not yet pushed to completions_
    mutable std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
    size_t outstanding_ = 0;
};

} // namespace thumbgrid
