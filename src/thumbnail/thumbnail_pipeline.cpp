// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "thumbnail_pipeline.h"

#include "disk_thumbnail_cache.h"
#include "thumbnail_source.h"

#include <hv/hthreadpool.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace thumbgrid {

ThumbnailPipeline::ThumbnailPipeline(DiskThumbnailCache& disk, ThumbnailSource& source,
                                     PipelineConfig config)
    : disk_(disk), source_(source), config_(std::move(config)),
      requests_(config_.request_queue_limit) {
    config_.worker_count =
        std::clamp(config_.worker_count, MIN_WORKER_THREADS, MAX_WORKER_THREADS);
}

ThumbnailPipeline::~ThumbnailPipeline() {
    shutdown();
}

void ThumbnailPipeline::start() {
    if (started_ || shutdown_) {
        return;
    }
    started_ = true;

    const int workers = config_.worker_count;
    thread_pool_ = std::make_unique<HThreadPool>(workers, workers);
    thread_pool_->start(workers);

    // Each worker is one long-running job; the pool only supplies and joins the threads
    for (int i = 0; i < workers; ++i) {
        thread_pool_->commit([this]() { worker_loop(); });
    }

    spdlog::debug("[ThumbnailPipeline] Started {} worker(s), target {}x{}, queue limit {}",
                  workers, config_.target.width, config_.target.height,
                  config_.request_queue_limit);
}

void ThumbnailPipeline::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }

    const size_t dropped = requests_.clear();
    requests_.close();

    if (thread_pool_) {
        thread_pool_->stop();
        thread_pool_.reset();
    }

    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        outstanding_ -= std::min(outstanding_, dropped);
    }
    idle_cv_.notify_all();
    // Note: Don't log here - this may be called during static destruction
}

bool ThumbnailPipeline::submit(PendingRequest request) {
    if (shutdown_) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        ++outstanding_;
    }
    if (!requests_.try_push(std::move(request))) {
        {
            std::lock_guard<std::mutex> lock(idle_mutex_);
            --outstanding_;
        }
        idle_cv_.notify_all();
        return false;
    }
    return true;
}

size_t ThumbnailPipeline::drain_completed(size_t max_items,
                                          const std::function<void(CompletedResult&&)>& fn) {
    return completions_.drain(max_items, fn);
}

CompletedResult ThumbnailPipeline::process(const PendingRequest& request) {
    CompletedResult result;
    result.index = request.index;
    result.display_path = request.display_path;
    result.content_key = request.content_key;

    const CacheKey key{request.content_key, config_.target_size};

    try {
        if (ThumbnailData cached = disk_.read(key)) {
            spdlog::trace("[ThumbnailPipeline] Disk hit for {}", request.display_path);
            result.bytes = std::move(cached);
            return result;
        }

        ThumbnailData source = source_.fetch_source_bytes(request.content_key, request.display_path);
        if (!source || source->empty()) {
            spdlog::debug("[ThumbnailPipeline] Source unavailable for {}", request.display_path);
            return result;
        }

        ProcessResult rendered = ThumbnailProcessor::render_cover(*source, config_.target);
        if (!rendered.success) {
            spdlog::warn("[ThumbnailPipeline] Failed to render {}: {}", request.display_path,
                         rendered.error);
            return result;
        }

        auto bytes = std::make_shared<const ThumbnailBytes>(std::move(rendered.bytes));
        if (!disk_.write(key, *bytes)) {
            spdlog::trace("[ThumbnailPipeline] {} not persisted to disk", request.display_path);
        }
        result.bytes = std::move(bytes);

        spdlog::debug("[ThumbnailPipeline] Rendered {} ({}x{})", request.display_path,
                      rendered.output_width, rendered.output_height);
    } catch (const std::exception& e) {
        spdlog::warn("[ThumbnailPipeline] Job for {} failed: {}", request.display_path, e.what());
        result.bytes.reset();
    }

    return result;
}

void ThumbnailPipeline::worker_loop() {
    PendingRequest request;
    while (requests_.pop_wait(request)) {
        finish_one(process(request));
    }
}

void ThumbnailPipeline::finish_one(CompletedResult&& result) {
    // Completion channel is unbounded, so this only fails after shutdown
    if (!completions_.try_push(std::move(result))) {
        spdlog::trace("[ThumbnailPipeline] Completion dropped after shutdown");
    }
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        if (outstanding_ > 0) {
            --outstanding_;
        }
    }
    idle_cv_.notify_all();
}

bool ThumbnailPipeline::wait_for_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return outstanding_ == 0; });
}

size_t ThumbnailPipeline::outstanding() const {
    std::lock_guard<std::mutex> lock(idle_mutex_);
    return outstanding_;
}

} // namespace thumbgrid
