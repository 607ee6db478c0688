// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "thumbnail_service.h"

#include "thumbnail_pipeline.h"

#include <spdlog/spdlog.h>

namespace thumbgrid {

ThumbnailService::ThumbnailService(ThumbnailPipeline& pipeline, size_t memory_capacity)
    : pipeline_(pipeline), memory_(memory_capacity) {
    spdlog::debug("[ThumbnailService] Memory cache capacity {}", memory_.capacity());
}

CacheKey ThumbnailService::key_for(const ResultItem& item) const {
    return CacheKey{item.cache_id(), pipeline_.target_size()};
}

ThumbnailData ThumbnailService::lookup(const CacheKey& key) {
    if (const ThumbnailData* hit = memory_.get(key)) {
        ++stats_.memory_hits;
        return *hit;
    }
    ++stats_.memory_misses;
    return nullptr;
}

RequestOutcome ThumbnailService::request(const ResultItem& item) {
    CacheKey key = key_for(item);

    if (memory_.contains(key)) {
        return RequestOutcome::Cached;
    }
    if (inflight_.count(key) > 0) {
        ++stats_.requests_deduplicated;
        return RequestOutcome::AlreadyInflight;
    }
    if (failed_.count(key) > 0) {
        return RequestOutcome::Failed;
    }

    PendingRequest pending;
    pending.index = item.index;
    pending.display_path = item.display_path;
    pending.content_key = key.content_key;

    if (!pipeline_.submit(std::move(pending))) {
        ++stats_.requests_rejected;
        spdlog::trace("[ThumbnailService] Request for {} rejected (queue full)", item.display_path);
        return RequestOutcome::Rejected;
    }

    inflight_.insert(std::move(key));
    ++stats_.requests_queued;
    return RequestOutcome::Queued;
}

size_t ThumbnailService::poll_completions(size_t max_items) {
    const int target_size = pipeline_.target_size();
    return pipeline_.drain_completed(max_items, [this, target_size](CompletedResult&& done) {
        CacheKey key{std::move(done.content_key), target_size};
        inflight_.erase(key);

        if (done.bytes) {
            ++stats_.completions_delivered;
            failed_.erase(key);
            memory_.put(key, std::move(done.bytes));
        } else {
            ++stats_.completions_failed;
            spdlog::debug("[ThumbnailService] No thumbnail for {}", done.display_path);
            failed_.insert(std::move(key));
        }
    });
}

void ThumbnailService::clear_failures() {
    failed_.clear();
}

} // namespace thumbgrid
