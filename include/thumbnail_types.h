// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

/**
 * @file thumbnail_types.h
 * @brief Value types shared by the thumbnail caches, the generation pipeline and the grid
 *
 * Everything here is plain data. Rendered thumbnails travel as
 * `std::shared_ptr<const ThumbnailBytes>` so a widget displaying the pixels keeps them alive
 * after the memory cache has evicted the entry.
 */

namespace thumbgrid {

/// Encoded thumbnail bytes (LVGL binary image: header + ARGB8888 pixels)
using ThumbnailBytes = std::vector<uint8_t>;

/// Shared, immutable rendered thumbnail. nullptr means "absent".
using ThumbnailData = std::shared_ptr<const ThumbnailBytes>;

/**
 * @brief One entry of the current result set
 *
 * Produced by a result provider; the position in the result vector is the layout order.
 */
struct ResultItem {
    int index = 0;
    std::string content_key;  ///< Stable content identifier, may be empty
    std::string display_path; ///< Path shown under the card and used as fallback key

    /// Identifier used for caching: content key, or the path when no key is known
    [[nodiscard]] const std::string& cache_id() const {
        return content_key.empty() ? display_path : content_key;
    }
};

/**
 * @brief Key of a rendered thumbnail in both cache tiers
 *
 * Equality only; there is deliberately no ordering.
 */
struct CacheKey {
    std::string content_key;
    int target_size = 0;

    bool operator==(const CacheKey& other) const {
        return target_size == other.target_size && content_key == other.content_key;
    }
    bool operator!=(const CacheKey& other) const {
        return !(*this == other);
    }
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const noexcept {
        size_t h = std::hash<std::string>{}(key.content_key);
        // boost::hash_combine mixing
        h ^= std::hash<int>{}(key.target_size) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

/// Work item handed from the UI thread to the pipeline workers
struct PendingRequest {
    int index = 0;
    std::string display_path;
    std::string content_key; ///< Already resolved: never empty once queued
};

/// Work result handed from a worker back to the UI thread
struct CompletedResult {
    int index = 0;
    std::string display_path;
    std::string content_key;
    ThumbnailData bytes; ///< nullptr when the thumbnail could not be produced
};

} // namespace thumbgrid
