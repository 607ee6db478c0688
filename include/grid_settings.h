// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <string>

namespace thumbgrid {

class Config;

/**
 * @brief Typed, range-checked view of the cache, thumbnail and grid configuration
 *
 * Defaults match Config::get_default_config().
 */
struct GridSettings {
    // cache
    size_t memory_capacity = 350;
    std::string cache_directory; ///< Empty = resolve automatically
    bool disk_enabled = true;

    // thumbnails
    int target_size = 200;
    int aspect_width = 16;
    int aspect_height = 9;
    int worker_threads = 1;
    size_t request_queue_limit = 0;

    // grid
    int card_width = 230;
    int card_padding = 8;
    int overscan_rows = 1;
    int prefetch_rows = 3;
    int prefetch_budget = 80;
    int render_min_interval_ms = 33;
    int render_max_deferral_ms = 250;
    int resize_delay_ms = 60;
    int scroll_idle_ms = 540;
    int poll_interval_ms = 30;
    size_t poll_batch = 40;
    size_t label_cache_capacity = 4000;

    /// Read from config; out-of-range values are clamped with a warning
    static GridSettings from_config(Config& config);
};

} // namespace thumbgrid
