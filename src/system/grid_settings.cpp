// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "grid_settings.h"

#include "config.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace thumbgrid {

namespace {

int read_clamped(Config& config, const std::string& ptr, int fallback, int lo, int hi) {
    const int value = config.get<int>(ptr, fallback);
    const int clamped = std::clamp(value, lo, hi);
    if (clamped != value) {
        spdlog::warn("[GridSettings] {}={} out of range [{}, {}], using {}", ptr, value, lo, hi,
                     clamped);
    }
    return clamped;
}

} // namespace

GridSettings GridSettings::from_config(Config& config) {
    GridSettings s;

    s.memory_capacity = static_cast<size_t>(
        read_clamped(config, "/cache/memory_capacity", 350, 1, 100000));
    s.cache_directory = config.get<std::string>("/cache/directory", "");
    s.disk_enabled = config.get<bool>("/cache/disk_enabled", true);

    s.target_size = read_clamped(config, "/thumbnails/target_size", 200, 16, 1024);
    s.aspect_width = read_clamped(config, "/thumbnails/aspect_width", 16, 1, 64);
    s.aspect_height = read_clamped(config, "/thumbnails/aspect_height", 9, 1, 64);
    s.worker_threads = read_clamped(config, "/thumbnails/worker_threads", 1, 1, 4);
    s.request_queue_limit = static_cast<size_t>(
        read_clamped(config, "/thumbnails/request_queue_limit", 0, 0, 100000));

    s.card_width = read_clamped(config, "/grid/card_width", 230, 64, 2048);
    s.card_padding = read_clamped(config, "/grid/card_padding", 8, 0, 64);
    s.overscan_rows = read_clamped(config, "/grid/overscan_rows", 1, 0, 16);
    s.prefetch_rows = read_clamped(config, "/grid/prefetch_rows", 3, 0, 32);
    s.prefetch_budget = read_clamped(config, "/grid/prefetch_budget", 80, 0, 1000);
    s.render_min_interval_ms = read_clamped(config, "/grid/render_min_interval_ms", 33, 0, 1000);
    s.render_max_deferral_ms =
        read_clamped(config, "/grid/render_max_deferral_ms", 250, 0, 5000);
    s.resize_delay_ms = read_clamped(config, "/grid/resize_delay_ms", 60, 0, 2000);
    s.scroll_idle_ms = read_clamped(config, "/grid/scroll_idle_ms", 540, 50, 10000);
    s.poll_interval_ms = read_clamped(config, "/grid/poll_interval_ms", 30, 1, 1000);
    s.poll_batch = static_cast<size_t>(read_clamped(config, "/grid/poll_batch", 40, 1, 10000));
    s.label_cache_capacity = static_cast<size_t>(
        read_clamped(config, "/grid/label_cache_capacity", 4000, 1, 1000000));

    return s;
}

} // namespace thumbgrid
