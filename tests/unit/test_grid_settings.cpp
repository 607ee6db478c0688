// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"
#include "grid_settings.h"

#include "test_helpers/thumbgrid_test_support.h"

#include <catch2/catch_all.hpp>

#include <fstream>

using namespace thumbgrid;

namespace {

GridSettings load(const std::string& contents) {
    test::TempDir dir;
    const std::string path = dir.path() + "/thumbgrid.json";
    {
        std::ofstream out(path);
        out << contents;
    }
    Config config;
    config.init(path);
    return GridSettings::from_config(config);
}

} // namespace

TEST_CASE("GridSettings: defaults match the built-in config", "[config][settings]") {
    GridSettings s = load("{}");
    GridSettings d;

    REQUIRE(s.memory_capacity == d.memory_capacity);
    REQUIRE(s.disk_enabled == d.disk_enabled);
    REQUIRE(s.cache_directory.empty());
    REQUIRE(s.target_size == d.target_size);
    REQUIRE(s.aspect_width == d.aspect_width);
    REQUIRE(s.aspect_height == d.aspect_height);
    REQUIRE(s.worker_threads == d.worker_threads);
    REQUIRE(s.card_width == d.card_width);
    REQUIRE(s.card_padding == d.card_padding);
    REQUIRE(s.overscan_rows == d.overscan_rows);
    REQUIRE(s.prefetch_rows == d.prefetch_rows);
    REQUIRE(s.prefetch_budget == d.prefetch_budget);
    REQUIRE(s.render_min_interval_ms == d.render_min_interval_ms);
    REQUIRE(s.render_max_deferral_ms == d.render_max_deferral_ms);
    REQUIRE(s.scroll_idle_ms == d.scroll_idle_ms);
    REQUIRE(s.poll_interval_ms == d.poll_interval_ms);
    REQUIRE(s.poll_batch == d.poll_batch);
    REQUIRE(s.label_cache_capacity == d.label_cache_capacity);
}

TEST_CASE("GridSettings: configured values are read", "[config][settings]") {
    GridSettings s = load(R"({"cache": {"memory_capacity": 500, "directory": "/var/tg",
                                        "disk_enabled": false},
                               "thumbnails": {"target_size": 256, "worker_threads": 2},
                               "grid": {"card_width": 300, "scroll_idle_ms": 800}})");
    REQUIRE(s.memory_capacity == 500);
    REQUIRE(s.cache_directory == "/var/tg");
    REQUIRE_FALSE(s.disk_enabled);
    REQUIRE(s.target_size == 256);
    REQUIRE(s.worker_threads == 2);
    REQUIRE(s.card_width == 300);
    REQUIRE(s.scroll_idle_ms == 800);
}

TEST_CASE("GridSettings: out-of-range values are clamped", "[config][settings]") {
    GridSettings s = load(R"({"thumbnails": {"target_size": 100000, "worker_threads": 0},
                               "grid": {"card_width": 5, "scroll_idle_ms": 1}})");
    REQUIRE(s.target_size == 1024);
    REQUIRE(s.worker_threads == 1);
    REQUIRE(s.card_width == 64);
    REQUIRE(s.scroll_idle_ms == 50);
}

TEST_CASE("GridSettings: wrong types fall back to defaults", "[config][settings]") {
    GridSettings s = load(R"({"grid": {"card_width": "wide"}})");
    REQUIRE(s.card_width == 230);
}
