// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_thumbnail_service.cpp
 * @brief Memory tier, request deduplication and failure tracking
 */

#include "disk_thumbnail_cache.h"
#include "lvgl_image_codec.h"
#include "thumbnail_pipeline.h"
#include "thumbnail_service.h"

#include "test_helpers/thumbgrid_test_support.h"

#include <catch2/catch_all.hpp>

#include <chrono>
#include <filesystem>

using namespace thumbgrid;
using namespace thumbgrid::test;

namespace {

ResultItem make_item(int index, const std::string& path, const std::string& content_key = "") {
    ResultItem item;
    item.index = index;
    item.display_path = path;
    item.content_key = content_key;
    return item;
}

struct ServiceFixture {
    TempDir dir;
    DiskThumbnailCache disk{dir.path()};
    FakeThumbnailSource source;
    ThumbnailPipeline pipeline{disk, source, PipelineConfig{}};
    ThumbnailService service{pipeline, 350};

    void finish_all() {
        pipeline.start();
        REQUIRE(pipeline.wait_for_idle(std::chrono::seconds(10)));
        service.poll_completions(1000);
    }
};

} // namespace

TEST_CASE_METHOD(ServiceFixture, "ThumbnailService: key uses content key and target size",
                 "[thumbnail][service]") {
    REQUIRE(service.key_for(make_item(0, "/photos/a.png", "abc123")) == CacheKey{"abc123", 200});
    REQUIRE(service.key_for(make_item(0, "/photos/a.png")) == CacheKey{"/photos/a.png", 200});
}

TEST_CASE_METHOD(ServiceFixture, "ThumbnailService: concurrent requests for one key are merged",
                 "[thumbnail][service]") {
    const ResultItem item = make_item(0, "/photos/a.png", "abc123");

    REQUIRE(service.request(item) == RequestOutcome::Queued);
    for (int i = 0; i < 4; ++i) {
        REQUIRE(service.request(item) == RequestOutcome::AlreadyInflight);
    }
    REQUIRE(pipeline.queued_requests() == 1);
    REQUIRE(service.is_inflight({"abc123", 200}));
    REQUIRE(service.stats().requests_deduplicated == 4);

    finish_all();

    REQUIRE(source.fetch_count() == 1);
    REQUIRE_FALSE(service.is_inflight({"abc123", 200}));
    REQUIRE(service.is_cached({"abc123", 200}));
    REQUIRE(service.lookup({"abc123", 200}) != nullptr);
    REQUIRE(service.request(item) == RequestOutcome::Cached);
}

TEST_CASE_METHOD(ServiceFixture, "ThumbnailService: lookup miss does not queue work",
                 "[thumbnail][service]") {
    REQUIRE(service.lookup({"nothing", 200}) == nullptr);
    REQUIRE(pipeline.queued_requests() == 0);
    REQUIRE(service.stats().memory_misses == 1);
}

TEST_CASE_METHOD(ServiceFixture, "ThumbnailService: failed keys are not retried until cleared",
                 "[thumbnail][service]") {
    const ResultItem item = make_item(0, "/photos/missing.png");
    source.mark_unavailable("/photos/missing.png");

    REQUIRE(service.request(item) == RequestOutcome::Queued);
    finish_all();

    const CacheKey key = service.key_for(item);
    REQUIRE(service.has_failed(key));
    REQUIRE_FALSE(service.is_cached(key));
    REQUIRE_FALSE(service.is_inflight(key));

    REQUIRE(service.request(item) == RequestOutcome::Failed);
    REQUIRE(pipeline.queued_requests() == 0);

    source.mark_available("/photos/missing.png");
    service.clear_failures();
    REQUIRE(service.request(item) == RequestOutcome::Queued);
    REQUIRE(pipeline.wait_for_idle(std::chrono::seconds(10)));
    service.poll_completions();
    REQUIRE(service.is_cached(key));
    REQUIRE_FALSE(service.has_failed(key));
}

TEST_CASE_METHOD(ServiceFixture, "ThumbnailService: poll honors the batch limit",
                 "[thumbnail][service]") {
    for (int i = 0; i < 5; ++i) {
        service.request(make_item(i, "/photos/" + std::to_string(i) + ".png"));
    }
    pipeline.start();
    REQUIRE(pipeline.wait_for_idle(std::chrono::seconds(10)));

    REQUIRE(service.poll_completions(2) == 2);
    REQUIRE(service.inflight_count() == 3);
    REQUIRE(service.poll_completions(10) == 3);
    REQUIRE(service.inflight_count() == 0);
    REQUIRE(service.poll_completions(10) == 0);
}

TEST_CASE("ThumbnailService: memory tier is bounded", "[thumbnail][service]") {
    TempDir dir;
    DiskThumbnailCache disk(dir.path());
    FakeThumbnailSource source;
    ThumbnailPipeline pipeline(disk, source, PipelineConfig{});
    ThumbnailService service(pipeline, 2);

    for (int i = 0; i < 3; ++i) {
        REQUIRE(service.request(make_item(i, "/photos/" + std::to_string(i) + ".png")) ==
                RequestOutcome::Queued);
    }
    pipeline.start();
    REQUIRE(pipeline.wait_for_idle(std::chrono::seconds(10)));
    service.poll_completions();

    REQUIRE(service.memory_cache().size() == 2);
    REQUIRE_FALSE(service.is_cached({"/photos/0.png", 200}));
    REQUIRE(service.is_cached({"/photos/2.png", 200}));
}

TEST_CASE("ThumbnailService: second service reuses the disk tier", "[thumbnail][service]") {
    TempDir dir;
    FakeThumbnailSource source;
    const ResultItem item = make_item(0, "/photos/a.png", "abc123");

    {
        DiskThumbnailCache disk(dir.path());
        ThumbnailPipeline pipeline(disk, source, PipelineConfig{});
        ThumbnailService service(pipeline, 10);
        service.request(item);
        pipeline.start();
        REQUIRE(pipeline.wait_for_idle(std::chrono::seconds(10)));
        service.poll_completions();
    }
    REQUIRE(source.fetch_count() == 1);

    DiskThumbnailCache disk(dir.path());
    ThumbnailPipeline pipeline(disk, source, PipelineConfig{});
    ThumbnailService service(pipeline, 10);
    REQUIRE(service.request(item) == RequestOutcome::Queued);
    pipeline.start();
    REQUIRE(pipeline.wait_for_idle(std::chrono::seconds(10)));
    service.poll_completions();

    REQUIRE(service.is_cached({"abc123", 200}));
    REQUIRE(source.fetch_count() == 1);
}

TEST_CASE("ThumbnailService: first view of an item fills both tiers", "[thumbnail][service]") {
    TempDir dir;
    DiskThumbnailCache disk(dir.path());
    FakeThumbnailSource source(500, 500);
    ThumbnailPipeline pipeline(disk, source, PipelineConfig{});
    ThumbnailService service(pipeline, 350);

    const ResultItem item = make_item(7, "/photos/a.png", "abc123");
    const CacheKey key{"abc123", 200};
    REQUIRE(disk.read(key) == nullptr);

    REQUIRE(service.request(item) == RequestOutcome::Queued);
    REQUIRE(service.request(item) == RequestOutcome::AlreadyInflight);

    pipeline.start();
    REQUIRE(pipeline.wait_for_idle(std::chrono::seconds(10)));
    REQUIRE(service.poll_completions() == 1);

    // Persisted at the deterministic path and cached in memory
    REQUIRE(std::filesystem::exists(disk.derive_path(key)));
    ThumbnailData first = service.lookup(key);
    REQUIRE(first != nullptr);
    REQUIRE(*first == *disk.read(key));

    LvglBinInfo info;
    REQUIRE(read_lvgl_bin_header(*first, info));
    REQUIRE(info.width == 200);
    REQUIRE(info.height == 112);

    // Every consumer of the key gets the very same bytes
    REQUIRE(service.lookup(key) == first);
    REQUIRE(source.fetch_count() == 1);
}
