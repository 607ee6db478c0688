// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_thumbnail_pipeline.cpp
 * @brief Background generation: disk tier, source fetch, render, completion delivery
 */

#include "disk_thumbnail_cache.h"
#include "lvgl_image_codec.h"
#include "thumbnail_pipeline.h"

#include "test_helpers/thumbgrid_test_support.h"

#include <catch2/catch_all.hpp>

#include <chrono>
#include <vector>

using namespace thumbgrid;
using namespace thumbgrid::test;

namespace {

PendingRequest make_request(int index, const std::string& path) {
    PendingRequest r;
    r.index = index;
    r.display_path = path;
    r.content_key = path;
    return r;
}

std::vector<CompletedResult> drain_all(ThumbnailPipeline& pipeline) {
    std::vector<CompletedResult> out;
    pipeline.drain_completed(1000, [&](CompletedResult&& r) { out.push_back(std::move(r)); });
    return out;
}

} // namespace

TEST_CASE("ThumbnailPipeline: process renders, persists and returns the image",
          "[thumbnail][pipeline]") {
    TempDir dir;
    DiskThumbnailCache disk(dir.path());
    FakeThumbnailSource source(320, 240);
    ThumbnailPipeline pipeline(disk, source, PipelineConfig{});

    CompletedResult done = pipeline.process(make_request(3, "/photos/a.png"));
    REQUIRE(done.index == 3);
    REQUIRE(done.display_path == "/photos/a.png");
    REQUIRE(done.bytes != nullptr);

    LvglBinInfo info;
    REQUIRE(read_lvgl_bin_header(*done.bytes, info));
    REQUIRE(info.width == 200);
    REQUIRE(info.height == 112);

    ThumbnailData persisted = disk.read({"/photos/a.png", 200});
    REQUIRE(persisted != nullptr);
    REQUIRE(*persisted == *done.bytes);
}

TEST_CASE("ThumbnailPipeline: disk hit skips the source", "[thumbnail][pipeline]") {
    TempDir dir;
    DiskThumbnailCache disk(dir.path());
    FakeThumbnailSource source;
    ThumbnailPipeline pipeline(disk, source, PipelineConfig{});

    const ThumbnailBytes stored = {1, 2, 3};
    REQUIRE(disk.write({"/photos/a.png", 200}, stored));

    CompletedResult done = pipeline.process(make_request(0, "/photos/a.png"));
    REQUIRE(done.bytes != nullptr);
    REQUIRE(*done.bytes == stored);
    REQUIRE(source.fetch_count() == 0);
}

TEST_CASE("ThumbnailPipeline: unavailable or undecodable source gives an absent result",
          "[thumbnail][pipeline]") {
    TempDir dir;
    DiskThumbnailCache disk(dir.path());
    FakeThumbnailSource source;
    ThumbnailPipeline pipeline(disk, source, PipelineConfig{});

    SECTION("source has nothing") {
        source.mark_unavailable("/photos/missing.png");
        CompletedResult done = pipeline.process(make_request(1, "/photos/missing.png"));
        REQUIRE(done.index == 1);
        REQUIRE(done.bytes == nullptr);
    }

    SECTION("source bytes are not an image") {
        source.set_bytes("/photos/broken.png", ThumbnailBytes(64, 0x00));
        CompletedResult done = pipeline.process(make_request(2, "/photos/broken.png"));
        REQUIRE(done.bytes == nullptr);
        REQUIRE(disk.read({"/photos/broken.png", 200}) == nullptr);
    }
}

TEST_CASE("ThumbnailPipeline: single worker completes in request order",
          "[thumbnail][pipeline]") {
    TempDir dir;
    DiskThumbnailCache disk(dir.path());
    FakeThumbnailSource source;
    ThumbnailPipeline pipeline(disk, source, PipelineConfig{});

    for (int i = 0; i < 8; ++i) {
        REQUIRE(pipeline.submit(make_request(i, "/photos/" + std::to_string(i) + ".png")));
    }
    pipeline.start();
    REQUIRE(pipeline.wait_for_idle(std::chrono::seconds(10)));

    auto done = drain_all(pipeline);
    REQUIRE(done.size() == 8);
    for (int i = 0; i < 8; ++i) {
        REQUIRE(done[static_cast<size_t>(i)].index == i);
        REQUIRE(done[static_cast<size_t>(i)].bytes != nullptr);
    }
    REQUIRE(pipeline.outstanding() == 0);
}

TEST_CASE("ThumbnailPipeline: several workers deliver every request",
          "[thumbnail][pipeline]") {
    TempDir dir;
    DiskThumbnailCache disk(dir.path());
    FakeThumbnailSource source;
    PipelineConfig config;
    config.worker_count = 3;
    ThumbnailPipeline pipeline(disk, source, config);
    REQUIRE(pipeline.worker_count() == 3);

    pipeline.start();
    for (int i = 0; i < 20; ++i) {
        REQUIRE(pipeline.submit(make_request(i, "/photos/" + std::to_string(i) + ".png")));
    }
    REQUIRE(pipeline.wait_for_idle(std::chrono::seconds(10)));
    REQUIRE(drain_all(pipeline).size() == 20);
}

TEST_CASE("ThumbnailPipeline: worker count is clamped", "[thumbnail][pipeline]") {
    TempDir dir;
    DiskThumbnailCache disk(dir.path());
    FakeThumbnailSource source;

    PipelineConfig many;
    many.worker_count = 64;
    REQUIRE(ThumbnailPipeline(disk, source, many).worker_count() ==
            ThumbnailPipeline::MAX_WORKER_THREADS);

    PipelineConfig none;
    none.worker_count = 0;
    REQUIRE(ThumbnailPipeline(disk, source, none).worker_count() == 1);
}

TEST_CASE("ThumbnailPipeline: bounded request queue rejects overflow",
          "[thumbnail][pipeline]") {
    TempDir dir;
    DiskThumbnailCache disk(dir.path());
    FakeThumbnailSource source;
    PipelineConfig config;
    config.request_queue_limit = 2;
    ThumbnailPipeline pipeline(disk, source, config);

    REQUIRE(pipeline.submit(make_request(0, "a")));
    REQUIRE(pipeline.submit(make_request(1, "b")));
    REQUIRE_FALSE(pipeline.submit(make_request(2, "c")));
    REQUIRE(pipeline.queued_requests() == 2);
    REQUIRE(pipeline.outstanding() == 2);
}

TEST_CASE("ThumbnailPipeline: shutdown drops queued work and refuses new requests",
          "[thumbnail][pipeline]") {
    TempDir dir;
    DiskThumbnailCache disk(dir.path());
    FakeThumbnailSource source;
    ThumbnailPipeline pipeline(disk, source, PipelineConfig{});

    pipeline.submit(make_request(0, "a"));
    pipeline.submit(make_request(1, "b"));
    pipeline.shutdown();

    REQUIRE(pipeline.queued_requests() == 0);
    REQUIRE(pipeline.outstanding() == 0);
    REQUIRE(pipeline.wait_for_idle(std::chrono::milliseconds(10)));
    REQUIRE_FALSE(pipeline.submit(make_request(2, "c")));

    // Idempotent
    pipeline.shutdown();
}
