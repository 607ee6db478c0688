// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "viewport_model.h"

#include <catch2/catch_all.hpp>

using namespace thumbgrid;

namespace {

ViewportInput grid_input(int items, int scroll = 0) {
    ViewportInput in;
    in.item_count = items;
    in.scroll_offset_px = scroll;
    in.viewport_width_px = 1080;
    in.viewport_height_px = 810;
    in.card_width_px = 270;
    in.card_height_px = 270;
    in.overscan_rows = 1;
    return in;
}

} // namespace

TEST_CASE("viewport::compute: rows, columns and virtual height", "[grid][viewport]") {
    ViewportLayout layout = viewport::compute(grid_input(1000));

    REQUIRE(layout.columns == 4);
    REQUIRE(layout.total_rows == 250);
    REQUIRE(layout.virtual_content_height_px == 67500);
    REQUIRE(layout.first_visible_row == 0);
    REQUIRE(layout.visible_row_count == 3 + 1 + 1);
    REQUIRE(layout.slot_count() == 20);
}

TEST_CASE("viewport::compute: scroll offset selects the first row", "[grid][viewport]") {
    REQUIRE(viewport::compute(grid_input(1000, 540)).first_visible_row == 2);
    REQUIRE(viewport::compute(grid_input(1000, 539)).first_visible_row == 1);
    REQUIRE(viewport::compute(grid_input(1000, 540)).first_index() == 8);
}

TEST_CASE("viewport::compute: slots cover the viewport at any scroll offset",
          "[grid][viewport]") {
    ViewportInput in;
    in.item_count = 1000;
    in.viewport_width_px = 920;
    in.viewport_height_px = 800;
    in.card_width_px = 230;
    in.card_height_px = 173;
    in.overscan_rows = GENERATE(0, 1);

    for (int scroll : {0, 1, 100, 172, 173, 345, 5000}) {
        in.scroll_offset_px = scroll;
        const ViewportLayout layout = viewport::compute(in);
        const int64_t covered_bottom =
            static_cast<int64_t>(layout.first_visible_row + layout.visible_row_count) *
            in.card_height_px;
        INFO("scroll=" << scroll << " overscan=" << in.overscan_rows);
        REQUIRE(covered_bottom >= scroll + in.viewport_height_px);
    }
}

TEST_CASE("viewport::compute: partial last row counts as a row", "[grid][viewport]") {
    ViewportLayout layout = viewport::compute(grid_input(1001));
    REQUIRE(layout.total_rows == 251);
    REQUIRE(layout.virtual_content_height_px == 251 * 270);
}

TEST_CASE("viewport::compute: degenerate inputs", "[grid][viewport]") {
    SECTION("no items means no content height") {
        ViewportLayout layout = viewport::compute(grid_input(0));
        REQUIRE(layout.total_rows == 0);
        REQUIRE(layout.virtual_content_height_px == 0);
    }

    SECTION("viewport narrower than a card still has one column") {
        ViewportInput in = grid_input(10);
        in.viewport_width_px = 100;
        REQUIRE(viewport::compute(in).columns == 1);
    }

    SECTION("zero-height viewport still materializes a row") {
        ViewportInput in = grid_input(10);
        in.viewport_height_px = 0;
        in.overscan_rows = 0;
        REQUIRE(viewport::compute(in).visible_row_count == 1);
    }

    SECTION("negative scroll is treated as the top") {
        REQUIRE(viewport::compute(grid_input(10, -50)).first_visible_row == 0);
    }

    SECTION("zero card size does not divide by zero") {
        ViewportInput in = grid_input(10);
        in.card_width_px = 0;
        in.card_height_px = 0;
        ViewportLayout layout = viewport::compute(in);
        REQUIRE(layout.columns >= 1);
        REQUIRE(layout.total_rows >= 1);
    }
}

TEST_CASE("viewport::compute: large result sets do not overflow", "[grid][viewport]") {
    ViewportInput in = grid_input(2000000000);
    in.viewport_width_px = 270;
    ViewportLayout layout = viewport::compute(in);
    REQUIRE(layout.virtual_content_height_px == int64_t(2000000000) * 270);
}

TEST_CASE("viewport::index_at: hit testing in content coordinates", "[grid][viewport]") {
    const ViewportInput in = grid_input(10);

    REQUIRE(viewport::index_at(in, 0, 0) == 0);
    REQUIRE(viewport::index_at(in, 275, 10) == 1);
    REQUIRE(viewport::index_at(in, 10, 280) == 4);
    REQUIRE(viewport::index_at(in, 550, 545) == -1); // row 2, col 2 is past the last item
    REQUIRE(viewport::index_at(in, 280, 545) == 9);
    REQUIRE(viewport::index_at(in, 1090, 0) == -1);
    REQUIRE(viewport::index_at(in, -1, 0) == -1);
}

TEST_CASE("viewport::clamp_scroll", "[grid][viewport]") {
    REQUIRE(viewport::clamp_scroll(-10, 500, 2000) == 0);
    REQUIRE(viewport::clamp_scroll(700, 500, 2000) == 700);
    REQUIRE(viewport::clamp_scroll(1800, 500, 2000) == 1500);
    REQUIRE(viewport::clamp_scroll(100, 500, 300) == 0);
}

TEST_CASE("CardGeometry: derived from the card width", "[grid][viewport]") {
    CardGeometry g = CardGeometry::from_width(230, 8);
    REQUIRE(g.card_width == 230);
    REQUIRE(g.preview_width == 198);
    REQUIRE(g.preview_height == 111);
    REQUIRE(g.label_width == 214);
    REQUIRE(g.card_height == 173);

    CardGeometry tiny = CardGeometry::from_width(0, 8);
    REQUIRE(tiny.preview_width >= 1);
    REQUIRE(tiny.preview_height >= 1);
}
