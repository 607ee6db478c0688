// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "viewport_model.h"

#include <algorithm>

namespace thumbgrid {

CardGeometry CardGeometry::from_width(int card_width, int padding) {
    CardGeometry g;
    g.padding = std::max(padding, 0);
    g.card_width = std::max(card_width, 2 * g.padding + PREVIEW_INSET + 1);
    g.preview_width = g.card_width - 2 * g.padding - PREVIEW_INSET;
    g.preview_height = std::max(1, g.preview_width * 9 / 16);
    g.label_width = g.card_width - 2 * g.padding;
    g.card_height = g.preview_height + CHROME_HEIGHT + LABEL_HEIGHT;
    return g;
}

namespace viewport {

ViewportLayout compute(const ViewportInput& in) {
    ViewportLayout out;
    const int card_w = std::max(in.card_width_px, 1);
    const int card_h = std::max(in.card_height_px, 1);
    const int items = std::max(in.item_count, 0);

    out.columns = std::max(1, in.viewport_width_px / card_w);
    out.first_visible_row = std::max(0, in.scroll_offset_px) / card_h;
    // A viewport that does not start on a row boundary straddles one more row than it holds
    const int height = std::max(0, in.viewport_height_px);
    out.visible_row_count = (height + card_h - 1) / card_h + 1 + std::max(0, in.overscan_rows);
    out.total_rows = (items + out.columns - 1) / out.columns;
    out.virtual_content_height_px = static_cast<int64_t>(out.total_rows) * card_h;
    return out;
}

int index_at(const ViewportInput& in, int x, int content_y) {
    if (x < 0 || content_y < 0) {
        return -1;
    }
    const ViewportLayout layout = compute(in);
    const int col = x / std::max(in.card_width_px, 1);
    if (col >= layout.columns) {
        return -1;
    }
    const int64_t row = content_y / std::max(in.card_height_px, 1);
    const int64_t index = row * layout.columns + col;
    return index < in.item_count ? static_cast<int>(index) : -1;
}

int clamp_scroll(int scroll_offset_px, int viewport_height_px, int64_t content_height_px) {
    const int64_t max_scroll =
        std::max<int64_t>(0, content_height_px - std::max(viewport_height_px, 0));
    return static_cast<int>(std::clamp<int64_t>(scroll_offset_px, 0, max_scroll));
}

} // namespace viewport

} // namespace thumbgrid
