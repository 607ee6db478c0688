// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>

/**
 * @file viewport_model.h
 * @brief Pure layout math for the virtualized thumbnail grid
 *
 * Maps (scroll offset, viewport size, item count, card size) to the range of rows that have
 * to be materialized and to the height of the virtual content. No state, no side effects.
 */

namespace thumbgrid {

struct ViewportInput {
    int scroll_offset_px = 0;
    int viewport_width_px = 0;
    int viewport_height_px = 0;
    int item_count = 0;
    int card_width_px = 1;
    int card_height_px = 1;
    int overscan_rows = 1; ///< Extra rows materialized beyond those needed to cover the viewport
};

struct ViewportLayout {
    int first_visible_row = 0;
    int columns = 1;
    int visible_row_count = 1;
    int total_rows = 0;
    int64_t virtual_content_height_px = 0;

    /// Result index bound to the first slot
    [[nodiscard]] int first_index() const {
        return first_visible_row * columns;
    }
    /// Size of the slot pool for this layout
    [[nodiscard]] int slot_count() const {
        return columns * visible_row_count;
    }
    bool operator==(const ViewportLayout& o) const {
        return first_visible_row == o.first_visible_row && columns == o.columns &&
               visible_row_count == o.visible_row_count && total_rows == o.total_rows &&
               virtual_content_height_px == o.virtual_content_height_px;
    }
};

/**
 * @brief Card dimensions derived from the configured card width
 *
 * The preview area is 16:9; text and chrome add a fixed height below it.
 */
struct CardGeometry {
    static constexpr int PREVIEW_INSET = 16;
    static constexpr int CHROME_HEIGHT = 38; ///< Frame, border and gaps
    static constexpr int LABEL_HEIGHT = 24;

    int card_width = 230;
    int card_height = 173;
    int padding = 8;
    int preview_width = 198;
    int preview_height = 111;
    int label_width = 214;

    static CardGeometry from_width(int card_width, int padding);
};

namespace viewport {

/**
 * @brief Compute the visible layout
 *
 * columns = max(1, width / card_width), first row = scroll / card_height,
 * visible rows = ceil(height / card_height) + 1 + overscan, so the pool covers the viewport at
 * any scroll offset; content height = rows * card_height.
 */
ViewportLayout compute(const ViewportInput& in);

/**
 * @brief Hit test in content coordinates
 * @return Result index under (x, content_y), or -1
 */
int index_at(const ViewportInput& in, int x, int content_y);

/// Clamp a scroll offset to [0, content height - viewport height]
int clamp_scroll(int scroll_offset_px, int viewport_height_px, int64_t content_height_px);

} // namespace viewport

} // namespace thumbgrid
