// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "thumbnail_types.h"

#include <cstddef>
#include <cstdint>

/**
 * @file lvgl_image_codec.h
 * @brief In-memory LVGL binary image (.bin) encoding
 *
 * Layout: 12-byte lv_image_header_t followed by tightly packed pixel rows. Thumbnails are
 * always ARGB8888 so LVGL can blit them at 1:1 without a decoder.
 */

namespace thumbgrid {

/// LVGL 9 color format constant for ARGB8888
constexpr uint8_t COLOR_FORMAT_ARGB8888 = 0x10;

/// Size of lv_image_header_t as written to disk
constexpr size_t LVGL_BIN_HEADER_SIZE = 12;

struct LvglBinInfo {
    int width = 0;
    int height = 0;
    int stride = 0;
    uint8_t color_format = 0;
};

/**
 * @brief Build a .bin image from BGRA pixels
 *
 * @return Encoded bytes, empty if the dimensions or data size are inconsistent
 */
ThumbnailBytes encode_lvgl_bin(int width, int height, uint8_t color_format,
                               const uint8_t* pixel_data, size_t data_size);

/**
 * @brief Parse and validate the header of an encoded image
 *
 * Checks the magic byte and that the payload holds stride * height bytes.
 */
bool read_lvgl_bin_header(const ThumbnailBytes& bytes, LvglBinInfo& info);

} // namespace thumbgrid
