// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "thumbnail_types.h"

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @file thumbnail_processor.h
 * @brief Cover-crop rendering of source images into display-ready thumbnails
 *
 * Decodes a source image (PNG, JPEG, BMP, GIF, TGA, PNM via stb_image), crops the largest
 * centered region with the target aspect ratio, resizes it to exactly the target box, and
 * encodes the result as an ARGB8888 LVGL .bin image. The grid then shows it at 1:1 with zero
 * runtime scaling.
 *
 * Stateless and thread-safe; called from pipeline worker threads.
 */

namespace thumbgrid {

/**
 * @brief Target box and pixel format of a rendered thumbnail
 */
struct ThumbnailTarget {
    int width = 200;
    int height = 112;

    /**
     * @brief Color format for output, always ARGB8888
     *
     * LVGL handles conversion to display format (e.g., RGB565) at render time.
     */
    uint8_t color_format = 0x10; // LV_COLOR_FORMAT_ARGB8888

    /**
     * @brief Box for a cache target size and aspect ratio
     *
     * Width is the target size, height follows the aspect (16:9 at 200 gives 200x112).
     */
    static ThumbnailTarget for_size(int target_size, int aspect_width, int aspect_height);

    bool operator==(const ThumbnailTarget& other) const {
        return width == other.width && height == other.height && color_format == other.color_format;
    }
};

/// Region of the source image that survives the crop
struct CropRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

/**
 * @brief Result of a render operation
 */
struct ProcessResult {
    bool success = false;
    ThumbnailBytes bytes; ///< Encoded .bin image (empty on failure)
    std::string error;    ///< Error message (empty on success)
    int output_width = 0;
    int output_height = 0;
};

class ThumbnailProcessor {
  public:
    // Safety limits to prevent memory exhaustion and integer overflow
    static constexpr size_t MAX_INPUT_SIZE = 32 * 1024 * 1024; // 32 MB compressed
    static constexpr int MAX_SOURCE_DIMENSION = 8192;
    static constexpr int MAX_OUTPUT_DIMENSION = 1024;

    /**
     * @brief Largest centered crop of a src_w x src_h image with the target's aspect ratio
     *
     * Scaling that crop to the target box fills it completely (cover semantics).
     */
    static CropRect compute_cover_crop(int src_w, int src_h, const ThumbnailTarget& target);

    /**
     * @brief Decode, cover-crop, resize and encode
     *
     * @param source Encoded source image bytes
     * @param target Output box; clamped to MAX_OUTPUT_DIMENSION
     */
    static ProcessResult render_cover(const ThumbnailBytes& source, const ThumbnailTarget& target);
};

} // namespace thumbgrid
