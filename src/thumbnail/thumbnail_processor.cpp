// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

// Define STB implementations in this compilation unit only
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION

#include "thumbnail_processor.h"

#include "lvgl_image_codec.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

// stb headers - single-file libraries for image processing
#include "stb_image.h"
#include "stb_image_resize.h"

namespace thumbgrid {

namespace {

// Frees stbi_load results on every exit path
struct StbiPixels {
    unsigned char* data = nullptr;
    ~StbiPixels() {
        if (data) {
            stbi_image_free(data);
        }
    }
};

} // namespace

ThumbnailTarget ThumbnailTarget::for_size(int target_size, int aspect_width, int aspect_height) {
    ThumbnailTarget target;
    target.color_format = COLOR_FORMAT_ARGB8888;
    target.width = std::max(target_size, 1);
    if (aspect_width <= 0 || aspect_height <= 0) {
        target.height = target.width;
    } else {
        target.height = std::max(1, target.width * aspect_height / aspect_width);
    }
    return target;
}

CropRect ThumbnailProcessor::compute_cover_crop(int src_w, int src_h,
                                                const ThumbnailTarget& target) {
    CropRect crop;
    if (src_w <= 0 || src_h <= 0 || target.width <= 0 || target.height <= 0) {
        return crop;
    }

    // Compare aspect ratios by cross-multiplying to stay in integers
    const int64_t src_wide = static_cast<int64_t>(src_w) * target.height;
    const int64_t dst_wide = static_cast<int64_t>(target.width) * src_h;

    if (src_wide > dst_wide) {
        // Source is wider than the target: keep full height, trim the sides
        crop.height = src_h;
        crop.width = static_cast<int>(
            std::lround(static_cast<double>(src_h) * target.width / target.height));
        crop.width = std::clamp(crop.width, 1, src_w);
        crop.x = (src_w - crop.width) / 2;
    } else {
        // Source is taller (or equal): keep full width, trim top and bottom
        crop.width = src_w;
        crop.height = static_cast<int>(
            std::lround(static_cast<double>(src_w) * target.height / target.width));
        crop.height = std::clamp(crop.height, 1, src_h);
        crop.y = (src_h - crop.height) / 2;
    }
    return crop;
}

ProcessResult ThumbnailProcessor::render_cover(const ThumbnailBytes& source,
                                               const ThumbnailTarget& target) {
    ProcessResult result;

    if (source.empty()) {
        result.error = "Empty source data";
        return result;
    }
    if (source.size() > MAX_INPUT_SIZE) {
        result.error = "Source too large (" + std::to_string(source.size() / 1024 / 1024) +
                       " MB, max " + std::to_string(MAX_INPUT_SIZE / 1024 / 1024) + " MB)";
        return result;
    }

    // Check dimensions from the header before allocating the decoded image
    int src_width = 0, src_height = 0, src_channels = 0;
    if (!stbi_info_from_memory(source.data(), static_cast<int>(source.size()), &src_width,
                               &src_height, &src_channels)) {
        result.error = std::string("Unrecognized image format: ") + stbi_failure_reason();
        return result;
    }
    if (src_width > MAX_SOURCE_DIMENSION || src_height > MAX_SOURCE_DIMENSION) {
        result.error = "Source image too large (" + std::to_string(src_width) + "x" +
                       std::to_string(src_height) + ", max " +
                       std::to_string(MAX_SOURCE_DIMENSION) + ")";
        return result;
    }

    // Request RGBA output regardless of source format
    StbiPixels src;
    src.data = stbi_load_from_memory(source.data(), static_cast<int>(source.size()), &src_width,
                                     &src_height, &src_channels, 4);
    if (!src.data) {
        result.error = std::string("Failed to decode image: ") + stbi_failure_reason();
        return result;
    }

    spdlog::trace("[ThumbnailProcessor] Decoded {}x{} ({} channels)", src_width, src_height,
                  src_channels);

    const int out_width = std::clamp(target.width, 1, MAX_OUTPUT_DIMENSION);
    const int out_height = std::clamp(target.height, 1, MAX_OUTPUT_DIMENSION);
    ThumbnailTarget box = target;
    box.width = out_width;
    box.height = out_height;

    const CropRect crop = compute_cover_crop(src_width, src_height, box);
    if (crop.width <= 0 || crop.height <= 0) {
        result.error = "Degenerate crop";
        return result;
    }

    spdlog::trace("[ThumbnailProcessor] Crop {}x{}+{}+{} -> {}x{}", crop.width, crop.height,
                  crop.x, crop.y, out_width, out_height);

    // Resize only the crop region: offset the input pointer and keep the full source stride
    const int src_stride = src_width * 4;
    const unsigned char* crop_origin =
        src.data + static_cast<size_t>(crop.y) * src_stride + static_cast<size_t>(crop.x) * 4;

    std::vector<unsigned char> pixels(static_cast<size_t>(out_width) * out_height * 4);
    if (!stbir_resize_uint8(crop_origin, crop.width, crop.height, src_stride, pixels.data(),
                            out_width, out_height, 0, 4)) {
        result.error = "Failed to resize image";
        return result;
    }

    // stb gives RGBA; LVGL ARGB8888 is B,G,R,A in memory on little-endian
    for (size_t i = 0; i < pixels.size(); i += 4) {
        std::swap(pixels[i], pixels[i + 2]);
    }

    result.bytes =
        encode_lvgl_bin(out_width, out_height, box.color_format, pixels.data(), pixels.size());
    if (result.bytes.empty()) {
        result.error = "Failed to encode .bin image";
        return result;
    }

    result.success = true;
    result.output_width = out_width;
    result.output_height = out_height;
    return result;
}

} // namespace thumbgrid
