// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_image_codec.h"

#include <spdlog/spdlog.h>

#include <cstring>

// LVGL headers for the correct binary header layout
#include <lvgl/src/draw/lv_image_dsc.h>

namespace thumbgrid {

static_assert(sizeof(lv_image_header_t) == LVGL_BIN_HEADER_SIZE,
              "lv_image_header_t layout changed");

ThumbnailBytes encode_lvgl_bin(int width, int height, uint8_t color_format,
                               const uint8_t* pixel_data, size_t data_size) {
    if (width <= 0 || height <= 0 || width > 0xFFFF || height > 0xFFFF || !pixel_data) {
        spdlog::warn("[LvglImageCodec] Invalid image {}x{}", width, height);
        return {};
    }

    const uint32_t stride = static_cast<uint32_t>(width) * 4;
    const size_t expected = static_cast<size_t>(stride) * static_cast<size_t>(height);
    if (data_size != expected) {
        spdlog::warn("[LvglImageCodec] Pixel data size {} does not match {}x{} (expected {})",
                     data_size, width, height, expected);
        return {};
    }

    lv_image_header_t header;
    std::memset(&header, 0, sizeof(header));
    header.magic = LV_IMAGE_HEADER_MAGIC;
    header.cf = color_format;
    header.flags = 0;
    header.w = static_cast<uint16_t>(width);
    header.h = static_cast<uint16_t>(height);
    header.stride = static_cast<uint16_t>(stride);

    ThumbnailBytes out(sizeof(header) + data_size);
    std::memcpy(out.data(), &header, sizeof(header));
    std::memcpy(out.data() + sizeof(header), pixel_data, data_size);
    return out;
}

bool read_lvgl_bin_header(const ThumbnailBytes& bytes, LvglBinInfo& info) {
    if (bytes.size() < sizeof(lv_image_header_t)) {
        return false;
    }

    lv_image_header_t header;
    std::memcpy(&header, bytes.data(), sizeof(header));
    if (header.magic != LV_IMAGE_HEADER_MAGIC || header.w == 0 || header.h == 0) {
        return false;
    }

    const size_t payload = bytes.size() - sizeof(header);
    if (payload < static_cast<size_t>(header.stride) * header.h) {
        return false;
    }

    info.width = header.w;
    info.height = header.h;
    info.stride = header.stride;
    info.color_format = static_cast<uint8_t>(header.cf);
    return true;
}

} // namespace thumbgrid
