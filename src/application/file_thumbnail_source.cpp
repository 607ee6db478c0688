// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "file_thumbnail_source.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>

namespace thumbgrid {

ThumbnailData FileThumbnailSource::fetch_source_bytes(const std::string& content_key,
                                                      const std::string& display_path) {
    const std::string& path = display_path.empty() ? content_key : display_path;

    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        spdlog::debug("[FileThumbnailSource] Cannot stat {}: {}", path, ec.message());
        return nullptr;
    }
    if (size == 0 || size > max_bytes_) {
        spdlog::debug("[FileThumbnailSource] Skipping {} ({} bytes)", path, size);
        return nullptr;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::debug("[FileThumbnailSource] Cannot open {}", path);
        return nullptr;
    }

    auto bytes = std::make_shared<ThumbnailBytes>(static_cast<size_t>(size));
    file.read(reinterpret_cast<char*>(bytes->data()), static_cast<std::streamsize>(size));
    if (file.gcount() != static_cast<std::streamsize>(size)) {
        spdlog::debug("[FileThumbnailSource] Short read on {}", path);
        return nullptr;
    }
    return bytes;
}

} // namespace thumbgrid
