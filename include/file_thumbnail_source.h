// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "thumbnail_source.h"

#include <cstddef>

namespace thumbgrid {

/**
 * @brief Thumbnail source that reads the original image file
 *
 * The content key is not resolvable without a content store, so the display path is always
 * what gets read. Files larger than max_bytes are reported unavailable.
 *
 * Stateless, so safe to call from any number of worker threads.
 */
class FileThumbnailSource : public ThumbnailSource {
  public:
    static constexpr size_t DEFAULT_MAX_BYTES = 32 * 1024 * 1024;

    explicit FileThumbnailSource(size_t max_bytes = DEFAULT_MAX_BYTES) : max_bytes_(max_bytes) {}

    ThumbnailData fetch_source_bytes(const std::string& content_key,
                                     const std::string& display_path) override;

  private:
    size_t max_bytes_;
};

} // namespace thumbgrid
