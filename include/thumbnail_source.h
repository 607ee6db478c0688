// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "thumbnail_types.h"

#include <string>

namespace thumbgrid {

/**
 * @brief Supplier of encoded source images for thumbnail generation
 *
 * Called from pipeline worker threads, so implementations must be thread-safe.
 * Returning nullptr means the source is unavailable; the pipeline reports that as an absent
 * thumbnail and does not retry.
 */
class ThumbnailSource {
  public:
    virtual ~ThumbnailSource() = default;

    /**
     * @param content_key Content identifier (the path when no identifier is known)
     * @param display_path Path of the original image, used when the key is not resolvable
     */
    virtual ThumbnailData fetch_source_bytes(const std::string& content_key,
                                             const std::string& display_path) = 0;
};

} // namespace thumbgrid
