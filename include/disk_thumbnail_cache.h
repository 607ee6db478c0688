// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "thumbnail_types.h"

#include <atomic>
#include <cstddef>
#include <string>

/**
 * @file disk_thumbnail_cache.h
 * @brief Persistent, content-addressed tier of the thumbnail cache
 *
 * Rendered thumbnails are stored as one file per CacheKey:
 *
 *   <root>/<first two chars of id>/<id>_<size>.bin
 *
 * where `id` is the normalized content identifier (see normalize_id()). The file name is a
 * pure function of the key, so any number of workers can read and write concurrently: writes
 * go to a uniquely named staging file in the same directory and are renamed into place, so a
 * reader sees either no file or the complete file.
 *
 * Every I/O failure is absorbed. A failed read is a miss, a failed write is a no-op. Both are
 * logged at debug/warn level and never surface to callers.
 *
 * Entries are never invalidated by age and the tier has no size bound; clear() is the only
 * way entries go away.
 *
 * Thread-safe: all const methods and write() may be called from any thread.
 */

namespace thumbgrid {

class DiskThumbnailCache {
  public:
    static constexpr const char* FILE_EXTENSION = ".bin";
    static constexpr const char* CACHE_SUBDIR = "thumbs";

    /**
     * @param root Cache root directory (created on demand)
     * @param enabled false turns every read into a miss and every write into a no-op
     */
    explicit DiskThumbnailCache(std::string root, bool enabled = true);

    /**
     * @brief Resolve the cache root directory
     *
     * Order: explicit configured directory, THUMBGRID_CACHE_DIR, $XDG_CACHE_HOME/thumbgrid,
     * $HOME/.cache/thumbgrid, /tmp/thumbgrid. The first one that can be created and written
     * wins; CACHE_SUBDIR is appended to it.
     */
    static std::string resolve_cache_dir(const std::string& configured);

    /**
     * @brief Normalize a content identifier for use in a file name
     *
     * Identifiers that already look like hashes (16-128 hex digits) are lowercased and kept.
     * Anything else is replaced by its SHA-256 hex digest. Empty becomes "unknown" first.
     */
    static std::string normalize_id(const std::string& content_key);

    /// Deterministic on-disk location of a key. Pure; does not touch the file system.
    [[nodiscard]] std::string derive_path(const CacheKey& key) const;

    /// @return The cached bytes, or nullptr on miss / empty file / any error
    [[nodiscard]] ThumbnailData read(const CacheKey& key) const;

    /// Stage and atomically publish. @return true if the entry is now on disk.
    bool write(const CacheKey& key, const ThumbnailBytes& bytes);

    /// Delete every cached entry. @return number of files removed
    size_t clear();

    [[nodiscard]] const std::string& root() const {
        return root_;
    }
    [[nodiscard]] bool enabled() const {
        return enabled_;
    }

  private:
    std::string root_;
    bool enabled_;
    std::atomic<uint64_t> staging_counter_{0};
};

} // namespace thumbgrid
