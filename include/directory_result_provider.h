// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "thumbnail_types.h"

#include <string>
#include <vector>

namespace thumbgrid {

/**
 * @brief Result provider that lists the image files of a directory
 *
 * Results are sorted by path. The content key is left empty, so the path doubles as the
 * cache identifier. Hidden entries and directories named thumbnails, temp or tmp are skipped.
 */
class DirectoryResultProvider {
  public:
    explicit DirectoryResultProvider(std::string root, bool recursive = false);

    /// File extensions (lowercase, with dot) treated as images
    static const std::vector<std::string>& image_extensions();

    static bool is_image_file(const std::string& path);

    /// Walk the directory. Unreadable entries are skipped with a warning.
    std::vector<ResultItem> scan() const;

    [[nodiscard]] const std::string& root() const {
        return root_;
    }

  private:
    std::string root_;
    bool recursive_;
};

} // namespace thumbgrid
