// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "directory_result_provider.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace thumbgrid {

namespace {

bool is_skipped_directory(const fs::path& dir) {
    const std::string name = dir.filename().string();
    return name.empty() || name[0] == '.' || name == "thumbnails" || name == "temp" ||
           name == "tmp";
}

} // namespace

DirectoryResultProvider::DirectoryResultProvider(std::string root, bool recursive)
    : root_(std::move(root)), recursive_(recursive) {}

const std::vector<std::string>& DirectoryResultProvider::image_extensions() {
    static const std::vector<std::string> extensions = {".png", ".jpg", ".jpeg", ".bmp",
                                                        ".gif", ".tga", ".ppm", ".pgm"};
    return extensions;
}

bool DirectoryResultProvider::is_image_file(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto& known = image_extensions();
    return std::find(known.begin(), known.end(), ext) != known.end();
}

std::vector<ResultItem> DirectoryResultProvider::scan() const {
    std::vector<std::string> paths;
    std::error_code ec;

    if (!fs::is_directory(root_, ec)) {
        spdlog::warn("[DirectoryResultProvider] Not a directory: {}", root_);
        return {};
    }

    auto consider = [&](const fs::directory_entry& entry) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            return;
        }
        const std::string name = entry.path().filename().string();
        if (!name.empty() && name[0] != '.' && is_image_file(name)) {
            paths.push_back(entry.path().string());
        }
    };

    if (recursive_) {
        fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied,
                                            ec);
        for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
            std::error_code entry_ec;
            if (it->is_directory(entry_ec)) {
                if (is_skipped_directory(it->path())) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            consider(*it);
        }
    } else {
        for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
            consider(*it);
        }
    }
    if (ec) {
        spdlog::warn("[DirectoryResultProvider] Scan of {} stopped early: {}", root_,
                     ec.message());
    }

    std::sort(paths.begin(), paths.end());

    std::vector<ResultItem> results;
    results.reserve(paths.size());
    for (auto& path : paths) {
        ResultItem item;
        item.index = static_cast<int>(results.size());
        item.display_path = std::move(path);
        results.push_back(std::move(item));
    }

    spdlog::info("[DirectoryResultProvider] {} images in {}{}", results.size(), root_,
                 recursive_ ? " (recursive)" : "");
    return results;
}

} // namespace thumbgrid
