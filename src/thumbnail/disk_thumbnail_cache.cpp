// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "disk_thumbnail_cache.h"

#include "content_hash.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

namespace thumbgrid {

namespace {

std::string trim_whitespace(const std::string& s) {
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(s.begin(), s.end(), is_space);
    auto end = std::find_if_not(s.rbegin(), std::string::const_reverse_iterator(begin), is_space)
                   .base();
    return std::string(begin, end);
}

// Create the directory and prove it is writable
bool try_create_dir(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec || !fs::is_directory(path, ec)) {
        return false;
    }
    std::string probe = path + "/.thumbgrid_write_test";
    {
        std::ofstream ofs(probe);
        if (!ofs.good()) {
            return false;
        }
    }
    fs::remove(probe, ec);
    return true;
}

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return (value && value[0] != '\0') ? std::string(value) : std::string();
}

} // namespace

DiskThumbnailCache::DiskThumbnailCache(std::string root, bool enabled)
    : root_(std::move(root)), enabled_(enabled) {
    if (enabled_ && !try_create_dir(root_)) {
        spdlog::warn("[DiskThumbnailCache] Cache directory {} is not writable, entries will not "
                     "persist",
                     root_);
    }
    spdlog::debug("[DiskThumbnailCache] Root: {} ({})", root_, enabled_ ? "enabled" : "disabled");
}

std::string DiskThumbnailCache::resolve_cache_dir(const std::string& configured) {
    std::vector<std::string> candidates;
    if (!configured.empty()) {
        candidates.push_back(configured);
    }
    std::string env_dir = env_or_empty("THUMBGRID_CACHE_DIR");
    if (!env_dir.empty()) {
        candidates.push_back(env_dir);
    }
    std::string xdg = env_or_empty("XDG_CACHE_HOME");
    if (!xdg.empty()) {
        candidates.push_back(xdg + "/thumbgrid");
    }
    std::string home = env_or_empty("HOME");
    if (!home.empty()) {
        candidates.push_back(home + "/.cache/thumbgrid");
    }
    candidates.emplace_back("/tmp/thumbgrid");

    for (const auto& base : candidates) {
        std::string path = base + "/" + CACHE_SUBDIR;
        if (try_create_dir(path)) {
            spdlog::info("[DiskThumbnailCache] Using cache directory: {}", path);
            return path;
        }
        spdlog::warn("[DiskThumbnailCache] Cannot use cache directory: {}", path);
    }

    // Nothing writable; reads will miss and writes will fail quietly
    return candidates.back() + "/" + CACHE_SUBDIR;
}

std::string DiskThumbnailCache::normalize_id(const std::string& content_key) {
    const std::string id =
        trim_whitespace(content_key.empty() ? std::string("unknown") : content_key);
    if (is_hex_identifier(id)) {
        std::string lowered = id;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered;
    }
    return sha256_hex(id);
}

std::string DiskThumbnailCache::derive_path(const CacheKey& key) const {
    const std::string id = normalize_id(key.content_key);
    return root_ + "/" + id.substr(0, 2) + "/" + id + "_" + std::to_string(key.target_size) +
           FILE_EXTENSION;
}

ThumbnailData DiskThumbnailCache::read(const CacheKey& key) const {
    if (!enabled_) {
        return nullptr;
    }

    const std::string path = derive_path(key);
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return nullptr;
    }

    auto bytes = std::make_shared<ThumbnailBytes>(std::istreambuf_iterator<char>(file),
                                                  std::istreambuf_iterator<char>());
    if (file.bad()) {
        spdlog::debug("[DiskThumbnailCache] Read error on {}", path);
        return nullptr;
    }
    if (bytes->empty()) {
        return nullptr;
    }

    spdlog::trace("[DiskThumbnailCache] Hit: {} ({} bytes)", path, bytes->size());
    return bytes;
}

bool DiskThumbnailCache::write(const CacheKey& key, const ThumbnailBytes& bytes) {
    if (!enabled_ || bytes.empty()) {
        return false;
    }

    const fs::path final_path = derive_path(key);
    std::error_code ec;
    fs::create_directories(final_path.parent_path(), ec);
    if (ec) {
        spdlog::debug("[DiskThumbnailCache] Cannot create {}: {}",
                      final_path.parent_path().string(), ec.message());
        return false;
    }

    // Staging name is unique per process and per write so concurrent writers never share it
    const fs::path staging = final_path.string() + ".tmp." + std::to_string(::getpid()) + "." +
                             std::to_string(staging_counter_.fetch_add(1));
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (out) {
            out.write(reinterpret_cast<const char*>(bytes.data()),
                      static_cast<std::streamsize>(bytes.size()));
        }
        if (!out.good()) {
            spdlog::debug("[DiskThumbnailCache] Failed to stage {}", staging.string());
            out.close();
            fs::remove(staging, ec);
            return false;
        }
    }

    fs::rename(staging, final_path, ec);
    if (ec) {
        spdlog::warn("[DiskThumbnailCache] Failed to publish {}: {}", final_path.string(),
                     ec.message());
        std::error_code cleanup_ec;
        fs::remove(staging, cleanup_ec);
        return false;
    }

    spdlog::trace("[DiskThumbnailCache] Stored {} ({} bytes)", final_path.string(), bytes.size());
    return true;
}

size_t DiskThumbnailCache::clear() {
    if (!enabled_) {
        return 0;
    }

    size_t removed = 0;
    std::error_code ec;
    for (fs::directory_iterator shard(root_, ec), end; !ec && shard != end; shard.increment(ec)) {
        if (!shard->is_directory(ec)) {
            continue;
        }
        std::error_code inner_ec;
        for (fs::directory_iterator it(shard->path(), inner_ec), inner_end;
             !inner_ec && it != inner_end; it.increment(inner_ec)) {
            std::error_code rm_ec;
            if (it->is_regular_file(rm_ec) && fs::remove(it->path(), rm_ec)) {
                ++removed;
            }
        }
        fs::remove(shard->path(), inner_ec);
    }
    if (ec) {
        spdlog::warn("[DiskThumbnailCache] Clear stopped early: {}", ec.message());
    }

    spdlog::info("[DiskThumbnailCache] Cleared {} cached thumbnails", removed);
    return removed;
}

} // namespace thumbgrid
