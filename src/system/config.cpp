// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>

#include <sys/stat.h>

namespace fs = std::filesystem;

namespace thumbgrid {

Config* Config::instance{NULL};

namespace {

// Copy keys present in defaults but absent from target. Existing values are never replaced.
bool fill_missing_keys(json& target, const json& defaults) {
    bool modified = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!target.contains(it.key())) {
            target[it.key()] = it.value();
            modified = true;
        } else if (it.value().is_object() && target[it.key()].is_object()) {
            modified |= fill_missing_keys(target[it.key()], it.value());
        }
    }
    return modified;
}

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return (value && value[0] != '\0') ? std::string(value) : std::string();
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == NULL) {
        instance = new Config();
    }
    return instance;
}

json Config::get_default_config() {
    return {{"log_level", "info"},
            {"log_target", "console"},
            {"cache", {{"memory_capacity", 350}, {"directory", ""}, {"disk_enabled", true}}},
            {"thumbnails",
             {{"target_size", 200},
              {"aspect_width", 16},
              {"aspect_height", 9},
              {"worker_threads", 1},
              {"request_queue_limit", 0}}},
            {"grid",
             {{"card_width", 230},
              {"card_padding", 8},
              {"overscan_rows", 1},
              {"prefetch_rows", 3},
              {"prefetch_budget", 80},
              {"render_min_interval_ms", 33},
              {"render_max_deferral_ms", 250},
              {"resize_delay_ms", 60},
              {"scroll_idle_ms", 540},
              {"poll_interval_ms", 30},
              {"poll_batch", 40},
              {"label_cache_capacity", 4000}}}};
}

std::string Config::default_path() {
    std::string xdg = env_or_empty("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        return xdg + "/thumbgrid/thumbgrid.json";
    }
    std::string home = env_or_empty("HOME");
    if (!home.empty()) {
        return home + "/.config/thumbgrid/thumbgrid.json";
    }
    return "thumbgrid.json";
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        std::string parse_error;
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
            if (!data.is_object()) {
                parse_error = "root is not an object";
            }
        } catch (const json::exception& e) {
            parse_error = e.what();
        }

        if (!parse_error.empty()) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, parse_error);
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = get_default_config();
            config_modified = true;
        }

        if (fill_missing_keys(data, get_default_config())) {
            spdlog::debug("[Config] Added missing default keys");
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;
    }

    if (config_modified && !save()) {
        spdlog::warn("[Config] Running with in-memory config only");
    }

    spdlog::debug("[Config] initialized: cache capacity={}, target size={}",
                  get<int>("/cache/memory_capacity", 350), get<int>("/thumbnails/target_size", 200));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    if (path.empty()) {
        return false;
    }
    spdlog::trace("[Config] Saving config to {}", path);

    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            spdlog::error("[Config] Cannot create config directory {}: {}", parent.string(),
                          ec.message());
            return false;
        }
    }

    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream o(tmp_path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", tmp_path);
            return false;
        }
        o << std::setw(2) << data << std::endl;
        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", tmp_path);
            o.close();
            fs::remove(tmp_path, ec);
            return false;
        }
    }

    fs::rename(tmp_path, path, ec);
    if (ec) {
        spdlog::error("[Config] Failed to replace {}: {}", path, ec.message());
        std::error_code cleanup_ec;
        fs::remove(tmp_path, cleanup_ec);
        return false;
    }

    spdlog::trace("[Config] saved successfully to {}", path);
    return true;
}

} // namespace thumbgrid
