// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __THUMBGRID_CONFIG_H__
#define __THUMBGRID_CONFIG_H__

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace thumbgrid {

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages application configuration from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Should be initialized once at startup
 * and accessed from the main thread only.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init(Config::default_path());
 *
 * int capacity = cfg->get<int>("/cache/memory_capacity", 350);
 *
 * cfg->set<int>("/grid/card_width", 260);
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Built-in defaults for every key the application reads
     */
    static json get_default_config();

    /**
     * @brief Default location of the config file
     *
     * $XDG_CONFIG_HOME/thumbgrid/thumbgrid.json, then $HOME/.config/thumbgrid/thumbgrid.json,
     * then ./thumbgrid.json.
     */
    static std::string default_path();

    /**
     * @brief Initialize configuration from file
     *
     * Creates the file with defaults if it doesn't exist. A file that fails to parse is
     * moved aside to `<path>.corrupt` and replaced by defaults. Keys missing from an existing
     * file are filled in from the defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * Throws nlohmann::json::exception if path doesn't exist.
     * Use the overload with default_value for safer access.
     *
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data.at(json::json_pointer(json_ptr)).template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds an incompatible type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::type_error& e) {
            spdlog::warn("[Config] {} has the wrong type ({}), using default", json_ptr, e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist.
     * Changes are in-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        data[json::json_pointer(json_ptr)] = v;
        return v;
    };

    /**
     * @brief Get JSON sub-object at path
     *
     * Returns mutable reference to JSON object for complex operations.
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * Written to a temp file next to the target and renamed over it.
     *
     * @return true on success
     */
    bool save();

    std::string get_path();

    static Config* get_instance();
};

} // namespace thumbgrid

#endif // __THUMBGRID_CONFIG_H__
