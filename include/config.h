// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __MOIRE_CONFIG_H__
#define __MOIRE_CONFIG_H__

#include "logging_init.h"
#include "render_presets.h"

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;

namespace moire {

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads default render parameters from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Should be initialized once at startup
 * and accessed from main thread only.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/path/to/moire.json");
 *
 * // Get with default fallback
 * double strain = cfg->get<double>("/layers/1/strain_percent", 3.0);
 *
 * // Set and save
 * cfg->set<std::string>("/system_mode", "trilayer");
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

    /// Fill in any missing keys with defaults
    void apply_defaults();

  public:
    /**
     * @brief Construct configuration manager
     *
     * Use get_instance() to obtain singleton instance.
     */
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Default configuration document
     */
    static json default_config();

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON file, or creates it with defaults if it doesn't
     * exist. Missing keys are back-filled and the file is written back.
     * A file that fails to parse is logged and replaced by defaults in
     * memory (the broken file is left untouched).
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds a value of
     * the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            try {
                return data[ptr].template get<T>();
            } catch (const json::exception& e) {
                spdlog::warn("[Config] {} has wrong type ({}), using default", json_ptr, e.what());
            }
        }
        return default_value;
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist.
     * Changes are in-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /**
     * @brief Get JSON sub-object at path
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * @return true on success, false on I/O error
     */
    bool save();

    /**
     * @brief Get configuration file path
     */
    std::string get_path();

    /**
     * @brief Build a render request from the stored parameters
     *
     * Unknown system_mode / render_quality strings fall back to
     * bilayer / quick. grid_size is read as a real and kept within the
     * quality's range; everything else is left for clamp_request().
     */
    RenderRequest to_render_request();

    /**
     * @brief Build logging setup from log_level / log_dest / log_path
     */
    logging::LogConfig to_log_config();

    /**
     * @brief Get singleton instance
     */
    static Config* get_instance();
};

} // namespace moire

#endif // __MOIRE_CONFIG_H__
