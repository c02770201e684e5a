// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace fs = std::filesystem;

namespace moire {

Config* Config::instance{nullptr};

Config::Config() {
    data = default_config();
}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

json Config::default_config() {
    LayerStack stack = default_layer_stack(SystemMode::Trilayer);

    json layers = json::array();
    for (size_t i = 0; i < MAX_LAYERS; ++i) {
        layers.push_back({{"strain_percent", stack[i].strain.percent},
                          {"strain_angle", stack[i].strain.angle_degrees},
                          {"twist", stack[i].twist_degrees}});
    }

    return {{"system_mode", "bilayer"},
            {"render_quality", "quick"},
            {"log_level", "warn"},
            {"log_dest", "auto"},
            {"log_path", ""},
            {"layers", layers}};
}

void Config::apply_defaults() {
    json defaults = default_config();

    for (const char* key : {"system_mode", "render_quality", "log_level", "log_dest", "log_path"}) {
        if (!data.contains(key) || data[key].is_null()) {
            data[key] = defaults[key];
        }
    }

    // Layers: keep user entries, fill missing ones and missing fields
    if (!data.contains("layers") || !data["layers"].is_array()) {
        data["layers"] = defaults["layers"];
    }
    json& layers = data["layers"];
    for (size_t i = 0; i < MAX_LAYERS; ++i) {
        if (i >= layers.size()) {
            layers.push_back(defaults["layers"][i]);
            continue;
        }
        if (!layers[i].is_object()) {
            layers[i] = defaults["layers"][i];
            continue;
        }
        for (auto& [field, value] : defaults["layers"][i].items()) {
            if (!layers[i].contains(field)) {
                layers[i][field] = value;
            }
        }
    }
}

void Config::init(const std::string& config_path) {
    path = config_path;

    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
        } catch (const json::parse_error& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Using built-in defaults");
            data = default_config();
            return;
        }
        if (!data.is_object()) {
            spdlog::error("[Config] {} is not a JSON object, using built-in defaults",
                          config_path);
            data = default_config();
            return;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = default_config();
    }

    apply_defaults();

    // Save updated config with any new defaults
    save();

    spdlog::debug("[Config] Initialized: mode={}, quality={}",
                  get<std::string>("/system_mode", "bilayer"),
                  get<std::string>("/render_quality", "quick"));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    if (path.empty()) {
        spdlog::debug("[Config] No config path set, not saving");
        return false;
    }

    spdlog::debug("[Config] Saving config to {}", path);

    try {
        std::ofstream o(path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", path);
            return false;
        }

        o.close();
        spdlog::debug("[Config] Config saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

RenderRequest Config::to_render_request() {
    std::string mode_str = get<std::string>("/system_mode", "bilayer");
    auto mode = parse_system_mode(mode_str);
    if (!mode) {
        spdlog::warn("[Config] Unknown system_mode '{}', using bilayer", mode_str);
    }

    std::string quality_str = get<std::string>("/render_quality", "quick");
    auto quality = parse_render_quality(quality_str);
    if (!quality) {
        spdlog::warn("[Config] Unknown render_quality '{}', using quick", quality_str);
    }

    RenderRequest request = default_request(mode.value_or(SystemMode::Bilayer),
                                            quality.value_or(RenderQuality::Quick));
    request.extent = get<double>("/extent", request.extent);

    // Read as double so negative or fractional values clamp from below
    ParamRange grid_range = quality_preset(request.quality).grid_size;
    double grid_size = get<double>("/grid_size", static_cast<double>(request.grid_size));
    double clamped = grid_range.clamp(grid_size);
    if (clamped != grid_size) {
        spdlog::warn("[Config] grid_size {} out of range [{}, {}], using {}", grid_size,
                     grid_range.min, grid_range.max, clamped);
    }
    request.grid_size = static_cast<size_t>(std::lround(clamped));

    for (size_t i = 0; i < MAX_LAYERS; ++i) {
        std::string prefix = "/layers/" + std::to_string(i) + "/";
        LayerSpec& layer = request.stack[i];
        layer.strain.percent = get<double>(prefix + "strain_percent", layer.strain.percent);
        layer.strain.angle_degrees = get<double>(prefix + "strain_angle", layer.strain.angle_degrees);
        layer.twist_degrees = get<double>(prefix + "twist", layer.twist_degrees);
    }
    return request;
}

logging::LogConfig Config::to_log_config() {
    logging::LogConfig log_config;
    std::string level_str = get<std::string>("/log_level", "warn");
    log_config.level = spdlog::level::from_str(level_str);
    if (log_config.level == spdlog::level::off && level_str != "off") {
        spdlog::warn("[Config] Unknown log_level '{}', using warn", level_str);
        log_config.level = spdlog::level::warn;
    }
    log_config.target = logging::parse_log_target(get<std::string>("/log_dest", "auto"));
    log_config.file_path = get<std::string>("/log_path", "");
    return log_config;
}

} // namespace moire
