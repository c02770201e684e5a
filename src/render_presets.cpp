// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "render_presets.h"

#include <spdlog/spdlog.h>

#include <cmath>

namespace moire {

namespace {

double clamp_logged(const ParamRange& range, double value, const char* what) {
    double clamped = range.clamp(value);
    if (clamped != value) {
        spdlog::warn("[Presets] {} {} out of range [{}, {}], clamped to {}", what, value,
                     range.min, range.max, clamped);
    }
    return clamped;
}

} // namespace

QualityPreset quality_preset(RenderQuality quality) {
    switch (quality) {
    case RenderQuality::HighRes:
        return {RenderQuality::HighRes, {50.0, 500.0, 200.0, 50.0}, {800.0, 3000.0, 1500.0, 100.0}};
    case RenderQuality::Quick:
        break;
    }
    return {RenderQuality::Quick, {10.0, 100.0, 50.0, 10.0}, {200.0, 800.0, 400.0, 100.0}};
}

ParamRange twist_range(size_t layer_index) {
    if (layer_index == 0) {
        return {0.0, 0.0, 0.0, 0.0};
    }
    if (layer_index == 1) {
        return presets::TWIST_LAYER2;
    }
    return presets::TWIST_LAYER3;
}

LayerStack default_layer_stack(SystemMode mode) {
    LayerStack stack;
    stack.mode = mode;
    for (size_t i = 0; i < MAX_LAYERS; ++i) {
        stack[i].strain = presets::DEFAULT_STRAIN[i];
        stack[i].twist_degrees = twist_range(i).default_value;
    }
    return stack;
}

RenderRequest default_request(SystemMode mode, RenderQuality quality) {
    QualityPreset preset = quality_preset(quality);

    RenderRequest request;
    request.quality = quality;
    request.extent = preset.extent.default_value;
    request.grid_size = static_cast<size_t>(preset.grid_size.default_value);
    request.stack = default_layer_stack(mode);
    return request;
}

RenderRequest clamp_request(const RenderRequest& request) {
    QualityPreset preset = quality_preset(request.quality);
    RenderRequest out = request;

    out.extent = clamp_logged(preset.extent, request.extent, "Extent");
    out.grid_size = static_cast<size_t>(std::lround(
        clamp_logged(preset.grid_size, static_cast<double>(request.grid_size), "Grid size")));

    for (size_t i = 0; i < out.stack.size(); ++i) {
        LayerSpec& layer = out.stack[i];
        layer.strain.percent =
            clamp_logged(presets::STRAIN_PERCENT, layer.strain.percent, "Strain percent");
        layer.strain.angle_degrees =
            clamp_logged(presets::STRAIN_ANGLE, layer.strain.angle_degrees, "Strain angle");
        layer.twist_degrees = clamp_logged(twist_range(i), layer.twist_degrees, "Twist");
    }
    return out;
}

// =============================================================================
// String conversions
// =============================================================================

std::optional<SystemMode> parse_system_mode(const std::string& str) {
    if (str == "bilayer" || str == "Bilayer")
        return SystemMode::Bilayer;
    if (str == "trilayer" || str == "Trilayer")
        return SystemMode::Trilayer;
    return std::nullopt;
}

const char* system_mode_name(SystemMode mode) {
    switch (mode) {
    case SystemMode::Bilayer:
        return "bilayer";
    case SystemMode::Trilayer:
        return "trilayer";
    }
    return "unknown";
}

std::optional<RenderQuality> parse_render_quality(const std::string& str) {
    if (str == "quick")
        return RenderQuality::Quick;
    if (str == "high-res" || str == "highres" || str == "high_res")
        return RenderQuality::HighRes;
    return std::nullopt;
}

const char* render_quality_name(RenderQuality quality) {
    switch (quality) {
    case RenderQuality::Quick:
        return "quick";
    case RenderQuality::HighRes:
        return "high-res";
    }
    return "unknown";
}

} // namespace moire
