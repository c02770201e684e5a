// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "moire_types.h"

#include <cmath>
#include <optional>
#include <string>

/**
 * @file render_presets.h
 * @brief Parameter ranges and defaults for the control surface
 *
 * The lattice pipeline itself does not validate its inputs. Anything that
 * feeds it user-supplied values (CLI, config file) goes through
 * clamp_request() first, which plays the role of bounded slider widgets.
 */

namespace moire {

enum class RenderQuality { Quick, HighRes };

/**
 * @brief Bounded numeric parameter (slider description)
 */
struct ParamRange {
    double min;
    double max;
    double default_value;
    double step;

    /// NaN maps to default_value
    double clamp(double value) const {
        if (std::isnan(value))
            return default_value;
        if (value < min)
            return min;
        if (value > max)
            return max;
        return value;
    }

    bool contains(double value) const {
        return value >= min && value <= max;
    }
};

/**
 * @brief Scan area and resolution bounds for one render quality
 */
struct QualityPreset {
    RenderQuality quality;
    ParamRange extent;    ///< Half-width of scan area (Å)
    ParamRange grid_size; ///< Samples per axis
};

namespace presets {

inline constexpr ParamRange STRAIN_PERCENT{0.0, 10.0, 0.0, 0.1};
inline constexpr ParamRange STRAIN_ANGLE{0.0, 180.0, 0.0, 1.0};
inline constexpr ParamRange TWIST_LAYER2{0.0, 10.0, 1.5, 0.1};
inline constexpr ParamRange TWIST_LAYER3{-10.0, 10.0, -1.5, 0.1};

/// Default strain per layer (index 0 = reference layer)
inline constexpr StrainSpec DEFAULT_STRAIN[MAX_LAYERS] = {{2.0, 0.0}, {3.0, 30.0}, {4.0, 60.0}};

} // namespace presets

/**
 * @brief Scan area / resolution bounds for a render quality
 *
 * Quick:   extent 10-100 Å (default 50),  grid 200-800 (default 400)
 * HighRes: extent 50-500 Å (default 200), grid 800-3000 (default 1500)
 */
QualityPreset quality_preset(RenderQuality quality);

/**
 * @brief Twist range for a layer index (0-based)
 *
 * Layer 0 is the reference and only admits 0.
 */
ParamRange twist_range(size_t layer_index);

/**
 * @brief Default layer stack for a system mode
 */
LayerStack default_layer_stack(SystemMode mode);

/**
 * @brief Everything needed for one render
 */
struct RenderRequest {
    RenderQuality quality = RenderQuality::Quick;
    double extent = 50.0;
    size_t grid_size = 400;
    LayerStack stack;
};

/**
 * @brief Default request for a system mode and render quality
 */
RenderRequest default_request(SystemMode mode, RenderQuality quality);

/**
 * @brief Clamp every parameter of a request into its allowed range
 *
 * Out-of-range values are pulled to the nearest bound and logged at warn
 * level. The reference layer twist is forced to 0.
 */
RenderRequest clamp_request(const RenderRequest& request);

// =============================================================================
// String conversions
// =============================================================================

std::optional<SystemMode> parse_system_mode(const std::string& str);
const char* system_mode_name(SystemMode mode);

std::optional<RenderQuality> parse_render_quality(const std::string& str);
const char* render_quality_name(RenderQuality quality);

} // namespace moire
