// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "moire_types.h"

#include <cstdint>
#include <vector>

/**
 * @file field_colormap.h
 * @brief False-color mapping of intensity fields
 *
 * Uses the ten-stop Viridis scale (dark purple → teal → yellow).
 * Images are laid out top row first with the field's largest Y at the
 * top, i.e. the field origin sits at the lower-left corner.
 */

namespace moire::rendering {

/**
 * @brief 8-bit RGB image, 3 bytes per pixel, rows top to bottom
 */
struct RgbImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    uint32_t pixel(int x, int y) const {
        size_t i = (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 3;
        return (static_cast<uint32_t>(pixels[i]) << 16) |
               (static_cast<uint32_t>(pixels[i + 1]) << 8) | pixels[i + 2];
    }
};

/**
 * @brief Viridis color at normalized position t
 *
 * @param t Position in [0, 1]; values outside are clamped, NaN maps to 0
 * @return Color as 0x00RRGGBB
 */
uint32_t viridis(double t);

/**
 * @brief Colorize a field over a fixed value range
 *
 * @param field Field to colorize
 * @param min_value Value mapped to the start of the scale
 * @param max_value Value mapped to the end of the scale
 */
RgbImage colorize(const Field& field, double min_value, double max_value);

/**
 * @brief Colorize a field over its own min/max
 */
RgbImage colorize(const Field& field);

} // namespace moire::rendering
