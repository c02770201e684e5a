// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "field_colormap.h"

#include "moire_render.h"

#include <spdlog/spdlog.h>

#include <array>
#include <cmath>

namespace moire::rendering {

namespace {

// Evenly spaced Viridis stops
constexpr std::array<uint32_t, 10> VIRIDIS_STOPS = {0x440154, 0x482878, 0x3E4989, 0x31688E,
                                                    0x26828E, 0x1F9E89, 0x35B779, 0x6ECE58,
                                                    0xB5DE2B, 0xFDE725};

uint8_t lerp_channel(uint32_t a, uint32_t b, int shift, double f) {
    double ca = static_cast<double>((a >> shift) & 0xFF);
    double cb = static_cast<double>((b >> shift) & 0xFF);
    return static_cast<uint8_t>(std::lround(ca + (cb - ca) * f));
}

} // namespace

uint32_t viridis(double t) {
    if (!(t > 0.0)) {
        return VIRIDIS_STOPS.front();
    }
    if (t >= 1.0) {
        return VIRIDIS_STOPS.back();
    }

    double pos = t * static_cast<double>(VIRIDIS_STOPS.size() - 1);
    size_t idx = static_cast<size_t>(pos);
    double frac = pos - static_cast<double>(idx);
    uint32_t a = VIRIDIS_STOPS[idx];
    uint32_t b = VIRIDIS_STOPS[idx + 1];

    return (static_cast<uint32_t>(lerp_channel(a, b, 16, frac)) << 16) |
           (static_cast<uint32_t>(lerp_channel(a, b, 8, frac)) << 8) | lerp_channel(a, b, 0, frac);
}

RgbImage colorize(const Field& field, double min_value, double max_value) {
    RgbImage image;
    image.width = static_cast<int>(field.cols);
    image.height = static_cast<int>(field.rows);
    image.pixels.resize(field.size() * 3);

    const double span = max_value - min_value;
    for (size_t r = 0; r < field.rows; ++r) {
        // Field row 0 is the smallest Y; it goes to the bottom of the image
        size_t out_row = field.rows - 1 - r;
        for (size_t c = 0; c < field.cols; ++c) {
            double t = span > 0.0 ? (field.at(r, c) - min_value) / span : 0.0;
            uint32_t rgb = viridis(t);
            size_t i = (out_row * field.cols + c) * 3;
            image.pixels[i] = static_cast<uint8_t>((rgb >> 16) & 0xFF);
            image.pixels[i + 1] = static_cast<uint8_t>((rgb >> 8) & 0xFF);
            image.pixels[i + 2] = static_cast<uint8_t>(rgb & 0xFF);
        }
    }

    spdlog::debug("[Colormap] Colorized {}x{} field over [{:.3f}, {:.3f}]", image.width,
                  image.height, min_value, max_value);
    return image;
}

RgbImage colorize(const Field& field) {
    double lo = 0.0;
    double hi = 0.0;
    field_range(field, lo, hi);
    return colorize(field, lo, hi);
}

} // namespace moire::rendering
