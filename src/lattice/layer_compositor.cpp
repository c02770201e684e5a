// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layer_compositor.h"

#include "format_utils.h"
#include "lattice_field.h"
#include "rotation_transform.h"
#include "strain_transform.h"

#include <spdlog/spdlog.h>

namespace moire::lattice {

namespace {

const char* mode_label(SystemMode mode) {
    return mode == SystemMode::Trilayer ? "Trilayer" : "Bilayer";
}

} // namespace

Field layer_field(const Grid& grid, const LayerSpec& layer, double a) {
    Coordinates xy = apply_strain(grid.X, grid.Y, layer.strain);
    if (layer.twist_degrees != 0.0) {
        xy = rotate(xy, layer.twist_degrees);
    }
    return evaluate(xy, a);
}

Field compose(const Grid& grid, const LayerStack& stack, double a) {
    spdlog::debug("[Compositor] Composing {} ({} layers) on {}x{} grid, a={}",
                  mode_label(stack.mode), stack.size(), grid.rows(), grid.cols(), a);

    Field combined(grid.rows(), grid.cols());
    size_t index = 0;
    for (const LayerSpec& layer : stack) {
        ++index;
        spdlog::trace("[Compositor] Layer {}: strain {}% @ {} deg, twist {} deg", index,
                      layer.strain.percent, layer.strain.angle_degrees, layer.twist_degrees);

        const Field field = layer_field(grid, layer, a);
        double* sum = combined.values.data();
        const double* add = field.values.data();
        for (size_t i = 0, n = combined.size(); i < n; ++i) {
            sum[i] += add[i];
        }
    }
    return combined;
}

std::string compose_title(const LayerStack& stack) {
    using format::format_real;

    std::string title = std::string(mode_label(stack.mode)) + " Graphene: ";
    if (stack.mode == SystemMode::Trilayer) {
        title += "Twists " + format_real(stack[1].twist_degrees) + "° / " +
                 format_real(stack[2].twist_degrees) + "°, Strains " +
                 format_real(stack[0].strain.percent) + "% / " +
                 format_real(stack[1].strain.percent) + "% / " +
                 format_real(stack[2].strain.percent) + "%";
    } else {
        title += "Twist " + format_real(stack[1].twist_degrees) + "°, Strains " +
                 format_real(stack[0].strain.percent) + "% / " +
                 format_real(stack[1].strain.percent) + "%";
    }
    return title;
}

} // namespace moire::lattice
