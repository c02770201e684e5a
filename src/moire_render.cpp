// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "moire_render.h"

#include "grid_builder.h"
#include "layer_compositor.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace moire {

void field_range(const Field& field, double& min_value, double& max_value) {
    if (field.values.empty()) {
        min_value = 0.0;
        max_value = 0.0;
        return;
    }
    auto [lo, hi] = std::minmax_element(field.values.begin(), field.values.end());
    min_value = *lo;
    max_value = *hi;
}

RenderResult render(const RenderRequest& request, double a) {
    auto start = std::chrono::steady_clock::now();

    Grid grid = lattice::build_grid(request.extent, request.grid_size);

    RenderResult result;
    result.combined = lattice::compose(grid, request.stack, a);
    result.title = lattice::compose_title(request.stack);
    field_range(result.combined, result.min_value, result.max_value);

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - start)
                          .count();
    spdlog::info("[Render] {} ({}x{}, {} quality) in {} ms, range [{:.3f}, {:.3f}]", result.title,
                 result.combined.rows, result.combined.cols, render_quality_name(request.quality),
                 elapsed_ms, result.min_value, result.max_value);
    return result;
}

} // namespace moire
