// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "grid_builder.h"

#include <spdlog/spdlog.h>

namespace moire::lattice {

std::vector<double> linspace(double start, double stop, size_t count) {
    std::vector<double> samples(count);
    if (count == 0) {
        return samples;
    }
    if (count == 1) {
        samples[0] = start;
        return samples;
    }

    const double step = (stop - start) / static_cast<double>(count - 1);
    for (size_t i = 0; i < count; ++i) {
        samples[i] = start + step * static_cast<double>(i);
    }
    samples[count - 1] = stop;
    return samples;
}

Grid build_grid(double extent, size_t grid_size) {
    Grid grid;
    grid.extent = extent;
    grid.x_axis = linspace(-extent, extent, grid_size);
    grid.y_axis = linspace(-extent, extent, grid_size);

    const size_t rows = grid.y_axis.size();
    const size_t cols = grid.x_axis.size();
    grid.X = Field(rows, cols);
    grid.Y = Field(rows, cols);

    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            grid.X.at(r, c) = grid.x_axis[c];
            grid.Y.at(r, c) = grid.y_axis[r];
        }
    }

    spdlog::debug("[GridBuilder] Built {}x{} grid over [-{}, {}] A", rows, cols, extent, extent);
    return grid;
}

} // namespace moire::lattice
