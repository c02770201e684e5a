// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "moire_types.h"

#include <vector>

namespace moire::lattice {

/**
 * @brief Evenly spaced samples over [start, stop], both endpoints included
 *
 * The last sample is set to @p stop exactly so the span is not shortened
 * by accumulated rounding.
 */
std::vector<double> linspace(double start, double stop, size_t count);

/**
 * @brief Build the coordinate sampling grid
 *
 * Produces grid_size samples over [-extent, extent] on each axis and the
 * full Cartesian meshgrid. Row index corresponds to Y, column index to X.
 *
 * @param extent Half-width of the scan area in angstroms (> 0)
 * @param grid_size Samples per axis (>= 2)
 */
Grid build_grid(double extent, size_t grid_size);

} // namespace moire::lattice
