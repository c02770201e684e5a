// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "moire_types.h"

/**
 * @file lattice_field.h
 * @brief Hexagonal lattice intensity from three plane waves
 *
 * Superposes three cosine waves whose wavevectors are 120° apart:
 *
 *     L(x,y) = cos(2πx/a)
 *            + cos(2π( 0.5x + (√3/2)y)/a)
 *            + cos(2π(-0.5x + (√3/2)y)/a)
 *
 * L is bounded to [-3, 3] and peaks at 3 on lattice sites (including the
 * origin). Its translations are (2a, 0), (a, √3a) and (0, 2a/√3); a shift
 * of a along x flips the sign of the last two waves.
 */

namespace moire::lattice {

/**
 * @brief Lattice intensity at a single point
 *
 * @param x X coordinate in angstroms
 * @param y Y coordinate in angstroms
 * @param a Lattice constant in angstroms (> 0)
 */
double evaluate_point(double x, double y, double a);

/**
 * @brief Lattice intensity over a coordinate array
 *
 * @param x X coordinates
 * @param y Y coordinates (same shape as x)
 * @param a Lattice constant in angstroms (> 0)
 * @return Intensity field, same shape as x
 */
Field evaluate(const Field& x, const Field& y, double a);

/// @overload
inline Field evaluate(const Coordinates& xy, double a) {
    return evaluate(xy.x, xy.y, a);
}

} // namespace moire::lattice
