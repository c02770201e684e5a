// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "moire_types.h"

namespace moire::lattice {

/**
 * @brief Rotate coordinates counter-clockwise by a twist angle
 *
 *     x_rot = x·cosθ − y·sinθ
 *     y_rot = x·sinθ + y·cosθ
 *
 * A zero angle returns copies of the inputs unchanged.
 *
 * @param x X coordinates
 * @param y Y coordinates (same shape as x)
 * @param angle_degrees Rotation angle in degrees
 */
Coordinates rotate(const Field& x, const Field& y, double angle_degrees);

/// @overload
inline Coordinates rotate(const Coordinates& xy, double angle_degrees) {
    return rotate(xy.x, xy.y, angle_degrees);
}

} // namespace moire::lattice
