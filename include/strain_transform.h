// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "moire_types.h"

/**
 * @file strain_transform.h
 * @brief Anisotropic linear strain applied to grid coordinates
 *
 * The strain is parameterized by a magnitude f = percent / 100 and a
 * principal direction θ. The symmetric strain tensor is
 *
 *     ε_xx = f·cos²θ    ε_yy = f·sin²θ    ε_xy = f·sinθ·cosθ
 *
 * and coordinates are mapped by the deformation matrix
 *
 *     M = | 1+ε_xx   ε_xy  |
 *         |  ε_xy   1+ε_yy |
 *
 * so (x', y') = M·(x, y) at every grid point. At zero strain M is the
 * identity and coordinates pass through bit-for-bit. Degenerate matrices
 * (det M = 0) and NaN/Inf inputs are not special-cased.
 */

namespace moire::lattice {

/**
 * @brief 2x2 symmetric deformation matrix
 */
struct StrainMatrix {
    double xx = 1.0; ///< 1 + ε_xx
    double xy = 0.0; ///< ε_xy (equal to ε_yx)
    double yy = 1.0; ///< 1 + ε_yy

    double determinant() const {
        return xx * yy - xy * xy;
    }
};

/**
 * @brief Build the deformation matrix for a strain
 *
 * @param percent Strain magnitude in percent
 * @param angle_degrees Principal strain direction in degrees
 */
StrainMatrix strain_matrix(double percent, double angle_degrees);

/**
 * @brief Apply strain to every point of a coordinate pair
 *
 * @param x X coordinates
 * @param y Y coordinates (same shape as x)
 * @param percent Strain magnitude in percent
 * @param angle_degrees Principal strain direction in degrees
 * @return Strained coordinates, same shape as the inputs
 */
Coordinates apply_strain(const Field& x, const Field& y, double percent, double angle_degrees);

/// @overload
inline Coordinates apply_strain(const Field& x, const Field& y, const StrainSpec& strain) {
    return apply_strain(x, y, strain.percent, strain.angle_degrees);
}

} // namespace moire::lattice
