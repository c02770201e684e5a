// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "rotation_transform.h"

#include "lattice_math.h"

#include <spdlog/spdlog.h>

namespace moire::lattice {

Coordinates rotate(const Field& x, const Field& y, double angle_degrees) {
    // cos(0) is exactly 1 but sin(0)*y can still turn -0.0 into +0.0
    if (angle_degrees == 0.0) {
        return Coordinates{x, y};
    }

    const double theta = deg_to_rad(angle_degrees);
    const double c = std::cos(theta);
    const double s = std::sin(theta);

    spdlog::trace("[Rotation] {:.3f} deg (cos={:.9f}, sin={:.9f})", angle_degrees, c, s);

    Coordinates out{Field(x.rows, x.cols), Field(y.rows, y.cols)};
    const size_t n = x.size();
    const double* px = x.values.data();
    const double* py = y.values.data();
    double* ox = out.x.values.data();
    double* oy = out.y.values.data();

    for (size_t i = 0; i < n; ++i) {
        ox[i] = px[i] * c - py[i] * s;
        oy[i] = px[i] * s + py[i] * c;
    }
    return out;
}

} // namespace moire::lattice
