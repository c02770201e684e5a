// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "strain_transform.h"

#include "lattice_math.h"

#include <spdlog/spdlog.h>

namespace moire::lattice {

StrainMatrix strain_matrix(double percent, double angle_degrees) {
    const double theta = deg_to_rad(angle_degrees);
    const double fraction = percent / 100.0;
    const double c = std::cos(theta);
    const double s = std::sin(theta);

    StrainMatrix m;
    m.xx = 1.0 + fraction * c * c;
    m.yy = 1.0 + fraction * s * s;
    m.xy = fraction * s * c;
    return m;
}

Coordinates apply_strain(const Field& x, const Field& y, double percent, double angle_degrees) {
    const StrainMatrix m = strain_matrix(percent, angle_degrees);

    spdlog::trace("[Strain] {:.2f}% @ {:.1f} deg -> M=[[{:.6f}, {:.6f}], [{:.6f}, {:.6f}]]",
                  percent, angle_degrees, m.xx, m.xy, m.xy, m.yy);

    Coordinates out{Field(x.rows, x.cols), Field(y.rows, y.cols)};
    const size_t n = x.size();
    const double* px = x.values.data();
    const double* py = y.values.data();
    double* ox = out.x.values.data();
    double* oy = out.y.values.data();

    for (size_t i = 0; i < n; ++i) {
        ox[i] = m.xx * px[i] + m.xy * py[i];
        oy[i] = m.xy * px[i] + m.yy * py[i];
    }
    return out;
}

} // namespace moire::lattice
