// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lattice_field.h"

#include "lattice_math.h"

namespace moire::lattice {

double evaluate_point(double x, double y, double a) {
    const double k = TWO_PI / a;
    const double ys = SQRT3_OVER_2 * y;
    return std::cos(k * x) + std::cos(k * (0.5 * x + ys)) + std::cos(k * (-0.5 * x + ys));
}

Field evaluate(const Field& x, const Field& y, double a) {
    Field out(x.rows, x.cols);
    const size_t n = x.size();
    const double* px = x.values.data();
    const double* py = y.values.data();
    double* o = out.values.data();

    for (size_t i = 0; i < n; ++i) {
        o[i] = evaluate_point(px[i], py[i], a);
    }
    return out;
}

} // namespace moire::lattice
