// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cmath>

namespace moire::lattice {

inline constexpr double PI = 3.14159265358979323846;
inline constexpr double TWO_PI = 2.0 * PI;
inline constexpr double SQRT3_OVER_2 = 0.86602540378443864676;

inline double deg_to_rad(double degrees) {
    return degrees * PI / 180.0;
}

} // namespace moire::lattice
