// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "format_utils.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace moire::format {

// =============================================================================
// Real Numbers
// =============================================================================

std::string format_real(double value) {
    char buf[64];

    if (!std::isfinite(value)) {
        std::snprintf(buf, sizeof(buf), "%g", value);
        return buf;
    }

    // Fixed notation for ordinary magnitudes, fewest decimals that read back
    double magnitude = std::fabs(value);
    if (value == 0.0 || (magnitude >= 1e-4 && magnitude < 1e16)) {
        for (int decimals = 0; decimals <= 24; ++decimals) {
            std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
            if (std::strtod(buf, nullptr) == value) {
                break;
            }
        }
        std::string out(buf);
        if (out.find('.') == std::string::npos) {
            out += ".0";
        }
        return out;
    }

    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (std::strtod(buf, nullptr) == value) {
            break;
        }
    }
    return buf;
}

// =============================================================================
// Unit Formatting
// =============================================================================

char* format_percent_float(double percent, int decimals, char* buf, size_t size) {
    std::snprintf(buf, size, "%.*f%%", decimals, percent);
    return buf;
}

char* format_degrees(double degrees, char* buf, size_t size) {
    std::snprintf(buf, size, "%.1f°", degrees);
    return buf;
}

char* format_angstrom(double angstrom, int precision, char* buf, size_t size) {
    std::snprintf(buf, size, "%.*f Å", precision, angstrom);
    return buf;
}

char* format_resolution(size_t grid_size, char* buf, size_t size) {
    std::snprintf(buf, size, "%zux%zu", grid_size, grid_size);
    return buf;
}

} // namespace moire::format
