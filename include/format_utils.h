// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <string>

namespace moire::format {

// =============================================================================
// Real Numbers
// =============================================================================

/**
 * @brief Format a real in shortest round-trip form, always with a decimal point
 *
 * 2.0 → "2.0", 1.5 → "1.5", -1.5 → "-1.5", 0.1 → "0.1".
 * Magnitudes below 1e-4 or from 1e16 up use exponent form ("1e-07");
 * non-finite values print as "inf" / "nan".
 *
 * @param value Value to format
 * @return Formatted string
 */
std::string format_real(double value);

// =============================================================================
// Unit Formatting
// =============================================================================

/**
 * @brief Format percentage with configurable decimal places
 *
 * @param percent Percentage value
 * @param decimals Decimal places (0-2)
 * @param buf Output buffer
 * @param size Buffer size (recommended: 12)
 * @return Pointer to buffer for chaining
 */
char* format_percent_float(double percent, int decimals, char* buf, size_t size);

/**
 * @brief Format an angle in degrees with one decimal (e.g. "30.0°")
 *
 * @param degrees Angle in degrees
 * @param buf Output buffer
 * @param size Buffer size (recommended: 16)
 * @return Pointer to buffer for chaining
 */
char* format_degrees(double degrees, char* buf, size_t size);

/**
 * @brief Format a length in angstroms (e.g. "50 Å")
 *
 * @param angstrom Length in angstroms
 * @param precision Decimal places (0-3)
 * @param buf Output buffer
 * @param size Buffer size (recommended: 16)
 * @return Pointer to buffer for chaining
 */
char* format_angstrom(double angstrom, int precision, char* buf, size_t size);

/**
 * @brief Format a square resolution (e.g. "400x400")
 *
 * @param grid_size Samples per axis
 * @param buf Output buffer
 * @param size Buffer size (recommended: 24)
 * @return Pointer to buffer for chaining
 */
char* format_resolution(size_t grid_size, char* buf, size_t size);

} // namespace moire::format
