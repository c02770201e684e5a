// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "field_colormap.h"
#include "moire_types.h"

#include <string>

namespace moire::rendering {

/**
 * @brief Write an RGB image as an uncompressed 24-bit BMP
 *
 * @param path Output file path
 * @param image Image to write (top row first)
 * @return true on success, false if the file could not be written
 */
bool write_bmp(const std::string& path, const RgbImage& image);

/**
 * @brief Write raw field values as CSV, one field row per line
 *
 * @param path Output file path
 * @param field Field to write
 * @return true on success, false if the file could not be written
 */
bool write_field_csv(const std::string& path, const Field& field);

} // namespace moire::rendering
