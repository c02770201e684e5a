// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "field_export.h"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <limits>
#include <memory>
#include <vector>

namespace moire::rendering {

bool write_bmp(const std::string& path, const RgbImage& image) {
    if (image.width <= 0 || image.height <= 0) {
        spdlog::error("[Export] Refusing to write empty image to {}", path);
        return false;
    }

    // RAII for file handle - automatically closes on all return paths
    std::unique_ptr<FILE, decltype(&fclose)> f(fopen(path.c_str(), "wb"), fclose);
    if (!f) {
        spdlog::error("[Export] Failed to open {} for writing", path);
        return false;
    }

    // Rows are padded to a multiple of 4 bytes
    uint32_t row_size = (static_cast<uint32_t>(image.width) * 3U + 3U) & ~3U;
    uint32_t image_size = row_size * static_cast<uint32_t>(image.height);
    uint32_t file_size = 54U + image_size;
    uint32_t pixel_offset = 54;
    uint32_t dib_size = 40;
    int32_t width = image.width;
    int32_t height = image.height;
    uint16_t planes = 1;
    uint16_t bpp = 24;
    uint32_t reserved = 0;
    uint32_t compression = 0;
    uint32_t ppm = 2835; // pixels per meter
    uint32_t colors = 0;

    // BMP file header (14 bytes)
    fputc('B', f.get());
    fputc('M', f.get());                  // Signature
    fwrite(&file_size, 4, 1, f.get());    // File size
    fwrite(&reserved, 4, 1, f.get());     // Reserved
    fwrite(&pixel_offset, 4, 1, f.get()); // Pixel data offset

    // DIB header (40 bytes)
    fwrite(&dib_size, 4, 1, f.get());    // DIB header size
    fwrite(&width, 4, 1, f.get());       // Width
    fwrite(&height, 4, 1, f.get());      // Height
    fwrite(&planes, 2, 1, f.get());      // Planes
    fwrite(&bpp, 2, 1, f.get());         // Bits per pixel
    fwrite(&compression, 4, 1, f.get()); // Compression (none)
    fwrite(&image_size, 4, 1, f.get());  // Image size
    fwrite(&ppm, 4, 1, f.get());         // X pixels per meter
    fwrite(&ppm, 4, 1, f.get());         // Y pixels per meter
    fwrite(&colors, 4, 1, f.get());      // Colors in palette
    fwrite(&colors, 4, 1, f.get());      // Important colors

    // BMP is bottom-up and BGR
    std::vector<uint8_t> row(row_size, 0);
    for (int y = image.height - 1; y >= 0; y--) {
        for (int x = 0; x < image.width; x++) {
            size_t src = (static_cast<size_t>(y) * static_cast<size_t>(image.width) +
                          static_cast<size_t>(x)) *
                         3;
            size_t dst = static_cast<size_t>(x) * 3;
            row[dst] = image.pixels[src + 2];
            row[dst + 1] = image.pixels[src + 1];
            row[dst + 2] = image.pixels[src];
        }
        if (fwrite(row.data(), 1, row_size, f.get()) != row_size) {
            spdlog::error("[Export] Short write to {}", path);
            return false;
        }
    }

    spdlog::info("[Export] Wrote {}x{} image to {}", image.width, image.height, path);
    return true;
}

bool write_field_csv(const std::string& path, const Field& field) {
    try {
        std::ofstream out(path);
        if (!out.is_open()) {
            spdlog::error("[Export] Failed to open {} for writing", path);
            return false;
        }

        out << std::setprecision(std::numeric_limits<double>::max_digits10);
        for (size_t r = 0; r < field.rows; ++r) {
            for (size_t c = 0; c < field.cols; ++c) {
                if (c > 0) {
                    out << ',';
                }
                out << field.at(r, c);
            }
            out << '\n';
        }

        if (!out.good()) {
            spdlog::error("[Export] Error writing field to {}", path);
            return false;
        }

        spdlog::info("[Export] Wrote {}x{} field to {}", field.rows, field.cols, path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Export] Exception while writing {}: {}", path, e.what());
        return false;
    }
}

} // namespace moire::rendering
