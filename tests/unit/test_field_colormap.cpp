// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_field_colormap.cpp
 * @brief Unit tests for the Viridis scale and field colorization
 */

#include "field_colormap.h"

#include <catch2/catch_test_macros.hpp>

#include <cmath>

using namespace moire;
using namespace moire::rendering;

// ============================================================================
// viridis() Tests
// ============================================================================

TEST_CASE("Colormap: viridis endpoints", "[colormap]") {
    REQUIRE(viridis(0.0) == 0x440154);
    REQUIRE(viridis(1.0) == 0xFDE725);
}

TEST_CASE("Colormap: viridis clamps out-of-range input", "[colormap][edge]") {
    REQUIRE(viridis(-0.5) == 0x440154);
    REQUIRE(viridis(2.0) == 0xFDE725);
    REQUIRE(viridis(std::nan("")) == 0x440154);
}

TEST_CASE("Colormap: viridis interpolates between stops", "[colormap]") {
    // t = 0.5 sits halfway between 0x26828E and 0x1F9E89
    REQUIRE(viridis(0.5) == 0x23908C);
}

TEST_CASE("Colormap: viridis brightens towards the top", "[colormap]") {
    auto green = [](uint32_t rgb) { return (rgb >> 8) & 0xFF; };
    uint32_t prev = green(viridis(0.0));
    for (int i = 1; i <= 20; ++i) {
        uint32_t g = green(viridis(i / 20.0));
        REQUIRE(g >= prev);
        prev = g;
    }
}

// ============================================================================
// colorize() Tests
// ============================================================================

TEST_CASE("Colormap: colorize keeps dimensions", "[colormap][colorize]") {
    Field f(3, 5, 1.0);
    RgbImage img = colorize(f, 0.0, 2.0);

    REQUIRE(img.width == 5);
    REQUIRE(img.height == 3);
    REQUIRE(img.pixels.size() == 3u * 5u * 3u);
}

TEST_CASE("Colormap: origin is at the lower-left", "[colormap][colorize]") {
    // Row 0 is the smallest Y and must end up at the bottom of the image
    Field f(2, 1);
    f.at(0, 0) = -3.0;
    f.at(1, 0) = 3.0;

    RgbImage img = colorize(f, -3.0, 3.0);
    REQUIRE(img.pixel(0, 0) == 0xFDE725);
    REQUIRE(img.pixel(0, 1) == 0x440154);
}

TEST_CASE("Colormap: columns keep their order", "[colormap][colorize]") {
    Field f(1, 2);
    f.at(0, 0) = 0.0;
    f.at(0, 1) = 1.0;

    RgbImage img = colorize(f);
    REQUIRE(img.pixel(0, 0) == 0x440154);
    REQUIRE(img.pixel(1, 0) == 0xFDE725);
}

TEST_CASE("Colormap: constant field maps to the start color", "[colormap][colorize][edge]") {
    Field f(4, 4, 6.0);
    RgbImage img = colorize(f);

    for (int y = 0; y < img.height; ++y) {
        for (int x = 0; x < img.width; ++x) {
            REQUIRE(img.pixel(x, y) == 0x440154);
        }
    }
}
