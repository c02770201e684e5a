// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_grid_builder.cpp
 * @brief Unit tests for linspace() and build_grid()
 */

#include "grid_builder.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace moire;
using namespace moire::lattice;
using Catch::Approx;

// ============================================================================
// linspace() Tests
// ============================================================================

TEST_CASE("linspace: endpoints are exact", "[grid][linspace]") {
    SECTION("Two samples") {
        auto s = linspace(-10.0, 10.0, 2);
        REQUIRE(s.size() == 2);
        REQUIRE(s[0] == -10.0);
        REQUIRE(s[1] == 10.0);
    }

    SECTION("Awkward spacing") {
        auto s = linspace(-0.3, 0.7, 7);
        REQUIRE(s.size() == 7);
        REQUIRE(s.front() == -0.3);
        REQUIRE(s.back() == 0.7);
    }
}

TEST_CASE("linspace: uniform spacing", "[grid][linspace]") {
    auto s = linspace(-50.0, 50.0, 400);
    const double step = 100.0 / 399.0;

    for (size_t i = 1; i < s.size(); ++i) {
        REQUIRE(s[i] - s[i - 1] == Approx(step));
    }
}

TEST_CASE("linspace: degenerate counts", "[grid][linspace][edge]") {
    REQUIRE(linspace(0.0, 1.0, 0).empty());

    auto one = linspace(3.0, 7.0, 1);
    REQUIRE(one.size() == 1);
    REQUIRE(one[0] == 3.0);
}

TEST_CASE("linspace: odd count hits zero exactly", "[grid][linspace]") {
    auto s = linspace(-50.0, 50.0, 401);
    REQUIRE(s[200] == 0.0);
}

// ============================================================================
// build_grid() Tests
// ============================================================================

TEST_CASE("build_grid: minimal grid spans the full range", "[grid]") {
    Grid g = build_grid(10.0, 2);

    REQUIRE(g.x_axis == std::vector<double>{-10.0, 10.0});
    REQUIRE(g.y_axis == std::vector<double>{-10.0, 10.0});
    REQUIRE(g.rows() == 2);
    REQUIRE(g.cols() == 2);

    REQUIRE(g.X.at(0, 0) == -10.0);
    REQUIRE(g.X.at(0, 1) == 10.0);
    REQUIRE(g.Y.at(0, 0) == -10.0);
    REQUIRE(g.Y.at(1, 0) == 10.0);
}

TEST_CASE("build_grid: X and Y have identical shape", "[grid]") {
    Grid g = build_grid(50.0, 400);

    REQUIRE(g.X.rows == 400);
    REQUIRE(g.X.cols == 400);
    REQUIRE(g.X.same_shape(g.Y));
    REQUIRE(g.X.size() == 400u * 400u);
}

TEST_CASE("build_grid: X varies along columns, Y along rows", "[grid]") {
    Grid g = build_grid(5.0, 11);

    SECTION("X is constant down a column") {
        for (size_t c = 0; c < g.cols(); ++c) {
            for (size_t r = 1; r < g.rows(); ++r) {
                REQUIRE(g.X.at(r, c) == g.X.at(0, c));
            }
        }
    }

    SECTION("Y is constant along a row") {
        for (size_t r = 0; r < g.rows(); ++r) {
            for (size_t c = 1; c < g.cols(); ++c) {
                REQUIRE(g.Y.at(r, c) == g.Y.at(r, 0));
            }
        }
    }

    SECTION("Both increase with index") {
        REQUIRE(g.X.at(0, 10) > g.X.at(0, 0));
        REQUIRE(g.Y.at(10, 0) > g.Y.at(0, 0));
        REQUIRE(g.X.at(0, 5) == Approx(0.0).margin(1e-12));
        REQUIRE(g.Y.at(5, 0) == Approx(0.0).margin(1e-12));
    }
}

TEST_CASE("build_grid: deterministic", "[grid]") {
    Grid a = build_grid(25.0, 64);
    Grid b = build_grid(25.0, 64);

    REQUIRE(a.X.values == b.X.values);
    REQUIRE(a.Y.values == b.Y.values);
}
