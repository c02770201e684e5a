// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_lattice_field.cpp
 * @brief Unit tests for the hexagonal lattice intensity
 */

#include "grid_builder.h"
#include "lattice_field.h"
#include "lattice_math.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

using namespace moire;
using namespace moire::lattice;
using Catch::Approx;

TEST_CASE("Lattice: peak of 3 at the origin", "[lattice]") {
    for (double a : {0.5, 1.0, 2.46, 3.0, 10.0}) {
        REQUIRE(evaluate_point(0.0, 0.0, a) == Approx(3.0));
    }
}

TEST_CASE("Lattice: bounded to [-3, 3]", "[lattice]") {
    const double a = GRAPHENE_LATTICE_CONSTANT;

    SECTION("Dense grid near the origin") {
        Grid g = build_grid(10.0, 201);
        Field f = evaluate(g.X, g.Y, a);
        for (double v : f.values) {
            REQUIRE(v >= -3.0);
            REQUIRE(v <= 3.0);
        }
    }

    SECTION("Far-away coordinates") {
        for (double x : {-1e6, -12345.678, 987.654, 4.2e5}) {
            for (double y : {-7.5e5, -3.3, 0.0, 1e6}) {
                double v = evaluate_point(x, y, a);
                REQUIRE(v >= -3.0);
                REQUIRE(v <= 3.0);
            }
        }
    }
}

TEST_CASE("Lattice: translational periodicity", "[lattice][periodic]") {
    // Translations that shift every wave phase by a multiple of 2π
    for (double a : {1.0, 2.46, 4.0}) {
        for (double x : {-3.7, 0.0, 0.41, 5.9}) {
            for (double y : {-2.2, 0.0, 1.3}) {
                double base = evaluate_point(x, y, a);

                REQUIRE(evaluate_point(x + 2.0 * a, y, a) == Approx(base).margin(1e-9));
                REQUIRE(evaluate_point(x + a, y + std::sqrt(3.0) * a, a) ==
                        Approx(base).margin(1e-9));
                REQUIRE(evaluate_point(x, y + 2.0 * a / std::sqrt(3.0), a) ==
                        Approx(base).margin(1e-9));
            }
        }
    }
}

TEST_CASE("Lattice: the first wave alone has period a along x", "[lattice][periodic]") {
    // Along y = 0 the second and third waves pair into 2cos(πx/a); shifting x
    // by a flips their sign while the first wave repeats
    const double a = GRAPHENE_LATTICE_CONSTANT;
    for (double x : {0.0, 0.3, 1.7}) {
        double l0 = evaluate_point(x, 0.0, a);
        double l1 = evaluate_point(x + a, 0.0, a);
        double first = std::cos(TWO_PI * x / a);
        REQUIRE(l0 + l1 == Approx(2.0 * first).margin(1e-9));
    }
}

TEST_CASE("Lattice: symmetric under x -> -x", "[lattice]") {
    const double a = GRAPHENE_LATTICE_CONSTANT;
    for (double x : {0.2, 1.1, 7.3}) {
        for (double y : {-0.9, 0.0, 2.5}) {
            REQUIRE(evaluate_point(-x, y, a) == Approx(evaluate_point(x, y, a)));
        }
    }
}

TEST_CASE("Lattice: array evaluation matches point evaluation", "[lattice]") {
    Grid g = build_grid(6.0, 25);
    Field f = evaluate(g.X, g.Y, 2.46);

    REQUIRE(f.same_shape(g.X));
    for (size_t r = 0; r < g.rows(); ++r) {
        for (size_t c = 0; c < g.cols(); ++c) {
            REQUIRE(f.at(r, c) == evaluate_point(g.X.at(r, c), g.Y.at(r, c), 2.46));
        }
    }
}

TEST_CASE("Lattice: known value on the x axis", "[lattice]") {
    // At (a/2, 0): cos(π) + 2·cos(π/2) = -1
    const double a = 2.46;
    REQUIRE(evaluate_point(a / 2.0, 0.0, a) == Approx(-1.0).margin(1e-12));
}
