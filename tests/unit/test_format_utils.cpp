// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "format_utils.h"

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <string>

using namespace moire::format;

// ============================================================================
// format_real
// ============================================================================

TEST_CASE("format_real: whole numbers get a decimal point", "[format][real]") {
    REQUIRE(format_real(2.0) == "2.0");
    REQUIRE(format_real(0.0) == "0.0");
    REQUIRE(format_real(-10.0) == "-10.0");
    REQUIRE(format_real(180.0) == "180.0");
}

TEST_CASE("format_real: shortest round-trip digits", "[format][real]") {
    REQUIRE(format_real(1.5) == "1.5");
    REQUIRE(format_real(-1.5) == "-1.5");
    REQUIRE(format_real(0.1) == "0.1");
    REQUIRE(format_real(4.8) == "4.8");
    REQUIRE(format_real(2.46) == "2.46");
}

TEST_CASE("format_real: values that don't round-trip short", "[format][real]") {
    // 0.1 * 3 is not exactly 0.3
    std::string s = format_real(0.1 * 3.0);
    REQUIRE(s == "0.30000000000000004");
}

TEST_CASE("format_real: special values", "[format][real][edge]") {
    REQUIRE(format_real(std::numeric_limits<double>::infinity()) == "inf");
    REQUIRE(format_real(-std::numeric_limits<double>::infinity()) == "-inf");
    REQUIRE(format_real(std::nan("")).find("nan") != std::string::npos);
    REQUIRE(format_real(1e-7) == "1e-07");
}

// ============================================================================
// Unit formatting
// ============================================================================

TEST_CASE("format_percent_float: decimals", "[format]") {
    char buf[16];
    REQUIRE(std::string(format_percent_float(3.0, 1, buf, sizeof(buf))) == "3.0%");
    REQUIRE(std::string(format_percent_float(2.345, 2, buf, sizeof(buf))) == "2.35%");
}

TEST_CASE("format_degrees: one decimal", "[format]") {
    char buf[16];
    REQUIRE(std::string(format_degrees(30.0, buf, sizeof(buf))) == "30.0°");
    REQUIRE(std::string(format_degrees(-1.5, buf, sizeof(buf))) == "-1.5°");
}

TEST_CASE("format_angstrom: precision", "[format]") {
    char buf[16];
    REQUIRE(std::string(format_angstrom(50.0, 0, buf, sizeof(buf))) == "50 Å");
    REQUIRE(std::string(format_angstrom(2.46, 2, buf, sizeof(buf))) == "2.46 Å");
}

TEST_CASE("format_resolution: square", "[format]") {
    char buf[24];
    REQUIRE(std::string(format_resolution(400, buf, sizeof(buf))) == "400x400");
}
