// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <array>
#include <cstddef>
#include <vector>

/**
 * @file moire_types.h
 * @brief Value types shared by the moiré field pipeline
 *
 * All arrays are row-major: row index follows Y, column index follows X.
 * Everything here is a plain value; nothing in the pipeline keeps state
 * between render requests.
 */

namespace moire {

/// Graphene lattice constant in angstroms
inline constexpr double GRAPHENE_LATTICE_CONSTANT = 2.46;

/// Maximum number of stacked layers (trilayer)
inline constexpr size_t MAX_LAYERS = 3;

/**
 * @brief Dense 2D array of doubles (rows × cols, row-major)
 *
 * Used for coordinate arrays and intensity fields alike.
 */
struct Field {
    size_t rows = 0;
    size_t cols = 0;
    std::vector<double> values;

    Field() = default;
    Field(size_t r, size_t c, double fill = 0.0) : rows(r), cols(c), values(r * c, fill) {}

    double& at(size_t row, size_t col) {
        return values[row * cols + col];
    }
    double at(size_t row, size_t col) const {
        return values[row * cols + col];
    }

    size_t size() const {
        return values.size();
    }

    bool same_shape(const Field& other) const {
        return rows == other.rows && cols == other.cols;
    }
};

/**
 * @brief Pair of coordinate arrays produced by a coordinate transform
 */
struct Coordinates {
    Field x;
    Field y;
};

/**
 * @brief Sampling grid over [-extent, extent]²
 *
 * x_axis/y_axis hold the 1D samples; X/Y are the full meshgrid
 * (X varies along columns, Y along rows).
 */
struct Grid {
    double extent = 0.0;
    std::vector<double> x_axis;
    std::vector<double> y_axis;
    Field X;
    Field Y;

    size_t rows() const {
        return Y.rows;
    }
    size_t cols() const {
        return X.cols;
    }
};

/**
 * @brief Anisotropic strain of one layer
 */
struct StrainSpec {
    double percent = 0.0;       ///< Strain magnitude in percent (>= 0)
    double angle_degrees = 0.0; ///< Principal strain direction
};

/**
 * @brief One graphene layer: strain plus twist relative to layer 1
 */
struct LayerSpec {
    StrainSpec strain;
    double twist_degrees = 0.0; ///< Always 0 for the reference layer
};

enum class SystemMode { Bilayer, Trilayer };

/**
 * @brief Layer count for a system mode (2 or 3)
 */
constexpr size_t layer_count(SystemMode mode) {
    return mode == SystemMode::Trilayer ? 3 : 2;
}

/**
 * @brief Ordered layer sequence tagged by system mode
 *
 * Storage is always MAX_LAYERS wide; only the first layer_count(mode)
 * entries take part in composition.
 */
struct LayerStack {
    SystemMode mode = SystemMode::Bilayer;
    std::array<LayerSpec, MAX_LAYERS> layers{};

    size_t size() const {
        return layer_count(mode);
    }

    const LayerSpec& operator[](size_t i) const {
        return layers[i];
    }
    LayerSpec& operator[](size_t i) {
        return layers[i];
    }

    const LayerSpec* begin() const {
        return layers.data();
    }
    const LayerSpec* end() const {
        return layers.data() + size();
    }
};

} // namespace moire
