// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "moire_types.h"

#include <string>

/**
 * @file layer_compositor.h
 * @brief Superposes strained, twisted lattice layers into one moiré field
 *
 * For each layer of the stack, in order:
 *   1. strain the grid coordinates (StrainSpec of the layer)
 *   2. rotate them by the layer twist (skipped when the twist is 0,
 *      which always holds for layer 1, the reference orientation)
 *   3. evaluate the hexagonal lattice intensity
 * and the per-layer fields are summed elementwise. Each layer field is
 * folded into the running sum as soon as it is produced so at most one
 * transient layer field is alive at a time.
 */

namespace moire::lattice {

/**
 * @brief Intensity field of a single layer on the grid
 */
Field layer_field(const Grid& grid, const LayerSpec& layer, double a);

/**
 * @brief Combined moiré field of a layer stack
 *
 * @param grid Sampling grid
 * @param stack Layer stack (2 layers for Bilayer, 3 for Trilayer)
 * @param a Lattice constant in angstroms
 * @return Elementwise sum of layer fields, same shape as the grid
 */
Field compose(const Grid& grid, const LayerStack& stack, double a = GRAPHENE_LATTICE_CONSTANT);

/**
 * @brief Human-readable summary of the stack parameters
 *
 * Bilayer:  "Bilayer Graphene: Twist 1.5°, Strains 2.0% / 3.0%"
 * Trilayer: "Trilayer Graphene: Twists 1.5° / -1.5°, Strains 2.0% / 3.0% / 4.0%"
 */
std::string compose_title(const LayerStack& stack);

} // namespace moire::lattice
