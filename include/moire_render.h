// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "moire_types.h"
#include "render_presets.h"

#include <string>

namespace moire {

/**
 * @brief Output of one render request
 *
 * Transient: handed to the rendering/export side and dropped afterwards.
 */
struct RenderResult {
    Field combined;
    std::string title;
    double min_value = 0.0;
    double max_value = 0.0;
};

/**
 * @brief Build the grid, compose all layers and summarize the result
 *
 * The request is used as given; callers feeding user input should pass it
 * through clamp_request() first.
 *
 * @param request Render parameters
 * @param a Lattice constant in angstroms
 */
RenderResult render(const RenderRequest& request, double a = GRAPHENE_LATTICE_CONSTANT);

/**
 * @brief Minimum and maximum of a field (0,0 for an empty field)
 */
void field_range(const Field& field, double& min_value, double& max_value);

} // namespace moire
