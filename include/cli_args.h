// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for moire-sim
 *
 * Every render parameter is optional on the command line; values that are
 * given override the config file, the rest come from config/presets.
 */

#include "moire_types.h"
#include "render_presets.h"

#include <optional>
#include <string>

namespace moire {

/**
 * @brief Per-layer command-line overrides
 */
struct LayerOverrides {
    std::optional<double> strain_percent;
    std::optional<double> strain_angle;
    std::optional<double> twist;
};

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    // System and quality
    std::optional<SystemMode> mode;
    std::optional<RenderQuality> quality;

    // Scan area
    std::optional<double> extent;
    std::optional<size_t> grid_size;

    // Layers (index 0 = reference layer, its twist is not settable)
    LayerOverrides layers[MAX_LAYERS];

    // Files
    std::string config_path = "moire.json";
    std::string output_path; ///< -o/--output: BMP image (empty = no image)
    std::string csv_path;    ///< --csv: raw field values (empty = none)

    // Logging
    int verbosity = 0;
    std::string log_dest; ///< --log-dest override (empty = from config)
    std::string log_file; ///< --log-file override (empty = from config)

    /// Help or version was printed; caller should exit successfully
    bool info_requested = false;

    /** @brief Check if any export was requested */
    bool wants_export() const {
        return !output_path.empty() || !csv_path.empty();
    }
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false if help/version was shown or an error occurred
 *         (args.info_requested distinguishes the two)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

/**
 * @brief Apply command-line overrides on top of a request
 *
 * Switching the render quality without an explicit extent/grid size
 * resets those two to the new preset defaults.
 */
void apply_cli_overrides(const CliArgs& args, RenderRequest& request);

} // namespace moire
