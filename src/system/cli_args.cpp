// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "moire_version.h"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace moire {

// Helper to parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, long& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (endptr == str || *endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = val;
    return true;
}

// Helper to parse double with validation
static bool parse_double(const char* str, double& out, const char* name) {
    char* endptr;
    double val = strtod(str, &endptr);
    if (endptr == str || *endptr != '\0' || !std::isfinite(val)) {
        printf("Error: %s requires a finite numeric value: %s\n", name, str);
        return false;
    }
    out = val;
    return true;
}

static void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Computes the moire intensity field of twisted, strained multilayer graphene.\n");
    printf("\nSystem:\n");
    printf("  -m, --mode <mode>       bilayer (default) or trilayer\n");
    printf("  -q, --quality <q>       quick (default) or high-res\n");
    printf("  -e, --extent <A>        Scan half-width in angstroms (quick: 10-100, high-res: "
           "50-500)\n");
    printf("  -g, --grid-size <n>     Samples per axis (quick: 200-800, high-res: 800-3000)\n");
    printf("\nLayers (1 = reference layer):\n");
    printf("  --strain1/2/3 <pct>     Strain magnitude in percent (0-10)\n");
    printf("  --angle1/2/3 <deg>      Strain direction in degrees (0-180)\n");
    printf("  --twist2 <deg>          Twist of layer 2 (0-10)\n");
    printf("  --twist3 <deg>          Twist of layer 3 (-10-10, trilayer only)\n");
    printf("\nOutput:\n");
    printf("  -o, --output <file>     Write false-color BMP image\n");
    printf("  --csv <file>            Write raw field values as CSV\n");
    printf("  -c, --config <file>     Config file (default: moire.json)\n");
    printf("\nLogging:\n");
    printf("  -v, --verbose           Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>       Log destination: auto, syslog, file, console\n");
    printf("  --log-file <path>       Log file path (when --log-dest=file)\n");
    printf("\n  -h, --help              Show this help message\n");
    printf("  -V, --version           Show version information\n");
    printf("\nOut-of-range values are clamped to the limits above.\n");
    printf("\nExamples:\n");
    printf("  %s --twist2 1.1 -o bilayer.bmp\n", program_name);
    printf("  %s -m trilayer -q high-res --twist3 -2.0 -o trilayer.bmp\n", program_name);
}

// Parse --strainN / --angleN / --twistN; returns false if argv[i] isn't a layer option
static bool match_layer_option(const char* arg, const char* prefix, size_t& layer_index) {
    size_t len = strlen(prefix);
    if (strncmp(arg, prefix, len) != 0 || arg[len] == '\0' || arg[len + 1] != '\0')
        return false;
    char digit = arg[len];
    if (digit < '1' || digit > '3')
        return false;
    layer_index = static_cast<size_t>(digit - '1');
    return true;
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        size_t layer = 0;

        // Options that need a value
        auto next_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                printf("Error: %s requires an argument\n", name);
                return nullptr;
            }
            return argv[++i];
        };

        if (strcmp(arg, "-m") == 0 || strcmp(arg, "--mode") == 0) {
            const char* value = next_value("-m/--mode");
            if (!value)
                return false;
            args.mode = parse_system_mode(value);
            if (!args.mode) {
                printf("Unknown mode: %s (expected bilayer or trilayer)\n", value);
                return false;
            }
        } else if (strcmp(arg, "-q") == 0 || strcmp(arg, "--quality") == 0) {
            const char* value = next_value("-q/--quality");
            if (!value)
                return false;
            args.quality = parse_render_quality(value);
            if (!args.quality) {
                printf("Unknown quality: %s (expected quick or high-res)\n", value);
                return false;
            }
        } else if (strcmp(arg, "-e") == 0 || strcmp(arg, "--extent") == 0) {
            const char* value = next_value("-e/--extent");
            double extent;
            if (!value || !parse_double(value, extent, "--extent"))
                return false;
            args.extent = extent;
        } else if (strcmp(arg, "-g") == 0 || strcmp(arg, "--grid-size") == 0) {
            const char* value = next_value("-g/--grid-size");
            long grid_size;
            if (!value || !parse_int(value, 2, 100000, grid_size, "--grid-size"))
                return false;
            args.grid_size = static_cast<size_t>(grid_size);
        }
        // Per-layer parameters
        else if (match_layer_option(arg, "--strain", layer)) {
            const char* value = next_value(arg);
            double v;
            if (!value || !parse_double(value, v, arg))
                return false;
            args.layers[layer].strain_percent = v;
        } else if (match_layer_option(arg, "--angle", layer)) {
            const char* value = next_value(arg);
            double v;
            if (!value || !parse_double(value, v, arg))
                return false;
            args.layers[layer].strain_angle = v;
        } else if (match_layer_option(arg, "--twist", layer)) {
            if (layer == 0) {
                printf("Error: layer 1 is the reference layer and cannot be twisted\n");
                return false;
            }
            const char* value = next_value(arg);
            double v;
            if (!value || !parse_double(value, v, arg))
                return false;
            args.layers[layer].twist = v;
        }
        // Files
        else if (strcmp(arg, "-c") == 0 || strcmp(arg, "--config") == 0) {
            const char* value = next_value("-c/--config");
            if (!value)
                return false;
            args.config_path = value;
        } else if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            const char* value = next_value("-o/--output");
            if (!value)
                return false;
            args.output_path = value;
        } else if (strcmp(arg, "--csv") == 0) {
            const char* value = next_value("--csv");
            if (!value)
                return false;
            args.csv_path = value;
        }
        // Logging
        else if (strcmp(arg, "-v") == 0 || strcmp(arg, "-vv") == 0 || strcmp(arg, "-vvv") == 0) {
            const char* p = arg;
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(arg, "--verbose") == 0) {
            args.verbosity++;
        } else if (strcmp(arg, "--log-dest") == 0) {
            const char* value = next_value("--log-dest");
            if (!value)
                return false;
            args.log_dest = value;
        } else if (strcmp(arg, "--log-file") == 0) {
            const char* value = next_value("--log-file");
            if (!value)
                return false;
            args.log_file = value;
        }
        // Help
        else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            args.info_requested = true;
            return false;
        }
        // Version
        else if (strcmp(arg, "-V") == 0 || strcmp(arg, "--version") == 0) {
            printf("moire-sim %s\n", MOIRE_VERSION);
            args.info_requested = true;
            return false;
        } else {
            printf("Unknown argument: %s\n", arg);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    return true;
}

void apply_cli_overrides(const CliArgs& args, RenderRequest& request) {
    if (args.mode) {
        request.stack.mode = *args.mode;
    }

    if (args.quality && *args.quality != request.quality) {
        QualityPreset preset = quality_preset(*args.quality);
        request.quality = *args.quality;
        request.extent = preset.extent.default_value;
        request.grid_size = static_cast<size_t>(preset.grid_size.default_value);
        spdlog::debug("[CLI] Quality {} selected, scan defaults {} A / {} px",
                      render_quality_name(request.quality), request.extent, request.grid_size);
    }

    if (args.extent) {
        request.extent = *args.extent;
    }
    if (args.grid_size) {
        request.grid_size = *args.grid_size;
    }

    for (size_t i = 0; i < MAX_LAYERS; ++i) {
        const LayerOverrides& o = args.layers[i];
        LayerSpec& layer = request.stack[i];
        if (o.strain_percent)
            layer.strain.percent = *o.strain_percent;
        if (o.strain_angle)
            layer.strain.angle_degrees = *o.strain_angle;
        if (o.twist)
            layer.twist_degrees = *o.twist;
    }
}

} // namespace moire
