// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"
#include "config.h"
#include "field_colormap.h"
#include "field_export.h"
#include "format_utils.h"
#include "logging_init.h"
#include "moire_render.h"
#include "render_presets.h"

#include <spdlog/spdlog.h>

#include <cstdio>

using namespace moire;

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.info_requested ? 0 : 1;
    }

    // Until the real logger is up, honor -v for config loading messages
    spdlog::set_level(logging::verbosity_to_level(args.verbosity));

    Config* cfg = Config::get_instance();
    cfg->init(args.config_path);

    logging::LogConfig log_config = cfg->to_log_config();
    if (args.verbosity > 0) {
        log_config.level = logging::verbosity_to_level(args.verbosity);
    }
    if (!args.log_dest.empty()) {
        log_config.target = logging::parse_log_target(args.log_dest);
    }
    if (!args.log_file.empty()) {
        log_config.file_path = args.log_file;
    }
    logging::init(log_config);

    RenderRequest request = cfg->to_render_request();
    apply_cli_overrides(args, request);
    request = clamp_request(request);

    char extent_buf[32];
    char res_buf[32];
    spdlog::info("[Main] {} / {} quality, extent {}, resolution {}",
                 system_mode_name(request.stack.mode), render_quality_name(request.quality),
                 format::format_angstrom(request.extent, 0, extent_buf, sizeof(extent_buf)),
                 format::format_resolution(request.grid_size, res_buf, sizeof(res_buf)));

    RenderResult result = render(request);

    printf("%s\n", result.title.c_str());
    printf("  field: %zux%zu, intensity range [%.4f, %.4f]\n", result.combined.rows,
           result.combined.cols, result.min_value, result.max_value);

    bool ok = true;
    if (args.wants_export()) {
        if (!args.output_path.empty()) {
            rendering::RgbImage image =
                rendering::colorize(result.combined, result.min_value, result.max_value);
            if (rendering::write_bmp(args.output_path, image)) {
                printf("  image: %s\n", args.output_path.c_str());
            } else {
                ok = false;
            }
        }
        if (!args.csv_path.empty()) {
            if (rendering::write_field_csv(args.csv_path, result.combined)) {
                printf("  values: %s\n", args.csv_path.c_str());
            } else {
                ok = false;
            }
        }
        if (!ok) {
            spdlog::dump_backtrace();
        }
    }

    spdlog::shutdown();
    return ok ? 0 : 1;
}
