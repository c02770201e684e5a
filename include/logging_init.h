// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace moire {
namespace logging {

/**
 * @brief Where log output goes in addition to the console
 */
enum class LogTarget {
    Auto,   ///< Resolve at runtime (console only)
    Syslog, ///< syslog (Linux)
    File,   ///< Rotating log file
    Console ///< Console only
};

/**
 * @brief Logging setup, filled from config and CLI
 */
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    std::string file_path; ///< Only used for LogTarget::File; empty = default location
    bool enable_console = true;
};

/**
 * @brief Install the default spdlog logger
 *
 * Creates a console sink (unless disabled) plus the sink for the selected
 * target, and enables a 32-message backtrace buffer.
 */
void init(const LogConfig& config);

/**
 * @brief Parse a log target name ("auto", "syslog", "file", "console")
 *
 * Unrecognized names yield LogTarget::Auto.
 */
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Map a -v count to a log level
 *
 * 0 = warn, 1 = info, 2 = debug, 3+ = trace
 */
spdlog::level::level_enum verbosity_to_level(int verbosity);

} // namespace logging
} // namespace moire
