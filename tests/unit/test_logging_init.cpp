// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_logging_init.cpp
 * @brief Unit tests for logging setup and option parsing
 */

#include "logging_init.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace moire;
using namespace moire::logging;

namespace fs = std::filesystem;

namespace {

// Restores a plain console logger so later tests aren't affected
struct LoggerRestore {
    ~LoggerRestore() {
        LogConfig config;
        config.target = LogTarget::Console;
        init(config);
    }
};

} // namespace

// ============================================================================
// parse_log_target() tests
// ============================================================================

TEST_CASE("parse_log_target: known targets", "[logging][config]") {
    REQUIRE(parse_log_target("auto") == LogTarget::Auto);
    REQUIRE(parse_log_target("syslog") == LogTarget::Syslog);
    REQUIRE(parse_log_target("file") == LogTarget::File);
    REQUIRE(parse_log_target("console") == LogTarget::Console);
}

TEST_CASE("parse_log_target: unknown falls back to auto", "[logging][config]") {
    REQUIRE(parse_log_target("") == LogTarget::Auto);
    REQUIRE(parse_log_target("journal") == LogTarget::Auto);
    REQUIRE(parse_log_target("FILE") == LogTarget::Auto);
}

TEST_CASE("log_target_name: names match parser", "[logging][config]") {
    for (LogTarget t : {LogTarget::Auto, LogTarget::Syslog, LogTarget::File, LogTarget::Console}) {
        REQUIRE(parse_log_target(log_target_name(t)) == t);
    }
}

// ============================================================================
// verbosity_to_level() tests
// ============================================================================

TEST_CASE("verbosity_to_level: -v count mapping", "[logging][config]") {
    REQUIRE(verbosity_to_level(-1) == spdlog::level::warn);
    REQUIRE(verbosity_to_level(0) == spdlog::level::warn);
    REQUIRE(verbosity_to_level(1) == spdlog::level::info);
    REQUIRE(verbosity_to_level(2) == spdlog::level::debug);
    REQUIRE(verbosity_to_level(3) == spdlog::level::trace);
    REQUIRE(verbosity_to_level(7) == spdlog::level::trace);
}

// ============================================================================
// init() tests
// ============================================================================

TEST_CASE("init: console logger takes configured level", "[logging][init]") {
    LoggerRestore restore;

    LogConfig config;
    config.level = spdlog::level::debug;
    config.target = LogTarget::Console;
    init(config);

    auto logger = spdlog::default_logger();
    REQUIRE(logger->name() == "moire");
    REQUIRE(logger->level() == spdlog::level::debug);
    REQUIRE(logger->sinks().size() == 1);
    REQUIRE(logger->should_backtrace());
}

TEST_CASE("init: file target writes to the given path", "[logging][init]") {
    LoggerRestore restore;

    fs::path dir = fs::temp_directory_path() / "moire_logging_test";
    fs::create_directories(dir);
    fs::path log_path = dir / "moire.log";
    std::error_code ec;
    fs::remove(log_path, ec);

    LogConfig config;
    config.level = spdlog::level::info;
    config.target = LogTarget::File;
    config.file_path = log_path.string();
    config.enable_console = false;
    init(config);

    REQUIRE(spdlog::default_logger()->sinks().size() == 1);

    spdlog::info("[Test] file sink check");
    spdlog::default_logger()->flush();

    REQUIRE(fs::exists(log_path));
    REQUIRE(fs::file_size(log_path) > 0);

    fs::remove_all(dir, ec);
}

TEST_CASE("init: unwritable file target keeps console", "[logging][init][edge]") {
    LoggerRestore restore;

    // A regular file as the parent directory can never be created
    fs::path dir = fs::temp_directory_path() / "moire_logging_blocked";
    fs::create_directories(dir);
    fs::path blocker = dir / "not_a_dir";
    {
        std::ofstream out(blocker);
        out << "x";
    }

    LogConfig config;
    config.target = LogTarget::File;
    config.file_path = (blocker / "moire.log").string();
    init(config);

    auto logger = spdlog::default_logger();
    REQUIRE(logger->name() == "moire");
    REQUIRE(logger->sinks().size() == 1);

    std::error_code ec;
    fs::remove_all(dir, ec);
}
