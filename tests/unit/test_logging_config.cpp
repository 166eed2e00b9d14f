// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include "hv/hlog.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace printwatch::logging;

namespace fs = std::filesystem;

/// Restores the process-wide default logger after each test
class LoggingFixture {
  public:
    LoggingFixture() : saved_(spdlog::default_logger()) {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir_ = fs::temp_directory_path() / ("printwatch_logging_test_" + std::to_string(stamp));
        fs::create_directories(dir_);
    }

    ~LoggingFixture() {
        spdlog::set_default_logger(saved_);
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

  protected:
    std::string path(const std::string& name) const {
        return (dir_ / name).string();
    }

    static std::shared_ptr<spdlog::logger> active() {
        return spdlog::default_logger();
    }

    template <typename Sink> static size_t count_sinks() {
        size_t n = 0;
        for (const auto& sink : active()->sinks()) {
            if (std::dynamic_pointer_cast<Sink>(sink)) {
                n++;
            }
        }
        return n;
    }

  private:
    std::shared_ptr<spdlog::logger> saved_;
    fs::path dir_;
};

// ============================================================================
// init_early() / init()
// ============================================================================

TEST_CASE_METHOD(LoggingFixture, "Logging: early logger is console-only at warn",
                 "[logging]") {
    init_early();

    REQUIRE(active()->name() == "printwatch");
    REQUIRE(active()->level() == spdlog::level::warn);
    REQUIRE(active()->sinks().size() == 1);
    REQUIRE(count_sinks<spdlog::sinks::stdout_color_sink_mt>() == 1);
}

TEST_CASE_METHOD(LoggingFixture, "Logging: console target installs the named logger",
                 "[logging]") {
    LogConfig config;
    config.level = spdlog::level::debug;
    config.target = LogTarget::Console;

    SECTION("with console") {
        init(config);
        REQUIRE(active()->name() == "printwatch");
        REQUIRE(active()->level() == spdlog::level::debug);
        REQUIRE(active()->sinks().size() == 1);
    }

    SECTION("without console nothing is attached") {
        config.enable_console = false;
        init(config);
        REQUIRE(active()->sinks().empty());
        REQUIRE_NOTHROW(spdlog::warn("[Test] dropped on the floor"));
    }
}

TEST_CASE_METHOD(LoggingFixture, "Logging: file target writes to the given path",
                 "[logging][file]") {
    LogConfig config;
    config.level = spdlog::level::info;
    config.target = LogTarget::File;
    config.enable_console = false;
    config.file_path = path("monitor.log");

    init(config);
    REQUIRE(count_sinks<spdlog::sinks::rotating_file_sink_mt>() == 1);

    spdlog::info("[SessionRegistry] Monitoring started for voron");
    spdlog::debug("[SessionRegistry] below the configured level");
    active()->flush();

    std::ifstream in(config.file_path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(contents.find("Monitoring started for voron") != std::string::npos);
    REQUIRE(contents.find("below the configured level") == std::string::npos);
}

TEST_CASE_METHOD(LoggingFixture, "Logging: unopenable file sink keeps console logging",
                 "[logging][file]") {
    // A regular file where a directory is needed makes the sink constructor throw
    std::string blocker = path("not-a-dir");
    {
        std::ofstream out(blocker);
        out << "x";
    }

    LogConfig config;
    config.target = LogTarget::File;
    config.file_path = blocker + "/nested/monitor.log";

    REQUIRE_NOTHROW(init(config));
    REQUIRE(active()->name() == "printwatch");
    REQUIRE(active()->sinks().size() == 1);
    REQUIRE(count_sinks<spdlog::sinks::stdout_color_sink_mt>() == 1);
    REQUIRE(count_sinks<spdlog::sinks::rotating_file_sink_mt>() == 0);
}

#ifdef __linux__
TEST_CASE_METHOD(LoggingFixture, "Logging: journal target always yields a system sink",
                 "[logging]") {
    // Without journal support it falls back to syslog; either way one sink is added
    LogConfig config;
    config.target = LogTarget::Journal;
    config.enable_console = false;

    init(config);
    REQUIRE(active()->sinks().size() == 1);

    config.target = LogTarget::Syslog;
    init(config);
    REQUIRE(active()->sinks().size() == 1);
}
#endif

// ============================================================================
// Level and target parsing
// ============================================================================

TEST_CASE("Logging: level names", "[logging][config]") {
    const std::vector<std::pair<std::string, spdlog::level::level_enum>> names = {
        {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},   {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},   {"off", spdlog::level::off}};
    for (const auto& [name, level] : names) {
        CAPTURE(name);
        REQUIRE(parse_level(name, spdlog::level::critical) == level);
    }

    REQUIRE(parse_level("Debug", spdlog::level::info) == spdlog::level::info);
    REQUIRE(parse_level("", spdlog::level::err) == spdlog::level::err);
}

TEST_CASE("Logging: effective level from -v and /log_level", "[logging][config]") {
    REQUIRE(resolve_log_level(0, "") == spdlog::level::warn);
    REQUIRE(resolve_log_level(0, "error") == spdlog::level::err);
    REQUIRE(resolve_log_level(0, "chatty") == spdlog::level::warn);
    REQUIRE(resolve_log_level(1, "error") == spdlog::level::info);
    REQUIRE(resolve_log_level(2, "") == spdlog::level::debug);
    REQUIRE(resolve_log_level(7, "off") == spdlog::level::trace);
    REQUIRE(verbosity_to_level(-1) == spdlog::level::warn);
}

TEST_CASE("Logging: libhv follows spdlog but never goes below DEBUG", "[logging][config]") {
    REQUIRE(to_hv_level(spdlog::level::trace) == LOG_LEVEL_DEBUG);
    REQUIRE(to_hv_level(spdlog::level::info) == LOG_LEVEL_INFO);
    REQUIRE(to_hv_level(spdlog::level::err) == LOG_LEVEL_ERROR);
    REQUIRE(to_hv_level(spdlog::level::critical) == LOG_LEVEL_FATAL);
    REQUIRE(to_hv_level(spdlog::level::off) == LOG_LEVEL_SILENT);
}

TEST_CASE("Logging: --log-dest values", "[logging][config]") {
    for (LogTarget target : {LogTarget::Auto, LogTarget::Journal, LogTarget::Syslog,
                             LogTarget::File, LogTarget::Console}) {
        REQUIRE(parse_log_target(log_target_name(target)) == target);
    }
    REQUIRE(parse_log_target("carrier-pigeon") == LogTarget::Auto);
    REQUIRE(parse_log_target("FILE") == LogTarget::Auto);
}
