// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <catch2/catch_test_macros.hpp>

#include <initializer_list>
#include <string>
#include <vector>

using namespace printwatch;

namespace {

/// Owns mutable argv storage for parse_cli_args
class Argv {
  public:
    Argv(std::initializer_list<const char*> args) {
        storage_.emplace_back("printwatch-monitor");
        for (const char* a : args) {
            storage_.emplace_back(a);
        }
        for (auto& s : storage_) {
            pointers_.push_back(s.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const {
        return static_cast<int>(storage_.size());
    }

    char** argv() {
        return pointers_.data();
    }

  private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

bool parse(Argv&& argv, CliArgs& args) {
    return parse_cli_args(argv.argc(), argv.argv(), args);
}

} // namespace

TEST_CASE("parse_cli_args: defaults", "[cli]") {
    CliArgs args;
    REQUIRE(parse(Argv{}, args));
    REQUIRE(args.config_path == "config/printwatch.json");
    REQUIRE(args.verbosity == 0);
    REQUIRE(args.printers.empty());
    REQUIRE(args.timeout_sec == 0);
    REQUIRE_FALSE(args.show_help);
}

TEST_CASE("parse_cli_args: options with values", "[cli]") {
    CliArgs args;
    REQUIRE(parse(Argv{"-c", "/etc/printwatch.json", "--printer", "voron", "-p", "ender",
                       "--log-dest=file", "--log-file", "/tmp/pw.log", "--timeout=30"},
                  args));

    REQUIRE(args.config_path == "/etc/printwatch.json");
    REQUIRE(args.printers == std::vector<std::string>{"voron", "ender"});
    REQUIRE(args.log_dest == "file");
    REQUIRE(args.log_file == "/tmp/pw.log");
    REQUIRE(args.timeout_sec == 30);
}

TEST_CASE("parse_cli_args: verbosity flags accumulate", "[cli]") {
    SECTION("-vv") {
        CliArgs args;
        REQUIRE(parse(Argv{"-vv"}, args));
        REQUIRE(args.verbosity == 2);
    }

    SECTION("-v -vvv --verbose") {
        CliArgs args;
        REQUIRE(parse(Argv{"-v", "-vvv", "--verbose"}, args));
        REQUIRE(args.verbosity == 5);
    }
}

TEST_CASE("parse_cli_args: help", "[cli]") {
    CliArgs args;
    REQUIRE(parse(Argv{"--help"}, args));
    REQUIRE(args.show_help);
}

TEST_CASE("parse_cli_args: rejects bad input", "[cli]") {
    CliArgs args;

    SECTION("unknown option") {
        REQUIRE_FALSE(parse(Argv{"--frobnicate"}, args));
    }

    SECTION("missing value") {
        REQUIRE_FALSE(parse(Argv{"--config"}, args));
        REQUIRE_FALSE(parse(Argv{"-p"}, args));
    }

    SECTION("invalid log destination") {
        REQUIRE_FALSE(parse(Argv{"--log-dest", "carrier-pigeon"}, args));
    }

    SECTION("timeout out of range or not a number") {
        REQUIRE_FALSE(parse(Argv{"-t", "0"}, args));
        REQUIRE_FALSE(parse(Argv{"-t", "86401"}, args));
        REQUIRE_FALSE(parse(Argv{"--timeout=soon"}, args));
    }
}
