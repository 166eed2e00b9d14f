// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace printwatch {

// Helper to parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*str == '\0' || *endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

// Accepts "--opt value" and "--opt=value"; advances i past a separate value
static const char* option_value(int argc, char** argv, int& i, const char* long_name) {
    size_t len = strlen(long_name);
    if (strncmp(argv[i], long_name, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    return nullptr;
}

static bool matches(const char* arg, const char* short_name, const char* long_name) {
    size_t len = strlen(long_name);
    return (short_name && strcmp(arg, short_name) == 0) || strcmp(arg, long_name) == 0 ||
           (strncmp(arg, long_name, len) == 0 && arg[len] == '=');
}

void print_usage(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <path>  Config file (default: config/printwatch.json)\n");
    printf("  -p, --printer <id>   Monitor this printer (repeatable; default: all)\n");
    printf("  -l, --log-dest <t>   Log target: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>    Log file path for --log-dest file\n");
    printf("  -t, --timeout <sec>  Auto-quit after specified seconds (1-86400)\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  -h, --help           Show this help message\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            args.show_help = true;
        } else if (matches(argv[i], "-c", "--config")) {
            const char* value = option_value(argc, argv, i, "--config");
            if (!value || *value == '\0') {
                printf("Error: --config requires a path argument\n");
                return false;
            }
            args.config_path = value;
        } else if (matches(argv[i], "-p", "--printer")) {
            const char* value = option_value(argc, argv, i, "--printer");
            if (!value || *value == '\0') {
                printf("Error: --printer requires a printer id\n");
                return false;
            }
            args.printers.emplace_back(value);
        } else if (matches(argv[i], "-l", "--log-dest")) {
            const char* value = option_value(argc, argv, i, "--log-dest");
            if (!value) {
                printf("Error: --log-dest requires an argument\n");
                return false;
            }
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "journal" &&
                args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                printf("Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                printf("Valid values: auto, journal, syslog, file, console\n");
                return false;
            }
        } else if (matches(argv[i], nullptr, "--log-file")) {
            const char* value = option_value(argc, argv, i, "--log-file");
            if (!value || *value == '\0') {
                printf("Error: --log-file requires a path argument\n");
                return false;
            }
            args.log_file = value;
        } else if (matches(argv[i], "-t", "--timeout")) {
            const char* value = option_value(argc, argv, i, "--timeout");
            if (!value) {
                printf("Error: --timeout requires a number of seconds\n");
                return false;
            }
            if (!parse_int(value, 1, 86400, args.timeout_sec, "--timeout"))
                return false;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        } else {
            printf("Error: unknown option: %s\n", argv[i]);
            return false;
        }
    }
    return true;
}

} // namespace printwatch
