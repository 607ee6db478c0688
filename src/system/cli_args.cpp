// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace thumbgrid {

namespace {

bool parse_int_arg(const char* flag, const char* value, int min, int max, int& out) {
    char* end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (!end || *end != '\0' || parsed < min || parsed > max) {
        printf("Error: %s expects an integer in [%d, %d], got '%s'\n", flag, min, max, value);
        return false;
    }
    out = static_cast<int>(parsed);
    return true;
}

} // namespace

void print_usage(const char* program) {
    printf("Usage: %s [options] <directory>\n\n", program);
    printf("Browse the images in <directory> as a scrollable thumbnail grid.\n\n");
    printf("Options:\n");
    printf("  -c, --config <path>     Config file (default: ~/.config/thumbgrid/thumbgrid.json)\n");
    printf("  -r, --recursive         Include images in subdirectories\n");
    printf("  -W, --width <px>        Window width (default: 1024)\n");
    printf("  -H, --height <px>       Window height (default: 800)\n");
    printf("  -v, --verbose           Increase log verbosity (-v debug, -vv trace)\n");
    printf("      --log-dest <dest>   auto, journal, syslog, file, console\n");
    printf("      --log-file <path>   Log file for --log-dest file\n");
    printf("      --clear-cache       Delete all cached thumbnails before starting\n");
    printf("  -h, --help              Show this help\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            print_usage(argv[0]);
            return false;
        } else if (strcmp(arg, "-c") == 0 || strcmp(arg, "--config") == 0) {
            if (i + 1 >= argc) {
                printf("Error: %s requires an argument\n", arg);
                return false;
            }
            args.config_path = argv[++i];
        } else if (strcmp(arg, "-r") == 0 || strcmp(arg, "--recursive") == 0) {
            args.recursive = true;
        } else if (strcmp(arg, "-W") == 0 || strcmp(arg, "--width") == 0 ||
                   strcmp(arg, "-H") == 0 || strcmp(arg, "--height") == 0) {
            if (i + 1 >= argc) {
                printf("Error: %s requires an argument\n", arg);
                return false;
            }
            int& target = (arg[1] == 'W' || strcmp(arg, "--width") == 0) ? args.width : args.height;
            if (!parse_int_arg(arg, argv[++i], 160, 8192, target)) {
                return false;
            }
        } else if (strcmp(arg, "--log-dest") == 0) {
            if (i + 1 >= argc) {
                printf("Error: %s requires an argument\n", arg);
                return false;
            }
            args.log_target = argv[++i];
        } else if (strcmp(arg, "--log-file") == 0) {
            if (i + 1 >= argc) {
                printf("Error: %s requires an argument\n", arg);
                return false;
            }
            args.log_file = argv[++i];
        } else if (strcmp(arg, "--clear-cache") == 0) {
            args.clear_cache = true;
        } else if (strcmp(arg, "--verbose") == 0) {
            args.verbosity++;
        } else if (arg[0] == '-' && arg[1] == 'v' && strspn(arg + 1, "v") == strlen(arg + 1)) {
            // -v, -vv, -vvv
            args.verbosity += static_cast<int>(strlen(arg + 1));
        } else if (arg[0] == '-') {
            printf("Error: unknown option '%s'\n", arg);
            print_usage(argv[0]);
            return false;
        } else if (args.directory.empty()) {
            args.directory = arg;
        } else {
            printf("Error: unexpected argument '%s'\n", arg);
            return false;
        }
    }

    if (args.directory.empty()) {
        printf("Error: no image directory given\n");
        print_usage(argv[0]);
        return false;
    }
    return true;
}

} // namespace thumbgrid
