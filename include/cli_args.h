// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for thumbgrid
 */

#include <string>

namespace thumbgrid {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string directory;   ///< Image directory to show (required)
    std::string config_path; ///< Empty = Config::default_path()
    bool recursive = false;

    // Window
    int width = 1024;
    int height = 800;

    // Logging
    int verbosity = 0;
    std::string log_target; ///< Empty = use config
    std::string log_file;

    // Maintenance
    bool clear_cache = false;

    bool show_help = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @return true on success, false if help was requested or an error occurred (a message has
 *         already been printed)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

void print_usage(const char* program);

} // namespace thumbgrid
