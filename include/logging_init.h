// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

/**
 * @file logging_init.h
 * @brief Default spdlog logger setup
 *
 * Console output is colored stdout. A second, optional sink sends logs to the system
 * journal, syslog, or a rotating file. A 32-message backtrace buffer is kept so fatal paths
 * can dump what led up to them.
 */

namespace thumbgrid {
namespace logging {

enum class LogTarget {
    Auto,    ///< journal if available, else syslog on Linux, console elsewhere
    Journal, ///< systemd journal (needs THUMBGRID_HAS_SYSTEMD)
    Syslog,
    File,    ///< rotating file, 5 MB x 3
    Console  ///< stdout only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool enable_console = true;
    LogTarget target = LogTarget::Console;
    std::string file_path; ///< Empty = $XDG_DATA_HOME/thumbgrid/thumbgrid.log
};

/// Install the default logger. Safe to call again to reconfigure.
void init(const LogConfig& config);

/// "auto", "journal", "syslog", "file", "console"; anything else is Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Log level from config string and -v count
 *
 * Each -v raises verbosity one step above the configured level (info -> debug -> trace).
 */
spdlog::level::level_enum resolve_level(const std::string& configured, int verbosity);

} // namespace logging
} // namespace thumbgrid
