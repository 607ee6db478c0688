// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <vector>

#ifdef __linux__
#ifdef THUMBGRID_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace thumbgrid {
namespace logging {

namespace {

constexpr const char* LOGGER_NAME = "thumbgrid";

/// Get XDG_DATA_HOME or default ~/.local/share
std::string get_xdg_data_home() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share";
    }
    return "/tmp";
}

std::string resolve_log_file_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }
    std::string dir = get_xdg_data_home() + "/thumbgrid";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return dir + "/thumbgrid.log";
}

LogTarget detect_best_target() {
#ifdef __linux__
#ifdef THUMBGRID_HAS_SYSTEMD
    std::error_code ec;
    if (std::filesystem::exists("/run/systemd/journal/socket", ec)) {
        return LogTarget::Journal;
    }
#endif
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

void add_system_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                     const std::string& file_path) {
    switch (target) {
#ifdef __linux__
    case LogTarget::Journal:
#ifdef THUMBGRID_HAS_SYSTEMD
        sinks.push_back(std::make_shared<spdlog::sinks::systemd_sink_mt>(LOGGER_NAME));
        break;
#endif
        // Without systemd support the journal falls back to syslog
    case LogTarget::Syslog:
        sinks.push_back(
            std::make_shared<spdlog::sinks::syslog_sink_mt>(LOGGER_NAME, LOG_PID, LOG_USER, false));
        break;
#else
    case LogTarget::Journal:
    case LogTarget::Syslog:
        break;
#endif
    case LogTarget::File: {
        // 5MB max size, 3 rotated files
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            resolve_log_file_path(file_path), 5 * 1024 * 1024, 3));
        break;
    }
    case LogTarget::Console:
    case LogTarget::Auto:
        break;
    }
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget effective_target =
        (config.target == LogTarget::Auto) ? detect_best_target() : config.target;

    std::string sink_error;
    try {
        add_system_sink(sinks, effective_target, config.file_path);
    } catch (const spdlog::spdlog_ex& e) {
        // Keep console logging when the file cannot be opened
        sink_error = e.what();
        effective_target = LogTarget::Console;
        if (sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    if (!sink_error.empty()) {
        spdlog::warn("[Logging] System sink unavailable: {}", sink_error);
    }

    // Recent messages get dumped on fatal errors
    spdlog::enable_backtrace(32);

    spdlog::debug("[Logging] Initialized: target={}, console={}, level={}, backtrace=32 messages",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no",
                  spdlog::level::to_string_view(config.level));
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "journal")
        return LogTarget::Journal;
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Journal:
        return "journal";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

spdlog::level::level_enum resolve_level(const std::string& configured, int verbosity) {
    spdlog::level::level_enum base = spdlog::level::from_str(configured);
    // from_str maps unknown names to off; treat those as info
    if (base == spdlog::level::off && configured != "off") {
        base = spdlog::level::info;
    }
    int level = static_cast<int>(base) - std::max(verbosity, 0);
    return static_cast<spdlog::level::level_enum>(std::max(level, 0));
}

} // namespace logging
} // namespace thumbgrid
