// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_lvgl_log_bridge.h"

#include <spdlog/spdlog.h>

#include <lvgl.h>
#include <string>

namespace thumbgrid::ui {

#if LV_USE_LOG

namespace {

void lvgl_log_to_spdlog(lv_log_level_t level, const char* buf) {
    std::string msg(buf ? buf : "");
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) {
        msg.pop_back();
    }
    switch (level) {
    case LV_LOG_LEVEL_TRACE:
        spdlog::trace("[LVGL] {}", msg);
        break;
    case LV_LOG_LEVEL_INFO:
        spdlog::debug("[LVGL] {}", msg);
        break;
    case LV_LOG_LEVEL_WARN:
        spdlog::warn("[LVGL] {}", msg);
        break;
    case LV_LOG_LEVEL_ERROR:
        spdlog::error("[LVGL] {}", msg);
        break;
    default:
        spdlog::info("[LVGL] {}", msg);
        break;
    }
}

} // namespace

void install_lvgl_log_bridge() {
    lv_log_register_print_cb(lvgl_log_to_spdlog);
    spdlog::debug("[LVGL] Log output routed to spdlog");
}

#else

void install_lvgl_log_bridge() {
    spdlog::debug("[LVGL] Built without LV_USE_LOG, nothing to route");
}

#endif

} // namespace thumbgrid::ui
