// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

namespace thumbgrid::ui {

/// Forward LVGL's log output into the default spdlog logger. Call after lv_init().
void install_lvgl_log_bridge();

} // namespace thumbgrid::ui
