// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "application.h"

#include "ui_lvgl_log_bridge.h"
#include "ui_thumbnail_grid_view.h"

#include "config.h"
#include "directory_result_provider.h"
#include "disk_thumbnail_cache.h"
#include "grid_controller.h"
#include "logging_init.h"

#include <SDL.h>
#include <spdlog/spdlog.h>

#include <cstdio>

namespace thumbgrid {

namespace {

uint32_t sdl_tick_cb() {
    return SDL_GetTicks();
}

} // namespace

Application::Application() = default;

Application::~Application() {
    shutdown();
}

int Application::run(int argc, char** argv) {
    // Phase 1: Parse command line args
    if (!parse_args(argc, argv)) {
        return m_args.show_help ? 0 : 1;
    }

    // Phase 2: Initialize config system
    if (!init_config()) {
        return 1;
    }

    // Phase 3: Initialize logging
    if (!init_logging()) {
        return 1;
    }

    spdlog::info("[Application] Starting thumbgrid");
    spdlog::debug("[Application] Window: {}x{}", m_args.width, m_args.height);
    spdlog::debug("[Application] Config: {}", m_config->get_path());

    if (m_args.clear_cache) {
        return clear_disk_cache();
    }

    // Phase 4: Initialize display
    if (!init_display()) {
        shutdown();
        return 1;
    }

    // Phase 5: Create the grid
    if (!init_ui()) {
        shutdown();
        return 1;
    }

    // Phase 6: Main loop
    int result = main_loop();

    // Phase 7: Shutdown
    shutdown();
    return result;
}

bool Application::parse_args(int argc, char** argv) {
    return parse_cli_args(argc, argv, m_args);
}

bool Application::init_config() {
    m_config = Config::get_instance();
    const std::string path =
        m_args.config_path.empty() ? Config::default_path() : m_args.config_path;
    m_config->init(path);
    m_settings = GridSettings::from_config(*m_config);
    return true;
}

bool Application::init_logging() {
    logging::LogConfig log_config;
    log_config.level = logging::resolve_level(
        m_config->get<std::string>("/log_level", std::string("info")), m_args.verbosity);

    const std::string target = m_args.log_target.empty()
                                   ? m_config->get<std::string>("/log_target", "console")
                                   : m_args.log_target;
    log_config.target = logging::parse_log_target(target);
    log_config.file_path = m_args.log_file;

    logging::init(log_config);
    spdlog::debug("[Application] Logging to {} at level {}",
                  logging::log_target_name(log_config.target),
                  spdlog::level::to_string_view(log_config.level));
    return true;
}

int Application::clear_disk_cache() {
    DiskThumbnailCache disk(DiskThumbnailCache::resolve_cache_dir(m_settings.cache_directory),
                            m_settings.disk_enabled);
    if (!disk.enabled()) {
        spdlog::warn("[Application] Disk cache disabled, nothing to clear");
        return 0;
    }
    size_t removed = disk.clear();
    spdlog::info("[Application] Removed {} cached thumbnail(s) from {}", removed, disk.root());
    printf("Removed %zu cached thumbnail(s) from %s\n", removed, disk.root().c_str());
    return 0;
}

bool Application::init_display() {
    lv_init();
    m_display_initialized = true;
    lv_tick_set_cb(sdl_tick_cb);
    ui::install_lvgl_log_bridge();

    m_display = lv_sdl_window_create(m_args.width, m_args.height);
    if (!m_display) {
        spdlog::error("[Application] Failed to create SDL window {}x{}", m_args.width,
                      m_args.height);
        return false;
    }
    lv_sdl_window_set_title(m_display, "thumbgrid");

    if (!lv_sdl_mouse_create()) {
        spdlog::error("[Application] Failed to create mouse input");
        return false;
    }
    if (!lv_sdl_mousewheel_create()) {
        spdlog::warn("[Application] No mouse wheel input, scrolling by drag only");
    }

    m_screen = lv_display_get_screen_active(m_display);
    spdlog::debug("[Application] Display ready");
    return true;
}

bool Application::init_ui() {
    m_view = std::make_unique<ui::ThumbnailGridView>();
    if (!m_view->setup(m_screen, [this](int index) { on_card_activated(index); })) {
        return false;
    }

    m_grid = std::make_unique<GridController>(m_settings, m_source, *m_view, steady_now,
                                              m_view->text_measure());
    m_grid->start();
    m_view->attach(*m_grid);

    DirectoryResultProvider provider(m_args.directory, m_args.recursive);
    m_grid->set_results(provider.scan());
    return true;
}

int Application::main_loop() {
    spdlog::info("[Application] Entering main loop");
    while (lv_display_get_next(NULL)) {
        uint32_t idle_ms = lv_timer_handler();
        SDL_Delay(idle_ms < 5 ? idle_ms : 5);
    }
    spdlog::info("[Application] Window closed");
    return 0;
}

void Application::on_card_activated(int result_index) {
    if (!m_grid) {
        return;
    }
    const ResultItem* item = m_grid->item(result_index);
    if (!item) {
        return;
    }
    spdlog::info("[Application] Selected #{}: {}", item->index, item->display_path);
}

void Application::shutdown() {
    // Guard against multiple calls (destructor + explicit shutdown)
    if (m_shutdown_complete) {
        return;
    }
    m_shutdown_complete = true;

    spdlog::info("[Application] Shutting down...");

    if (m_view) {
        m_view->detach();
    }
    if (m_grid) {
        m_grid->shutdown();
        m_grid.reset();
    }
    m_view.reset();

    if (m_display_initialized) {
        // Quit SDL before LVGL deinit
        lv_sdl_quit();
        if (lv_is_initialized()) {
            lv_deinit();
        }
        m_display_initialized = false;
    }

    spdlog::info("[Application] Shutdown complete");
    spdlog::shutdown();
}

} // namespace thumbgrid
