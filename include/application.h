// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cli_args.h"
#include "file_thumbnail_source.h"
#include "grid_settings.h"

#include <lvgl.h>
#include <memory>

namespace thumbgrid {
class Config;
class GridController;
namespace ui {
class ThumbnailGridView;
}
} // namespace thumbgrid

namespace thumbgrid {

/**
 * @brief Main application orchestrator
 *
 * Application coordinates all subsystems in the correct order:
 * 1. Parse CLI args
 * 2. Load config
 * 3. Configure logging
 * 4. Initialize display (LVGL, SDL window, input devices)
 * 5. Create the grid view and controller, scan the directory
 * 6. Run the main loop until the window closes
 * 7. Shutdown in reverse order
 *
 * Usage:
 *   Application app;
 *   return app.run(argc, argv);
 */
class Application {
  public:
    Application();
    ~Application();

    // Non-copyable, non-movable
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * @brief Run the application
     * @return Exit code (0 = success)
     */
    int run(int argc, char** argv);

  private:
    // Initialization phases
    bool parse_args(int argc, char** argv);
    bool init_config();
    bool init_logging();
    bool init_display();
    bool init_ui();

    /// --clear-cache: remove generated thumbnails and exit
    int clear_disk_cache();

    int main_loop();
    void shutdown();

    void on_card_activated(int result_index);

    // Configuration
    Config* m_config = nullptr; // Singleton, not owned
    CliArgs m_args;
    GridSettings m_settings;

    FileThumbnailSource m_source;

    // Destroyed in reverse: the view detaches before the controller goes away
    std::unique_ptr<ui::ThumbnailGridView> m_view;
    std::unique_ptr<GridController> m_grid;

    // Not owned, managed by LVGL
    lv_display_t* m_display = nullptr;
    lv_obj_t* m_screen = nullptr;

    bool m_display_initialized = false;
    bool m_shutdown_complete = false;
};

} // namespace thumbgrid
