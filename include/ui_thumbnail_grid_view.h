// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "grid_controller.h"
#include "thumbnail_types.h"

#include <functional>
#include <lvgl.h>
#include <memory>
#include <string>
#include <vector>

namespace thumbgrid::ui {

/**
 * @file ui_thumbnail_grid_view.h
 * @brief LVGL widget layer of the virtualized thumbnail grid
 *
 * A scrollable container holds a spacer sized to the virtual content height and a pool of
 * absolutely positioned card widgets, one per GridController slot. The controller decides
 * what each slot shows; this class only mirrors slot changes into widgets and feeds scroll,
 * resize and click events back.
 *
 * Thumbnails are LVGL .bin images held in memory. Each card keeps a reference to the bytes
 * it displays and an lv_image_dsc_t pointing into them, so eviction from the memory cache
 * never frees pixels that are still on screen.
 *
 * ## Usage:
 * @code
 * ThumbnailGridView view;
 * view.setup(lv_screen_active(), on_activate);
 * GridController grid(settings, source, view, steady_now, view.text_measure());
 * view.attach(grid);
 * @endcode
 */

/**
 * @brief Callback for card activation
 * @param result_index Index into the current result set
 */
using CardActivateCallback = std::function<void(int result_index)>;

class ThumbnailGridView : public GridSlotPresenter {
  public:
    static constexpr uint32_t TICK_PERIOD_MS = 10;
    static constexpr const char* LOADING_TEXT = "Loading";
    static constexpr const char* UNAVAILABLE_TEXT = "No preview";

    ThumbnailGridView();
    ~ThumbnailGridView() override;

    // Non-copyable
    ThumbnailGridView(const ThumbnailGridView&) = delete;
    ThumbnailGridView& operator=(const ThumbnailGridView&) = delete;

    /**
     * @brief Create the scroll container under parent
     * @return true if setup succeeded
     */
    bool setup(lv_obj_t* parent, CardActivateCallback on_activate);

    /**
     * @brief Connect the controller and start the tick timer
     *
     * Must be called after setup(). The controller must outlive detach()/destruction.
     */
    void attach(GridController& controller);

    /// Stop the timer and forget the controller
    void detach();

    /// Label width measurement with the card label font
    TextMeasureFn text_measure() const;

    // GridSlotPresenter
    void on_layout_changed(int slot_count, int64_t content_height_px) override;
    void on_slot_updated(int slot_index, const GridSlot& slot) override;
    void on_results_replaced(int item_count) override;

    [[nodiscard]] lv_obj_t* container() const {
        return container_;
    }

  private:
    struct CardWidgets {
        lv_obj_t* card = nullptr;
        lv_obj_t* image = nullptr;
        lv_obj_t* placeholder = nullptr;
        lv_obj_t* label = nullptr;
        lv_image_dsc_t dsc{};
        ThumbnailData bytes; ///< Keeps dsc.data valid
        int result_index = -1;
    };

    CardWidgets* create_card();
    void destroy_cards();
    void show_image(CardWidgets& w, const ThumbnailData& bytes);
    void clear_image(CardWidgets& w);

    static void on_timer(lv_timer_t* timer);
    static void on_scroll(lv_event_t* e);
    static void on_size_changed(lv_event_t* e);
    static void on_card_clicked(lv_event_t* e);
    static void on_container_deleted(lv_event_t* e);

    lv_obj_t* container_ = nullptr;
    lv_obj_t* spacer_ = nullptr;
    std::vector<std::unique_ptr<CardWidgets>> cards_;
    lv_timer_t* timer_ = nullptr;
    GridController* controller_ = nullptr;
    CardActivateCallback on_activate_;
    const lv_font_t* label_font_ = nullptr;
    bool programmatic_scroll_ = false;
};

} // namespace thumbgrid::ui
