// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "disk_thumbnail_cache.h"
#include "grid_clock.h"
#include "grid_settings.h"
#include "lru_cache.h"
#include "render_scheduler.h"
#include "scroll_activity_tracker.h"
#include "thumbnail_pipeline.h"
#include "thumbnail_service.h"
#include "thumbnail_types.h"
#include "viewport_model.h"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

/**
 * @file grid_controller.h
 * @brief Virtualized thumbnail grid: slot pool, thumbnail resolution and render timing
 *
 * Only the visible rows (plus overscan) are materialized. A fixed pool of slots is reused
 * across render passes and reallocated only when its dimensions change (columns x visible
 * rows). Each render pass binds every slot to a result index and resolves its thumbnail:
 *
 * - memory cache hit: the slot shows the image
 * - miss: the slot shows a loading placeholder and a generation request is queued
 *   (deduplicated against inflight work)
 * - earlier generation failure: "unavailable" placeholder, no new request
 *
 * While the user is actively scrolling, slots keep the image they already show and fall back
 * to the placeholder otherwise; no new work is queued until scrolling settles. After the
 * visible slots, rows just outside the viewport are prefetched through the same deduplicated
 * path, bounded per pass.
 *
 * Rendering is driven entirely by tick(), called periodically from the UI loop. Events
 * (results, resize, scroll) only schedule renders.
 *
 * UI thread only. The presenter is told about slots whose content actually changed.
 *
 * Usage:
 * @code
 *   GridController grid(settings, source, view);
 *   grid.start();
 *   grid.set_viewport_size(800, 600);
 *   grid.set_results(provider.scan());
 *   // from the UI timer:
 *   grid.tick();
 * @endcode
 */

namespace thumbgrid {

class ThumbnailSource;

enum class SlotState {
    Hidden,     ///< No result bound (past the end of the results)
    Loading,    ///< Placeholder while the thumbnail is generated or scrolling is active
    Ready,      ///< Image bytes bound
    Unavailable ///< Generation failed
};

const char* slot_state_name(SlotState state);

struct GridSlot {
    int index = -1; ///< Result index, -1 when hidden
    SlotState state = SlotState::Hidden;

    // Card rectangle in content coordinates (padding already applied)
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    std::string display_path;
    std::string label; ///< Ellipsized display path
    CacheKey key;
    ThumbnailData image; ///< Non-null only when Ready

    bool operator==(const GridSlot& o) const {
        return index == o.index && state == o.state && x == o.x && y == o.y &&
               width == o.width && height == o.height && image == o.image && key == o.key &&
               label == o.label && display_path == o.display_path;
    }
    bool operator!=(const GridSlot& o) const {
        return !(*this == o);
    }
};

/**
 * @brief Receiver of slot changes (the widget layer)
 */
class GridSlotPresenter {
  public:
    virtual ~GridSlotPresenter() = default;

    /// Pool size or content height changed. All slots start hidden after this call.
    virtual void on_layout_changed(int slot_count, int64_t content_height_px) = 0;

    /// Slot content changed
    virtual void on_slot_updated(int slot_index, const GridSlot& slot) = 0;

    /// A new result set replaced the old one; scroll position was reset to the top
    virtual void on_results_replaced(int item_count) {
        (void)item_count;
    }
};

/// Pixel width of a label string
using TextMeasureFn = std::function<int(const std::string&)>;

struct GridStats {
    ThumbnailStats thumbnails;
    uint64_t render_passes = 0;
    uint64_t render_skips = 0;
    uint64_t slot_updates = 0;
    uint64_t prefetch_requests = 0;
};

class GridController {
  public:
    static constexpr const char* ELLIPSIS = "...";

    GridController(const GridSettings& settings, ThumbnailSource& source,
                   GridSlotPresenter& presenter, NowFn now = steady_now,
                   TextMeasureFn measure = nullptr);
    ~GridController();

    // Non-copyable
    GridController(const GridController&) = delete;
    GridController& operator=(const GridController&) = delete;

    /// Start background generation
    void start();

    /// Stop background generation. Logs final statistics.
    void shutdown();

    // Events. Each schedules a render; none renders synchronously.

    /// Replace the result set. Resets scroll to the top.
    void set_results(std::vector<ResultItem> results);
    void set_viewport_size(int width_px, int height_px);
    void set_scroll_offset(int scroll_offset_px);
    /// User scroll input (wheel, drag). Suppresses image swaps until scrolling settles.
    void on_scroll_input();

    /**
     * @brief Drive timers: completion polling, scroll settle, pending render
     *
     * Call from the UI loop at least as often as the poll interval.
     */
    void tick();

    /**
     * @brief Run one render pass now
     *
     * Normally invoked by the scheduler from tick(). Skips all work when nothing that affects
     * the visible slots changed since the previous pass.
     */
    void render();

    /// Result index at content coordinates, or -1
    [[nodiscard]] int index_at(int x, int content_y) const;

    /// nullptr if out of range
    [[nodiscard]] const ResultItem* item(int index) const;

    /// Shorten text from the left with "..." to fit max_px. Memoized.
    std::string ellipsize_left(const std::string& text, int max_px);

    [[nodiscard]] const std::vector<ResultItem>& results() const {
        return results_;
    }
    [[nodiscard]] const std::vector<GridSlot>& slots() const {
        return slots_;
    }
    [[nodiscard]] const ViewportLayout& layout() const {
        return layout_;
    }
    [[nodiscard]] const CardGeometry& card() const {
        return card_;
    }
    [[nodiscard]] const GridSettings& settings() const {
        return settings_;
    }
    [[nodiscard]] int scroll_offset() const {
        return scroll_offset_;
    }
    [[nodiscard]] GridStats stats() const;

    ThumbnailService& thumbnails() {
        return service_;
    }
    ThumbnailPipeline& pipeline() {
        return pipeline_;
    }
    DiskThumbnailCache& disk_cache() {
        return disk_;
    }
    RenderScheduler& scheduler() {
        return scheduler_;
    }
    ScrollActivityTracker& scroll_tracker() {
        return tracker_;
    }

  private:
    /// Inputs of a render pass; an unchanged key means the slots are already correct
    struct RenderKey {
        int first_row = -1;
        int columns = 0;
        int visible_rows = 0;
        int card_width = 0;
        int item_count = 0;
        bool scroll_active = false;

        bool operator==(const RenderKey& o) const {
            return first_row == o.first_row && columns == o.columns &&
                   visible_rows == o.visible_rows && card_width == o.card_width &&
                   item_count == o.item_count && scroll_active == o.scroll_active;
        }
        bool operator!=(const RenderKey& o) const {
            return !(*this == o);
        }
    };

    ViewportInput viewport_input() const;
    GridSlot resolve_slot(int slot_index, const ViewportLayout& layout, bool scrolling);
    void prefetch(const ViewportLayout& layout);
    void invalidate_render_key();

    GridSettings settings_;
    CardGeometry card_;
    GridSlotPresenter& presenter_;
    NowFn now_;
    TextMeasureFn measure_;

    DiskThumbnailCache disk_;
    ThumbnailPipeline pipeline_;
    ThumbnailService service_;
    RenderScheduler scheduler_;
    ScrollActivityTracker tracker_;

    std::vector<ResultItem> results_;
    std::vector<GridSlot> slots_;
    ViewportLayout layout_;

    int viewport_width_ = 0;
    int viewport_height_ = 0;
    int scroll_offset_ = 0;

    RenderKey last_key_;
    bool have_key_ = false;
    bool content_dirty_ = true;
    TimePoint next_poll_{};

    LruCache<std::string, std::string> label_cache_;

    uint64_t render_passes_ = 0;
    uint64_t render_skips_ = 0;
    uint64_t slot_updates_ = 0;
    uint64_t prefetch_requests_ = 0;
};

} // namespace thumbgrid
