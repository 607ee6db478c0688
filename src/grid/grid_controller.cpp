// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "grid_controller.h"

#include "thumbnail_source.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace thumbgrid {

namespace {

// Fallback when no font metrics are available: fixed advance per UTF-8 code point
constexpr int DEFAULT_GLYPH_WIDTH_PX = 7;

int estimate_text_width(const std::string& text) {
    int glyphs = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++glyphs;
        }
    }
    return glyphs * DEFAULT_GLYPH_WIDTH_PX;
}

bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

PipelineConfig make_pipeline_config(const GridSettings& s) {
    PipelineConfig cfg;
    cfg.worker_count = s.worker_threads;
    cfg.request_queue_limit = s.request_queue_limit;
    cfg.target_size = s.target_size;
    cfg.target = ThumbnailTarget::for_size(s.target_size, s.aspect_width, s.aspect_height);
    return cfg;
}

} // namespace

const char* slot_state_name(SlotState state) {
    switch (state) {
    case SlotState::Hidden:
        return "hidden";
    case SlotState::Loading:
        return "loading";
    case SlotState::Ready:
        return "ready";
    case SlotState::Unavailable:
        return "unavailable";
    }
    return "unknown";
}

GridController::GridController(const GridSettings& settings, ThumbnailSource& source,
                               GridSlotPresenter& presenter, NowFn now, TextMeasureFn measure)
    : settings_(settings), card_(CardGeometry::from_width(settings.card_width,
                                                          settings.card_padding)),
      presenter_(presenter), now_(std::move(now)),
      measure_(measure ? std::move(measure) : TextMeasureFn(estimate_text_width)),
      disk_(settings.disk_enabled ? DiskThumbnailCache::resolve_cache_dir(settings.cache_directory)
                                  : std::string(),
            settings.disk_enabled),
      pipeline_(disk_, source, make_pipeline_config(settings)),
      service_(pipeline_, settings.memory_capacity),
      scheduler_([this]() { render(); },
                 RenderScheduler::Settings{Millis(settings.render_min_interval_ms),
                                           Millis(settings.render_max_deferral_ms)},
                 now_),
      tracker_([this]() { scheduler_.schedule_render(Millis(1)); },
               Millis(settings.scroll_idle_ms), now_),
      label_cache_(settings.label_cache_capacity) {
    spdlog::debug("[GridController] Card {}x{} (preview {}x{}), thumbnails {}px",
                  card_.card_width, card_.card_height, card_.preview_width, card_.preview_height,
                  settings_.target_size);
}

GridController::~GridController() {
    pipeline_.shutdown();
}

void GridController::start() {
    pipeline_.start();
    next_poll_ = now_();
}

void GridController::shutdown() {
    pipeline_.shutdown();
    const GridStats s = stats();
    spdlog::debug("[GridController] Stats: renders={} skipped={} slot updates={} memory "
                  "hits={} misses={} queued={} deduplicated={} prefetched={} delivered={} "
                  "failed={}",
                  s.render_passes, s.render_skips, s.slot_updates, s.thumbnails.memory_hits,
                  s.thumbnails.memory_misses, s.thumbnails.requests_queued,
                  s.thumbnails.requests_deduplicated, s.prefetch_requests,
                  s.thumbnails.completions_delivered, s.thumbnails.completions_failed);
}

// ============================================================================
// Events
// ============================================================================

void GridController::set_results(std::vector<ResultItem> results) {
    results_ = std::move(results);
    for (size_t i = 0; i < results_.size(); ++i) {
        results_[i].index = static_cast<int>(i);
    }
    scroll_offset_ = 0;
    service_.clear_failures();
    invalidate_render_key();

    spdlog::debug("[GridController] {} results", results_.size());
    presenter_.on_results_replaced(static_cast<int>(results_.size()));
    scheduler_.schedule_render(Millis(0));
}

void GridController::set_viewport_size(int width_px, int height_px) {
    width_px = std::max(width_px, 0);
    height_px = std::max(height_px, 0);
    if (width_px == viewport_width_ && height_px == viewport_height_) {
        return;
    }
    viewport_width_ = width_px;
    viewport_height_ = height_px;
    invalidate_render_key();
    scheduler_.schedule_render(Millis(settings_.resize_delay_ms));
}

void GridController::set_scroll_offset(int scroll_offset_px) {
    scroll_offset_px = std::max(scroll_offset_px, 0);
    if (scroll_offset_px == scroll_offset_) {
        return;
    }
    scroll_offset_ = scroll_offset_px;
    scheduler_.schedule_render(Millis(1));
}

void GridController::on_scroll_input() {
    tracker_.mark_scroll_active();
    scheduler_.schedule_render(Millis(16));
}

void GridController::tick() {
    const TimePoint now = now_();
    if (now >= next_poll_) {
        next_poll_ = now + Millis(settings_.poll_interval_ms);
        if (service_.poll_completions(settings_.poll_batch) > 0) {
            content_dirty_ = true;
            scheduler_.schedule_render(Millis(0));
        }
    }
    tracker_.tick();
    scheduler_.tick();
}

void GridController::invalidate_render_key() {
    have_key_ = false;
    content_dirty_ = true;
}

// ============================================================================
// Render pass
// ============================================================================

ViewportInput GridController::viewport_input() const {
    ViewportInput in;
    in.scroll_offset_px = scroll_offset_;
    in.viewport_width_px = viewport_width_;
    in.viewport_height_px = viewport_height_;
    in.item_count = static_cast<int>(results_.size());
    in.card_width_px = card_.card_width;
    in.card_height_px = card_.card_height;
    in.overscan_rows = settings_.overscan_rows;
    return in;
}

void GridController::render() {
    ++render_passes_;

    // Completions are cheap to merge and may change what the slots should show
    if (service_.poll_completions(settings_.poll_batch) > 0) {
        content_dirty_ = true;
    }

    const ViewportLayout layout = viewport::compute(viewport_input());
    const bool scrolling = tracker_.is_active();

    RenderKey key;
    key.first_row = layout.first_visible_row;
    key.columns = layout.columns;
    key.visible_rows = layout.visible_row_count;
    key.card_width = card_.card_width;
    key.item_count = static_cast<int>(results_.size());
    key.scroll_active = scrolling;

    const bool key_changed = !have_key_ || key != last_key_;
    if (!key_changed && !content_dirty_) {
        ++render_skips_;
        return;
    }

    // A different set of visible rows is a new visibility pass: failed keys may retry
    if (key_changed) {
        service_.clear_failures();
    }
    last_key_ = key;
    have_key_ = true;
    content_dirty_ = false;

    const size_t slot_count = static_cast<size_t>(layout.slot_count());
    const bool pool_changed = slot_count != slots_.size();
    if (pool_changed || layout.virtual_content_height_px != layout_.virtual_content_height_px) {
        // The presenter hides every card on a layout change, so every slot is pushed again
        slots_.assign(slot_count, GridSlot{});
        if (pool_changed) {
            spdlog::debug("[GridController] Slot pool: {} columns x {} rows", layout.columns,
                          layout.visible_row_count);
        }
        presenter_.on_layout_changed(static_cast<int>(slot_count),
                                     layout.virtual_content_height_px);
    }
    layout_ = layout;

    for (size_t i = 0; i < slots_.size(); ++i) {
        GridSlot next = resolve_slot(static_cast<int>(i), layout, scrolling);
        if (next != slots_[i]) {
            slots_[i] = std::move(next);
            ++slot_updates_;
            presenter_.on_slot_updated(static_cast<int>(i), slots_[i]);
        }
    }

    if (!scrolling) {
        prefetch(layout);
    }
}

GridSlot GridController::resolve_slot(int slot_index, const ViewportLayout& layout,
                                      bool scrolling) {
    GridSlot next;
    const int index = layout.first_index() + slot_index;
    if (index < 0 || index >= static_cast<int>(results_.size())) {
        return next;
    }

    const ResultItem& item = results_[static_cast<size_t>(index)];
    const int row = slot_index / layout.columns;
    const int col = slot_index % layout.columns;

    next.index = index;
    next.x = col * card_.card_width + card_.padding;
    next.y = (layout.first_visible_row + row) * card_.card_height + card_.padding;
    next.width = card_.card_width - 2 * card_.padding;
    next.height = card_.card_height - 2 * card_.padding;
    next.display_path = item.display_path;
    next.label = ellipsize_left(item.display_path, card_.label_width);
    next.key = service_.key_for(item);

    if (scrolling) {
        // Keep what is already on screen for this key, never swap in new bytes
        const GridSlot& current = slots_[static_cast<size_t>(slot_index)];
        if (current.state == SlotState::Ready && current.key == next.key) {
            next.state = SlotState::Ready;
            next.image = current.image;
        } else {
            next.state = SlotState::Loading;
        }
        return next;
    }

    if (ThumbnailData image = service_.lookup(next.key)) {
        next.state = SlotState::Ready;
        next.image = std::move(image);
        return next;
    }

    switch (service_.request(item)) {
    case RequestOutcome::Failed:
        next.state = SlotState::Unavailable;
        break;
    case RequestOutcome::Cached:
    case RequestOutcome::AlreadyInflight:
    case RequestOutcome::Queued:
    case RequestOutcome::Rejected:
        next.state = SlotState::Loading;
        break;
    }
    return next;
}

void GridController::prefetch(const ViewportLayout& layout) {
    int budget = settings_.prefetch_budget;
    if (budget <= 0 || settings_.prefetch_rows <= 0 || results_.empty()) {
        return;
    }

    const int count = static_cast<int>(results_.size());
    const int cols = layout.columns;
    const int visible_begin = std::min(count, layout.first_index());
    const int visible_end = std::min(count, visible_begin + layout.slot_count());
    const int ahead_end =
        std::min(count, (layout.first_visible_row + layout.visible_row_count +
                         settings_.prefetch_rows) *
                            cols);
    const int behind_begin =
        std::max(0, (layout.first_visible_row - settings_.prefetch_rows) * cols);

    // Rows below the viewport first (the usual scroll direction), then rows above it
    auto issue = [&](int begin, int end) {
        for (int i = begin; i < end && budget > 0; ++i) {
            switch (service_.request(results_[static_cast<size_t>(i)])) {
            case RequestOutcome::Queued:
                --budget;
                ++prefetch_requests_;
                break;
            case RequestOutcome::Rejected:
                // Queue full: excess prefetches are simply not issued
                budget = 0;
                break;
            case RequestOutcome::Cached:
            case RequestOutcome::AlreadyInflight:
            case RequestOutcome::Failed:
                break;
            }
        }
    };
    issue(visible_end, ahead_end);
    issue(behind_begin, visible_begin);
}

// ============================================================================
// Queries
// ============================================================================

int GridController::index_at(int x, int content_y) const {
    return viewport::index_at(viewport_input(), x, content_y);
}

const ResultItem* GridController::item(int index) const {
    if (index < 0 || index >= static_cast<int>(results_.size())) {
        return nullptr;
    }
    return &results_[static_cast<size_t>(index)];
}

std::string GridController::ellipsize_left(const std::string& text, int max_px) {
    const std::string cache_key = std::to_string(max_px) + '|' + text;
    if (const std::string* hit = label_cache_.get(cache_key)) {
        return *hit;
    }

    std::string result;
    if (max_px <= 0) {
        result.clear();
    } else if (measure_(text) <= max_px) {
        result = text;
    } else {
        // Binary search the shortest cut (longest suffix) that still fits after "..."
        size_t lo = 1;
        size_t hi = text.size();
        while (lo < hi) {
            size_t mid = lo + (hi - lo) / 2;
            if (measure_(ELLIPSIS + text.substr(mid)) <= max_px) {
                hi = mid;
            } else {
                lo = mid + 1;
            }
        }
        size_t cut = lo;
        while (cut < text.size() && is_utf8_continuation(text[cut])) {
            ++cut;
        }
        result = ELLIPSIS + text.substr(cut);
    }

    label_cache_.put(cache_key, result);
    return result;
}

GridStats GridController::stats() const {
    GridStats s;
    s.thumbnails = service_.stats();
    s.render_passes = render_passes_;
    s.render_skips = render_skips_;
    s.slot_updates = slot_updates_;
    s.prefetch_requests = prefetch_requests_;
    return s;
}

} // namespace thumbgrid
