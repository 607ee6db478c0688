// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_thumbnail_grid_view.h"

#include "lvgl_image_codec.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>

namespace thumbgrid::ui {

namespace {

constexpr uint32_t CARD_BG_COLOR = 0x2a2d33;
constexpr uint32_t PREVIEW_BG_COLOR = 0x1c1e22;
constexpr uint32_t TEXT_COLOR = 0xd8dadf;
constexpr uint32_t MUTED_TEXT_COLOR = 0x8a8f98;
constexpr int CARD_RADIUS = 6;

} // namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

ThumbnailGridView::ThumbnailGridView() {
    spdlog::trace("[ThumbnailGridView] Constructed");
}

ThumbnailGridView::~ThumbnailGridView() {
    detach();
    if (lv_is_initialized()) {
        destroy_cards();
        if (container_) {
            lv_obj_delete(container_);
        }
    }
    container_ = nullptr;
    spacer_ = nullptr;
    // Note: Don't log here - may run after spdlog teardown at exit
}

// ============================================================================
// Setup
// ============================================================================

bool ThumbnailGridView::setup(lv_obj_t* parent, CardActivateCallback on_activate) {
    if (!parent) {
        spdlog::error("[ThumbnailGridView] Cannot setup - null parent");
        return false;
    }

    on_activate_ = std::move(on_activate);
    label_font_ = LV_FONT_DEFAULT;

    container_ = lv_obj_create(parent);
    lv_obj_set_size(container_, lv_pct(100), lv_pct(100));
    lv_obj_set_style_pad_all(container_, 0, LV_PART_MAIN);
    lv_obj_set_style_border_width(container_, 0, LV_PART_MAIN);
    lv_obj_set_style_radius(container_, 0, LV_PART_MAIN);
    lv_obj_set_style_bg_color(container_, lv_color_hex(PREVIEW_BG_COLOR), LV_PART_MAIN);
    lv_obj_set_scroll_dir(container_, LV_DIR_VER);
    lv_obj_add_flag(container_, LV_OBJ_FLAG_SCROLLABLE);
    lv_obj_add_event_cb(container_, on_scroll, LV_EVENT_SCROLL, this);
    lv_obj_add_event_cb(container_, on_size_changed, LV_EVENT_SIZE_CHANGED, this);
    lv_obj_add_event_cb(container_, on_container_deleted, LV_EVENT_DELETE, this);

    // Spacer defines the scrollable extent; cards are positioned over it
    spacer_ = lv_obj_create(container_);
    lv_obj_remove_style_all(spacer_);
    lv_obj_remove_flag(spacer_, LV_OBJ_FLAG_CLICKABLE);
    lv_obj_set_pos(spacer_, 0, 0);
    lv_obj_set_size(spacer_, 1, 0);

    spdlog::trace("[ThumbnailGridView] Setup complete");
    return true;
}

void ThumbnailGridView::attach(GridController& controller) {
    controller_ = &controller;
    if (!container_) {
        spdlog::error("[ThumbnailGridView] attach() before setup()");
        return;
    }

    if (!timer_) {
        timer_ = lv_timer_create(on_timer, TICK_PERIOD_MS, this);
        if (!timer_) {
            spdlog::error("[ThumbnailGridView] Failed to create tick timer");
        }
    }

    lv_obj_update_layout(container_);
    controller_->set_viewport_size(lv_obj_get_content_width(container_),
                                   lv_obj_get_content_height(container_));
}

void ThumbnailGridView::detach() {
    if (timer_ && lv_is_initialized()) {
        lv_timer_delete(timer_);
    }
    timer_ = nullptr;
    controller_ = nullptr;
}

TextMeasureFn ThumbnailGridView::text_measure() const {
    const lv_font_t* font = label_font_;
    if (!font) {
        return nullptr;
    }
    return [font](const std::string& text) {
        lv_point_t size;
        lv_text_get_size(&size, text.c_str(), font, 0, 0, LV_COORD_MAX, LV_TEXT_FLAG_NONE);
        return static_cast<int>(size.x);
    };
}

// ============================================================================
// Card pool
// ============================================================================

ThumbnailGridView::CardWidgets* ThumbnailGridView::create_card() {
    const CardGeometry& g = controller_->card();
    auto w = std::make_unique<CardWidgets>();

    w->card = lv_obj_create(container_);
    lv_obj_remove_flag(w->card, LV_OBJ_FLAG_SCROLLABLE);
    lv_obj_add_flag(w->card, LV_OBJ_FLAG_HIDDEN);
    lv_obj_set_style_pad_all(w->card, 0, LV_PART_MAIN);
    lv_obj_set_style_border_width(w->card, 0, LV_PART_MAIN);
    lv_obj_set_style_radius(w->card, CARD_RADIUS, LV_PART_MAIN);
    lv_obj_set_style_bg_color(w->card, lv_color_hex(CARD_BG_COLOR), LV_PART_MAIN);
    lv_obj_add_event_cb(w->card, on_card_clicked, LV_EVENT_CLICKED, this);

    w->image = lv_image_create(w->card);
    lv_obj_set_size(w->image, g.preview_width, g.preview_height);
    lv_obj_align(w->image, LV_ALIGN_TOP_MID, 0, g.padding);
    lv_image_set_inner_align(w->image, LV_IMAGE_ALIGN_CENTER);
    lv_obj_remove_flag(w->image, LV_OBJ_FLAG_CLICKABLE);
    lv_obj_add_flag(w->image, LV_OBJ_FLAG_HIDDEN);

    w->placeholder = lv_label_create(w->card);
    lv_label_set_text(w->placeholder, LOADING_TEXT);
    lv_obj_set_style_text_color(w->placeholder, lv_color_hex(MUTED_TEXT_COLOR), LV_PART_MAIN);
    lv_obj_align(w->placeholder, LV_ALIGN_TOP_MID, 0, g.padding + g.preview_height / 2 - 8);

    w->label = lv_label_create(w->card);
    lv_label_set_long_mode(w->label, LV_LABEL_LONG_CLIP);
    lv_obj_set_width(w->label, g.label_width);
    lv_obj_set_style_text_font(w->label, label_font_, LV_PART_MAIN);
    lv_obj_set_style_text_color(w->label, lv_color_hex(TEXT_COLOR), LV_PART_MAIN);
    lv_obj_align(w->label, LV_ALIGN_BOTTOM_MID, 0, -g.padding);

    cards_.push_back(std::move(w));
    return cards_.back().get();
}

void ThumbnailGridView::destroy_cards() {
    for (auto& w : cards_) {
        clear_image(*w);
        if (w->card) {
            lv_obj_delete(w->card);
        }
    }
    cards_.clear();
}

void ThumbnailGridView::clear_image(CardWidgets& w) {
    if (!w.bytes) {
        return;
    }
    lv_image_set_src(w.image, nullptr);
    lv_image_cache_drop(&w.dsc);
    std::memset(&w.dsc, 0, sizeof(w.dsc));
    w.bytes.reset();
}

void ThumbnailGridView::show_image(CardWidgets& w, const ThumbnailData& bytes) {
    if (w.bytes == bytes) {
        return;
    }

    LvglBinInfo info;
    if (!bytes || !read_lvgl_bin_header(*bytes, info)) {
        spdlog::warn("[ThumbnailGridView] Ignoring malformed thumbnail image");
        clear_image(w);
        return;
    }

    clear_image(w);
    w.bytes = bytes;
    w.dsc.header.magic = LV_IMAGE_HEADER_MAGIC;
    w.dsc.header.cf = info.color_format;
    w.dsc.header.w = static_cast<uint32_t>(info.width);
    w.dsc.header.h = static_cast<uint32_t>(info.height);
    w.dsc.header.stride = static_cast<uint32_t>(info.stride);
    w.dsc.data_size = static_cast<uint32_t>(info.stride) * static_cast<uint32_t>(info.height);
    w.dsc.data = bytes->data() + LVGL_BIN_HEADER_SIZE;
    lv_image_set_src(w.image, &w.dsc);
}

// ============================================================================
// GridSlotPresenter
// ============================================================================

void ThumbnailGridView::on_layout_changed(int slot_count, int64_t content_height_px) {
    if (!container_ || !controller_) {
        return;
    }

    const size_t wanted = static_cast<size_t>(std::max(slot_count, 0));
    while (cards_.size() > wanted) {
        clear_image(*cards_.back());
        lv_obj_delete(cards_.back()->card);
        cards_.pop_back();
    }
    while (cards_.size() < wanted) {
        create_card();
    }
    for (auto& w : cards_) {
        clear_image(*w);
        w->result_index = -1;
        lv_obj_add_flag(w->card, LV_OBJ_FLAG_HIDDEN);
    }

    const int64_t height = std::min<int64_t>(content_height_px, LV_COORD_MAX);
    lv_obj_set_height(spacer_, static_cast<int32_t>(height));

    spdlog::debug("[ThumbnailGridView] Pool {} cards, content height {}", cards_.size(),
                  content_height_px);
}

void ThumbnailGridView::on_slot_updated(int slot_index, const GridSlot& slot) {
    if (slot_index < 0 || static_cast<size_t>(slot_index) >= cards_.size()) {
        return;
    }
    CardWidgets& w = *cards_[static_cast<size_t>(slot_index)];

    if (slot.state == SlotState::Hidden) {
        clear_image(w);
        w.result_index = -1;
        lv_obj_add_flag(w.card, LV_OBJ_FLAG_HIDDEN);
        return;
    }

    w.result_index = slot.index;
    lv_obj_set_pos(w.card, slot.x, slot.y);
    lv_obj_set_size(w.card, slot.width, slot.height);
    lv_label_set_text(w.label, slot.label.c_str());

    switch (slot.state) {
    case SlotState::Ready:
        show_image(w, slot.image);
        lv_obj_remove_flag(w.image, LV_OBJ_FLAG_HIDDEN);
        lv_obj_add_flag(w.placeholder, LV_OBJ_FLAG_HIDDEN);
        break;
    case SlotState::Loading:
    case SlotState::Unavailable:
        clear_image(w);
        lv_obj_add_flag(w.image, LV_OBJ_FLAG_HIDDEN);
        lv_label_set_text(w.placeholder,
                          slot.state == SlotState::Loading ? LOADING_TEXT : UNAVAILABLE_TEXT);
        lv_obj_remove_flag(w.placeholder, LV_OBJ_FLAG_HIDDEN);
        break;
    case SlotState::Hidden:
        break;
    }

    lv_obj_remove_flag(w.card, LV_OBJ_FLAG_HIDDEN);
}

void ThumbnailGridView::on_results_replaced(int item_count) {
    if (!container_) {
        return;
    }
    programmatic_scroll_ = true;
    lv_obj_scroll_to_y(container_, 0, LV_ANIM_OFF);
    programmatic_scroll_ = false;
    spdlog::trace("[ThumbnailGridView] Results replaced ({} items)", item_count);
}

// ============================================================================
// LVGL callbacks
// ============================================================================

void ThumbnailGridView::on_timer(lv_timer_t* timer) {
    auto* self = static_cast<ThumbnailGridView*>(lv_timer_get_user_data(timer));
    if (self && self->controller_) {
        self->controller_->tick();
    }
}

// Closing the window deletes the screen with everything on it
void ThumbnailGridView::on_container_deleted(lv_event_t* e) {
    auto* self = static_cast<ThumbnailGridView*>(lv_event_get_user_data(e));
    if (!self) {
        return;
    }
    for (auto& w : self->cards_) {
        if (w->bytes) {
            lv_image_cache_drop(&w->dsc);
        }
    }
    self->cards_.clear();
    self->container_ = nullptr;
    self->spacer_ = nullptr;
}

void ThumbnailGridView::on_scroll(lv_event_t* e) {
    auto* self = static_cast<ThumbnailGridView*>(lv_event_get_user_data(e));
    if (!self || !self->controller_) {
        return;
    }
    if (!self->programmatic_scroll_) {
        self->controller_->on_scroll_input();
    }
    self->controller_->set_scroll_offset(lv_obj_get_scroll_y(self->container_));
}

void ThumbnailGridView::on_size_changed(lv_event_t* e) {
    auto* self = static_cast<ThumbnailGridView*>(lv_event_get_user_data(e));
    if (!self || !self->controller_) {
        return;
    }
    self->controller_->set_viewport_size(lv_obj_get_content_width(self->container_),
                                         lv_obj_get_content_height(self->container_));
}

void ThumbnailGridView::on_card_clicked(lv_event_t* e) {
    auto* self = static_cast<ThumbnailGridView*>(lv_event_get_user_data(e));
    auto* card = static_cast<lv_obj_t*>(lv_event_get_current_target(e));
    if (!self || !card || !self->on_activate_) {
        return;
    }

    for (const auto& w : self->cards_) {
        if (w->card == card && w->result_index >= 0) {
            self->on_activate_(w->result_index);
            return;
        }
    }
}

} // namespace thumbgrid::ui
