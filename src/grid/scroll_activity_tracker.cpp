// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "scroll_activity_tracker.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace thumbgrid {

ScrollActivityTracker::ScrollActivityTracker(std::function<void()> on_idle, Millis idle_timeout,
                                             NowFn now)
    : on_idle_(std::move(on_idle)), idle_timeout_(idle_timeout), now_(std::move(now)) {}

void ScrollActivityTracker::mark_scroll_active() {
    if (state_ == State::Idle) {
        spdlog::trace("[ScrollActivityTracker] Scrolling started");
    }
    state_ = State::Active;
    idle_deadline_ = now_() + idle_timeout_;
}

bool ScrollActivityTracker::tick() {
    if (state_ != State::Active || now_() < idle_deadline_) {
        return false;
    }

    state_ = State::Idle;
    spdlog::trace("[ScrollActivityTracker] Scrolling settled");
    if (on_idle_) {
        on_idle_();
    }
    return true;
}

} // namespace thumbgrid
