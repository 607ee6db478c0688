// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "render_scheduler.h"

#include <algorithm>
#include <utility>

namespace thumbgrid {

RenderScheduler::RenderScheduler(std::function<void()> render, Settings settings, NowFn now)
    : render_(std::move(render)), settings_(settings), now_(std::move(now)) {}

void RenderScheduler::schedule_render(Millis min_delay) {
    const TimePoint now = now_();
    if (min_delay <= Millis(1)) {
        min_delay = Millis(0);
    }

    TimePoint target = now + min_delay;
    const TimePoint earliest = has_rendered_ ? last_render_ + settings_.min_interval : now;
    target = std::max(target, earliest);

    if (!pending_) {
        batch_started_ = now;
    } else {
        // Re-arming must not postpone a batch indefinitely
        const TimePoint cap = std::max(batch_started_ + settings_.max_deferral, earliest);
        target = std::min(target, cap);
    }

    pending_ = true;
    deadline_ = target;
}

bool RenderScheduler::tick() {
    if (!pending_) {
        return false;
    }
    const TimePoint now = now_();
    if (now < deadline_) {
        return false;
    }

    // Clear state first so the callback may schedule the next render
    pending_ = false;
    has_rendered_ = true;
    last_render_ = now;
    ++render_count_;

    if (render_) {
        render_();
    }
    return true;
}

void RenderScheduler::cancel() {
    pending_ = false;
}

Millis RenderScheduler::time_until_due() const {
    if (!pending_) {
        return Millis(0);
    }
    const TimePoint now = now_();
    if (now >= deadline_) {
        return Millis(0);
    }
    return std::chrono::duration_cast<Millis>(deadline_ - now);
}

} // namespace thumbgrid
