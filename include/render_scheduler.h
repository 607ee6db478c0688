// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "grid_clock.h"

#include <cstdint>
#include <functional>

/**
 * @file render_scheduler.h
 * @brief Coalescing, rate-limited render trigger
 *
 * Any number of schedule_render() calls collapse into one pending render. The deadline is
 *
 *   max(now + min_delay, last_render + min_interval)
 *
 * and each call re-arms it (the most recent trigger wins). Re-arming can push a pending
 * render later, but never more than max_deferral past the first trigger of the batch, so a
 * steady stream of triggers cannot starve rendering.
 *
 * The scheduler owns no timer: the owner calls tick() from its loop and the render callback
 * runs inside tick() when the deadline has passed.
 */

namespace thumbgrid {

class RenderScheduler {
  public:
    struct Settings {
        Millis min_interval{33}; ///< ~30 renders per second
        Millis max_deferral{250};
    };

    RenderScheduler(std::function<void()> render, Settings settings, NowFn now = steady_now);

    /// Request a render no sooner than min_delay from now. Delays <= 1 ms mean "immediately".
    void schedule_render(Millis min_delay);

    /**
     * @brief Fire the pending render if its deadline has passed
     * @return true if the render callback ran
     */
    bool tick();

    /// Drop the pending render, if any
    void cancel();

    [[nodiscard]] bool has_pending() const {
        return pending_;
    }
    [[nodiscard]] TimePoint deadline() const {
        return deadline_;
    }
    /// Time until the pending render is due (zero if due or nothing pending)
    [[nodiscard]] Millis time_until_due() const;
    [[nodiscard]] uint64_t render_count() const {
        return render_count_;
    }

  private:
    std::function<void()> render_;
    Settings settings_;
    NowFn now_;

    bool pending_ = false;
    TimePoint deadline_{};
    TimePoint batch_started_{};
    bool has_rendered_ = false;
    TimePoint last_render_{};
    uint64_t render_count_ = 0;
};

} // namespace thumbgrid
