// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "grid_clock.h"

#include <functional>

namespace thumbgrid {

/**
 * @brief Idle/Active scroll state with a quiet-period timer
 *
 * Any scroll input moves the tracker to Active and re-arms the idle deadline. When tick()
 * observes that the deadline has passed it returns to Idle and invokes on_idle exactly once
 * for that scroll burst. While Active, the grid keeps showing whatever each slot already
 * shows and does not start new thumbnail work.
 */
class ScrollActivityTracker {
  public:
    enum class State { Idle, Active };

    static constexpr Millis DEFAULT_IDLE_TIMEOUT{540};

    explicit ScrollActivityTracker(std::function<void()> on_idle,
                                   Millis idle_timeout = DEFAULT_IDLE_TIMEOUT,
                                   NowFn now = steady_now);

    void mark_scroll_active();

    /// @return true if this call performed the Active -> Idle transition
    bool tick();

    [[nodiscard]] bool is_active() const {
        return state_ == State::Active;
    }
    [[nodiscard]] State state() const {
        return state_;
    }
    [[nodiscard]] Millis idle_timeout() const {
        return idle_timeout_;
    }

  private:
    std::function<void()> on_idle_;
    Millis idle_timeout_;
    NowFn now_;

    State state_ = State::Idle;
    TimePoint idle_deadline_{};
};

} // namespace thumbgrid
