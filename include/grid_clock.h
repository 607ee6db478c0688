// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <functional>

namespace thumbgrid {

using GridClock = std::chrono::steady_clock;
using TimePoint = GridClock::time_point;
using Millis = std::chrono::milliseconds;

/// Injected time source so timers can be driven by tests
using NowFn = std::function<TimePoint()>;

inline TimePoint steady_now() {
    return GridClock::now();
}

} // namespace thumbgrid
