// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "scroll_activity_tracker.h"

#include "test_helpers/thumbgrid_test_support.h"

#include <catch2/catch_all.hpp>

using namespace thumbgrid;
using thumbgrid::test::ManualClock;

TEST_CASE("ScrollActivityTracker: idle after the timeout without input", "[grid][scroll]") {
    ManualClock clock;
    int idle_calls = 0;
    ScrollActivityTracker tracker([&]() { ++idle_calls; }, Millis(540), clock.fn());

    REQUIRE_FALSE(tracker.is_active());
    tracker.mark_scroll_active();
    REQUIRE(tracker.is_active());

    clock.advance(Millis(539));
    REQUIRE_FALSE(tracker.tick());
    REQUIRE(tracker.is_active());

    clock.advance(Millis(1));
    REQUIRE(tracker.tick());
    REQUIRE_FALSE(tracker.is_active());
    REQUIRE(idle_calls == 1);

    // Only the transition fires the callback
    clock.advance(Millis(1000));
    REQUIRE_FALSE(tracker.tick());
    REQUIRE(idle_calls == 1);
}

TEST_CASE("ScrollActivityTracker: new input restarts the timeout", "[grid][scroll]") {
    ManualClock clock;
    int idle_calls = 0;
    ScrollActivityTracker tracker([&]() { ++idle_calls; }, Millis(540), clock.fn());

    tracker.mark_scroll_active();
    for (int i = 0; i < 10; ++i) {
        clock.advance(Millis(300));
        tracker.mark_scroll_active();
        REQUIRE_FALSE(tracker.tick());
    }
    REQUIRE(idle_calls == 0);

    clock.advance(Millis(540));
    REQUIRE(tracker.tick());
    REQUIRE(idle_calls == 1);
}

TEST_CASE("ScrollActivityTracker: tick while idle does nothing", "[grid][scroll]") {
    ManualClock clock;
    int idle_calls = 0;
    ScrollActivityTracker tracker([&]() { ++idle_calls; }, Millis(540), clock.fn());

    REQUIRE_FALSE(tracker.tick());
    REQUIRE(tracker.state() == ScrollActivityTracker::State::Idle);
    REQUIRE(idle_calls == 0);
}
