// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "channel.h"

#include <catch2/catch_all.hpp>

#include <thread>
#include <vector>

using namespace thumbgrid;

TEST_CASE("Channel: FIFO order", "[channel]") {
    Channel<int> ch;
    for (int i = 0; i < 5; ++i) {
        REQUIRE(ch.try_push(i));
    }
    int v = -1;
    for (int i = 0; i < 5; ++i) {
        REQUIRE(ch.try_pop(v));
        REQUIRE(v == i);
    }
    REQUIRE_FALSE(ch.try_pop(v));
}

TEST_CASE("Channel: bounded channel rejects when full", "[channel]") {
    Channel<int> ch(2);
    REQUIRE(ch.try_push(1));
    REQUIRE(ch.try_push(2));
    REQUIRE_FALSE(ch.try_push(3));
    REQUIRE(ch.size() == 2);
}

TEST_CASE("Channel: drain takes at most max items", "[channel]") {
    Channel<int> ch;
    for (int i = 0; i < 10; ++i) {
        ch.try_push(i);
    }
    std::vector<int> got;
    REQUIRE(ch.drain(4, [&](int&& v) { got.push_back(v); }) == 4);
    REQUIRE(got == std::vector<int>{0, 1, 2, 3});
    REQUIRE(ch.size() == 6);
}

TEST_CASE("Channel: close wakes a blocked consumer", "[channel]") {
    Channel<int> ch;
    bool result = true;
    std::thread consumer([&]() {
        int v = 0;
        result = ch.pop_wait(v);
    });
    ch.close();
    consumer.join();
    REQUIRE_FALSE(result);
    REQUIRE_FALSE(ch.try_push(1));
}

TEST_CASE("Channel: items queued before close are still delivered", "[channel]") {
    Channel<int> ch;
    ch.try_push(7);
    ch.close();
    int v = 0;
    REQUIRE(ch.pop_wait(v));
    REQUIRE(v == 7);
    REQUIRE_FALSE(ch.pop_wait(v));
}

TEST_CASE("Channel: clear reports dropped items", "[channel]") {
    Channel<int> ch;
    ch.try_push(1);
    ch.try_push(2);
    REQUIRE(ch.clear() == 2);
    REQUIRE(ch.size() == 0);
}
