/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Use of this software is governed by the Business Source License
 * included in the file licenses/BSL.md
 *
 * As of the Change Date specified in that file, in accordance with
 * the Business Source License, use of this software will be governed
 * by the Apache License, Version 2.0
 */

#include "upload/cooldown_coordinator.h"

#include <seastar/core/manual_clock.hh>

#include <gtest/gtest.h>

using namespace std::chrono_literals;

using coordinator = upload::cooldown_coordinator<ss::manual_clock>;

TEST(cooldown_coordinator, inactive_by_default) {
    coordinator c(160s, 220s);
    EXPECT_EQ(c.is_on_cooldown(), upload::cooldown_state{});
    EXPECT_FALSE(c.wall_deadline().has_value());
}

TEST(cooldown_coordinator, counts_down_and_expires) {
    coordinator c(160s, 220s);
    c.extend(90s);
    EXPECT_EQ(c.is_on_cooldown(), (upload::cooldown_state{true, 90s}));
    ss::manual_clock::advance(40s);
    EXPECT_EQ(c.is_on_cooldown(), (upload::cooldown_state{true, 50s}));
    ss::manual_clock::advance(50s);
    EXPECT_FALSE(c.is_on_cooldown().active);
    EXPECT_FALSE(c.wall_deadline().has_value());
}

TEST(cooldown_coordinator, extend_never_shortens) {
    coordinator c(160s, 220s);
    c.extend(120s);
    c.extend(30s);
    EXPECT_EQ(c.is_on_cooldown().remaining, 120s);
    c.extend(200s);
    EXPECT_EQ(c.is_on_cooldown().remaining, 200s);
}

TEST(cooldown_coordinator, record_write_uses_write_window) {
    coordinator c(160s, 220s);
    auto d = c.record_write();
    EXPECT_GE(d, 160s);
    EXPECT_LE(d, 220s);
    EXPECT_EQ(c.is_on_cooldown().remaining, d);
    c.clear();
    EXPECT_FALSE(c.is_on_cooldown().active);
}

TEST(cooldown_coordinator, wall_deadline_round_trip) {
    coordinator c(160s, 220s);
    c.extend(100s);
    auto wall = c.wall_deadline();
    ASSERT_TRUE(wall.has_value());

    coordinator restored(160s, 220s);
    restored.restore(wall.value());
    auto st = restored.is_on_cooldown();
    EXPECT_TRUE(st.active);
    // wall clock kept running between the two calls
    EXPECT_GE(st.remaining, 99s);
    EXPECT_LE(st.remaining, 100s);
}

TEST(cooldown_coordinator, restore_of_past_deadline_is_noop) {
    coordinator c(160s, 220s);
    c.restore(std::chrono::system_clock::now() - 10s);
    EXPECT_FALSE(c.is_on_cooldown().active);
}
