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

#include "ssx/countdown.h"
#include "test_utils/async.h"
#include "test_utils/test.h"

#include <seastar/core/abort_source.hh>
#include <seastar/core/manual_clock.hh>
#include <seastar/core/sleep.hh>

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

using namespace std::chrono_literals;

TEST_CORO(countdown, ticks_every_second_down_to_one) {
    ss::abort_source as;
    std::vector<std::chrono::seconds> ticks;
    auto fut = ssx::countdown<ss::manual_clock>(
      3s, as, [&ticks](std::chrono::seconds rem) {
          ticks.push_back(rem);
          return ss::stop_iteration::no;
      });
    auto spent = co_await tests::advance_until_ready(fut, 10s);
    EXPECT_EQ(fut.get(), ssx::countdown_result::elapsed);
    EXPECT_EQ(spent, 3s);
    EXPECT_EQ(ticks, (std::vector<std::chrono::seconds>{3s, 2s, 1s}));
}

TEST_CORO(countdown, zero_duration_finishes_without_ticks) {
    ss::abort_source as;
    int ticks = 0;
    auto r = co_await ssx::countdown<ss::manual_clock>(
      0s, as, [&ticks](std::chrono::seconds) {
          ++ticks;
          return ss::stop_iteration::no;
      });
    EXPECT_EQ(r, ssx::countdown_result::elapsed);
    EXPECT_EQ(ticks, 0);
}

TEST_CORO(countdown, stops_at_the_next_checkpoint) {
    ss::abort_source as;
    bool stop = false;
    std::chrono::seconds last{0};
    auto fut = ssx::countdown<ss::manual_clock>(
      60s, as, [&](std::chrono::seconds rem) {
          last = rem;
          return stop ? ss::stop_iteration::yes : ss::stop_iteration::no;
      });
    co_await tests::drain_task_queue();
    for (int i = 0; i < 10; ++i) {
        ss::manual_clock::advance(1s);
        co_await tests::drain_task_queue();
    }
    EXPECT_EQ(last, 50s);
    stop = true;
    ss::manual_clock::advance(1s);
    co_await tests::drain_task_queue();
    ASSERT_TRUE_CORO(fut.available());
    EXPECT_EQ(fut.get(), ssx::countdown_result::interrupted);
    EXPECT_EQ(last, 49s);
}

TEST_CORO(countdown, abort_fails_with_sleep_aborted) {
    ss::abort_source as;
    auto fut = ssx::countdown<ss::manual_clock>(
      600s, as, [](std::chrono::seconds) { return ss::stop_iteration::no; });
    co_await tests::drain_task_queue();
    as.request_abort();
    co_await tests::drain_task_queue();
    ASSERT_TRUE_CORO(fut.available());
    EXPECT_THROW(fut.get(), ss::sleep_aborted);
}
