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

#include "upload/retry_policy.h"

#include <gtest/gtest.h>

using namespace std::chrono_literals;
using upload::error_kind;
using upload::halt_reason;
using upload::retry_action;

class retry_policy_test : public ::testing::Test {
protected:
    upload::retry_policy policy{upload::retry_policy_config{}};
};

TEST_F(retry_policy_test, fatal_kinds_halt_immediately) {
    EXPECT_EQ(
      policy.decide(error_kind::session_expired, 0, 0),
      retry_action::halted(halt_reason::session_expired));
    EXPECT_EQ(
      policy.decide(error_kind::bot_detected, 0, 0),
      retry_action::halted(halt_reason::locked_out));
    EXPECT_EQ(
      policy.decide(error_kind::item_rejected, 0, 0),
      retry_action::halted(halt_reason::item_rejected));
}

TEST_F(retry_policy_test, halts_win_over_exhausted_counters) {
    EXPECT_EQ(
      policy.decide(error_kind::session_expired, 5, 5),
      retry_action::halted(halt_reason::session_expired));
}

TEST_F(retry_policy_test, generic_wait_is_jittered_minute) {
    for (int i = 0; i < 100; ++i) {
        auto a = policy.decide(error_kind::generic_transient, 0, 0);
        ASSERT_EQ(a.type, retry_action::kind::retry_after);
        ASSERT_GE(a.wait, 60s);
        ASSERT_LE(a.wait, 90s);
    }
}

TEST_F(retry_policy_test, cooldown_wait_adds_safety_margin) {
    EXPECT_EQ(
      policy.decide(
        error_kind::cooldown_active,
        0,
        0,
        "Please wait 1m 30s before uploading another"),
      retry_action::after(120s));
    // no duration in the message, floor plus margin
    EXPECT_EQ(
      policy.decide(
        error_kind::cooldown_active, 1, 1, "please wait before uploading"),
      retry_action::after(60s));
}

TEST_F(retry_policy_test, network_waits_for_recovery) {
    EXPECT_EQ(
      policy.decide(error_kind::network_transient, 2, 2),
      retry_action::when_network_recovers());
}

TEST_F(retry_policy_test, escalates_on_per_item_attempts) {
    EXPECT_EQ(
      policy.decide(error_kind::generic_transient, 3, 0),
      retry_action::escalation());
}

TEST_F(retry_policy_test, escalates_on_consecutive_retries) {
    EXPECT_EQ(
      policy.decide(error_kind::network_transient, 0, 3),
      retry_action::escalation());
    EXPECT_EQ(
      policy.decide(error_kind::cooldown_active, 0, 3, "please wait 2m"),
      retry_action::escalation());
    EXPECT_NE(
      policy.decide(error_kind::generic_transient, 2, 2).type,
      retry_action::kind::escalate);
}

TEST(retry_policy, custom_limits) {
    upload::retry_policy p(upload::retry_policy_config{
      .max_attempts = 1,
      .generic_retry_base = 10s,
      .generic_retry_jitter = 0s,
    });
    EXPECT_EQ(
      p.decide(error_kind::generic_transient, 0, 0), retry_action::after(10s));
    EXPECT_EQ(
      p.decide(error_kind::generic_transient, 1, 0),
      retry_action::escalation());
}
