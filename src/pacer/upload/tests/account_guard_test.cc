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

#include "test_utils/test.h"
#include "upload/account_guard.h"
#include "upload/error_classifier.h"

#include <seastar/core/manual_clock.hh>
#include <seastar/coroutine/as_future.hh>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

using namespace std::chrono_literals;
using ::testing::Return;
using upload::error_kind;

namespace {

class mock_remote : public upload::remote_api {
public:
    MOCK_METHOD(
      ss::future<ss::sstring>,
      upload,
      (const ss::sstring& payload),
      (override));
    MOCK_METHOD(
      ss::future<bool>,
      archive,
      (const ss::sstring& remote_handle),
      (override));
    MOCK_METHOD(ss::future<>, probe_network_stability, (), (override));
    MOCK_METHOD(ss::future<bool>, is_account_locked_out, (), (override));
};

ss::future<ss::sstring> failing_upload(const char* msg) {
    return ss::make_exception_future<ss::sstring>(std::runtime_error(msg));
}

} // namespace

using guard_t = upload::account_guard<ss::manual_clock>;

TEST(account_guard, bot_flag_locks_for_configured_time) {
    guard_t guard(upload::account_guard_config{});
    guard.record_failure(error_kind::bot_detected);
    EXPECT_TRUE(guard.is_locked_out());
    EXPECT_EQ(guard.remaining(), 900s);
    ss::manual_clock::advance(899s);
    EXPECT_TRUE(guard.is_locked_out());
    ss::manual_clock::advance(1s);
    EXPECT_FALSE(guard.is_locked_out());
    EXPECT_EQ(guard.remaining(), 0s);
}

TEST(account_guard, failure_streak_locks_as_precaution) {
    guard_t guard(upload::account_guard_config{});
    guard.record_failure(error_kind::generic_transient);
    guard.record_failure(error_kind::cooldown_active);
    EXPECT_FALSE(guard.is_locked_out());
    EXPECT_EQ(guard.consecutive_failures(), 2);
    guard.record_failure(error_kind::generic_transient);
    EXPECT_TRUE(guard.is_locked_out());
    EXPECT_EQ(guard.remaining(), 300s);
    EXPECT_EQ(guard.consecutive_failures(), 0);
}

TEST(account_guard, success_and_network_failures_do_not_count) {
    guard_t guard(upload::account_guard_config{});
    guard.record_failure(error_kind::generic_transient);
    guard.record_failure(error_kind::generic_transient);
    guard.record_success();
    guard.record_failure(error_kind::generic_transient);
    for (int i = 0; i < 5; ++i) {
        guard.record_failure(error_kind::network_transient);
    }
    EXPECT_FALSE(guard.is_locked_out());
    EXPECT_EQ(guard.consecutive_failures(), 1);
}

TEST_CORO(guarded_remote, records_outcomes_and_fails_fast_while_locked) {
    mock_remote inner;
    guard_t guard(upload::account_guard_config{
      .bot_lockout = 600s, .failure_threshold = 2, .failure_lockout = 60s});
    upload::guarded_remote<ss::manual_clock> remote(inner, guard);

    EXPECT_CALL(inner, upload(ss::sstring("a.jpg")))
      .WillOnce(Return(failing_upload("internal error")))
      .WillOnce(Return(failing_upload("internal error")));
    EXPECT_CALL(inner, is_account_locked_out()).Times(0);

    for (int i = 0; i < 2; ++i) {
        auto fut = co_await ss::coroutine::as_future(remote.upload("a.jpg"));
        ASSERT_TRUE_CORO(fut.failed());
        fut.ignore_ready_future();
    }
    EXPECT_TRUE(guard.is_locked_out());
    EXPECT_TRUE(co_await remote.is_account_locked_out());

    // while locked the inner client is not called and the failure reads as
    // a bot flag
    auto locked = co_await ss::coroutine::as_future(remote.archive("h1"));
    ASSERT_TRUE_CORO(locked.failed());
    EXPECT_EQ(
      upload::classify(locked.get_exception()).kind, error_kind::bot_detected);
}

TEST_CORO(guarded_remote, bot_failure_from_service_locks) {
    mock_remote inner;
    guard_t guard(upload::account_guard_config{});
    upload::guarded_remote<ss::manual_clock> remote(inner, guard);

    EXPECT_CALL(inner, archive(ss::sstring("h1")))
      .WillOnce(Return(ss::make_exception_future<bool>(
        std::runtime_error("challenge_required"))));
    auto fut = co_await ss::coroutine::as_future(remote.archive("h1"));
    ASSERT_TRUE_CORO(fut.failed());
    fut.ignore_ready_future();
    EXPECT_EQ(guard.remaining(), 900s);
    ss::manual_clock::advance(900s);
    EXPECT_FALSE(guard.is_locked_out());

    EXPECT_CALL(inner, is_account_locked_out())
      .WillOnce(Return(ss::make_ready_future<bool>(false)));
    EXPECT_FALSE(co_await remote.is_account_locked_out());
}

TEST_CORO(guarded_remote, unconfirmed_archive_counts_as_failure) {
    mock_remote inner;
    guard_t guard(upload::account_guard_config{});
    upload::guarded_remote<ss::manual_clock> remote(inner, guard);

    EXPECT_CALL(inner, archive(ss::sstring("h1")))
      .WillOnce(Return(ss::make_ready_future<bool>(false)))
      .WillOnce(Return(ss::make_ready_future<bool>(true)));
    EXPECT_FALSE(co_await remote.archive("h1"));
    EXPECT_EQ(guard.consecutive_failures(), 1);
    EXPECT_TRUE(co_await remote.archive("h1"));
    EXPECT_EQ(guard.consecutive_failures(), 0);
}
