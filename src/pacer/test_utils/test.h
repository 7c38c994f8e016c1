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
#pragma once

#include <seastar/core/coroutine.hh>
#include <seastar/core/future.hh>
#include <seastar/core/thread.hh>

#include <gtest/gtest.h>

/// Fixture base for tests whose body is a coroutine. The body and the async
/// set up / tear down hooks run on the seastar reactor started by
/// test_utils/gtest_main.cc.
class seastar_test : public ::testing::Test {
public:
    virtual seastar::future<> SetUpAsync() {
        return seastar::make_ready_future<>();
    }
    virtual seastar::future<> TearDownAsync() {
        return seastar::make_ready_future<>();
    }

private:
    void SetUp() override { SetUpAsync().get(); }
    void TearDown() override { TearDownAsync().get(); }
};

// NOLINTBEGIN(cppcoreguidelines-macro-usage,bugprone-macro-parentheses)
#define PACER_TEST_SEASTAR_(suite, name, parent, parent_id)                    \
    static_assert(                                                             \
      std::is_base_of_v<seastar_test, parent>, "fixture must derive from "     \
                                               "seastar_test");                \
    class GTEST_TEST_CLASS_NAME_(suite, name) : public parent {                \
    public:                                                                    \
        GTEST_TEST_CLASS_NAME_(suite, name)() = default;                       \
        GTEST_TEST_CLASS_NAME_(suite, name)                                    \
        (const GTEST_TEST_CLASS_NAME_(suite, name) &) = delete;                \
        GTEST_TEST_CLASS_NAME_(suite, name) &                                  \
        operator=(const GTEST_TEST_CLASS_NAME_(suite, name) &) = delete;       \
                                                                               \
    private:                                                                   \
        void TestBody() override { TestBodyWrapped().get(); }                  \
        seastar::future<> TestBodyWrapped();                                   \
        static ::testing::TestInfo* const test_info_ [[maybe_unused]];         \
    };                                                                         \
    ::testing::TestInfo* const GTEST_TEST_CLASS_NAME_(                         \
      suite, name)::test_info_                                                 \
      = ::testing::internal::MakeAndRegisterTestInfo(                          \
        #suite,                                                                \
        #name,                                                                 \
        nullptr,                                                               \
        nullptr,                                                               \
        ::testing::internal::CodeLocation(__FILE__, __LINE__),                 \
        (parent_id),                                                           \
        ::testing::internal::SuiteApiResolver<parent>::GetSetUpCaseOrSuite(    \
          __FILE__, __LINE__),                                                 \
        ::testing::internal::SuiteApiResolver<                                 \
          parent>::GetTearDownCaseOrSuite(__FILE__, __LINE__),                 \
        new ::testing::internal::TestFactoryImpl<GTEST_TEST_CLASS_NAME_(       \
          suite, name)>);                                                      \
    seastar::future<> GTEST_TEST_CLASS_NAME_(suite, name)::TestBodyWrapped()

#define TEST_CORO(suite, name)                                                 \
    PACER_TEST_SEASTAR_(                                                       \
      suite, name, seastar_test, ::testing::internal::GetTestTypeId())

#define TEST_F_CORO(fixture, name)                                             \
    PACER_TEST_SEASTAR_(                                                       \
      fixture, name, fixture, ::testing::internal::GetTypeId<fixture>())

/*
 * Fatal assertions return from the enclosing function. Inside a coroutine
 * body that has to be a co_return.
 */
#define PACER_FATAL_FAILURE_CORO_(message)                                     \
    co_return GTEST_MESSAGE_(message, ::testing::TestPartResult::kFatalFailure)

#define ASSERT_TRUE_CORO(condition)                                            \
    GTEST_TEST_BOOLEAN_(                                                       \
      condition, #condition, false, true, PACER_FATAL_FAILURE_CORO_)
#define ASSERT_FALSE_CORO(condition)                                           \
    GTEST_TEST_BOOLEAN_(                                                       \
      !(condition), #condition, true, false, PACER_FATAL_FAILURE_CORO_)
#define ASSERT_EQ_CORO(val1, val2)                                             \
    GTEST_PRED_FORMAT2_(                                                       \
      ::testing::internal::EqHelper::Compare,                                  \
      val1,                                                                    \
      val2,                                                                    \
      PACER_FATAL_FAILURE_CORO_)
#define ASSERT_NE_CORO(val1, val2)                                             \
    GTEST_PRED_FORMAT2_(                                                       \
      ::testing::internal::CmpHelperNE, val1, val2, PACER_FATAL_FAILURE_CORO_)
#define ASSERT_GE_CORO(val1, val2)                                             \
    GTEST_PRED_FORMAT2_(                                                       \
      ::testing::internal::CmpHelperGE, val1, val2, PACER_FATAL_FAILURE_CORO_)
#define ASSERT_LE_CORO(val1, val2)                                             \
    GTEST_PRED_FORMAT2_(                                                       \
      ::testing::internal::CmpHelperLE, val1, val2, PACER_FATAL_FAILURE_CORO_)
// NOLINTEND(cppcoreguidelines-macro-usage,bugprone-macro-parentheses)
