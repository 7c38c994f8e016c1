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
#include "test_utils/tmp_dir.h"
#include "upload/errc.h"
#include "upload/ledger_store.h"
#include "upload/progress_ledger.h"
#include "utils/file_io.h"

#include <seastar/core/seastar.hh>

#include <gtest/gtest.h>

#include <optional>

using namespace std::chrono_literals;

TEST(progress_ledger, json_document_layout) {
    upload::progress_ledger l{
      .current_index = 2,
      .total = 5,
      .consecutive_auto_retries = 1,
      .resume_index = 2,
      .is_paused = true};
    EXPECT_EQ(
      upload::ledger_to_json(l),
      R"({"version":1,"current_index":2,"total":5,)"
      R"("consecutive_auto_retries":1,"resume_index":2,"is_paused":true})");

    auto parsed = upload::ledger_from_json(upload::ledger_to_json(l));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value(), l);
}

TEST(progress_ledger, cleared_resume_index_is_null) {
    upload::progress_ledger l{.current_index = 3, .total = 3};
    auto doc = upload::ledger_to_json(l);
    EXPECT_NE(doc.find(R"("resume_index":null)"), ss::sstring::npos);
    auto parsed = upload::ledger_from_json(doc);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed.value().resume_index.has_value());
}

TEST(progress_ledger, rejects_malformed_documents) {
    for (std::string_view doc : {
           "[]",
           "{not json",
           R"({"version":2,"current_index":0,"total":0,)"
           R"("consecutive_auto_retries":0,"resume_index":null,)"
           R"("is_paused":false})",
           R"({"version":1,"current_index":"x","total":0,)"
           R"("consecutive_auto_retries":0,"resume_index":null,)"
           R"("is_paused":false})",
           R"({"version":1,"total":0})",
         }) {
        auto r = upload::ledger_from_json(doc);
        ASSERT_TRUE(r.has_error()) << doc;
        EXPECT_EQ(r.error(), upload::errc::ledger_corrupted) << doc;
    }
}

class file_ledger_store_test : public seastar_test {
public:
    ss::future<> SetUpAsync() override {
        dir.emplace(co_await temporary_dir::create("file_ledger_store"));
        store.emplace(dir->get_path() / "ledgers");
        co_await store->start();
    }

    ss::future<> TearDownAsync() override {
        if (dir.has_value()) {
            co_await dir->remove();
        }
    }

    std::optional<temporary_dir> dir;
    std::optional<upload::file_ledger_store> store;
};

TEST_F_CORO(file_ledger_store_test, missing_ledger_is_not_found) {
    auto r = co_await store->load("q1");
    ASSERT_TRUE_CORO(r.has_error());
    EXPECT_EQ(r.error(), upload::errc::ledger_not_found);
}

TEST_F_CORO(file_ledger_store_test, save_load_and_remove) {
    upload::progress_ledger l{
      .current_index = 1, .total = 4, .resume_index = 1, .is_paused = true};
    auto ec = co_await store->save("q1", l);
    ASSERT_FALSE_CORO(ec);
    EXPECT_TRUE(co_await ss::file_exists(store->ledger_path("q1").string()));

    auto r = co_await store->load("q1");
    ASSERT_TRUE_CORO(r.has_value());
    EXPECT_EQ(r.value(), l);

    // other queues are independent
    auto other = co_await store->load("q2");
    EXPECT_TRUE(other.has_error());

    ec = co_await store->remove("q1");
    ASSERT_FALSE_CORO(ec);
    auto gone = co_await store->load("q1");
    ASSERT_TRUE_CORO(gone.has_error());
    EXPECT_EQ(gone.error(), upload::errc::ledger_not_found);
    // removing twice is fine
    EXPECT_FALSE(co_await store->remove("q1"));
}

TEST_F_CORO(file_ledger_store_test, corrupted_file_is_reported) {
    co_await replace_file(store->ledger_path("q1"), "{\"version\":");
    auto r = co_await store->load("q1");
    ASSERT_TRUE_CORO(r.has_error());
    EXPECT_EQ(r.error(), upload::errc::ledger_corrupted);
}

TEST_F_CORO(file_ledger_store_test, cooldown_deadline_round_trip) {
    auto nf = co_await store->load_cooldown();
    ASSERT_TRUE_CORO(nf.has_error());
    EXPECT_EQ(nf.error(), upload::errc::ledger_not_found);

    auto deadline = std::chrono::system_clock::now() + 200s;
    auto ec = co_await store->save_cooldown(deadline);
    ASSERT_FALSE_CORO(ec);
    auto r = co_await store->load_cooldown();
    ASSERT_TRUE_CORO(r.has_value());
    // persisted with millisecond precision
    EXPECT_LE(r.value(), deadline);
    EXPECT_GT(r.value(), deadline - 1ms);

    ec = co_await store->save_cooldown(std::nullopt);
    ASSERT_FALSE_CORO(ec);
    auto cleared = co_await store->load_cooldown();
    ASSERT_TRUE_CORO(cleared.has_error());
    EXPECT_EQ(cleared.error(), upload::errc::ledger_not_found);
}
