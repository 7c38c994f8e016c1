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

#include "upload/error_classifier.h"

#include <seastar/core/timed_out_error.hh>

#include <gtest/gtest.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>

using namespace std::chrono_literals;
using upload::error_kind;

TEST(error_classifier, keyword_classes) {
    EXPECT_EQ(
      upload::classify("Session expired, please login again"),
      error_kind::session_expired);
    EXPECT_EQ(
      upload::classify("challenge_required"), error_kind::bot_detected);
    EXPECT_EQ(
      upload::classify("Feedback required: spam"), error_kind::bot_detected);
    EXPECT_EQ(
      upload::classify("Unsupported aspect ratio"), error_kind::item_rejected);
    EXPECT_EQ(
      upload::classify("Please wait 2m before uploading another photo"),
      error_kind::cooldown_active);
    EXPECT_EQ(
      upload::classify("The request timed out"), error_kind::network_transient);
    EXPECT_EQ(
      upload::classify("Internal server error"), error_kind::generic_transient);
}

TEST(error_classifier, matching_is_case_insensitive) {
    EXPECT_EQ(
      upload::classify("SESSION INVALID"), error_kind::session_expired);
    EXPECT_EQ(upload::classify("CheckPoint"), error_kind::bot_detected);
}

TEST(error_classifier, precedence_follows_declaration_order) {
    // bot beats network
    EXPECT_EQ(
      upload::classify("challenge page timed out"), error_kind::bot_detected);
    // session beats bot
    EXPECT_EQ(
      upload::classify("session expired, checkpoint required"),
      error_kind::session_expired);
    // rejection beats cooldown
    EXPECT_EQ(
      upload::classify(
        "invalid image, please wait 30s before uploading another"),
      error_kind::item_rejected);
}

TEST(error_classifier, please_wait_needs_upload_context) {
    EXPECT_EQ(
      upload::classify("Please wait a moment"), error_kind::generic_transient);
    EXPECT_EQ(
      upload::classify("please wait 45s before upload"),
      error_kind::cooldown_active);
}

TEST(error_classifier, transport_error_codes) {
    auto refused = std::make_error_code(std::errc::connection_refused);
    EXPECT_TRUE(upload::is_transport_error(refused));
    EXPECT_EQ(
      upload::classify("write failed", refused), error_kind::network_transient);
    EXPECT_FALSE(upload::is_transport_error(
      std::make_error_code(std::errc::permission_denied)));
    EXPECT_FALSE(upload::is_transport_error({}));
}

TEST(error_classifier, classify_exception) {
    auto sys = upload::classify(std::make_exception_ptr(std::system_error(
      std::make_error_code(std::errc::connection_reset), "send")));
    EXPECT_EQ(sys.kind, error_kind::network_transient);

    auto timeout = upload::classify(
      std::make_exception_ptr(ss::timed_out_error()));
    EXPECT_EQ(timeout.kind, error_kind::network_transient);

    auto generic = upload::classify(
      std::make_exception_ptr(std::runtime_error("Login_Required")));
    EXPECT_EQ(generic.kind, error_kind::bot_detected);
    EXPECT_EQ(generic.message, "Login_Required");
}

TEST(error_classifier, parse_cooldown_sums_minutes_and_seconds) {
    EXPECT_EQ(
      upload::parse_cooldown_seconds(
        "Please wait 1m 30s before uploading another"),
      90s);
    EXPECT_EQ(
      upload::parse_cooldown_seconds("please wait 2m before uploading"), 120s);
    EXPECT_EQ(
      upload::parse_cooldown_seconds("please wait 45s."), 45s);
}

TEST(error_classifier, parse_cooldown_applies_floor) {
    EXPECT_EQ(
      upload::parse_cooldown_seconds("please wait before uploading"), 30s);
    EXPECT_EQ(upload::parse_cooldown_seconds("please wait 10s"), 30s);
    EXPECT_EQ(upload::parse_cooldown_seconds("wait 10s", 5s), 10s);
}

TEST(error_classifier, parse_cooldown_ignores_non_numeric_tokens) {
    EXPECT_EQ(upload::parse_cooldown_seconds("items xs 3ms 1m"), 60s);
}
