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

#include "base/fmt.h"
#include "base/seastarx.h"

#include <seastar/core/sstring.hh>

#include <chrono>
#include <cstdint>
#include <exception>
#include <iosfwd>
#include <string_view>
#include <system_error>

namespace upload {

/// Failure taxonomy of the remote media service. The order of the
/// enumerators is the classification precedence.
enum class error_kind : int8_t {
    // Authenticated session is gone, needs re-authentication
    session_expired,
    // Remote service flagged automated behaviour
    bot_detected,
    // Payload refused, waiting will not help
    item_rejected,
    // Server side rate limit with a declared wait
    cooldown_active,
    // Connectivity failure below the application layer
    network_transient,
    // Anything else
    generic_transient,
};

std::ostream& operator<<(std::ostream&, error_kind);

/// A failed remote call after classification.
struct classified_error {
    error_kind kind;
    ss::sstring message;
};

/// Classify by message text and, when present, an error code. Matching is
/// case insensitive and the first matching class in precedence order wins,
/// so a message mentioning both a challenge and a timeout is bot_detected.
error_kind classify(std::string_view message, std::error_code ec = {});

/// Classify the exception a remote call failed with.
classified_error classify(const std::exception_ptr& e);

/// Connection level errno values (refused, reset, unreachable, ...).
bool is_transport_error(const std::error_code& ec);

/// Sum of the `<int>m` and `<int>s` tokens of a rate limit message, never
/// less than `floor`. "please wait 1m 30s" yields 90s.
std::chrono::seconds parse_cooldown_seconds(
  std::string_view message,
  std::chrono::seconds floor = std::chrono::seconds(30));

} // namespace upload

PACER_OSTREAM_FMT(upload::error_kind)
