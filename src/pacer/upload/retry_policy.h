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
#include "random/time_window.h"
#include "upload/error_classifier.h"

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace upload {

using namespace std::chrono_literals;

enum class halt_reason : int8_t {
    session_expired,
    locked_out,
    item_rejected,
};

std::ostream& operator<<(std::ostream&, halt_reason);

/// What to do about a failed attempt.
struct retry_action {
    enum class kind : int8_t {
        // Sleep for `wait` then retry the same item
        retry_after,
        // Wait until the network probe succeeds then retry the same item
        retry_when_network_recovers,
        // Take the long escalation pause and stay paused
        escalate,
        // Stop, `reason` says why
        halt,
    };

    kind type{kind::halt};
    std::chrono::seconds wait{0s};
    std::optional<halt_reason> reason;

    static retry_action after(std::chrono::seconds wait) {
        return {.type = kind::retry_after, .wait = wait};
    }
    static retry_action when_network_recovers() {
        return {.type = kind::retry_when_network_recovers};
    }
    static retry_action escalation() { return {.type = kind::escalate}; }
    static retry_action halted(halt_reason r) {
        return {.type = kind::halt, .reason = r};
    }

    bool operator==(const retry_action&) const = default;
    friend std::ostream& operator<<(std::ostream&, const retry_action&);
};

struct retry_policy_config {
    // Per item retries and consecutive retries across items
    int max_attempts{3};
    std::chrono::seconds generic_retry_base{60s};
    std::chrono::seconds generic_retry_jitter{30s};
    std::chrono::seconds cooldown_safety_margin{30s};
    std::chrono::seconds cooldown_floor{30s};

    friend std::ostream& operator<<(std::ostream&, const retry_policy_config&);
};

/// Maps a classified failure and the retry counters to an action.
///
/// Failures that need a human (expired session, bot flag, rejected payload)
/// halt on the first occurrence. Self-resolving failures get bounded
/// automatic retries; once either the per item attempt counter or the
/// consecutive counter shared by all items reaches max_attempts the answer
/// is escalate.
class retry_policy {
public:
    explicit retry_policy(retry_policy_config cfg);

    /// \param attempt automatic retries already made for the current item
    /// \param consecutive_auto_retries automatic retries since the last
    ///        successful archive, across items
    /// \param message the failure text; rate limit messages carry the wait
    retry_action decide(
      error_kind kind,
      int attempt,
      int consecutive_auto_retries,
      std::string_view message = {});

    int max_attempts() const { return _cfg.max_attempts; }
    const retry_policy_config& config() const { return _cfg; }

private:
    retry_policy_config _cfg;
    random_generators::time_window<std::chrono::seconds> _generic_wait;
};

} // namespace upload

PACER_OSTREAM_FMT(upload::halt_reason)
PACER_OSTREAM_FMT(upload::retry_action)
PACER_OSTREAM_FMT(upload::retry_policy_config)
