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

#include "base/plog.h"
#include "upload/logger.h"

#include <fmt/chrono.h>
#include <fmt/ostream.h>

#include <ostream>

namespace upload {

std::ostream& operator<<(std::ostream& o, halt_reason r) {
    switch (r) {
        using enum halt_reason;
    case session_expired:
        return o << "session_expired";
    case locked_out:
        return o << "locked_out";
    case item_rejected:
        return o << "item_rejected";
    }
    return o << "unknown";
}

std::ostream& operator<<(std::ostream& o, const retry_action& a) {
    switch (a.type) {
        using enum retry_action::kind;
    case retry_after:
        fmt::print(o, "retry_after({})", a.wait);
        break;
    case retry_when_network_recovers:
        o << "retry_when_network_recovers";
        break;
    case escalate:
        o << "escalate";
        break;
    case halt:
        if (a.reason.has_value()) {
            fmt::print(o, "halt({})", a.reason.value());
        } else {
            o << "halt";
        }
        break;
    }
    return o;
}

std::ostream& operator<<(std::ostream& o, const retry_policy_config& cfg) {
    fmt::print(
      o,
      "{{max_attempts: {}, generic_retry_base: {}, generic_retry_jitter: {}, "
      "cooldown_safety_margin: {}, cooldown_floor: {}}}",
      cfg.max_attempts,
      cfg.generic_retry_base,
      cfg.generic_retry_jitter,
      cfg.cooldown_safety_margin,
      cfg.cooldown_floor);
    return o;
}

retry_policy::retry_policy(retry_policy_config cfg)
  : _cfg(cfg)
  , _generic_wait(
      cfg.generic_retry_base,
      cfg.generic_retry_base + cfg.generic_retry_jitter) {}

retry_action retry_policy::decide(
  error_kind kind,
  int attempt,
  int consecutive_auto_retries,
  std::string_view message) {
    switch (kind) {
    case error_kind::session_expired:
        return retry_action::halted(halt_reason::session_expired);
    case error_kind::bot_detected:
        return retry_action::halted(halt_reason::locked_out);
    case error_kind::item_rejected:
        return retry_action::halted(halt_reason::item_rejected);
    case error_kind::cooldown_active:
    case error_kind::network_transient:
    case error_kind::generic_transient:
        break;
    }

    if (
      attempt >= _cfg.max_attempts
      || consecutive_auto_retries >= _cfg.max_attempts) {
        plog(
          upload_log.info,
          "Escalating {} failure, attempt: {}, consecutive retries: {}, "
          "limit: {}",
          kind,
          attempt,
          consecutive_auto_retries,
          _cfg.max_attempts);
        return retry_action::escalation();
    }

    switch (kind) {
    case error_kind::cooldown_active: {
        auto declared = parse_cooldown_seconds(message, _cfg.cooldown_floor);
        return retry_action::after(declared + _cfg.cooldown_safety_margin);
    }
    case error_kind::network_transient:
        return retry_action::when_network_recovers();
    default:
        return retry_action::after(_generic_wait.next());
    }
}

} // namespace upload
