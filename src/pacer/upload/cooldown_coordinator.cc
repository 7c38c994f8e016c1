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

#include "base/plog.h"
#include "upload/logger.h"

#include <seastar/core/manual_clock.hh>

#include <fmt/chrono.h>
#include <fmt/ostream.h>

#include <ostream>

namespace upload {

std::ostream& operator<<(std::ostream& o, const cooldown_state& s) {
    fmt::print(o, "{{active: {}, remaining: {}}}", s.active, s.remaining);
    return o;
}

template<class Clock>
cooldown_coordinator<Clock>::cooldown_coordinator(
  std::chrono::seconds write_cooldown_min,
  std::chrono::seconds write_cooldown_max)
  : _write_window(write_cooldown_min, write_cooldown_max) {}

template<class Clock>
cooldown_state cooldown_coordinator<Clock>::is_on_cooldown() {
    if (!_deadline.has_value()) {
        return {};
    }
    auto now = Clock::now();
    if (now >= _deadline.value()) {
        plog(upload_log.debug, "Account cooldown expired");
        _deadline.reset();
        return {};
    }
    return {
      .active = true,
      .remaining = std::chrono::ceil<std::chrono::seconds>(
        _deadline.value() - now)};
}

template<class Clock>
void cooldown_coordinator<Clock>::extend(std::chrono::seconds d) {
    auto candidate = Clock::now()
                     + std::chrono::duration_cast<typename Clock::duration>(d);
    if (!_deadline.has_value() || _deadline.value() < candidate) {
        plog(upload_log.debug, "Account cooldown set to {}", d);
        _deadline = candidate;
    }
}

template<class Clock>
std::chrono::seconds cooldown_coordinator<Clock>::record_write() {
    auto d = _write_window.next();
    extend(d);
    return d;
}

template<class Clock>
void cooldown_coordinator<Clock>::clear() {
    _deadline.reset();
}

template<class Clock>
std::optional<std::chrono::system_clock::time_point>
cooldown_coordinator<Clock>::wall_deadline() const {
    if (!_deadline.has_value()) {
        return std::nullopt;
    }
    auto left = _deadline.value() - Clock::now();
    return std::chrono::system_clock::now()
           + std::chrono::duration_cast<std::chrono::system_clock::duration>(
             left);
}

template<class Clock>
void cooldown_coordinator<Clock>::restore(
  std::chrono::system_clock::time_point wall_deadline) {
    auto left = wall_deadline - std::chrono::system_clock::now();
    if (left <= std::chrono::system_clock::duration::zero()) {
        _deadline.reset();
        return;
    }
    _deadline = Clock::now()
                + std::chrono::duration_cast<typename Clock::duration>(left);
    plog(
      upload_log.info,
      "Restored account cooldown, {} left",
      std::chrono::ceil<std::chrono::seconds>(left));
}

template class cooldown_coordinator<ss::lowres_clock>;
template class cooldown_coordinator<ss::manual_clock>;

} // namespace upload
