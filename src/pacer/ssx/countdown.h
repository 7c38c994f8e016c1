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

#include "base/seastarx.h"
#include "ssx/sleep_abortable.h"

#include <seastar/core/abort_source.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/future.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/util/noncopyable_function.hh>

#include <chrono>
#include <ostream>

namespace ssx {

enum class countdown_result {
    // The whole duration passed
    elapsed,
    // The tick callback asked to stop
    interrupted,
};

/// Observer of a running countdown. Receives the remaining time before every
/// one second step and returns ss::stop_iteration::yes to cut it short.
using countdown_tick
  = ss::noncopyable_function<ss::stop_iteration(std::chrono::seconds)>;

/// Interruptible wait decomposed into one second checkpoints.
///
/// The tick callback sees `total`, `total - 1s`, ..., `1s`. A zero or
/// negative duration finishes immediately without calling it. Aborting `as`
/// fails the returned future with ss::sleep_aborted, which is how shutdown
/// propagates out of any waiting state.
template<class Clock = ss::lowres_clock>
ss::future<countdown_result> countdown(
  std::chrono::seconds total, ss::abort_source& as, countdown_tick on_tick) {
    using namespace std::chrono_literals;
    for (auto remaining = total; remaining > 0s; remaining -= 1s) {
        if (on_tick(remaining) == ss::stop_iteration::yes) {
            co_return countdown_result::interrupted;
        }
        co_await ssx::sleep_abortable<Clock>(
          std::chrono::duration_cast<typename Clock::duration>(1s), as);
    }
    co_return countdown_result::elapsed;
}

inline std::ostream& operator<<(std::ostream& o, countdown_result r) {
    switch (r) {
    case countdown_result::elapsed:
        return o << "elapsed";
    case countdown_result::interrupted:
        return o << "interrupted";
    }
    return o << "unknown";
}

} // namespace ssx
