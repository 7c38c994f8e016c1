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

#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/core/sleep.hh>
#include <seastar/core/timer.hh>
#include <seastar/util/optimized_optional.hh>

#include <memory>

namespace ssx {

/// Same as seastar::sleep_abortable but works with any clock that has a
/// seastar timer, ss::manual_clock included. Resolves with ss::sleep_aborted
/// when the abort source fires before the timer.
template<class Clock = ss::lowres_clock>
ss::future<>
sleep_abortable(typename Clock::duration dur, ss::abort_source& as) {
    if (as.abort_requested()) {
        return ss::make_exception_future<>(ss::sleep_aborted());
    }
    struct sleeper {
        ss::promise<> done;
        ss::timer<Clock> tmr;
        ss::optimized_optional<ss::abort_source::subscription> sub;
    };
    auto st = std::make_unique<sleeper>();
    auto fut = st->done.get_future();
    st->tmr.set_callback([s = st.get()] {
        s->sub = {};
        s->done.set_value();
    });
    st->sub = as.subscribe([s = st.get()]() noexcept {
        s->tmr.cancel();
        s->done.set_exception(ss::sleep_aborted());
    });
    st->tmr.arm(dur);
    return fut.finally([st = std::move(st)] {});
}

} // namespace ssx
