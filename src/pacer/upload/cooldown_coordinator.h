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
#include "random/time_window.h"

#include <seastar/core/lowres_clock.hh>

#include <chrono>
#include <iosfwd>
#include <optional>

namespace upload {

struct cooldown_state {
    bool active{false};
    // Rounded up to whole seconds, zero when inactive
    std::chrono::seconds remaining{0};

    bool operator==(const cooldown_state&) const = default;
    friend std::ostream& operator<<(std::ostream&, const cooldown_state&);
};

/// Account wide "next write allowed at" gate.
///
/// The remote rate limit belongs to the account, not to a queue, so a
/// single coordinator is shared by every orchestrator of the shard and
/// outlives individual runs. The deadline can be exported as a wall clock
/// time point to survive restarts.
template<class Clock = ss::lowres_clock>
class cooldown_coordinator {
public:
    using clock_type = Clock;

    cooldown_coordinator(
      std::chrono::seconds write_cooldown_min,
      std::chrono::seconds write_cooldown_max);

    /// Expired deadlines are dropped on read.
    cooldown_state is_on_cooldown();

    /// Push the deadline to now + d unless it is already later.
    void extend(std::chrono::seconds d);

    /// A write was accepted by the remote service. Starts a random cooldown
    /// from the write window and returns its length.
    std::chrono::seconds record_write();

    void clear();

    std::optional<std::chrono::system_clock::time_point> wall_deadline() const;
    void restore(std::chrono::system_clock::time_point wall_deadline);

private:
    std::optional<typename Clock::time_point> _deadline;
    random_generators::time_window<std::chrono::seconds> _write_window;
};

} // namespace upload

PACER_OSTREAM_FMT(upload::cooldown_state)
