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
#include "upload/account_guard.h"
#include "upload/retry_policy.h"

#include <seastar/core/sstring.hh>

#include <chrono>
#include <iosfwd>

namespace upload {

/// Snapshot of the orchestrator tunables, taken once per orchestrator.
/// Values come from get_orchestrator_config().
struct orchestrator_config {
    retry_policy_config retry;
    std::chrono::seconds bot_lockout{};
    std::chrono::seconds escalation_pause{};

    std::chrono::seconds pre_archive_delay_min{};
    std::chrono::seconds pre_archive_delay_max{};
    std::chrono::seconds inter_item_delay_min{};
    std::chrono::seconds inter_item_delay_max{};
    // Added on top of a running cooldown before the next item
    std::chrono::seconds cooldown_jitter_min{};
    std::chrono::seconds cooldown_jitter_max{};

    std::chrono::seconds network_probe_interval{};
    std::chrono::seconds network_probe_ceiling{};
    std::chrono::seconds network_settle{};

    friend std::ostream&
    operator<<(std::ostream&, const orchestrator_config&);
};

struct cooldown_window {
    std::chrono::seconds min{};
    std::chrono::seconds max{};
};

/// Builds the configuration from config::shard_local_cfg(). Throws
/// std::runtime_error if a min/max pair is inverted.
orchestrator_config get_orchestrator_config();

account_guard_config get_account_guard_config();

cooldown_window get_write_cooldown_window();

ss::sstring get_ledger_directory();

} // namespace upload

PACER_OSTREAM_FMT(upload::orchestrator_config)
