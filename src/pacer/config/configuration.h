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

#include "config/config_store.h"
#include "config/convert.h"
#include "config/property.h"

#include <seastar/core/sstring.hh>

#include <chrono>

namespace config {

/// Pacing and recovery knobs of the upload orchestrator. All durations are
/// in seconds.
struct configuration final : public config_store {
    // Retry policy
    property<int> pacer_max_auto_retries;
    property<std::chrono::seconds> pacer_generic_retry_base;
    property<std::chrono::seconds> pacer_generic_retry_jitter;
    property<std::chrono::seconds> pacer_cooldown_safety_margin;
    property<std::chrono::seconds> pacer_cooldown_floor;
    property<std::chrono::seconds> pacer_escalation_pause;
    property<std::chrono::seconds> pacer_bot_lockout;

    // Pacing
    property<std::chrono::seconds> pacer_pre_archive_delay_min;
    property<std::chrono::seconds> pacer_pre_archive_delay_max;
    property<std::chrono::seconds> pacer_inter_item_delay_min;
    property<std::chrono::seconds> pacer_inter_item_delay_max;
    property<std::chrono::seconds> pacer_cooldown_jitter_min;
    property<std::chrono::seconds> pacer_cooldown_jitter_max;
    property<std::chrono::seconds> pacer_write_cooldown_min;
    property<std::chrono::seconds> pacer_write_cooldown_max;

    // Network recovery
    property<std::chrono::seconds> pacer_network_probe_interval;
    property<std::chrono::seconds> pacer_network_probe_ceiling;
    property<std::chrono::seconds> pacer_network_settle;

    // Account guard
    property<int> pacer_failure_lockout_threshold;
    property<std::chrono::seconds> pacer_failure_lockout;

    // Persistence
    property<ss::sstring> pacer_ledger_directory;

    configuration();

    error_map_t load(const YAML::Node& root_node);
};

configuration& shard_local_cfg();

} // namespace config
