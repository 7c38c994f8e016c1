// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "config/configuration.h"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <optional>
#include <stdexcept>

namespace config {
using namespace std::chrono_literals;

namespace {
std::optional<ss::sstring> validate_positive_duration(std::chrono::seconds v) {
    if (v <= 0s) {
        return fmt::format("{} must be greater than zero", v);
    }
    return std::nullopt;
}

std::optional<ss::sstring>
validate_non_negative_duration(std::chrono::seconds v) {
    if (v < 0s) {
        return fmt::format("{} must not be negative", v);
    }
    return std::nullopt;
}

std::optional<ss::sstring> validate_positive_count(int v) {
    if (v <= 0) {
        return fmt::format("{} must be greater than zero", v);
    }
    return std::nullopt;
}

std::optional<ss::sstring> validate_not_empty(const ss::sstring& v) {
    if (v.empty()) {
        return "value must not be empty";
    }
    return std::nullopt;
}
} // namespace

configuration::configuration()
  : pacer_max_auto_retries(
      *this,
      "pacer_max_auto_retries",
      "Automatic retries allowed for one item, and consecutive automatic "
      "retries allowed across items, before the run escalates.",
      {.needs_restart = needs_restart::no,
       .example = "3",
       .visibility = visibility::user},
      3,
      validate_positive_count)
  , pacer_generic_retry_base(
      *this,
      "pacer_generic_retry_base",
      "Base wait before retrying after an unclassified failure.",
      {.needs_restart = needs_restart::no, .visibility = visibility::tunable},
      60s,
      validate_non_negative_duration)
  , pacer_generic_retry_jitter(
      *this,
      "pacer_generic_retry_jitter",
      "Upper bound of the random extra wait added to "
      "pacer_generic_retry_base.",
      {.needs_restart = needs_restart::no, .visibility = visibility::tunable},
      30s,
      validate_non_negative_duration)
  , pacer_cooldown_safety_margin(
      *this,
      "pacer_cooldown_safety_margin",
      "Margin added to a wait time declared by the remote service.",
      {.needs_restart = needs_restart::no, .visibility = visibility::tunable},
      30s,
      validate_non_negative_duration)
  , pacer_cooldown_floor(
      *this,
      "pacer_cooldown_floor",
      "Minimum wait assumed for a rate limit response, also used when the "
      "response carries no parsable duration.",
      {.needs_restart = needs_restart::no, .visibility = visibility::tunable},
      30s,
      validate_non_negative_duration)
  , pacer_escalation_pause(
      *this,
      "pacer_escalation_pause",
      "Length of the pause taken once automatic retries are exhausted. The "
      "run stays paused afterwards.",
      {.needs_restart = needs_restart::no,
       .example = "300",
       .visibility = visibility::user},
      300s,
      validate_positive_duration)
  , pacer_bot_lockout(
      *this,
      "pacer_bot_lockout",
      "Lockout countdown started when the remote service flags automated "
      "behaviour.",
      {.needs_restart = needs_restart::no,
       .example = "900",
       .visibility = visibility::user},
      900s,
      validate_positive_duration)
  , pacer_pre_archive_delay_min(
      *this,
      "pacer_pre_archive_delay_min",
      "Lower bound of the random delay between upload and archive of an item.",
      {.needs_restart = needs_restart::no, .visibility = visibility::tunable},
      5s,
      validate_non_negative_duration)
  , pacer_pre_archive_delay_max(
      *this,
      "pacer_pre_archive_delay_max",
      "Upper bound of the random delay between upload and archive of an item.",
      {.needs_restart = needs_restart::no, .visibility = visibility::tunable},
      10s,
      validate_non_negative_duration)
  , pacer_inter_item_delay_min(
      *this,
      "pacer_inter_item_delay_min",
      "Lower bound of the random gap between two items when no cooldown is "
      "active.",
      {.needs_restart = needs_restart::no,
       .example = "160",
       .visibility = visibility::user},
      160s,
      validate_non_negative_duration)
  , pacer_inter_item_delay_max(
      *this,
      "pacer_inter_item_delay_max",
      "Upper bound of the random gap between two items when no cooldown is "
      "active.",
      {.needs_restart = needs_restart::no,
       .example = "220",
       .visibility = visibility::user},
      220s,
      validate_non_negative_duration)
  , pacer_cooldown_jitter_min(
      *this,
      "pacer_cooldown_jitter_min",
      "Lower bound of the jitter added to an active cooldown between items.",
      {.needs_restart = needs_restart::no, .visibility = visibility::tunable},
      5s,
      validate_non_negative_duration)
  , pacer_cooldown_jitter_max(
      *this,
      "pacer_cooldown_jitter_max",
      "Upper bound of the jitter added to an active cooldown between items.",
      {.needs_restart = needs_restart::no, .visibility = visibility::tunable},
      15s,
      validate_non_negative_duration)
  , pacer_write_cooldown_min(
      *this,
      "pacer_write_cooldown_min",
      "Lower bound of the account cooldown started by a successful archive.",
      {.needs_restart = needs_restart::no, .visibility = visibility::tunable},
      160s,
      validate_non_negative_duration)
  , pacer_write_cooldown_max(
      *this,
      "pacer_write_cooldown_max",
      "Upper bound of the account cooldown started by a successful archive.",
      {.needs_restart = needs_restart::no, .visibility = visibility::tunable},
      220s,
      validate_non_negative_duration)
  , pacer_network_probe_interval(
      *this,
      "pacer_network_probe_interval",
      "Interval between network stability probes while waiting for the "
      "connection to recover.",
      {.needs_restart = needs_restart::no, .visibility = visibility::tunable},
      2s,
      validate_positive_duration)
  , pacer_network_probe_ceiling(
      *this,
      "pacer_network_probe_ceiling",
      "Longest time spent waiting for the network to recover.",
      {.needs_restart = needs_restart::no, .visibility = visibility::tunable},
      120s,
      validate_positive_duration)
  , pacer_network_settle(
      *this,
      "pacer_network_settle",
      "Extra wait after the network recovered, before the next attempt.",
      {.needs_restart = needs_restart::no, .visibility = visibility::tunable},
      5s,
      validate_non_negative_duration)
  , pacer_failure_lockout_threshold(
      *this,
      "pacer_failure_lockout_threshold",
      "Consecutive failed remote calls that lock the account as a "
      "precaution.",
      {.needs_restart = needs_restart::no, .visibility = visibility::tunable},
      3,
      validate_positive_count)
  , pacer_failure_lockout(
      *this,
      "pacer_failure_lockout",
      "Length of the precautionary lockout.",
      {.needs_restart = needs_restart::no, .visibility = visibility::tunable},
      300s,
      validate_positive_duration)
  , pacer_ledger_directory(
      *this,
      "pacer_ledger_directory",
      "Directory holding the persisted progress ledgers and the account "
      "cooldown.",
      {.needs_restart = needs_restart::yes,
       .example = "/var/lib/pacer",
       .visibility = visibility::user},
      "/var/lib/pacer",
      validate_not_empty) {}

configuration::error_map_t configuration::load(const YAML::Node& root_node) {
    if (!root_node["pacer"]) {
        throw std::invalid_argument("'pacer' root is required");
    }

    return config_store::read_yaml(root_node["pacer"]);
}

configuration& shard_local_cfg() {
    static thread_local configuration cfg;
    return cfg;
}

} // namespace config
