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

#include "upload/types.h"

#include "base/plog.h"
#include "config/configuration.h"
#include "upload/logger.h"

#include <fmt/chrono.h>
#include <fmt/ostream.h>

#include <ostream>
#include <stdexcept>
#include <string_view>

namespace upload {

std::ostream& operator<<(std::ostream& o, const orchestrator_config& cfg) {
    fmt::print(
      o,
      "{{retry: {}, bot_lockout: {}, escalation_pause: {}, "
      "pre_archive_delay: [{}, {}], inter_item_delay: [{}, {}], "
      "cooldown_jitter: [{}, {}], network_probe_interval: {}, "
      "network_probe_ceiling: {}, network_settle: {}}}",
      cfg.retry,
      cfg.bot_lockout,
      cfg.escalation_pause,
      cfg.pre_archive_delay_min,
      cfg.pre_archive_delay_max,
      cfg.inter_item_delay_min,
      cfg.inter_item_delay_max,
      cfg.cooldown_jitter_min,
      cfg.cooldown_jitter_max,
      cfg.network_probe_interval,
      cfg.network_probe_ceiling,
      cfg.network_settle);
    return o;
}

static void check_window(
  std::string_view name, std::chrono::seconds min, std::chrono::seconds max) {
    if (min > max) {
        plog(
          upload_log.error,
          "Configuration properties {}_min ({}) and {}_max ({}) are "
          "inconsistent",
          name,
          min,
          name,
          max);
        throw std::runtime_error(
          fmt::format("{}_min is greater than {}_max", name, name));
    }
}

orchestrator_config get_orchestrator_config() {
    plog(upload_log.debug, "Generating orchestrator configuration");
    const auto& cfg = config::shard_local_cfg();
    orchestrator_config oc{
      .retry = {
        .max_attempts = cfg.pacer_max_auto_retries(),
        .generic_retry_base = cfg.pacer_generic_retry_base(),
        .generic_retry_jitter = cfg.pacer_generic_retry_jitter(),
        .cooldown_safety_margin = cfg.pacer_cooldown_safety_margin(),
        .cooldown_floor = cfg.pacer_cooldown_floor(),
      },
      .bot_lockout = cfg.pacer_bot_lockout(),
      .escalation_pause = cfg.pacer_escalation_pause(),
      .pre_archive_delay_min = cfg.pacer_pre_archive_delay_min(),
      .pre_archive_delay_max = cfg.pacer_pre_archive_delay_max(),
      .inter_item_delay_min = cfg.pacer_inter_item_delay_min(),
      .inter_item_delay_max = cfg.pacer_inter_item_delay_max(),
      .cooldown_jitter_min = cfg.pacer_cooldown_jitter_min(),
      .cooldown_jitter_max = cfg.pacer_cooldown_jitter_max(),
      .network_probe_interval = cfg.pacer_network_probe_interval(),
      .network_probe_ceiling = cfg.pacer_network_probe_ceiling(),
      .network_settle = cfg.pacer_network_settle(),
    };
    check_window(
      "pacer_pre_archive_delay",
      oc.pre_archive_delay_min,
      oc.pre_archive_delay_max);
    check_window(
      "pacer_inter_item_delay",
      oc.inter_item_delay_min,
      oc.inter_item_delay_max);
    check_window(
      "pacer_cooldown_jitter", oc.cooldown_jitter_min, oc.cooldown_jitter_max);
    plog(upload_log.debug, "Orchestrator configuration generated: {}", oc);
    return oc;
}

account_guard_config get_account_guard_config() {
    const auto& cfg = config::shard_local_cfg();
    return {
      .bot_lockout = cfg.pacer_bot_lockout(),
      .failure_threshold = cfg.pacer_failure_lockout_threshold(),
      .failure_lockout = cfg.pacer_failure_lockout(),
    };
}

cooldown_window get_write_cooldown_window() {
    const auto& cfg = config::shard_local_cfg();
    cooldown_window w{
      .min = cfg.pacer_write_cooldown_min(),
      .max = cfg.pacer_write_cooldown_max(),
    };
    check_window("pacer_write_cooldown", w.min, w.max);
    return w;
}

ss::sstring get_ledger_directory() {
    return config::shard_local_cfg().pacer_ledger_directory();
}

} // namespace upload
