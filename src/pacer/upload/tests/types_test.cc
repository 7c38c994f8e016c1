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

#include "config/configuration.h"
#include "upload/types.h"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <stdexcept>

using namespace std::chrono_literals;

class orchestrator_config_test : public ::testing::Test {
public:
    void TearDown() override {
        config::shard_local_cfg().for_each(
          [](config::base_property& p) { p.reset(); });
    }

    static void load(const char* yaml) {
        auto errors = config::shard_local_cfg().load(YAML::Load(yaml));
        ASSERT_TRUE(errors.empty());
    }
};

TEST_F(orchestrator_config_test, defaults) {
    auto oc = upload::get_orchestrator_config();
    EXPECT_EQ(oc.retry.max_attempts, 3);
    EXPECT_EQ(oc.retry.generic_retry_base, 60s);
    EXPECT_EQ(oc.bot_lockout, 900s);
    EXPECT_EQ(oc.escalation_pause, 300s);
    EXPECT_EQ(oc.pre_archive_delay_min, 5s);
    EXPECT_EQ(oc.pre_archive_delay_max, 10s);
    EXPECT_EQ(oc.inter_item_delay_min, 160s);
    EXPECT_EQ(oc.inter_item_delay_max, 220s);
    EXPECT_EQ(oc.network_probe_ceiling, 120s);
    EXPECT_EQ(oc.network_settle, 5s);

    auto window = upload::get_write_cooldown_window();
    EXPECT_EQ(window.min, 160s);
    EXPECT_EQ(window.max, 220s);
}

TEST_F(orchestrator_config_test, loaded_values_reach_every_snapshot) {
    load(R"(
pacer:
  pacer_max_auto_retries: 5
  pacer_cooldown_floor: 45
  pacer_bot_lockout: 1200
  pacer_inter_item_delay_min: 100
  pacer_inter_item_delay_max: 140
  pacer_network_settle: 8
  pacer_write_cooldown_min: 90
  pacer_write_cooldown_max: 95
  pacer_failure_lockout_threshold: 4
  pacer_failure_lockout: 600
  pacer_ledger_directory: /tmp/pacer-ledgers
)");
    auto oc = upload::get_orchestrator_config();
    EXPECT_EQ(oc.retry.max_attempts, 5);
    EXPECT_EQ(oc.retry.cooldown_floor, 45s);
    EXPECT_EQ(oc.bot_lockout, 1200s);
    EXPECT_EQ(oc.inter_item_delay_min, 100s);
    EXPECT_EQ(oc.inter_item_delay_max, 140s);
    EXPECT_EQ(oc.network_settle, 8s);

    auto guard = upload::get_account_guard_config();
    EXPECT_EQ(guard.bot_lockout, 1200s);
    EXPECT_EQ(guard.failure_threshold, 4);
    EXPECT_EQ(guard.failure_lockout, 600s);

    auto window = upload::get_write_cooldown_window();
    EXPECT_EQ(window.min, 90s);
    EXPECT_EQ(window.max, 95s);

    EXPECT_EQ(upload::get_ledger_directory(), "/tmp/pacer-ledgers");
}

TEST_F(orchestrator_config_test, inverted_delay_window_is_rejected) {
    load(R"(
pacer:
  pacer_pre_archive_delay_min: 20
)");
    EXPECT_THROW(upload::get_orchestrator_config(), std::runtime_error);
}

TEST_F(orchestrator_config_test, inverted_jitter_window_is_rejected) {
    load(R"(
pacer:
  pacer_cooldown_jitter_min: 30
  pacer_cooldown_jitter_max: 10
)");
    EXPECT_THROW(upload::get_orchestrator_config(), std::runtime_error);
}

TEST_F(orchestrator_config_test, inverted_write_cooldown_is_rejected) {
    load(R"(
pacer:
  pacer_write_cooldown_min: 300
)");
    EXPECT_THROW(upload::get_write_cooldown_window(), std::runtime_error);
    // the orchestrator snapshot does not depend on it
    EXPECT_NO_THROW(upload::get_orchestrator_config());
}
