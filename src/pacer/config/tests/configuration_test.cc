// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "config/configuration.h"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <sstream>

using namespace std::chrono_literals;

TEST(configuration, defaults) {
    config::configuration cfg;
    EXPECT_EQ(cfg.pacer_max_auto_retries(), 3);
    EXPECT_EQ(cfg.pacer_bot_lockout(), 900s);
    EXPECT_EQ(cfg.pacer_escalation_pause(), 300s);
    EXPECT_EQ(cfg.pacer_inter_item_delay_min(), 160s);
    EXPECT_EQ(cfg.pacer_inter_item_delay_max(), 220s);
    EXPECT_EQ(cfg.pacer_network_probe_ceiling(), 120s);
    EXPECT_EQ(cfg.pacer_ledger_directory(), "/var/lib/pacer");
    EXPECT_TRUE(cfg.pacer_bot_lockout.is_default());
}

TEST(configuration, load_overrides_values) {
    config::configuration cfg;
    auto root = YAML::Load(R"(
pacer:
  pacer_max_auto_retries: 5
  pacer_bot_lockout: 1200
  pacer_ledger_directory: /tmp/ledgers
)");
    auto errors = cfg.load(root);
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(cfg.pacer_max_auto_retries(), 5);
    EXPECT_EQ(cfg.pacer_bot_lockout(), 1200s);
    EXPECT_EQ(cfg.pacer_ledger_directory(), "/tmp/ledgers");
    EXPECT_FALSE(cfg.pacer_bot_lockout.is_default());

    cfg.pacer_bot_lockout.reset();
    EXPECT_EQ(cfg.pacer_bot_lockout(), 900s);
}

TEST(configuration, invalid_values_are_reported_and_not_applied) {
    config::configuration cfg;
    auto root = YAML::Load(R"(
pacer:
  pacer_max_auto_retries: 0
  pacer_escalation_pause: not-a-number
  pacer_network_settle: 7
)");
    auto errors = cfg.load(root);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_TRUE(errors.contains("pacer_max_auto_retries"));
    EXPECT_TRUE(errors.contains("pacer_escalation_pause"));
    EXPECT_EQ(cfg.pacer_max_auto_retries(), 3);
    EXPECT_EQ(cfg.pacer_escalation_pause(), 300s);
    // valid entries next to invalid ones still apply
    EXPECT_EQ(cfg.pacer_network_settle(), 7s);
}

TEST(configuration, unknown_property_is_fatal) {
    config::configuration cfg;
    auto root = YAML::Load(R"(
pacer:
  pacer_no_such_thing: 1
)");
    EXPECT_THROW(cfg.load(root), std::invalid_argument);
}

TEST(configuration, missing_root_is_fatal) {
    config::configuration cfg;
    EXPECT_THROW(cfg.load(YAML::Load("other: {}")), std::invalid_argument);
}

TEST(configuration, lookup_and_print) {
    config::configuration cfg;
    EXPECT_TRUE(cfg.contains("pacer_cooldown_floor"));
    EXPECT_FALSE(cfg.contains("pacer_cooldown_ceiling"));
    EXPECT_THROW(cfg.get("pacer_cooldown_ceiling"), std::out_of_range);

    auto& prop = cfg.get("pacer_cooldown_floor");
    EXPECT_EQ(prop.type_name(), "seconds");
    EXPECT_EQ(prop.get_visibility(), config::visibility::tunable);
    EXPECT_FALSE(prop.needs_restart());

    std::ostringstream os;
    os << prop;
    EXPECT_EQ(os.str(), "pacer_cooldown_floor:30s");
}

TEST(configuration, to_json_writes_every_property) {
    config::configuration cfg;
    json::StringBuffer buf;
    json::Writer<json::StringBuffer> w(buf);
    cfg.to_json(w);

    json::Document doc;
    doc.Parse(buf.GetString());
    ASSERT_TRUE(doc.IsObject());
    EXPECT_EQ(doc.MemberCount(), cfg.property_names().size());
    EXPECT_EQ(doc["pacer_bot_lockout"].GetInt64(), 900);
    EXPECT_STREQ(doc["pacer_ledger_directory"].GetString(), "/var/lib/pacer");
}
