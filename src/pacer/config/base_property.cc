// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "config/base_property.h"

#include "base/passert.h"
#include "config/config_store.h"

#include <ostream>

namespace config {
base_property::base_property(
  config_store& conf,
  std::string_view name,
  std::string_view desc,
  base_property::metadata meta)
  : _name(name)
  , _desc(desc)
  , _meta(meta) {
    auto [_, inserted] = conf._properties.emplace(name, this);
    passert(inserted, "Property {} registered twice", name);
}

std::ostream& operator<<(std::ostream& o, const base_property& p) {
    p.print(o);
    return o;
}

std::string_view to_string_view(visibility v) {
    switch (v) {
    case config::visibility::tunable:
        return "tunable";
    case config::visibility::user:
        return "user";
    }

    return "{invalid}";
}

} // namespace config
