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

#include <seastar/core/sstring.hh>

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <string>

namespace YAML {

template<>
struct convert<ss::sstring> {
    static Node encode(const ss::sstring& rhs) { return Node(rhs.c_str()); }
    static bool decode(const Node& node, ss::sstring& rhs) {
        if (!node.IsScalar()) {
            return false;
        }
        rhs = node.as<std::string>();
        return true;
    }
};

/// Durations are plain integers in the unit of the property type, e.g. a
/// std::chrono::seconds property reads `pacer_bot_lockout: 900`.
template<typename Rep, typename Period>
struct convert<std::chrono::duration<Rep, Period>> {
    using type = std::chrono::duration<Rep, Period>;

    static Node encode(const type& rhs) { return Node(rhs.count()); }

    static bool decode(const Node& node, type& rhs) {
        Rep count;
        if (!convert<Rep>::decode(node, count)) {
            return false;
        }
        rhs = type(count);
        return true;
    }
};

} // namespace YAML
