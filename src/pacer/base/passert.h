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

#include <seastar/util/backtrace.hh>
#include <seastar/util/log.hh>

namespace detail {
struct passert_logger {
    static inline ss::logger l{"assert"};
};
inline passert_logger g_passert_log;
} // namespace detail

/// Invariant check for states that can only be reached through a
/// programming error. Logs the condition with a backtrace and traps.
// NOLINTNEXTLINE
#define passert(x, msg, args...)                                               \
    do {                                                                       \
        if (__builtin_expect(!(x), false)) {                                   \
            ::detail::g_passert_log.l.error(                                   \
              "Assert failure: ({}:{}) '{}' " msg,                             \
              __FILE__,                                                        \
              __LINE__,                                                        \
              #x,                                                              \
              ##args);                                                         \
            ::detail::g_passert_log.l.error(                                   \
              "Backtrace below:\n{}", ss::current_backtrace());                \
            __builtin_trap();                                                  \
        }                                                                      \
    } while (0)
