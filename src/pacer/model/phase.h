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

#include <chrono>
#include <iosfwd>
#include <string_view>
#include <type_traits>
#include <variant>

namespace model {

// Item ordinals in phases are 1-based, the way they are shown to a user.
namespace phase {
struct idle {
    bool operator==(const idle&) const = default;
};
struct uploading {
    int item;
    bool operator==(const uploading&) const = default;
};
struct archiving {
    int item;
    bool operator==(const archiving&) const = default;
};
struct waiting_next_item {
    int next;
    std::chrono::seconds remaining;
    bool operator==(const waiting_next_item&) const = default;
};
struct cooldown {
    std::chrono::seconds remaining;
    bool operator==(const cooldown&) const = default;
};
struct auto_retrying {
    std::chrono::seconds remaining;
    int attempt;
    bool operator==(const auto_retrying&) const = default;
};
struct waiting_network {
    int attempt;
    bool operator==(const waiting_network&) const = default;
};
struct escalated_pause {
    std::chrono::seconds remaining;
    bool operator==(const escalated_pause&) const = default;
};
struct locked_out {
    std::chrono::seconds remaining;
    bool operator==(const locked_out&) const = default;
};
// The remote service refused the payload; waits for skip or replace.
struct item_rejected {
    int item;
    bool operator==(const item_rejected&) const = default;
};
struct session_expired {
    bool operator==(const session_expired&) const = default;
};
struct paused {
    bool operator==(const paused&) const = default;
};
struct completed {
    bool operator==(const completed&) const = default;
};
} // namespace phase

/// What the orchestrator is doing right now. Changes far more often than any
/// item status because countdowns publish every tick.
class orchestration_phase {
public:
    using variant_t = std::variant<
      phase::idle,
      phase::uploading,
      phase::archiving,
      phase::waiting_next_item,
      phase::cooldown,
      phase::auto_retrying,
      phase::waiting_network,
      phase::escalated_pause,
      phase::locked_out,
      phase::item_rejected,
      phase::session_expired,
      phase::paused,
      phase::completed>;

    orchestration_phase() = default;

    template<typename T>
    requires std::is_constructible_v<variant_t, T>
    orchestration_phase(T v) // NOLINT(hicpp-explicit-conversions)
      : _v(std::move(v)) {}

    template<typename T>
    bool is() const {
        return std::holds_alternative<T>(_v);
    }

    template<typename T>
    const T* get_if() const {
        return std::get_if<T>(&_v);
    }

    const variant_t& get() const { return _v; }

    std::string_view name() const;

    bool operator==(const orchestration_phase&) const = default;

    friend std::ostream& operator<<(std::ostream&, const orchestration_phase&);

private:
    variant_t _v;
};

} // namespace model

PACER_OSTREAM_FMT(model::orchestration_phase)
