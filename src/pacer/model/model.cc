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

#include "model/phase.h"
#include "model/queue_item.h"

#include <fmt/chrono.h>
#include <fmt/ostream.h>

#include <ostream>

namespace model {

std::ostream& operator<<(std::ostream& o, item_status s) {
    switch (s) {
        using enum item_status;
    case pending:
        return o << "pending";
    case uploading:
        return o << "uploading";
    case uploaded:
        return o << "uploaded";
    case archiving:
        return o << "archiving";
    case completed:
        return o << "completed";
    case failed:
        return o << "failed";
    }
    return o << "unknown";
}

std::ostream& operator<<(std::ostream& o, queue_status s) {
    switch (s) {
        using enum queue_status;
    case ready:
        return o << "ready";
    case uploading:
        return o << "uploading";
    case paused:
        return o << "paused";
    case error:
        return o << "error";
    case completed:
        return o << "completed";
    }
    return o << "unknown";
}

std::ostream& operator<<(std::ostream& o, const queue_item& item) {
    fmt::print(
      o,
      "{{id: {}, status: {}, remote_handle: {}, last_error: {}}}",
      item.id,
      item.status,
      item.remote_handle.value_or("none"),
      item.last_error.value_or("none"));
    return o;
}

namespace {
struct phase_printer {
    std::ostream& o;

    void operator()(const phase::idle&) const { o << "idle"; }
    void operator()(const phase::uploading& p) const {
        fmt::print(o, "uploading({})", p.item);
    }
    void operator()(const phase::archiving& p) const {
        fmt::print(o, "archiving({})", p.item);
    }
    void operator()(const phase::waiting_next_item& p) const {
        fmt::print(o, "waiting_next_item({}, {})", p.next, p.remaining);
    }
    void operator()(const phase::cooldown& p) const {
        fmt::print(o, "cooldown({})", p.remaining);
    }
    void operator()(const phase::auto_retrying& p) const {
        fmt::print(o, "auto_retrying({}, attempt {})", p.remaining, p.attempt);
    }
    void operator()(const phase::waiting_network& p) const {
        fmt::print(o, "waiting_network(attempt {})", p.attempt);
    }
    void operator()(const phase::escalated_pause& p) const {
        fmt::print(o, "escalated_pause({})", p.remaining);
    }
    void operator()(const phase::locked_out& p) const {
        fmt::print(o, "locked_out({})", p.remaining);
    }
    void operator()(const phase::item_rejected& p) const {
        fmt::print(o, "item_rejected({})", p.item);
    }
    void operator()(const phase::session_expired&) const {
        o << "session_expired";
    }
    void operator()(const phase::paused&) const { o << "paused"; }
    void operator()(const phase::completed&) const { o << "completed"; }
};

struct phase_namer {
    std::string_view operator()(const phase::idle&) const { return "idle"; }
    std::string_view operator()(const phase::uploading&) const {
        return "uploading";
    }
    std::string_view operator()(const phase::archiving&) const {
        return "archiving";
    }
    std::string_view operator()(const phase::waiting_next_item&) const {
        return "waiting_next_item";
    }
    std::string_view operator()(const phase::cooldown&) const {
        return "cooldown";
    }
    std::string_view operator()(const phase::auto_retrying&) const {
        return "auto_retrying";
    }
    std::string_view operator()(const phase::waiting_network&) const {
        return "waiting_network";
    }
    std::string_view operator()(const phase::escalated_pause&) const {
        return "escalated_pause";
    }
    std::string_view operator()(const phase::locked_out&) const {
        return "locked_out";
    }
    std::string_view operator()(const phase::item_rejected&) const {
        return "item_rejected";
    }
    std::string_view operator()(const phase::session_expired&) const {
        return "session_expired";
    }
    std::string_view operator()(const phase::paused&) const {
        return "paused";
    }
    std::string_view operator()(const phase::completed&) const {
        return "completed";
    }
};
} // namespace

std::string_view orchestration_phase::name() const {
    return std::visit(phase_namer{}, _v);
}

std::ostream& operator<<(std::ostream& o, const orchestration_phase& p) {
    std::visit(phase_printer{o}, p._v);
    return o;
}

} // namespace model
